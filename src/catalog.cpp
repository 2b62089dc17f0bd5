#include "catalog.h"
#include "utilities.h"

#include <algorithm>

// ============================================================================
// Catalog
// ============================================================================

[[nodiscard]] Item make_item(const ItemKind kind, std::string name,
                             std::string command,
                             std::optional<std::string> icon)
{
	Item item       = {.kind = kind};
	item.name_lower = Util::to_lower(name);
	item.name       = std::move(name);
	item.command    = std::move(command);
	item.icon       = std::move(icon);
	return item;
}

void Catalog::sort_items()
{
	std::ranges::stable_sort(items_, [](const Item& a, const Item& b) {
		return (a.kind != b.kind) ? (a.kind < b.kind)
		                          : (a.name_lower < b.name_lower);
	});
}

Catalog::Catalog(std::vector<Item> items) : items_(std::move(items))
{
	sort_items();
}

void Catalog::rebuild(std::vector<Item> items)
{
	items_ = std::move(items);
	sort_items();
	++generation_;
}

[[nodiscard]] const std::vector<Item>& Catalog::items() const
{
	return items_;
}

[[nodiscard]] const Item& Catalog::item(const size_t index) const
{
	return items_.at(index);
}

[[nodiscard]] size_t Catalog::size() const
{
	return items_.size();
}

[[nodiscard]] bool Catalog::empty() const
{
	return items_.empty();
}

[[nodiscard]] uint64_t Catalog::generation() const
{
	return generation_;
}

#include "catalog_cache.h"
#include "utilities.h"

#include <charconv>
#include <functional>
#include <fstream>
#include <map>
#include <string>

// ============================================================================
// Catalog Cache
// ============================================================================

namespace Field {
constexpr auto Type      = "type";
constexpr auto Name      = "name";
constexpr auto NameLower = "name_lower";
constexpr auto Cmdline   = "cmdline";
constexpr auto IconPath  = "icon_path";
} // namespace Field

[[nodiscard]] std::optional<Item> CatalogCache::parse_line(const std::string_view line)
{
	std::map<std::string, std::string, std::less<>> fields = {};

	size_t pos = 0;
	while (pos < line.size()) {
		const size_t comma = line.find(',', pos);
		if (comma == std::string_view::npos) {
			return std::nullopt;
		}

		const auto token = line.substr(pos, comma - pos);
		const size_t colon = token.find(':');
		if (colon == std::string_view::npos || colon == 0 ||
		    colon + 1 == token.size() ||
		    token.find(':', colon + 1) != std::string_view::npos) {
			return std::nullopt;
		}

		fields.insert_or_assign(std::string(token.substr(0, colon)),
		                        std::string(token.substr(colon + 1)));
		pos = comma + 1;
	}

	const auto type = fields.find(Field::Type);
	const auto name = fields.find(Field::Name);
	const auto cmd  = fields.find(Field::Cmdline);
	if (type == fields.end() || name == fields.end() || cmd == fields.end()) {
		return std::nullopt;
	}

	int kind = 0;
	const auto& t = type->second;
	const auto [end, ec] = std::from_chars(t.data(), t.data() + t.size(), kind);
	if (ec != std::errc{} || end != t.data() + t.size() ||
	    kind < static_cast<int>(ItemKind::Application) ||
	    kind > static_cast<int>(ItemKind::Document)) {
		return std::nullopt;
	}

	std::optional<std::string> icon = {};
	if (const auto it = fields.find(Field::IconPath); it != fields.end()) {
		icon = it->second;
	}

	// name_lower is recomputed from name rather than trusted
	return make_item(static_cast<ItemKind>(kind), name->second, cmd->second,
	                 std::move(icon));
}

[[nodiscard]] bool CatalogCache::is_storable(const Item& item)
{
	const auto clean = [](const std::string_view value) {
		return !value.empty() &&
		       value.find_first_of(",:\r\n") == std::string_view::npos;
	};

	return clean(item.name) && clean(item.command) &&
	       (!item.icon || clean(*item.icon));
}

[[nodiscard]] std::optional<std::vector<Item>> CatalogCache::read(
        const std::filesystem::path& file)
{
	using namespace std::string_view_literals;

	std::ifstream in(file);
	if (!in) {
		return std::nullopt;
	}

	std::vector<Item> items = {};
	size_t line_number      = 0;

	for (std::string line = {}; std::getline(in, line);) {
		++line_number;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty()) {
			continue;
		}

		auto item = parse_line(line);
		if (!item) {
			std::cerr << "Cache read error: "sv << file.string() << ':'
			          << line_number << " is malformed\n"sv;
			return std::nullopt;
		}
		items.emplace_back(std::move(*item));
	}

	if (in.bad()) {
		std::cerr << "Cache read error: "sv << file.string() << '\n';
		return std::nullopt;
	}
	return items;
}

[[nodiscard]] bool CatalogCache::write(const std::filesystem::path& file,
                                       const std::vector<Item>& items)
{
	using namespace std::string_view_literals;

	std::error_code ec = {};
	if (file.has_parent_path()) {
		std::filesystem::create_directories(file.parent_path(), ec);
		if (ec) {
			std::cerr << "Cache write error: "sv << ec.message() << '\n';
			return false;
		}
	}

	std::ofstream out(file, std::ios::trunc);
	if (!out) {
		std::cerr << "Cache write error: cannot open "sv << file.string() << '\n';
		return false;
	}

	size_t skipped = 0;
	for (const auto& item : items) {
		if (!is_storable(item)) {
			++skipped;
			continue;
		}
		out << format_line(item) << '\n';
	}

	if (skipped > 0) {
		std::cerr << "Cache write: left out "sv << skipped
		          << " items with ',' or ':' in a field\n"sv;
	}

	out.flush();
	return static_cast<bool>(out);
}

[[nodiscard]] std::string CatalogCache::format_line(const Item& item)
{
	std::string line = {};

	const auto add = [&line](const std::string_view key, const std::string_view value) {
		line.append(key).append(1, ':').append(value).append(1, ',');
	};

	add(Field::Type, std::to_string(static_cast<int>(item.kind)));
	add(Field::Name, item.name);
	add(Field::NameLower, item.name_lower);
	add(Field::Cmdline, item.command);
	if (item.icon) {
		add(Field::IconPath, *item.icon);
	}
	return line;
}

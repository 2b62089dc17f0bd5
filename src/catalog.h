#ifndef CATALOG_H
#define CATALOG_H

#include "item_t.h"

#include <cstdint>
#include <vector>

// ============================================================================
// Catalog
// ============================================================================

// Items in canonical order: kind first (applications, executables,
// documents), then folded name. Only a rebuild replaces them.
class Catalog {
	std::vector<Item> items_ = {};
	uint64_t generation_     = 0;

	void sort_items();

public:
	Catalog() = default;

	explicit Catalog(std::vector<Item> items);

	void rebuild(std::vector<Item> items);

	[[nodiscard]] const std::vector<Item>& items() const;

	[[nodiscard]] const Item& item(const size_t index) const;

	[[nodiscard]] size_t size() const;

	[[nodiscard]] bool empty() const;

	// Bumped by every rebuild; dependents compare it to detect a stale view.
	[[nodiscard]] uint64_t generation() const;
};

#endif

#ifndef CATALOG_SOURCE_H
#define CATALOG_SOURCE_H

#include "item_t.h"

#include <optional>
#include <vector>

// ============================================================================
// Catalog Source
// ============================================================================

// Produces the unordered item list a Catalog is built from. std::nullopt
// means nothing usable was produced.
class CatalogSource {
public:
	virtual ~CatalogSource() = default;

	// Startup load, may be served from a persisted cache.
	[[nodiscard]] virtual std::optional<std::vector<Item>> load() = 0;

	// Always rebuilds from the underlying sources.
	[[nodiscard]] virtual std::optional<std::vector<Item>> rescan() = 0;
};

#endif

#ifndef CATALOG_CACHE_H
#define CATALOG_CACHE_H

#include "item_t.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Catalog Cache
// ============================================================================

// Persisted item list, one item per line:
//
//   type:1,name:Firefox,name_lower:firefox,cmdline:firefox %u,icon_path:firefox,
//
// Values are not escaped, so an item with ',' or ':' in any field cannot be
// stored and is left out of the file.
class CatalogCache {
	[[nodiscard]] static std::optional<Item> parse_line(const std::string_view line);

	[[nodiscard]] static bool is_storable(const Item& item);

public:
	[[nodiscard]] static std::optional<std::vector<Item>> read(
	        const std::filesystem::path& file);

	[[nodiscard]] static bool write(const std::filesystem::path& file,
	                                const std::vector<Item>& items);

	[[nodiscard]] static std::string format_line(const Item& item);
};

#endif

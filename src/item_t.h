#ifndef ITEM_T
#define ITEM_T

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ItemKind : int {
	Application = 1,
	Executable  = 2,
	Document    = 3,
};

struct Item {
	ItemKind kind                   = ItemKind::Application;
	std::string name                = {};
	std::string name_lower          = {};
	std::string command             = {};
	std::optional<std::string> icon = {};
};

// A catalog item that contains the query, with the position of the
// leftmost occurrence in its folded name.
struct Match {
	size_t index  = {};
	size_t offset = {};
};

using ResultList = std::vector<Match>;

[[nodiscard]] Item make_item(const ItemKind kind, std::string name,
                             std::string command,
                             std::optional<std::string> icon = std::nullopt);

#endif

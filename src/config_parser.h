#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config_t.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Config Parser
// ============================================================================

namespace tinyxml2 { class XMLElement; }

class ConfigParser {
	static constexpr auto get_text = [](const auto* parent, const char* tag) {
		const auto* elem = parent->FirstChildElement(tag);
		return elem ? elem->GetText() : nullptr;
	};

	[[nodiscard]] static std::vector<std::string> get_all(
	        const tinyxml2::XMLElement* root, const char* tag);

	[[nodiscard]] static std::optional<bool> parse_flag(
	        const tinyxml2::XMLElement* root, const char* tag, const bool fallback);

	[[nodiscard]] static bool parse_colors(const tinyxml2::XMLElement* root,
	                                       Config& config);

public:
	[[nodiscard]] static std::optional<Config> parse(const std::string_view filename);

	[[nodiscard]] static std::optional<Config> parse_text(const std::string_view xml);

	[[nodiscard]] static std::optional<Config> from_root(const tinyxml2::XMLElement* root);
};

#endif

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <tinyxml2.h>
#pragma GCC diagnostic pop

#include "config_parser.h"

#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <utility>

// ============================================================================
// Config Parser
// ============================================================================

namespace {

constexpr auto RootElement = "QuickLaunch";

[[nodiscard]] std::string expand_home(const std::string_view path)
{
	if (path.starts_with('-')) {
		return "-" + expand_home(path.substr(1));
	}
	if (path == "~") {
		return Util::home_directory().string();
	}
	if (path.starts_with("~/")) {
		return (Util::home_directory() / std::filesystem::path(path.substr(2))).string();
	}
	return std::string(path);
}

[[nodiscard]] std::optional<int> parse_int(const std::string_view text)
{
	const auto value = Util::trim(text);
	int result       = 0;
	const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(),
	                                       result);
	if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
		return std::nullopt;
	}
	return result;
}

} // namespace

void apply_path_defaults(Config& config)
{
	const auto home = Util::home_directory();

	if (config.app_dirs.empty()) {
		config.app_dirs = {"/usr/share/applications",
		                   home / ".local/share/applications"};
	}

	if (config.cache_file.empty()) {
		std::string file_name = config.name;
		std::ranges::replace_if(file_name, [](const unsigned char c) {
			return !std::isalpha(c);
		}, 'x');
		config.cache_file = home / ".cache" / "quicklaunch" / file_name;
	}
}

[[nodiscard]] std::vector<std::string> ConfigParser::get_all(
        const tinyxml2::XMLElement* root, const char* tag)
{
	std::vector<std::string> values = {};

	for (const auto* elem = root->FirstChildElement(tag); elem;
	     elem             = elem->NextSiblingElement(tag)) {
		if (const auto* text = elem->GetText()) {
			if (auto value = Util::trim(text); !value.empty()) {
				values.emplace_back(std::move(value));
			}
		}
	}
	return values;
}

[[nodiscard]] std::optional<bool> ConfigParser::parse_flag(
        const tinyxml2::XMLElement* root, const char* tag, const bool fallback)
{
	const auto* text = get_text(root, tag);
	if (!text) {
		return fallback;
	}

	const auto value = Util::to_lower(Util::trim(text));
	if (value == "true" || value == "1" || value == "yes") {
		return true;
	}
	if (value == "false" || value == "0" || value == "no") {
		return false;
	}

	std::cerr << "Config error: <" << tag << "> expects true or false, got \""
	          << text << "\"\n";
	return std::nullopt;
}

[[nodiscard]] bool ConfigParser::parse_colors(const tinyxml2::XMLElement* root,
                                              Config& config)
{
	const auto* colors = root->FirstChildElement("Colors");
	if (!colors) {
		return true;
	}

	const std::pair<const char*, int*> attributes[] = {
	        {"fg", &config.normal.fg},
	        {"bg", &config.normal.bg},
	        {"fg_focus", &config.focus.fg},
	        {"bg_focus", &config.focus.bg},
	};

	for (const auto& [name, target] : attributes) {
		int value = *target;
		const auto rc = colors->QueryIntAttribute(name, &value);
		if (rc == tinyxml2::XML_NO_ATTRIBUTE) {
			continue;
		}
		if (rc != tinyxml2::XML_SUCCESS || value < 0 || value > 255) {
			std::cerr << "Config error: color " << name
			          << " must be a number between 0 and 255\n";
			return false;
		}
		*target = value;
	}
	return true;
}

[[nodiscard]] std::optional<Config> ConfigParser::from_root(const tinyxml2::XMLElement* root)
{
	Config config = {};

	if (const auto* name = root->Attribute("name"); name && *name) {
		config.name = name;
	}

	if (const auto* rows = get_text(root, "Rows")) {
		const auto value = parse_int(rows);
		if (!value || *value < 1) {
			std::cerr << "Config error: <Rows> must be a positive number\n";
			return std::nullopt;
		}
		config.rows = static_cast<size_t>(*value);
	}

	if (const auto* terminal = get_text(root, "Terminal")) {
		config.terminal = Util::trim(terminal);
	}

	const auto disable_apps  = parse_flag(root, "DisableApps", false);
	const auto disable_cache = parse_flag(root, "DisableCache", false);
	if (!disable_apps || !disable_cache) {
		return std::nullopt;
	}
	config.disable_apps  = *disable_apps;
	config.disable_cache = *disable_cache;

	if (const auto* cache = get_text(root, "CacheFile")) {
		config.cache_file = expand_home(Util::trim(cache));
	}

	for (const auto& dir : get_all(root, "AppDir")) {
		config.app_dirs.emplace_back(expand_home(dir));
	}
	for (const auto& dir : get_all(root, "DocDir")) {
		config.doc_dirs.emplace_back(expand_home(dir));
	}
	for (const auto& dir : get_all(root, "BinDir")) {
		config.bin_dirs.emplace_back(expand_home(dir));
	}
	config.doc_ext = get_all(root, "DocExt");
	config.bin_ext = get_all(root, "BinExt");

	if (const auto* key = get_text(root, "ExitKey")) {
		const auto value = Util::trim(key);
		if (value.size() != 1 || !std::isalpha(static_cast<unsigned char>(value[0]))) {
			std::cerr << "Config error: <ExitKey> must be a single letter\n";
			return std::nullopt;
		}
		const auto letter = static_cast<char>(
		        std::tolower(static_cast<unsigned char>(value[0])));
		// Ctrl+H, Ctrl+I, Ctrl+J and Ctrl+M are Backspace, Tab, Enter
		if (std::string_view("hijm").find(letter) != std::string_view::npos) {
			std::cerr << "Config error: <ExitKey> " << letter
			          << " collides with an editing key\n";
			return std::nullopt;
		}
		config.exit_key = letter;
	}

	if (!parse_colors(root, config)) {
		return std::nullopt;
	}

	apply_path_defaults(config);
	return config;
}

[[nodiscard]] std::optional<Config> ConfigParser::parse_text(const std::string_view xml)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
		std::cerr << "Error parsing config: " << doc.ErrorStr() << '\n';
		return std::nullopt;
	}

	const auto* root = doc.FirstChildElement(RootElement);
	if (!root) {
		std::cerr << "Error: No " << RootElement << " root element found\n";
		return std::nullopt;
	}
	return from_root(root);
}

[[nodiscard]] std::optional<Config> ConfigParser::parse(const std::string_view filename)
{
	try {
		tinyxml2::XMLDocument doc = {};
		if (doc.LoadFile(std::string(filename).c_str()) !=
		    tinyxml2::XML_SUCCESS) {
			std::cerr << "Error: Cannot open config file " << filename
			          << '\n';
			return std::nullopt;
		}

		const auto* root = doc.FirstChildElement(RootElement);
		if (!root) {
			std::cerr << "Error: No " << RootElement << " root element found\n";
			return std::nullopt;
		}

		return from_root(root);
	} catch (const std::exception& e) {
		std::cerr << "Error parsing config: " << e.what() << '\n';
		return std::nullopt;
	}
}

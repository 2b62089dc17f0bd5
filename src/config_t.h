#ifndef CONFIG_T
#define CONFIG_T

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Defaults {
constexpr size_t Rows     = 10;
constexpr auto Terminal   = "xterm";
constexpr auto Name       = "launcher";
constexpr int Foreground  = 7;
constexpr int Background  = 0;
constexpr int FocusFg     = 15;
constexpr int FocusBg     = 24;
} // namespace Defaults

struct ColorPair {
	int fg = {};
	int bg = {};
};

struct Config {
	std::string name                            = Defaults::Name;
	size_t rows                                 = Defaults::Rows;
	std::string terminal                        = Defaults::Terminal;
	bool disable_apps                           = false;
	bool disable_cache                          = false;
	std::filesystem::path cache_file            = {};
	std::vector<std::filesystem::path> app_dirs = {};
	std::vector<std::string> doc_dirs           = {};
	std::vector<std::string> doc_ext            = {};
	std::vector<std::string> bin_dirs           = {};
	std::vector<std::string> bin_ext            = {};
	std::optional<char> exit_key                = {};
	ColorPair normal                            = {Defaults::Foreground, Defaults::Background};
	ColorPair focus                             = {Defaults::FocusFg, Defaults::FocusBg};
};

// Fills in the directory and cache defaults that depend on the user's home.
void apply_path_defaults(Config& config);

#endif

#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ranges>

#ifdef _WIN32
#include <windows.h>
#endif

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s)
{
	std::string result = {};
	result.reserve(s.size());
	std::ranges::transform(s, std::back_inserter(result), [](const unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

[[nodiscard]] std::string trim(const std::string_view s)
{
	constexpr std::string_view blanks = " \t\r\n";

	const size_t first = s.find_first_not_of(blanks);
	if (first == std::string_view::npos) {
		return {};
	}
	const size_t last = s.find_last_not_of(blanks);
	return std::string(s.substr(first, last - first + 1));
}

// "notes.tar.gz" -> "gz", ".bashrc" -> "", "README" -> ""
[[nodiscard]] std::string extension_of(const std::string_view file_name)
{
	const size_t dot = file_name.find_last_of('.');
	if (dot == std::string_view::npos || dot == 0) {
		return {};
	}
	return std::string(file_name.substr(dot + 1));
}

[[nodiscard]] std::filesystem::path home_directory()
{
#ifdef _WIN32
	const char* home = std::getenv("USERPROFILE");
#else
	const char* home = std::getenv("HOME");
#endif
	return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

void move_cursor(const size_t row, const size_t col)
{
#ifdef _WIN32
	COORD coord = {static_cast<SHORT>(col - 1), static_cast<SHORT>(row - 1)};
	SetConsoleCursorPosition(GetStdHandle(STD_OUTPUT_HANDLE), coord);
#else
	std::cout << "\033[" << row << ";" << col << "H";
#endif
}

void clear_screen()
{
#ifdef _WIN32
	std::system("cls");
#else
	std::cout << "\033[H\033[J";
#endif
}

void clear_line()
{
	std::cout << "\033[2K";
}

void show_cursor(const bool visible)
{
	std::cout << (visible ? "\033[?25h" : "\033[?25l");
}

} // namespace Util

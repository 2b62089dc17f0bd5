#ifndef UTILITIES_H
#define UTILITIES_H

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s);

[[nodiscard]] std::string trim(const std::string_view s);

[[nodiscard]] std::string extension_of(const std::string_view file_name);

[[nodiscard]] std::filesystem::path home_directory();

void move_cursor(const size_t row, const size_t col);

void clear_screen();

void clear_line();

void show_cursor(const bool visible);

} // namespace Util

#endif

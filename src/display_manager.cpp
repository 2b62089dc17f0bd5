#include "display_manager.h"
#include "timing_t.h"
#include "utilities.h"

#include <iostream>
#include <string_view>

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace Color {

using namespace std::string_view_literals;

constexpr auto Reset = "\033[0m"sv;
constexpr auto Bold  = "\033[1m"sv;
constexpr auto Cyan  = "\033[96m"sv;

struct Pair {
	ColorPair colors = {};
};

std::ostream& operator<<(std::ostream& os, const Pair& pair)
{
	return os << "\033[38;5;" << pair.colors.fg << "m\033[48;5;"
	          << pair.colors.bg << 'm';
}

} // namespace Color

// ============================================================================
// Display Manager
// ============================================================================

namespace {

constexpr size_t HeaderLines = 1;

[[nodiscard]] std::string_view kind_marker(const ItemKind kind)
{
	using namespace std::string_view_literals;

	switch (kind) {
	case ItemKind::Application: return "◆ "sv;
	case ItemKind::Executable: return "▸ "sv;
	case ItemKind::Document: return "≡ "sv;
	}
	return "  "sv;
}

} // namespace

[[nodiscard]] size_t DisplayManager::screen_line(const size_t row)
{
	return HeaderLines + row;
}

[[nodiscard]] bool DisplayManager::covered(const size_t row) const
{
	return overlay_until_.has_value() && row == rows_.size();
}

void DisplayManager::write_row(const size_t row) const
{
	using namespace std::string_view_literals;

	if (row == 0 || row > rows_.size() || covered(row)) {
		return;
	}

	const bool focused = (row == focused_row_);
	Util::move_cursor(screen_line(row), 1);
	std::cout << Color::Pair{focused ? focus_ : normal_};
	Util::clear_line();

	if (const Item* item = rows_[row - 1]) {
		std::cout << ' ' << (item->icon ? kind_marker(item->kind) : "  "sv)
		          << item->name;
	}
	std::cout << Color::Reset;
}

void DisplayManager::write_overlay() const
{
	using namespace std::string_view_literals;

	Util::move_cursor(screen_line(rows_.size()), 1);
	std::cout << Color::Pair{normal_};
	Util::clear_line();
	std::cout << Color::Cyan << " > "sv << Color::Pair{normal_} << query_
	          << "▍"sv << Color::Reset;
}

DisplayManager::DisplayManager(std::string title, const size_t rows,
                               const ColorPair normal, const ColorPair focus)
        : title_(std::move(title)),
          normal_(normal),
          focus_(focus),
          rows_(rows, nullptr)
{}

void DisplayManager::draw_frame()
{
	Util::clear_screen();
	Util::show_cursor(false);
	Util::move_cursor(1, 1);
	std::cout << Color::Bold << Color::Cyan << title_ << Color::Reset;

	for (size_t row = 1; row <= rows_.size(); ++row) {
		write_row(row);
	}
	if (overlay_until_) {
		write_overlay();
	}
	std::cout << std::flush;
}

void DisplayManager::draw_rows(const std::vector<const Item*>& rows)
{
	const size_t count = rows_.size();
	rows_              = rows;
	rows_.resize(count, nullptr);
	focused_row_ = 0;

	for (size_t row = 1; row <= rows_.size(); ++row) {
		write_row(row);
	}
	std::cout << std::flush;
}

void DisplayManager::highlight_row(const size_t row, const bool focused)
{
	if (focused) {
		focused_row_ = row;
	} else if (focused_row_ == row) {
		focused_row_ = 0;
	}
	write_row(row);
	std::cout << std::flush;
}

void DisplayManager::show_filter(const std::string& query,
                                 const Clock::time_point now)
{
	query_         = query;
	overlay_until_ = now + Timing::FilterOverlay;
	write_overlay();
	std::cout << std::flush;
}

void DisplayManager::tick(const Clock::time_point now)
{
	if (!overlay_until_ || now < *overlay_until_) {
		return;
	}
	overlay_until_.reset();
	write_row(rows_.size());
	std::cout << std::flush;
}

void DisplayManager::close() const
{
	Util::move_cursor(screen_line(rows_.size()) + 1, 1);
	std::cout << Color::Reset;
	Util::show_cursor(true);
	std::cout << '\n' << std::flush;
}

[[nodiscard]] bool DisplayManager::overlay_visible() const
{
	return overlay_until_.has_value();
}

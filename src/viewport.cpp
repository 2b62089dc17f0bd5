#include "viewport.h"

#include <algorithm>
#include <stdexcept>

// ============================================================================
// Viewport
// ============================================================================

Viewport::Viewport(const size_t window_size) : window_size_(window_size)
{
	if (window_size_ == 0) {
		throw std::invalid_argument("viewport needs at least one row");
	}
}

[[nodiscard]] Redraw Viewport::reset(const size_t count)
{
	count_         = count;
	first_visible_ = 1;
	selected_      = std::min<size_t>(1, count_);
	return Redraw::Full;
}

[[nodiscard]] Redraw Viewport::move_up()
{
	if (selected_ <= 1) {
		return Redraw::None;
	}

	--selected_;
	if (selected_ < first_visible_) {
		first_visible_ = selected_;
		return Redraw::Full;
	}
	return Redraw::Highlight;
}

[[nodiscard]] Redraw Viewport::move_down()
{
	if (selected_ == None || selected_ == count_) {
		return Redraw::None;
	}

	++selected_;
	if (selected_ > logical_index_for(window_size_)) {
		++first_visible_;
		return Redraw::Full;
	}
	return Redraw::Highlight;
}

[[nodiscard]] size_t Viewport::row_for(const size_t logical_index) const
{
	return logical_index - first_visible_ + 1;
}

[[nodiscard]] size_t Viewport::logical_index_for(const size_t row) const
{
	return first_visible_ + row - 1;
}

[[nodiscard]] bool Viewport::is_visible(const size_t logical_index) const
{
	return logical_index >= first_visible_ &&
	       logical_index <= logical_index_for(window_size_);
}

[[nodiscard]] size_t Viewport::window_size() const
{
	return window_size_;
}

[[nodiscard]] size_t Viewport::count() const
{
	return count_;
}

[[nodiscard]] size_t Viewport::first_visible() const
{
	return first_visible_;
}

[[nodiscard]] size_t Viewport::selected() const
{
	return selected_;
}

[[nodiscard]] bool Viewport::has_selection() const
{
	return selected_ != None;
}

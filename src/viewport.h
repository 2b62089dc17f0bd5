#ifndef VIEWPORT_H
#define VIEWPORT_H

#include <cstddef>

// ============================================================================
// Viewport
// ============================================================================

// What a state change requires the renderer to do.
enum class Redraw {
	None,      // nothing moved
	Highlight, // recolor the previous and the new selected row
	Full,      // rewrite every visible row
};

// Fixed-size window over a result list of `count` entries. Indices are
// 1-based; a selection of 0 means the list is empty.
class Viewport {
	size_t window_size_   = 1;
	size_t count_         = 0;
	size_t first_visible_ = 1;
	size_t selected_      = 0;

public:
	static constexpr size_t None = 0;

	explicit Viewport(const size_t window_size);

	[[nodiscard]] Redraw reset(const size_t count);

	[[nodiscard]] Redraw move_up();

	[[nodiscard]] Redraw move_down();

	[[nodiscard]] size_t row_for(const size_t logical_index) const;

	[[nodiscard]] size_t logical_index_for(const size_t row) const;

	[[nodiscard]] bool is_visible(const size_t logical_index) const;

	[[nodiscard]] size_t window_size() const;

	[[nodiscard]] size_t count() const;

	[[nodiscard]] size_t first_visible() const;

	[[nodiscard]] size_t selected() const;

	[[nodiscard]] bool has_selection() const;
};

#endif

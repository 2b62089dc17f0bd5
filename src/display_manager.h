#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include "config_t.h"
#include "renderer.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// Display Manager
// ============================================================================

// ANSI terminal renderer: a title line followed by a fixed number of rows.
// While keys are being typed the last row shows the query instead of its
// item; it comes back once typing pauses.
class DisplayManager : public Renderer {
	using Clock = std::chrono::steady_clock;

	std::string title_                              = {};
	ColorPair normal_                               = {};
	ColorPair focus_                                = {};
	std::vector<const Item*> rows_                  = {};
	size_t focused_row_                             = 0;
	std::string query_                              = {};
	std::optional<Clock::time_point> overlay_until_ = {};

	[[nodiscard]] static size_t screen_line(const size_t row);

	[[nodiscard]] bool covered(const size_t row) const;

	void write_row(const size_t row) const;

	void write_overlay() const;

public:
	DisplayManager(std::string title, const size_t rows, const ColorPair normal,
	               const ColorPair focus);

	void draw_frame();

	void draw_rows(const std::vector<const Item*>& rows) override;

	void highlight_row(const size_t row, const bool focused) override;

	// Shows the query on the last row until `now` + the overlay delay; a
	// further call restarts the delay.
	void show_filter(const std::string& query, const Clock::time_point now);

	void tick(const Clock::time_point now);

	void close() const;

	[[nodiscard]] bool overlay_visible() const;
};

#endif

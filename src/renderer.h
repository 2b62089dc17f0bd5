#ifndef RENDERER_H
#define RENDERER_H

#include "item_t.h"

#include <cstddef>
#include <vector>

// ============================================================================
// Renderer
// ============================================================================

class Renderer {
public:
	virtual ~Renderer() = default;

	// One entry per visible row, top to bottom; nullptr is an empty row.
	// Every row is drawn with the normal colors.
	virtual void draw_rows(const std::vector<const Item*>& rows) = 0;

	// Recolors a single 1-based row with the focus or the normal colors.
	virtual void highlight_row(const size_t row, const bool focused) = 0;
};

#endif

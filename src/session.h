#ifndef SESSION_H
#define SESSION_H

#include "catalog.h"
#include "catalog_source.h"
#include "filter_cache.h"
#include "key_event_t.h"
#include "query_history.h"
#include "renderer.h"
#include "viewport.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// ============================================================================
// Session
// ============================================================================

enum class SessionState {
	Idle,
	Active,
};

// Owns the catalog and all search state of one launcher instance and turns
// key events into filter, history and viewport changes. Only one thread may
// use a Session.
class Session {
public:
	using DoneCallback = std::function<void()>;
	using Executor     = std::function<void(const std::string&)>;

private:
	CatalogSource& source_;
	Renderer& renderer_;
	Executor executor_;

	Catalog catalog_;
	FilterCache cache_;
	QueryHistory history_ = {};
	Viewport viewport_;

	std::shared_ptr<const ResultList> results_ = {};
	SessionState state_                        = SessionState::Idle;
	DoneCallback done_                         = {};

	void show_results(std::shared_ptr<const ResultList> results);

	void apply(const Redraw redraw, const size_t previous_selected);

	void draw_visible_rows();

	void focus_selected(const bool focused);

	void append_char(const char c);

	void remove_last_char();

	void refresh();

	void confirm();

	void cancel();

public:
	Session(std::vector<Item> items, CatalogSource& source, Renderer& renderer,
	        Executor executor, const size_t window_size);

	Session(const Session&)            = delete;
	Session& operator=(const Session&) = delete;

	void start(DoneCallback done = {});

	void stop();

	// Clean slate: empty query, no history, full catalog, first row selected.
	void init_list();

	void handle(const KeyEvent& event);

	[[nodiscard]] SessionState state() const;

	[[nodiscard]] const std::string& query() const;

	[[nodiscard]] const QueryHistory& history() const;

	[[nodiscard]] const FilterCache& cache() const;

	[[nodiscard]] const Catalog& catalog() const;

	[[nodiscard]] const Viewport& viewport() const;

	[[nodiscard]] const ResultList& results() const;

	[[nodiscard]] const Item* selected_item() const;

	[[nodiscard]] std::vector<const Item*> visible_rows() const;
};

#endif

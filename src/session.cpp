#include "session.h"

#include <cctype>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <variant>

// ============================================================================
// Session
// ============================================================================

void Session::show_results(std::shared_ptr<const ResultList> results)
{
	results_ = std::move(results);
	apply(viewport_.reset(results_->size()), Viewport::None);
}

void Session::apply(const Redraw redraw, const size_t previous_selected)
{
	switch (redraw) {
	case Redraw::None: break;
	case Redraw::Highlight:
		renderer_.highlight_row(viewport_.row_for(previous_selected), false);
		focus_selected(true);
		break;
	case Redraw::Full:
		draw_visible_rows();
		if (state_ == SessionState::Active) {
			focus_selected(true);
		}
		break;
	}
}

void Session::draw_visible_rows()
{
	renderer_.draw_rows(visible_rows());
}

void Session::focus_selected(const bool focused)
{
	if (!viewport_.has_selection()) {
		return;
	}
	renderer_.highlight_row(viewport_.row_for(viewport_.selected()), focused);
}

void Session::append_char(const char c)
{
	const auto& current = history_.current();
	auto next           = current + static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

	const auto result    = cache_.filter(next, current);
	const auto* accepted = std::get_if<Accepted>(&result);
	if (!accepted) {
		return;
	}

	history_.accept(std::move(next));
	show_results(accepted->results);
}

void Session::remove_last_char()
{
	const auto previous = history_.peek();
	if (!previous) {
		return;
	}

	// Every query on the stack was accepted, and therefore cached, before
	// it was superseded.
	if (!cache_.contains(*previous)) {
		throw std::logic_error("query history out of sync with filter cache at \"" +
		                       *previous + "\"");
	}

	const auto result    = cache_.filter(*previous, "");
	const auto* accepted = std::get_if<Accepted>(&result);
	if (!accepted || !accepted->cache_hit) {
		throw std::logic_error("cached query \"" + *previous + "\" was rescanned");
	}

	static_cast<void>(history_.undo());
	show_results(accepted->results);
}

void Session::refresh()
{
	using namespace std::string_view_literals;

	std::optional<std::vector<Item>> items = {};
	try {
		items = source_.rescan();
	} catch (const std::exception& e) {
		std::cerr << "Refresh failed: "sv << e.what() << '\n';
		return;
	}

	if (!items) {
		std::cerr << "Refresh failed: catalog source returned nothing\n"sv;
		return;
	}

	catalog_.rebuild(std::move(*items));
	cache_.reset();
	init_list();
}

void Session::confirm()
{
	const Item* item = selected_item();
	if (!item || item->command.empty()) {
		return;
	}

	const std::string command = item->command;
	cancel();
	if (executor_) {
		executor_(command);
	}
}

void Session::cancel()
{
	stop();
	if (done_) {
		done_();
	}
}

Session::Session(std::vector<Item> items, CatalogSource& source,
                 Renderer& renderer, Executor executor, const size_t window_size)
        : source_(source),
          renderer_(renderer),
          executor_(std::move(executor)),
          catalog_(std::move(items)),
          cache_(catalog_),
          viewport_(window_size)
{
	init_list();
}

void Session::start(DoneCallback done)
{
	if (state_ == SessionState::Active) {
		return;
	}
	done_  = std::move(done);
	state_ = SessionState::Active;
	focus_selected(true);
}

void Session::stop()
{
	if (state_ == SessionState::Idle) {
		return;
	}
	state_ = SessionState::Idle;
	focus_selected(false);
}

void Session::init_list()
{
	history_.clear();

	const auto result    = cache_.filter("", "");
	const auto* accepted = std::get_if<Accepted>(&result);
	if (!accepted) {
		throw std::logic_error("empty query missing from filter cache");
	}
	show_results(accepted->results);
}

void Session::handle(const KeyEvent& event)
{
	if (state_ != SessionState::Active) {
		return;
	}

	std::visit(
	        [this](auto&& key) {
		        using T = std::decay_t<decltype(key)>;

		        if constexpr (std::is_same_v<T, CharKey>) {
			        append_char(key.c);
		        } else if constexpr (std::is_same_v<T, Backspace>) {
			        remove_last_char();
		        } else if constexpr (std::is_same_v<T, MoveUp>) {
			        const size_t previous = viewport_.selected();
			        apply(viewport_.move_up(), previous);
		        } else if constexpr (std::is_same_v<T, MoveDown>) {
			        const size_t previous = viewport_.selected();
			        apply(viewport_.move_down(), previous);
		        } else if constexpr (std::is_same_v<T, Confirm>) {
			        confirm();
		        } else if constexpr (std::is_same_v<T, Refresh>) {
			        refresh();
		        } else if constexpr (std::is_same_v<T, Cancel>) {
			        cancel();
		        }
	        },
	        event);
}

[[nodiscard]] SessionState Session::state() const
{
	return state_;
}

[[nodiscard]] const std::string& Session::query() const
{
	return history_.current();
}

[[nodiscard]] const QueryHistory& Session::history() const
{
	return history_;
}

[[nodiscard]] const FilterCache& Session::cache() const
{
	return cache_;
}

[[nodiscard]] const Catalog& Session::catalog() const
{
	return catalog_;
}

[[nodiscard]] const Viewport& Session::viewport() const
{
	return viewport_;
}

[[nodiscard]] const ResultList& Session::results() const
{
	return *results_;
}

[[nodiscard]] const Item* Session::selected_item() const
{
	if (!viewport_.has_selection()) {
		return nullptr;
	}
	return &catalog_.item((*results_)[viewport_.selected() - 1].index);
}

[[nodiscard]] std::vector<const Item*> Session::visible_rows() const
{
	std::vector<const Item*> rows(viewport_.window_size(), nullptr);

	for (size_t row = 1; row <= rows.size(); ++row) {
		const size_t index = viewport_.logical_index_for(row);
		if (index <= results_->size()) {
			rows[row - 1] = &catalog_.item((*results_)[index - 1].index);
		}
	}
	return rows;
}

#include "query_history.h"

// ============================================================================
// Query History
// ============================================================================

[[nodiscard]] const std::string& QueryHistory::current() const
{
	return current_;
}

void QueryHistory::accept(std::string query)
{
	stack_.push_back(std::move(current_));
	current_ = std::move(query);
}

[[nodiscard]] std::optional<std::string> QueryHistory::peek() const
{
	if (stack_.empty()) {
		return std::nullopt;
	}
	return stack_.back();
}

[[nodiscard]] std::optional<std::string> QueryHistory::undo()
{
	if (stack_.empty()) {
		return std::nullopt;
	}
	current_ = std::move(stack_.back());
	stack_.pop_back();
	return current_;
}

void QueryHistory::clear()
{
	current_.clear();
	stack_.clear();
}

[[nodiscard]] bool QueryHistory::empty() const
{
	return stack_.empty();
}

[[nodiscard]] size_t QueryHistory::depth() const
{
	return stack_.size();
}

[[nodiscard]] const std::vector<std::string>& QueryHistory::entries() const
{
	return stack_;
}

#ifndef QUERY_HISTORY_H
#define QUERY_HISTORY_H

#include <optional>
#include <string>
#include <vector>

// ============================================================================
// Query History
// ============================================================================

// The accepted query and every query it superseded, newest last. Undoing
// the last character restores the previous query verbatim instead of
// editing the string.
class QueryHistory {
	std::string current_            = {};
	std::vector<std::string> stack_ = {};

public:
	[[nodiscard]] const std::string& current() const;

	void accept(std::string query);

	[[nodiscard]] std::optional<std::string> peek() const;

	[[nodiscard]] std::optional<std::string> undo();

	void clear();

	[[nodiscard]] bool empty() const;

	[[nodiscard]] size_t depth() const;

	[[nodiscard]] const std::vector<std::string>& entries() const;
};

#endif

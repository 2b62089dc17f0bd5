#include "filter_cache.h"

#include <algorithm>

// ============================================================================
// Filter Cache
// ============================================================================

void FilterCache::sync_with_catalog()
{
	if (generation_ != catalog_.generation()) {
		reset();
	}
}

[[nodiscard]] ResultList FilterCache::scan(const std::string_view query,
                                           const ResultList* candidates) const
{
	ResultList matches = {};

	const auto test = [&](const size_t index) {
		const auto pos = std::string_view(catalog_.item(index).name_lower).find(query);
		if (pos != std::string_view::npos) {
			matches.emplace_back(index, pos);
		}
	};

	if (candidates) {
		for (const auto& candidate : *candidates) {
			test(candidate.index);
		}
	} else {
		for (size_t i = 0; i < catalog_.size(); ++i) {
			test(i);
		}
	}

	// The catalog index breaks ties between equal folded names, so the order
	// does not depend on which candidate list was searched.
	std::ranges::sort(matches, [this](const Match& a, const Match& b) {
		if (a.offset != b.offset) {
			return a.offset < b.offset;
		}
		const auto& a_name = catalog_.item(a.index).name_lower;
		const auto& b_name = catalog_.item(b.index).name_lower;
		if (a_name != b_name) {
			return a_name < b_name;
		}
		return a.index < b.index;
	});
	return matches;
}

FilterCache::FilterCache(const Catalog& catalog) : catalog_(catalog)
{
	reset();
}

void FilterCache::reset()
{
	results_.clear();
	rejected_.clear();
	generation_ = catalog_.generation();

	auto all = std::make_shared<ResultList>();
	all->reserve(catalog_.size());
	for (size_t i = 0; i < catalog_.size(); ++i) {
		all->emplace_back(i, 0);
	}
	results_.emplace("", std::move(all));
}

[[nodiscard]] FilterResult FilterCache::filter(const std::string& query,
                                               const std::string& previous_query)
{
	sync_with_catalog();

	if (rejected_.contains(query)) {
		return Rejected{};
	}

	if (const auto it = results_.find(query); it != results_.end()) {
		return Accepted{it->second, true};
	}

	// Only valid because queries grow one character at a time, so the
	// previous query's matches are a superset of this one's.
	const ResultList* candidates = nullptr;
	if (const auto it = results_.find(previous_query); it != results_.end()) {
		candidates = it->second.get();
	}

	++scan_count_;
	auto matches = scan(query, candidates);

	if (matches.empty()) {
		rejected_.insert(query);
		return Rejected{};
	}

	auto shared = std::make_shared<const ResultList>(std::move(matches));
	results_.emplace(query, shared);
	return Accepted{std::move(shared), false};
}

[[nodiscard]] bool FilterCache::contains(const std::string& query) const
{
	return generation_ == catalog_.generation() && results_.contains(query);
}

[[nodiscard]] bool FilterCache::is_rejected(const std::string& query) const
{
	return generation_ == catalog_.generation() && rejected_.contains(query);
}

[[nodiscard]] size_t FilterCache::scan_count() const
{
	return scan_count_;
}

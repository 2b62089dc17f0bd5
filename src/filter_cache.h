#ifndef FILTER_CACHE_H
#define FILTER_CACHE_H

#include "catalog.h"
#include "item_t.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>

// ============================================================================
// Filter Cache
// ============================================================================

struct Accepted {
	std::shared_ptr<const ResultList> results = {};
	bool cache_hit                            = {};
};

struct Rejected {};

using FilterResult = std::variant<Accepted, Rejected>;

// Memoized substring filter over a Catalog.
//
// Every query that produced matches is kept with its ordered result list,
// every query that produced none is remembered as rejected. A query that
// extends a cached one by a single character is searched within the cached
// results only. Both maps are dropped whenever the catalog is rebuilt; the
// empty query is always seeded with the full catalog order.
class FilterCache {
	const Catalog& catalog_;
	uint64_t generation_ = 0;
	size_t scan_count_   = 0;

	std::unordered_map<std::string, std::shared_ptr<const ResultList>> results_ = {};
	std::unordered_set<std::string> rejected_ = {};

	void sync_with_catalog();

	[[nodiscard]] ResultList scan(const std::string_view query,
	                              const ResultList* candidates) const;

public:
	explicit FilterCache(const Catalog& catalog);

	// Drops every cached result and reseeds the empty query.
	void reset();

	[[nodiscard]] FilterResult filter(const std::string& query,
	                                  const std::string& previous_query);

	[[nodiscard]] bool contains(const std::string& query) const;

	[[nodiscard]] bool is_rejected(const std::string& query) const;

	// Number of filter passes that had to walk a candidate list.
	[[nodiscard]] size_t scan_count() const;
};

#endif

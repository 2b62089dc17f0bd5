#include "filter_cache.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;

namespace {

std::vector<Item> launcher_items()
{
	return make_items({
	        {ItemKind::Application, "Firefox"},
	        {ItemKind::Executable, "firefox-esr"},
	        {ItemKind::Document, "file.pdf"},
	});
}

std::vector<std::string> names(const Catalog& catalog, const ResultList& results)
{
	std::vector<std::string> out = {};
	for (const auto& match : results) {
		out.push_back(catalog.item(match.index).name);
	}
	return out;
}

const Accepted& accepted(const FilterResult& result)
{
	const auto* ok = std::get_if<Accepted>(&result);
	if (!ok) {
		throw std::runtime_error("filter was rejected");
	}
	return *ok;
}

} // namespace

TEST(FilterCache, EmptyQueryIsTheCatalogOrder)
{
	const Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	const auto result = cache.filter("", "anything");
	const auto& ok    = accepted(result);

	EXPECT_TRUE(ok.cache_hit);
	EXPECT_EQ(names(catalog, *ok.results),
	          (std::vector{"Firefox"s, "firefox-esr"s, "file.pdf"s}));
	EXPECT_EQ(cache.scan_count(), 0u);
}

TEST(FilterCache, NarrowsOneCharacterAtATime)
{
	const Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	const auto f = cache.filter("f", "");
	EXPECT_EQ(names(catalog, *accepted(f).results),
	          (std::vector{"file.pdf"s, "Firefox"s, "firefox-esr"s}));

	static_cast<void>(cache.filter("fi", "f"));
	const auto fir = cache.filter("fir", "fi");
	EXPECT_EQ(names(catalog, *accepted(fir).results),
	          (std::vector{"Firefox"s, "firefox-esr"s}));

	const auto fire = cache.filter("fire", "fir");
	EXPECT_EQ(names(catalog, *accepted(fire).results),
	          (std::vector{"Firefox"s, "firefox-esr"s}));
	EXPECT_EQ(cache.scan_count(), 4u);
}

TEST(FilterCache, EarliestMatchRanksFirst)
{
	const Catalog catalog(make_items({
	        {ItemKind::Application, "VSCode"},
	        {ItemKind::Application, "Decoder"},
	        {ItemKind::Application, "Code"},
	        {ItemKind::Document, "barcode.txt"},
	}));
	FilterCache cache(catalog);

	const auto result = cache.filter("code", "");
	const auto& ok    = accepted(result);

	EXPECT_EQ(names(catalog, *ok.results),
	          (std::vector{"Code"s, "Decoder"s, "VSCode"s, "barcode.txt"s}));

	std::vector<size_t> offsets = {};
	for (const auto& match : *ok.results) {
		offsets.push_back(match.offset);
	}
	EXPECT_EQ(offsets, (std::vector<size_t>{0, 2, 2, 3}));
}

TEST(FilterCache, OffsetIsTheLeftmostOccurrence)
{
	const Catalog catalog(make_items({{ItemKind::Document, "abcabc"}}));
	FilterCache cache(catalog);

	const auto result = cache.filter("bc", "");
	ASSERT_EQ(accepted(result).results->size(), 1u);
	EXPECT_EQ(accepted(result).results->front().offset, 1u);
}

TEST(FilterCache, PrefixOfAnotherNameSortsFirst)
{
	const Catalog catalog(make_items({
	        {ItemKind::Executable, "gimp-console"},
	        {ItemKind::Application, "GIMP"},
	        {ItemKind::Executable, "gimp-2.10"},
	}));
	FilterCache cache(catalog);

	const auto result = cache.filter("gimp", "");
	EXPECT_EQ(names(catalog, *accepted(result).results),
	          (std::vector{"GIMP"s, "gimp-2.10"s, "gimp-console"s}));
}

TEST(FilterCache, RepeatedQueryIsServedFromCache)
{
	const Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	const auto first  = cache.filter("fox", "");
	const auto second = cache.filter("fox", "");

	EXPECT_FALSE(accepted(first).cache_hit);
	EXPECT_TRUE(accepted(second).cache_hit);
	EXPECT_EQ(accepted(first).results, accepted(second).results);
	EXPECT_EQ(cache.scan_count(), 1u);
}

TEST(FilterCache, RejectedQueryStaysRejectedWithoutRescan)
{
	const Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	EXPECT_TRUE(std::holds_alternative<Rejected>(cache.filter("firez", "")));
	EXPECT_TRUE(cache.is_rejected("firez"));
	EXPECT_FALSE(cache.contains("firez"));

	EXPECT_TRUE(std::holds_alternative<Rejected>(cache.filter("firez", "fire")));
	EXPECT_TRUE(std::holds_alternative<Rejected>(cache.filter("firez", "")));
	EXPECT_EQ(cache.scan_count(), 1u);
}

TEST(FilterCache, SearchesWithinThePreviousResults)
{
	const Catalog catalog(make_items({
	        {ItemKind::Application, "ab"},
	        {ItemKind::Application, "xab"},
	}));
	FilterCache cache(catalog);

	static_cast<void>(cache.filter("x", ""));

	// "ab" is not derived from "x"; only the cached "x" results are searched
	const auto result = cache.filter("ab", "x");
	EXPECT_EQ(names(catalog, *accepted(result).results), (std::vector{"xab"s}));
}

TEST(FilterCache, UnknownPreviousQueryFallsBackToCatalog)
{
	const Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	const auto result = cache.filter("esr", "never-seen");
	EXPECT_EQ(names(catalog, *accepted(result).results), (std::vector{"firefox-esr"s}));
}

TEST(FilterCache, IncrementalMatchesDirectFiltering)
{
	const Catalog catalog(make_items({
	        {ItemKind::Application, "Terminal"},
	        {ItemKind::Application, "Text Editor"},
	        {ItemKind::Application, "Thunderbird"},
	        {ItemKind::Executable, "tee"},
	        {ItemKind::Executable, "test"},
	        {ItemKind::Executable, "tmux"},
	        {ItemKind::Executable, "latex"},
	        {ItemKind::Document, "letter.odt"},
	        {ItemKind::Document, "TeX notes.tex"},
	        {ItemKind::Document, "contest.md"},
	}));

	for (const std::string target : {"te", "tex", "test", "ter", "e"}) {
		FilterCache incremental(catalog);
		std::string previous = {};
		std::optional<FilterResult> last = {};
		for (const char c : target) {
			const std::string next = previous + c;
			last                   = incremental.filter(next, previous);
			previous               = next;
		}

		FilterCache direct(catalog);
		const auto expected = direct.filter(target, "");

		ASSERT_TRUE(last.has_value());
		ASSERT_EQ(std::holds_alternative<Accepted>(*last),
		          std::holds_alternative<Accepted>(expected))
		        << target;
		if (std::holds_alternative<Accepted>(expected)) {
			EXPECT_EQ(names(catalog, *accepted(*last).results),
			          names(catalog, *accepted(expected).results))
			        << target;
		}
	}
}

TEST(FilterCache, DuplicateNamesKeepCatalogOrderOnEveryPath)
{
	std::vector<Item> items = {};
	for (int i = 0; i < 20; ++i) {
		const auto name = "ab" + std::to_string(10 + i);
		items.push_back(make_item(ItemKind::Application, name, "app " + name));
		items.push_back(make_item(ItemKind::Executable, name, "bin " + name));
		items.push_back(make_item(ItemKind::Document, "x" + name, "doc " + name));
		items.push_back(make_item(ItemKind::Document, "x" + name, "doc2 " + name));
	}
	const Catalog catalog(std::move(items));

	FilterCache incremental(catalog);
	static_cast<void>(incremental.filter("a", ""));
	const auto narrowed = incremental.filter("ab", "a");

	FilterCache direct(catalog);
	const auto expected = direct.filter("ab", "");

	const auto& got  = *accepted(narrowed).results;
	const auto& want = *accepted(expected).results;
	ASSERT_EQ(got.size(), 80u);
	ASSERT_EQ(got.size(), want.size());
	for (size_t i = 0; i < got.size(); ++i) {
		EXPECT_EQ(got[i].index, want[i].index) << "position " << i;
	}

	// Same folded name: the application comes before the executable
	EXPECT_EQ(catalog.item(got[0].index).kind, ItemKind::Application);
	EXPECT_EQ(catalog.item(got[1].index).kind, ItemKind::Executable);
}

TEST(FilterCache, CatalogRebuildDropsCachedResults)
{
	Catalog catalog(launcher_items());
	FilterCache cache(catalog);

	static_cast<void>(cache.filter("fire", ""));
	EXPECT_TRUE(std::holds_alternative<Rejected>(cache.filter("vim", "")));

	catalog.rebuild(make_items({
	        {ItemKind::Executable, "vim"},
	        {ItemKind::Executable, "gvim"},
	}));

	EXPECT_FALSE(cache.contains("fire"));
	EXPECT_FALSE(cache.is_rejected("vim"));

	const auto all = cache.filter("", "");
	EXPECT_EQ(names(catalog, *accepted(all).results), (std::vector{"gvim"s, "vim"s}));

	const auto vim = cache.filter("vim", "");
	EXPECT_EQ(names(catalog, *accepted(vim).results), (std::vector{"vim"s, "gvim"s}));
}

TEST(FilterCache, EmptyCatalogStillAcceptsEmptyQuery)
{
	const Catalog catalog;
	FilterCache cache(catalog);

	const auto result = cache.filter("", "");
	EXPECT_TRUE(accepted(result).results->empty());
	EXPECT_TRUE(std::holds_alternative<Rejected>(cache.filter("a", "")));
}

#include "fuzzy_matcher.h"
#include "utilities.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<Item> make_items(const std::vector<std::string>& texts)
{
	std::vector<Item> items = {};
	for (const auto& text : texts) {
		items.push_back({.text = text, .folded = Util::to_lower(text), .index = items.size()});
	}
	return items;
}

std::vector<size_t> indices(const FilterResult& results)
{
	std::vector<size_t> out = {};
	for (const auto& r : results) {
		out.push_back(r.index);
	}
	return out;
}

// Deterministic pseudo-random words over a small alphabet.
std::vector<Item> generated_items(const size_t count)
{
	std::vector<std::string> texts = {};
	uint32_t state                 = 12345;
	for (size_t i = 0; i < count; ++i) {
		std::string text = {};
		const size_t len = 3 + i % 9;
		for (size_t j = 0; j < len; ++j) {
			state = state * 1103515245u + 12345u;
			text += static_cast<char>('a' + (state >> 16) % 20);
		}
		texts.push_back(text);
	}
	return make_items(texts);
}

} // namespace

// ============================================================================
// Scoring
// ============================================================================

TEST(ScoreTest, ExactMatchGetsFullBonuses)
{
	EXPECT_EQ(score_item("abc", "abc"),
	          Score::Substring + Score::PositionBonusMax + Score::CoverageBonusMax);
}

TEST(ScoreTest, SubstringBonusesDependOnPositionAndCoverage)
{
	// position 1, coverage 1/3
	EXPECT_EQ(score_item("abc", "b"), Score::Substring + 999 + 333);
}

TEST(ScoreTest, SubsequenceScoreShrinksWithGap)
{
	EXPECT_EQ(score_item("a_b_c", "abc"), Score::SubsequenceMax - 2 * Score::GapPenalty);
	EXPECT_EQ(score_item("a" + std::string(5000, 'x') + "b", "ab"), Score::SubsequenceMin);
}

TEST(ScoreTest, NonMatchesScoreNothing)
{
	EXPECT_FALSE(score_item("abc", "cb"));
	EXPECT_FALSE(score_item("ab", "abc"));
	EXPECT_EQ(score_item("abc", ""), Score::None);
}

// ============================================================================
// Filtering
// ============================================================================

TEST(FilterTest, SubstringQuery)
{
	const auto items = make_items({"apple", "banana", "cherry"});
	EXPECT_EQ(indices(filter(items, "ap")), std::vector<size_t>{0});
}

TEST(FilterTest, QueryWithoutMatches)
{
	const auto items = make_items({"apple", "banana", "cherry"});
	EXPECT_TRUE(filter(items, "ay").empty());
}

TEST(FilterTest, EmptyQueryKeepsOriginalOrder)
{
	const auto items   = make_items({"c", "a", "b"});
	const auto results = filter(items, "");

	ASSERT_EQ(results.size(), 3u);
	for (size_t i = 0; i < results.size(); ++i) {
		EXPECT_EQ(results[i].index, i);
		EXPECT_EQ(results[i].score, 0);
	}
}

TEST(FilterTest, EmptyItemSet)
{
	EXPECT_TRUE(filter({}, "abc").empty());
	EXPECT_TRUE(filter({}, "").empty());
}

TEST(FilterTest, CaseInsensitive)
{
	const auto items = make_items({"Apple", "APRICOT", "grape"});
	// apple 11400, grape 11398, apricot 11285
	EXPECT_EQ(indices(filter(items, "AP")), (std::vector<size_t>{0, 2, 1}));
}

TEST(FilterTest, CaseInsensitiveBeyondAscii)
{
	const auto items = make_items({"ÄRGER", "Ärzte", "Straße", "МОСКВА"});

	EXPECT_EQ(indices(filter(items, "ärger")), std::vector<size_t>{0});
	EXPECT_EQ(indices(filter(items, "ÄR")), (std::vector<size_t>{0, 1}));
	EXPECT_EQ(indices(filter(items, "моск")), std::vector<size_t>{3});
}

TEST(FilterTest, SubstringOutranksSubsequence)
{
	const auto items   = make_items({"a_x_b_c", "zzzzzzzzzzzzabc"});
	const auto results = filter(items, "abc");

	ASSERT_EQ(results.size(), 2u);
	EXPECT_EQ(results[0].index, 1u);
	EXPECT_GE(results[0].score, Score::Substring);
	EXPECT_LT(results[1].score, Score::Substring);
}

TEST(FilterTest, EarlierSubstringRanksHigher)
{
	const auto items = make_items({"xxab", "abxx"});
	EXPECT_EQ(indices(filter(items, "ab")), (std::vector<size_t>{1, 0}));
}

TEST(FilterTest, TiesKeepInsertionOrder)
{
	const auto items = make_items({"xab", "yab", "zab"});
	EXPECT_EQ(indices(filter(items, "ab")), (std::vector<size_t>{0, 1, 2}));
}

TEST(FilterTest, EveryResultIsAFuzzyMatch)
{
	const auto items = generated_items(500);
	for (const auto* query : {"ab", "cde", "aj", "t"}) {
		for (const auto& r : filter(items, query)) {
			EXPECT_FALSE(match_positions(items[r.index].folded, query).empty())
			        << items[r.index].text << " / " << query;
		}
	}
}

TEST(FilterTest, Idempotent)
{
	const auto items = generated_items(300);
	EXPECT_EQ(filter(items, "abc"), filter(items, "abc"));
}

TEST(MatchPositionsTest, SubstringRun)
{
	EXPECT_EQ(match_positions("hello", "ell"), (std::vector<size_t>{1, 2, 3}));
}

TEST(MatchPositionsTest, GreedySubsequence)
{
	EXPECT_EQ(match_positions("a_b_c", "abc"), (std::vector<size_t>{0, 2, 4}));
}

TEST(MatchPositionsTest, NoMatch)
{
	EXPECT_TRUE(match_positions("abc", "x").empty());
	EXPECT_TRUE(match_positions("abc", "").empty());
}

// ============================================================================
// Similarity buckets
// ============================================================================

TEST(SimilarityBucketsTest, SignatureIsCharacterSet)
{
	EXPECT_EQ(SimilarityBuckets::signature("abba"), SimilarityBuckets::signature("ab"));
	EXPECT_NE(SimilarityBuckets::signature("ab"), SimilarityBuckets::signature("ac"));
}

TEST(SimilarityBucketsTest, GroupsItemsWithSameCharacters)
{
	const auto items = make_items({"ab", "ba", "abab", "cd"});

	SimilarityBuckets buckets = {};
	buckets.index(items);

	EXPECT_EQ(buckets.bucket_count(), 2u);
	EXPECT_EQ(buckets.indexed(), 4u);
}

TEST(SimilarityBucketsTest, MatchesUnbucketedFilter)
{
	const auto items = generated_items(3000);

	SimilarityBuckets buckets = {};
	buckets.index(items);

	for (const auto* query : {"", "a", "ab", "ebc", "jjj", "atq", "st"}) {
		EXPECT_EQ(buckets.filter(items, query), filter(items, query)) << query;
	}
}

// ============================================================================
// Caching matcher
// ============================================================================

TEST(FuzzyMatcherTest, RepeatedQueryHitsCache)
{
	const auto items = make_items({"apple", "banana", "cherry"});
	FuzzyMatcher matcher(4);

	const auto first  = matcher.filter(items, "an");
	const auto second = matcher.filter(items, "AN");

	EXPECT_EQ(first, second);
	EXPECT_EQ(matcher.cache_hits(), 1u);
	EXPECT_EQ(matcher.cache_misses(), 1u);
}

TEST(FuzzyMatcherTest, CachedResultsEqualFreshResults)
{
	const auto items = generated_items(4000);
	FuzzyMatcher matcher(8);

	for (const auto* query : {"ab", "cd", "ab", "efg", "cd"}) {
		EXPECT_EQ(matcher.filter(items, query), filter(items, query)) << query;
	}
	EXPECT_EQ(matcher.cache_hits(), 2u);
}

TEST(FuzzyMatcherTest, NewItemsInvalidateCache)
{
	auto items = make_items({"apple"});
	FuzzyMatcher matcher(4);

	EXPECT_EQ(matcher.filter(items, "a").size(), 1u);

	items.push_back({.text = "avocado", .folded = "avocado", .index = 1});
	EXPECT_EQ(matcher.filter(items, "a").size(), 2u);
	EXPECT_EQ(matcher.cache_hits(), 0u);
}

TEST(FuzzyMatcherTest, EvictsLeastRecentlyUsed)
{
	const auto items = make_items({"abc"});
	FuzzyMatcher matcher(2);

	(void)matcher.filter(items, "a");
	(void)matcher.filter(items, "b");
	(void)matcher.filter(items, "a"); // refreshes "a"
	(void)matcher.filter(items, "c"); // evicts "b"
	EXPECT_EQ(matcher.cache_size(), 2u);

	(void)matcher.filter(items, "a");
	EXPECT_EQ(matcher.cache_hits(), 2u);

	(void)matcher.filter(items, "b");
	EXPECT_EQ(matcher.cache_hits(), 2u);
}

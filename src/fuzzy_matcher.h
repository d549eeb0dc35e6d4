#ifndef FUZZY_MATCHER_H
#define FUZZY_MATCHER_H

#include "command_t.h"
#include "item_t.h"

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// ============================================================================
// Matching Engine
// ============================================================================

namespace Score {
constexpr int Substring        = 10000;
constexpr int PositionBonusMax = 1000;
constexpr int CoverageBonusMax = 1000;
constexpr int SubsequenceMax   = 9000;
constexpr int SubsequenceMin   = 1;
constexpr int GapPenalty       = 10;
constexpr int None             = 0;
} // namespace Score

struct SearchResult {
	size_t index = {}; // original insertion index
	int score    = {};

	bool operator==(const SearchResult&) const = default;
};

using FilterResult = std::vector<SearchResult>;

// Both arguments must already be case-folded. Returns nullopt when the
// query is neither a substring nor an in-order subsequence of the item.
[[nodiscard]] std::optional<int> score_item(const std::string_view item,
                                            const std::string_view query);

// Ranks every matching item: score descending, original order on ties.
// An empty query returns all items in original order with score 0.
[[nodiscard]] FilterResult filter(const std::vector<Item>& items,
                                  const std::string_view query);

// Byte offsets of the matched query characters inside a folded item.
[[nodiscard]] std::vector<size_t> match_positions(const std::string_view item,
                                                  const std::string_view query);

// ============================================================================
// Similarity buckets
// ============================================================================

// Groups items by the set of characters they contain. A bucket whose
// signature lacks any query character cannot hold a match and is skipped
// as a whole, so results are the same as the unbucketed filter.
class SimilarityBuckets {
	struct Bucket {
		uint64_t signature          = {};
		std::vector<size_t> members = {};
	};

	std::vector<Bucket> buckets_                       = {};
	std::unordered_map<uint64_t, size_t> by_signature_ = {};
	size_t indexed_                                    = 0;

public:
	[[nodiscard]] static uint64_t signature(const std::string_view folded);

	// Indexes items appended since the last call.
	void index(const std::vector<Item>& items);

	void clear();

	[[nodiscard]] size_t bucket_count() const;

	[[nodiscard]] size_t indexed() const;

	[[nodiscard]] FilterResult filter(const std::vector<Item>& items,
	                                  const std::string_view query) const;
};

// ============================================================================
// Caching matcher
// ============================================================================

class FuzzyMatcher {
	using CacheEntry = std::pair<std::string, FilterResult>;

	static constexpr size_t BucketThreshold = 2048;

	SimilarityBuckets buckets_ = {};
	size_t capacity_           = Display::DefaultCacheCapacity;
	std::list<CacheEntry> lru_ = {};
	std::unordered_map<std::string, std::list<CacheEntry>::iterator> cache_ = {};
	size_t hits_   = 0;
	size_t misses_ = 0;

	void remember(const std::string& key, const FilterResult& result);

public:
	explicit FuzzyMatcher(const size_t cache_capacity = Display::DefaultCacheCapacity);

	// Picks up items appended to the list and drops every cached result.
	void append(const std::vector<Item>& items);

	void invalidate();

	[[nodiscard]] FilterResult filter(const std::vector<Item>& items,
	                                  const std::string_view query);

	[[nodiscard]] size_t cache_size() const;

	[[nodiscard]] size_t cache_hits() const;

	[[nodiscard]] size_t cache_misses() const;
};

#endif

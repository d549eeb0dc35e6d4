#include "fuzzy_matcher.h"
#include "utilities.h"

#include <algorithm>
#include <ranges>

// ============================================================================
// Matching Engine
// ============================================================================

namespace {

[[nodiscard]] bool ranks_before(const SearchResult& a, const SearchResult& b)
{
	return (a.score != b.score) ? (a.score > b.score) : (a.index < b.index);
}

[[nodiscard]] int substring_score(const size_t pos, const size_t query_len,
                                  const size_t item_len)
{
	const auto position_bonus = Score::PositionBonusMax -
	                            static_cast<int>(std::min(
	                                    pos, static_cast<size_t>(Score::PositionBonusMax)));

	const auto coverage_bonus = static_cast<int>(
	        (query_len * static_cast<size_t>(Score::CoverageBonusMax)) / item_len);

	return Score::Substring + position_bonus + coverage_bonus;
}

// Greedy leftmost subsequence match; returns the summed gap between
// consecutive matched characters.
[[nodiscard]] std::optional<size_t> subsequence_gap(const std::string_view item,
                                                    const std::string_view query)
{
	size_t qi   = 0;
	size_t gap  = 0;
	size_t last = 0;

	for (size_t i = 0; i < item.size() && qi < query.size(); ++i) {
		if (item[i] != query[qi]) {
			continue;
		}
		if (qi > 0) {
			gap += i - last - 1;
		}
		last = i;
		++qi;
	}

	if (qi != query.size()) {
		return std::nullopt;
	}
	return gap;
}

[[nodiscard]] int subsequence_score(const size_t gap)
{
	const auto steps = static_cast<int>(std::min(gap, static_cast<size_t>(Score::SubsequenceMax)));
	return std::max(Score::SubsequenceMin, Score::SubsequenceMax - steps * Score::GapPenalty);
}

} // namespace

[[nodiscard]] std::optional<int> score_item(const std::string_view item,
                                            const std::string_view query)
{
	if (query.empty()) {
		return Score::None;
	}
	if (item.size() < query.size()) {
		return std::nullopt;
	}

	if (const auto pos = item.find(query); pos != std::string_view::npos) {
		return substring_score(pos, query.size(), item.size());
	}

	if (const auto gap = subsequence_gap(item, query)) {
		return subsequence_score(*gap);
	}
	return std::nullopt;
}

[[nodiscard]] FilterResult filter(const std::vector<Item>& items,
                                  const std::string_view query)
{
	FilterResult results = {};

	if (query.empty()) {
		results.reserve(items.size());
		for (const auto& item : items) {
			results.push_back({item.index, Score::None});
		}
		return results;
	}

	const auto folded = Util::to_lower(query);
	for (const auto& item : items) {
		if (const auto s = score_item(item.folded, folded)) {
			results.push_back({item.index, *s});
		}
	}

	std::ranges::sort(results, ranks_before);
	return results;
}

[[nodiscard]] std::vector<size_t> match_positions(const std::string_view item,
                                                  const std::string_view query)
{
	std::vector<size_t> positions = {};
	if (query.empty()) {
		return positions;
	}

	if (const auto pos = item.find(query); pos != std::string_view::npos) {
		for (size_t i = 0; i < query.size(); ++i) {
			positions.push_back(pos + i);
		}
		return positions;
	}

	size_t qi = 0;
	for (size_t i = 0; i < item.size() && qi < query.size(); ++i) {
		if (item[i] == query[qi]) {
			positions.push_back(i);
			++qi;
		}
	}

	if (qi != query.size()) {
		positions.clear();
	}
	return positions;
}

// ============================================================================
// Similarity buckets
// ============================================================================

[[nodiscard]] uint64_t SimilarityBuckets::signature(const std::string_view folded)
{
	uint64_t bits = 0;
	for (const unsigned char c : folded) {
		unsigned bit = 63;
		if (c >= 'a' && c <= 'z') {
			bit = c - 'a';
		} else if (c >= '0' && c <= '9') {
			bit = 26 + (c - '0');
		} else if (c < 0x80) {
			bit = 36 + (c % 27);
		}
		bits |= uint64_t{1} << bit;
	}
	return bits;
}

void SimilarityBuckets::index(const std::vector<Item>& items)
{
	for (; indexed_ < items.size(); ++indexed_) {
		const auto sig = signature(items[indexed_].folded);

		auto it = by_signature_.find(sig);
		if (it == by_signature_.end()) {
			it = by_signature_.emplace(sig, buckets_.size()).first;
			buckets_.push_back({.signature = sig});
		}
		buckets_[it->second].members.push_back(indexed_);
	}
}

void SimilarityBuckets::clear()
{
	buckets_.clear();
	by_signature_.clear();
	indexed_ = 0;
}

[[nodiscard]] size_t SimilarityBuckets::bucket_count() const
{
	return buckets_.size();
}

[[nodiscard]] size_t SimilarityBuckets::indexed() const
{
	return indexed_;
}

[[nodiscard]] FilterResult SimilarityBuckets::filter(const std::vector<Item>& items,
                                                     const std::string_view query) const
{
	if (query.empty()) {
		return ::filter(items, query);
	}

	const auto folded = Util::to_lower(query);
	const auto wanted = signature(folded);

	FilterResult results = {};
	for (const auto& bucket : buckets_) {
		if ((wanted & ~bucket.signature) != 0) {
			continue;
		}
		for (const auto idx : bucket.members) {
			if (idx >= items.size()) {
				continue;
			}
			if (const auto s = score_item(items[idx].folded, folded)) {
				results.push_back({items[idx].index, *s});
			}
		}
	}

	std::ranges::sort(results, ranks_before);
	return results;
}

// ============================================================================
// Caching matcher
// ============================================================================

FuzzyMatcher::FuzzyMatcher(const size_t cache_capacity)
        : capacity_(std::max(size_t(1), cache_capacity))
{}

void FuzzyMatcher::append(const std::vector<Item>& items)
{
	if (items.size() < buckets_.indexed()) {
		buckets_.clear();
	}
	buckets_.index(items);
	invalidate();
}

void FuzzyMatcher::invalidate()
{
	lru_.clear();
	cache_.clear();
}

void FuzzyMatcher::remember(const std::string& key, const FilterResult& result)
{
	lru_.emplace_front(key, result);
	cache_[key] = lru_.begin();

	while (lru_.size() > capacity_) {
		cache_.erase(lru_.back().first);
		lru_.pop_back();
	}
}

[[nodiscard]] FilterResult FuzzyMatcher::filter(const std::vector<Item>& items,
                                                const std::string_view query)
{
	if (items.size() != buckets_.indexed()) {
		append(items);
	}

	const auto key = Util::to_lower(query);

	if (const auto it = cache_.find(key); it != cache_.end()) {
		lru_.splice(lru_.begin(), lru_, it->second);
		++hits_;
		return it->second->second;
	}

	++misses_;
	auto result = (items.size() >= BucketThreshold) ? buckets_.filter(items, key)
	                                                : ::filter(items, key);
	remember(key, result);
	return result;
}

[[nodiscard]] size_t FuzzyMatcher::cache_size() const
{
	return lru_.size();
}

[[nodiscard]] size_t FuzzyMatcher::cache_hits() const
{
	return hits_;
}

[[nodiscard]] size_t FuzzyMatcher::cache_misses() const
{
	return misses_;
}

#include "benchmark.h"
#include "fuzzy_matcher.h"
#include "utilities.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <string>

// ============================================================================
// Filtering benchmark
// ============================================================================

namespace Benchmark {

[[nodiscard]] std::vector<Item> sequential_items(const size_t count)
{
	std::vector<Item> items = {};
	items.reserve(count);

	for (size_t i = 0; i < count; ++i) {
		char name[32] = {};
		std::snprintf(name, sizeof(name), "item_%05zu", i);
		items.push_back({.text = name, .folded = Util::to_lower(name), .index = i});
	}
	return items;
}

[[nodiscard]] Measurement measure(const std::vector<Item>& items, const std::string_view query,
                                  const size_t iterations)
{
	FuzzyMatcher matcher;
	matcher.append(items);

	const size_t rounds = std::max(iterations, size_t(1));
	size_t results      = 0;

	const auto start = std::chrono::steady_clock::now();
	for (size_t i = 0; i < rounds; ++i) {
		matcher.invalidate();
		results = matcher.filter(items, query).size();
	}
	const auto elapsed = std::chrono::duration<double, std::micro>(
	        std::chrono::steady_clock::now() - start);

	return {.query      = query,
	        .average_us = elapsed.count() / static_cast<double>(rounds),
	        .results    = results};
}

void run(std::ostream& out, const std::vector<size_t>& sizes, const size_t iterations)
{
	out << "Filtering benchmark (" << iterations << " iterations per query)\n";

	for (const auto size : sizes) {
		const auto items = sequential_items(size);

		out << '\n' << size << " items:\n";
		for (const auto query : Queries) {
			const auto m = measure(items, query, iterations);
			out << "  Query '" << m.query << "': " << std::fixed << std::setprecision(2)
			    << m.average_us << "us avg, " << m.results << " results\n";
		}
	}
	out << std::flush;
}

} // namespace Benchmark

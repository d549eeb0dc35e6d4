#ifndef BENCHMARK_H
#define BENCHMARK_H

#include "item_t.h"

#include <array>
#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

// ============================================================================
// Filtering benchmark
// ============================================================================

namespace Benchmark {

constexpr std::array<size_t, 4> Sizes             = {100, 1000, 10000, 50000};
constexpr std::array<std::string_view, 4> Queries = {"item", "item_1", "item_12", "item_123"};
constexpr size_t Iterations                       = 10;

struct Measurement {
	std::string_view query = {};
	double average_us      = 0.0;
	size_t results         = 0;
};

// "item_00000", "item_00001", ...
[[nodiscard]] std::vector<Item> sequential_items(const size_t count);

// Average time of an uncached filter over the items.
[[nodiscard]] Measurement measure(const std::vector<Item>& items, const std::string_view query,
                                  const size_t iterations);

void run(std::ostream& out, const std::vector<size_t>& sizes, const size_t iterations);

} // namespace Benchmark

#endif

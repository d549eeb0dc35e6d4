#include "benchmark.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(BenchmarkTest, SequentialItemsArePaddedAndFolded)
{
	const auto items = Benchmark::sequential_items(12);

	ASSERT_EQ(items.size(), 12u);
	EXPECT_EQ(items[0].text, "item_00000");
	EXPECT_EQ(items[11].text, "item_00011");
	EXPECT_EQ(items[11].folded, "item_00011");
	EXPECT_EQ(items[11].index, 11u);
}

TEST(BenchmarkTest, MeasureCountsResults)
{
	const auto items = Benchmark::sequential_items(200);

	const auto all = Benchmark::measure(items, "item", 2);
	EXPECT_EQ(all.results, 200u);
	EXPECT_GE(all.average_us, 0.0);

	EXPECT_EQ(Benchmark::measure(items, "item_00199", 1).results, 1u);
	EXPECT_EQ(Benchmark::measure(items, "zzz", 1).results, 0u);
}

TEST(BenchmarkTest, MeasureUsesBucketsForLargeSets)
{
	const auto items = Benchmark::sequential_items(5000);

	EXPECT_EQ(Benchmark::measure(items, "item", 1).results, 5000u);
	EXPECT_EQ(Benchmark::measure(items, "item_04999", 1).results, 1u);
}

TEST(BenchmarkTest, RunReportsEverySizeAndQuery)
{
	std::ostringstream out;
	Benchmark::run(out, {10, 20}, 1);

	const auto text = out.str();
	EXPECT_NE(text.find("10 items:"), std::string::npos);
	EXPECT_NE(text.find("20 items:"), std::string::npos);
	EXPECT_NE(text.find("Query 'item': "), std::string::npos);
	EXPECT_NE(text.find("Query 'item_123': "), std::string::npos);
	EXPECT_NE(text.find("us avg, 20 results"), std::string::npos);
}

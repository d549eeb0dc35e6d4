#include "errors_t.h"
#include "session.h"

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(SessionTest, MutationsBecomeVisibleOnMerge)
{
	Session session;
	session.add("apple");
	session.add_batch({"banana", "cherry"});

	EXPECT_TRUE(session.items().empty());
	EXPECT_EQ(session.pending(), 2u);

	const auto report = session.merge();
	EXPECT_EQ(report.items_added, 3u);
	ASSERT_EQ(session.items().size(), 3u);
	EXPECT_EQ(session.items()[2].text, "cherry");
	EXPECT_EQ(session.items()[2].index, 2u);
	EXPECT_EQ(session.items()[0].folded, "apple");
}

TEST(SessionTest, FoldsItemsOnInsertion)
{
	Session session;
	session.add("MiXeD");
	(void)session.merge();

	EXPECT_EQ(session.items()[0].text, "MiXeD");
	EXPECT_EQ(session.items()[0].folded, "mixed");
}

TEST(SessionTest, IndicatorsByTextAndIndex)
{
	Session session;
	session.add_batch({"build", "test", "build"});
	session.set_indicator(std::string("build"), Indicators::Spinner{});
	session.set_indicator(size_t{2}, Indicators::Success{});
	(void)session.merge();

	ASSERT_NE(session.indicator_for(0), nullptr);
	EXPECT_TRUE(std::holds_alternative<Indicators::Spinner>(*session.indicator_for(0)));
	EXPECT_EQ(session.indicator_for(1), nullptr);

	// Index-keyed wins over text-keyed.
	ASSERT_NE(session.indicator_for(2), nullptr);
	EXPECT_TRUE(std::holds_alternative<Indicators::Success>(*session.indicator_for(2)));
}

TEST(SessionTest, IndexIndicatorWaitsForItsItem)
{
	Session session;
	session.add("first");
	session.set_indicator(size_t{2}, Indicators::Warning{});
	(void)session.merge();

	EXPECT_EQ(session.indicator_for(2), nullptr);

	session.add_batch({"second", "third"});
	(void)session.merge();

	EXPECT_EQ(session.indicator_for(1), nullptr);
	ASSERT_NE(session.indicator_for(2), nullptr);
	EXPECT_TRUE(std::holds_alternative<Indicators::Warning>(*session.indicator_for(2)));
}

TEST(SessionTest, NoneClearsIndicator)
{
	Session session;
	session.add("job");
	session.set_indicator(size_t{0}, Indicators::Error{});
	session.set_indicator(size_t{0}, Indicators::None{});
	(void)session.merge();

	EXPECT_EQ(session.indicator_for(0), nullptr);
}

TEST(SessionTest, AddWithIndicatorTagsNewItem)
{
	Session session;
	session.add("first");
	session.add("second", Indicators::ColoredText{.text = "new", .color = Color::Green});
	const auto report = session.merge();

	EXPECT_TRUE(report.indicators_changed);
	EXPECT_EQ(session.indicator_for(0), nullptr);

	const auto* indicator = session.indicator_for(1);
	ASSERT_NE(indicator, nullptr);
	EXPECT_EQ(std::get<Indicators::ColoredText>(*indicator).text, "new");
}

TEST(SessionTest, StartsLoadingAndFinishInputTurnsReady)
{
	Session session("Reading", "Done");
	EXPECT_TRUE(std::holds_alternative<Loading>(session.status()));
	EXPECT_TRUE(session.has_spinners());

	session.finish_input();
	const auto report = session.merge();

	EXPECT_TRUE(report.status_changed);
	EXPECT_TRUE(session.input_finished());
	ASSERT_TRUE(std::holds_alternative<Ready>(session.status()));
	EXPECT_EQ(std::get<Ready>(session.status()).message, "Done");
	EXPECT_FALSE(session.has_spinners());
}

TEST(SessionTest, FinishInputKeepsExplicitReadyStatus)
{
	Session session;
	session.set_global_status(Ready{"custom"});
	session.finish_input();
	(void)session.merge();

	EXPECT_EQ(std::get<Ready>(session.status()).message, "custom");
}

TEST(SessionTest, SpinnerIndicatorKeepsAnimationAlive)
{
	Session session;
	session.add("task", Indicators::Spinner{});
	session.set_global_status(Ready{});
	(void)session.merge();

	EXPECT_TRUE(session.has_spinners());
}

TEST(SessionTest, MutationsAfterFinishThrow)
{
	Session session;
	session.add("a");
	session.finish(Cancelled{});

	EXPECT_TRUE(session.closed());
	EXPECT_THROW(session.add_batch({"b"}), ClosedSessionError);
	EXPECT_THROW(session.add("b"), ClosedSessionError);
	EXPECT_THROW(session.set_indicator(size_t{0}, Indicators::Success{}), ClosedSessionError);
	EXPECT_THROW(session.set_global_status(Ready{}), ClosedSessionError);
	EXPECT_THROW(session.finish_input(), ClosedSessionError);
}

TEST(SessionTest, OneMergeAppliesEverythingQueued)
{
	constexpr size_t Count = 10005;

	Session session;
	for (size_t i = 0; i < Count; ++i) {
		session.add("item " + std::to_string(i));
	}

	const auto report = session.merge();
	EXPECT_EQ(report.items_added, Count);
	EXPECT_EQ(session.items().size(), Count);
	EXPECT_EQ(session.pending(), 0u);
}

TEST(SessionTest, FinishMergesMutationsAcceptedBeforeClosing)
{
	Session session;
	session.add("early");
	(void)session.merge();
	session.add_batch({"late", "later"});

	session.finish(Cancelled{});

	EXPECT_EQ(session.pending(), 0u);
	ASSERT_EQ(session.items().size(), 3u);
	EXPECT_EQ(session.items()[2].text, "later");
	EXPECT_THROW(session.add("too late"), ClosedSessionError);
}

TEST(SessionTest, ResolvesExactlyOnce)
{
	Session session;
	session.finish(Selected{.indices = {1}, .items = {"b"}});
	session.finish(Cancelled{});

	const auto outcome = session.await_result();
	ASSERT_TRUE(std::holds_alternative<Selected>(outcome));
	EXPECT_EQ(std::get<Selected>(outcome).items, std::vector<std::string>{"b"});
}

TEST(SessionTest, FailureRethrowsFromAwait)
{
	Session session;
	session.fail(std::make_exception_ptr(RenderError("no tty")));

	EXPECT_THROW((void)session.await_result(), RenderError);
	EXPECT_THROW(session.add("late"), ClosedSessionError);
}

TEST(SessionTest, TryResultTimesOutWhileRunning)
{
	Session session;
	EXPECT_FALSE(session.try_result(1ms));

	session.finish(Cancelled{});
	const auto outcome = session.try_result(1ms);
	ASSERT_TRUE(outcome);
	EXPECT_TRUE(std::holds_alternative<Cancelled>(*outcome));
}

TEST(SessionTest, AwaitUnblocksWhenFinishedFromAnotherThread)
{
	Session session;
	std::jthread renderer([&session] {
		std::this_thread::sleep_for(10ms);
		session.finish(Cancelled{});
	});

	EXPECT_TRUE(std::holds_alternative<Cancelled>(session.await_result()));
}

TEST(SessionTest, ConcurrentProducersAssignDistinctIndices)
{
	Session session;
	constexpr size_t Producers = 4;
	constexpr size_t PerThread = 250;

	{
		std::vector<std::jthread> producers = {};
		for (size_t p = 0; p < Producers; ++p) {
			producers.emplace_back([&session, p] {
				for (size_t i = 0; i < PerThread; ++i) {
					session.add(std::to_string(p) + ":" + std::to_string(i));
				}
			});
		}
	}

	size_t merged = 0;
	while (session.pending() > 0) {
		merged += session.merge().items_added;
	}

	EXPECT_EQ(merged, Producers * PerThread);
	for (size_t i = 0; i < session.items().size(); ++i) {
		EXPECT_EQ(session.items()[i].index, i);
	}
}

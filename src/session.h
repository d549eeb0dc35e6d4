#ifndef SESSION_H
#define SESSION_H

#include "command_t.h"
#include "indicator_t.h"
#include "item_t.h"
#include "outcome_t.h"
#include "safe_queue.h"

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Session
// ============================================================================

// Single source of truth for one find operation. Producers on any thread
// queue mutations; the render loop merges them once per tick and is the
// only reader of the merged state. Every mutation after finish() or fail()
// throws ClosedSessionError.
class Session {
	SafeQueue<Mutation> pending_ = {};

	// Merged state, owned by the render loop.
	std::vector<Item> items_                             = {};
	std::unordered_map<std::string, Indicator> by_text_ = {};
	std::unordered_map<size_t, Indicator> by_index_      = {};
	GlobalStatus status_                                 = Loading{};
	std::optional<std::string> ready_message_            = {};
	bool input_finished_                                 = false;

	std::promise<SelectionOutcome> promise_      = {};
	std::shared_future<SelectionOutcome> result_ = {};
	std::atomic<bool> resolved_{false};

	void enqueue(Mutation&& mutation);

	void apply_indicator(const IndicatorKey& key, Indicator indicator);

public:
	struct MergeReport {
		size_t items_added      = 0;
		bool indicators_changed = false;
		bool status_changed     = false;

		[[nodiscard]] bool any() const;
	};

	explicit Session(std::optional<std::string> loading_message = std::nullopt,
	                 std::optional<std::string> ready_message   = std::nullopt);

	Session(const Session&)            = delete;
	Session& operator=(const Session&) = delete;

	// Producer API, callable from any thread.

	void add(std::string text);

	void add(std::string text, Indicator indicator);

	void add_batch(std::vector<std::string> texts);

	void set_indicator(IndicatorKey key, Indicator indicator);

	void set_global_status(GlobalStatus status);

	// Marks the end of streaming; a Loading status turns Ready.
	void finish_input();

	// Blocks until the session terminates. Rethrows RenderError when the
	// render loop failed.
	[[nodiscard]] SelectionOutcome await_result() const;

	[[nodiscard]] std::optional<SelectionOutcome> try_result(
	        const std::chrono::milliseconds timeout) const;

	[[nodiscard]] bool closed() const;

	[[nodiscard]] size_t pending() const;

	// Consumer API, render loop only.

	[[nodiscard]] MergeReport merge();

	[[nodiscard]] const std::vector<Item>& items() const;

	// nullptr when the item has no indicator.
	[[nodiscard]] const Indicator* indicator_for(const size_t index) const;

	[[nodiscard]] const GlobalStatus& status() const;

	[[nodiscard]] bool input_finished() const;

	[[nodiscard]] bool has_spinners() const;

	// Resolve the session exactly once; later calls are ignored. finish()
	// closes the queue and merges what was accepted before it closed.
	void finish(SelectionOutcome outcome);

	// Callable from any thread; does not merge.
	void fail(std::exception_ptr error);
};

#endif

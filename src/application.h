#ifndef APPLICATION_H
#define APPLICATION_H

#include "config.h"
#include "fuzzy_matcher.h"
#include "input_handler.h"
#include "renderer.h"
#include "selection_state.h"
#include "session.h"
#include "terminal.h"
#include "timing_t.h"

#include <chrono>
#include <optional>

// ============================================================================
// Application
// ============================================================================

// The render loop. Owns the terminal for the life of one session and is
// the only consumer of the session's merged state.
class Application {
public:
	enum class State {
		Init,
		Running,
		Selecting,
		Cancelled,
		Terminated,
	};

private:
	Terminal& terminal_;
	Session& session_;
	FinderConfig config_;
	FuzzyMatcher matcher_;
	SelectionState selection_;
	InputHandler input_;
	Renderer renderer_;

	FilterResult results_                       = {};
	State state_                                = State::Init;
	std::optional<SelectionOutcome> outcome_    = {};
	size_t rows_                                = 0;
	size_t origin_                              = 0;
	size_t scroll_                              = 0;
	size_t spinner_frame_                       = 0;
	std::chrono::steady_clock::time_point spun_ = {};

	void start();

	void layout();

	void refilter();

	void follow_cursor();

	void advance_spinner();

	void stop();

	void restore();

public:
	Application(Terminal& terminal, Session& session, FinderConfig config);

	Application(const Application&)            = delete;
	Application& operator=(const Application&) = delete;

	// One loop iteration: merge, re-filter, poll input, dispatch, render.
	// Returns the outcome once the user has confirmed or cancelled.
	[[nodiscard]] std::optional<SelectionOutcome> tick(
	        const std::chrono::milliseconds timeout = Timing::PollInterval);

	// Ticks until the user decides, restores the terminal and resolves the
	// session. A failure resolves the session with a RenderError instead.
	// Returns early when a producer has already failed the session.
	void run();

	[[nodiscard]] State state() const;

	[[nodiscard]] const FilterResult& results() const;

	[[nodiscard]] const SelectionState& selection() const;

	[[nodiscard]] const Renderer& renderer() const;

	[[nodiscard]] size_t page_size() const;

	[[nodiscard]] size_t scroll() const;
};

#endif

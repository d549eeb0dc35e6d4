#include "application.h"
#include "errors_t.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

// ============================================================================
// Application
// ============================================================================

Application::Application(Terminal& terminal, Session& session, FinderConfig config)
        : terminal_(terminal),
          session_(session),
          config_(std::move(config)),
          matcher_(config_.cache_capacity),
          selection_(config_.multi_select, config_.query),
          input_(terminal),
          renderer_(terminal)
{}

void Application::start()
{
	const auto size = terminal_.size();
	rows_           = config_.viewport_rows(size.rows);
	origin_         = terminal_.enter(config_.fullscreen(), rows_);
	state_          = State::Running;

	renderer_.resize(rows_, size.cols, origin_);
	spun_ = std::chrono::steady_clock::now();
	refilter();
}

void Application::layout()
{
	using namespace std::string_view_literals;

	const auto size = terminal_.size();
	rows_           = config_.viewport_rows(size.rows);

	if (config_.fullscreen()) {
		origin_ = 0;
		terminal_.write("\033[2J"sv);
	} else {
		origin_ = std::min(origin_, size.rows - rows_);
	}
	renderer_.resize(rows_, size.cols, origin_);
}

void Application::refilter()
{
	results_ = matcher_.filter(session_.items(), selection_.query());
	selection_.clamp(results_.size());
}

void Application::follow_cursor()
{
	const size_t page = page_size();
	if (page == 0) {
		return;
	}

	const size_t cursor = selection_.cursor();
	if (cursor < scroll_) {
		scroll_ = cursor;
	} else if (cursor >= scroll_ + page) {
		scroll_ = cursor - page + 1;
	}

	// Never leave blank rows below a list that shrank.
	const size_t last_start = results_.size() > page ? results_.size() - page : 0;
	scroll_                 = std::min(scroll_, last_start);
}

void Application::advance_spinner()
{
	const auto now = std::chrono::steady_clock::now();
	if (now - spun_ < Timing::SpinnerInterval || !session_.has_spinners()) {
		return;
	}
	++spinner_frame_;
	spun_ = now;
}

[[nodiscard]] std::optional<SelectionOutcome> Application::tick(
        const std::chrono::milliseconds timeout)
{
	if (state_ == State::Init) {
		start();
	}
	if (state_ != State::Running) {
		return outcome_;
	}

	const auto report = session_.merge();
	if (terminal_.take_resize()) {
		layout();
	}
	if (report.items_added > 0) {
		refilter();
	}

	if (const auto action = input_.poll(timeout, selection_.multi_select())) {
		const auto transition = selection_.apply(*action, results_, session_.items(),
		                                         page_size());
		if (transition.query_changed) {
			refilter();
		}
		if (transition.outcome) {
			state_   = std::holds_alternative<Cancelled>(*transition.outcome)
			                   ? State::Cancelled
			                   : State::Selecting;
			outcome_ = transition.outcome;
			return outcome_;
		}
	}

	advance_spinner();
	follow_cursor();

	renderer_.draw({.session       = session_,
	                .selection     = selection_,
	                .results       = results_,
	                .prompt        = config_.prompt,
	                .scroll        = scroll_,
	                .spinner_frame = spinner_frame_,
	                .show_help     = config_.show_help,
	                .show_status   = config_.show_status});
	return std::nullopt;
}

void Application::stop()
{
	if (!config_.fullscreen()) {
		renderer_.erase();
	}
	terminal_.leave();
	state_ = State::Terminated;
}

void Application::restore()
{
	using namespace std::string_view_literals;

	state_ = State::Terminated;
	try {
		terminal_.leave();
	} catch (const std::exception& e) {
		std::cerr << "Terminal restore error: "sv << e.what() << '\n';
	}
}

void Application::run()
{
	try {
		// A producer that fails closes the session, which ends the loop
		// without an outcome.
		std::optional<SelectionOutcome> outcome = {};
		while (!outcome && !session_.closed()) {
			outcome = tick();
		}
		stop();
		if (outcome) {
			session_.finish(std::move(*outcome));
		}
	} catch (const RenderError&) {
		restore();
		session_.fail(std::current_exception());
	} catch (const std::exception& e) {
		restore();
		session_.fail(std::make_exception_ptr(RenderError(e.what())));
	}
}

[[nodiscard]] Application::State Application::state() const
{
	return state_;
}

[[nodiscard]] const FilterResult& Application::results() const
{
	return results_;
}

[[nodiscard]] const SelectionState& Application::selection() const
{
	return selection_;
}

[[nodiscard]] const Renderer& Application::renderer() const
{
	return renderer_;
}

[[nodiscard]] size_t Application::page_size() const
{
	return Renderer::page_size(rows_, config_.show_help);
}

[[nodiscard]] size_t Application::scroll() const
{
	return scroll_;
}

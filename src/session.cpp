#include "session.h"
#include "errors_t.h"
#include "utilities.h"

#include <algorithm>
#include <type_traits>
#include <utility>

// ============================================================================
// Session
// ============================================================================

[[nodiscard]] bool Session::MergeReport::any() const
{
	return items_added > 0 || indicators_changed || status_changed;
}

Session::Session(std::optional<std::string> loading_message,
                 std::optional<std::string> ready_message)
        : status_(Loading{std::move(loading_message)}),
          ready_message_(std::move(ready_message)),
          result_(promise_.get_future().share())
{}

void Session::enqueue(Mutation&& mutation)
{
	if (!pending_.push(std::move(mutation))) {
		throw ClosedSessionError();
	}
}

void Session::add(std::string text)
{
	enqueue(AddItems{.texts = {std::move(text)}});
}

void Session::add(std::string text, Indicator indicator)
{
	enqueue(AddItems{.texts = {std::move(text)}, .indicator = std::move(indicator)});
}

void Session::add_batch(std::vector<std::string> texts)
{
	enqueue(AddItems{.texts = std::move(texts)});
}

void Session::set_indicator(IndicatorKey key, Indicator indicator)
{
	enqueue(SetIndicator{std::move(key), std::move(indicator)});
}

void Session::set_global_status(GlobalStatus status)
{
	enqueue(SetStatus{std::move(status)});
}

void Session::finish_input()
{
	enqueue(FinishInput{});
}

[[nodiscard]] SelectionOutcome Session::await_result() const
{
	return result_.get();
}

[[nodiscard]] std::optional<SelectionOutcome> Session::try_result(
        const std::chrono::milliseconds timeout) const
{
	if (result_.wait_for(timeout) != std::future_status::ready) {
		return std::nullopt;
	}
	return result_.get();
}

[[nodiscard]] bool Session::closed() const
{
	return pending_.closed();
}

[[nodiscard]] size_t Session::pending() const
{
	return pending_.size();
}

void Session::apply_indicator(const IndicatorKey& key, Indicator indicator)
{
	const bool clear = std::holds_alternative<Indicators::None>(indicator);

	if (const auto* text = std::get_if<std::string>(&key)) {
		if (clear) {
			by_text_.erase(*text);
		} else {
			by_text_.insert_or_assign(*text, std::move(indicator));
		}
		return;
	}

	const auto index = std::get<size_t>(key);
	if (clear) {
		by_index_.erase(index);
	} else {
		by_index_.insert_or_assign(index, std::move(indicator));
	}
}

[[nodiscard]] Session::MergeReport Session::merge()
{
	MergeReport report = {};

	for (auto& mutation : pending_.drain()) {
		std::visit(
		        [this, &report](auto&& arg) {
			        using T = std::decay_t<decltype(arg)>;

			        if constexpr (std::is_same_v<T, AddItems>) {
				        const bool tagged = !std::holds_alternative<Indicators::None>(
				                arg.indicator);
				        for (auto& text : arg.texts) {
					        const size_t index = items_.size();
					        auto folded        = Util::to_lower(text);
					        items_.push_back({.text   = std::move(text),
					                          .folded = std::move(folded),
					                          .index  = index});
					        if (tagged) {
						        by_index_.insert_or_assign(index, arg.indicator);
						        report.indicators_changed = true;
					        }
				        }
				        report.items_added += arg.texts.size();
			        } else if constexpr (std::is_same_v<T, SetIndicator>) {
				        apply_indicator(arg.key, std::move(arg.indicator));
				        report.indicators_changed = true;
			        } else if constexpr (std::is_same_v<T, SetStatus>) {
				        status_               = std::move(arg.status);
				        report.status_changed = true;
			        } else if constexpr (std::is_same_v<T, FinishInput>) {
				        input_finished_ = true;
				        if (std::holds_alternative<Loading>(status_)) {
					        status_               = Ready{ready_message_};
					        report.status_changed = true;
				        }
			        }
		        },
		        mutation);
	}

	return report;
}

[[nodiscard]] const std::vector<Item>& Session::items() const
{
	return items_;
}

[[nodiscard]] const Indicator* Session::indicator_for(const size_t index) const
{
	if (index >= items_.size()) {
		return nullptr;
	}
	if (const auto it = by_index_.find(index); it != by_index_.end()) {
		return &it->second;
	}
	if (const auto it = by_text_.find(items_[index].text); it != by_text_.end()) {
		return &it->second;
	}
	return nullptr;
}

[[nodiscard]] const GlobalStatus& Session::status() const
{
	return status_;
}

[[nodiscard]] bool Session::input_finished() const
{
	return input_finished_;
}

[[nodiscard]] bool Session::has_spinners() const
{
	const auto spinning = [](const auto& entry) {
		return std::holds_alternative<Indicators::Spinner>(entry.second);
	};

	return std::holds_alternative<Loading>(status_) ||
	       std::ranges::any_of(by_index_, spinning) ||
	       std::ranges::any_of(by_text_, spinning);
}

void Session::finish(SelectionOutcome outcome)
{
	pending_.shutdown();

	// Mutations accepted before the queue closed still reach the merged state.
	static_cast<void>(merge());

	if (!resolved_.exchange(true)) {
		promise_.set_value(std::move(outcome));
	}
}

void Session::fail(std::exception_ptr error)
{
	pending_.shutdown();
	if (!resolved_.exchange(true)) {
		promise_.set_exception(std::move(error));
	}
}

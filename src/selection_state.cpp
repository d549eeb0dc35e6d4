#include "selection_state.h"
#include "utilities.h"

#include <algorithm>
#include <type_traits>
#include <utility>

// ============================================================================
// Selection State
// ============================================================================

SelectionState::SelectionState(const bool multi_select, std::string initial_query)
        : multi_select_(multi_select),
          query_(std::move(initial_query))
{}

[[nodiscard]] SelectionState::Transition SelectionState::apply(const Action& action,
                                                               const FilterResult& view,
                                                               const std::vector<Item>& items,
                                                               const size_t page_size)
{
	Transition transition = {};

	std::visit(
	        [&](auto&& arg) {
		        using T = std::decay_t<decltype(arg)>;

		        if constexpr (std::is_same_v<T, MoveCursor>) {
			        move_cursor(arg.delta, view.size());
		        } else if constexpr (std::is_same_v<T, PageScroll>) {
			        page(arg.up, view.size(), page_size);
		        } else if constexpr (std::is_same_v<T, ToggleSelection>) {
			        toggle(view);
			        if (arg.advance && multi_select_) {
				        move_cursor(1, view.size());
			        }
		        } else if constexpr (std::is_same_v<T, Confirm>) {
			        transition.outcome = confirm(view, items);
		        } else if constexpr (std::is_same_v<T, Cancel>) {
			        transition.outcome = Cancelled{};
		        } else if constexpr (std::is_same_v<T, TypeCharacter>) {
			        transition.query_changed = type(arg.ch);
		        } else if constexpr (std::is_same_v<T, Backspace>) {
			        transition.query_changed = backspace();
		        } else if constexpr (std::is_same_v<T, ClearQuery>) {
			        transition.query_changed = clear_query();
		        }
	        },
	        action);

	return transition;
}

void SelectionState::move_cursor(const int delta, const size_t result_count)
{
	if (result_count == 0) {
		return;
	}

	const auto last   = static_cast<long long>(result_count) - 1;
	const auto target = static_cast<long long>(cursor_) + delta;
	cursor_           = static_cast<size_t>(std::clamp(target, 0LL, last));
}

void SelectionState::page(const bool up, const size_t result_count, const size_t page_size)
{
	const auto step = static_cast<int>(page_size > 1 ? page_size - 1 : 1);
	move_cursor(up ? -step : step, result_count);
}

void SelectionState::toggle(const FilterResult& view)
{
	if (!multi_select_ || view.empty() || cursor_ >= view.size()) {
		return;
	}

	const auto index = view[cursor_].index;
	if (!selected_.erase(index)) {
		selected_.insert(index);
	}
}

void SelectionState::clamp(const size_t result_count)
{
	if (result_count == 0) {
		cursor_ = 0;
	} else if (cursor_ >= result_count) {
		cursor_ = result_count - 1;
	}
}

[[nodiscard]] SelectionOutcome SelectionState::confirm(const FilterResult& view,
                                                       const std::vector<Item>& items) const
{
	Selected result = {};

	const auto take = [&](const size_t index) {
		if (index < items.size()) {
			result.indices.push_back(index);
			result.items.push_back(items[index].text);
		}
	};

	if (multi_select_) {
		for (const auto index : selected_) {
			take(index);
		}
	} else if (cursor_ < view.size()) {
		take(view[cursor_].index);
	}

	return result;
}

bool SelectionState::type(const std::string_view ch)
{
	if (ch.empty()) {
		return false;
	}
	query_ += ch;
	return true;
}

bool SelectionState::backspace()
{
	return Util::pop_code_point(query_);
}

bool SelectionState::clear_query()
{
	if (query_.empty()) {
		return false;
	}
	query_.clear();
	return true;
}

[[nodiscard]] size_t SelectionState::cursor() const
{
	return cursor_;
}

[[nodiscard]] const std::string& SelectionState::query() const
{
	return query_;
}

[[nodiscard]] bool SelectionState::multi_select() const
{
	return multi_select_;
}

[[nodiscard]] bool SelectionState::is_selected(const size_t index) const
{
	return selected_.contains(index);
}

[[nodiscard]] const std::set<size_t>& SelectionState::selected() const
{
	return selected_;
}

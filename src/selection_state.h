#ifndef SELECTION_STATE_H
#define SELECTION_STATE_H

#include "command_t.h"
#include "fuzzy_matcher.h"
#include "item_t.h"
#include "outcome_t.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Selection State
// ============================================================================

// Cursor, query and selection. The cursor indexes the current FilterResult
// and always satisfies 0 <= cursor < max(1, len). Selections are original
// indices, so they survive re-filtering.
class SelectionState {
	bool multi_select_         = false;
	std::set<size_t> selected_ = {};
	size_t cursor_             = 0;
	std::string query_         = {};

public:
	struct Transition {
		bool query_changed                      = false;
		std::optional<SelectionOutcome> outcome = {};
	};

	explicit SelectionState(const bool multi_select, std::string initial_query = {});

	[[nodiscard]] Transition apply(const Action& action, const FilterResult& view,
	                               const std::vector<Item>& items,
	                               const size_t page_size);

	void move_cursor(const int delta, const size_t result_count);

	void page(const bool up, const size_t result_count, const size_t page_size);

	void toggle(const FilterResult& view);

	// Pulls the cursor back into a result list of the given length.
	void clamp(const size_t result_count);

	[[nodiscard]] SelectionOutcome confirm(const FilterResult& view,
	                                       const std::vector<Item>& items) const;

	bool type(const std::string_view ch);

	bool backspace();

	bool clear_query();

	[[nodiscard]] size_t cursor() const;

	[[nodiscard]] const std::string& query() const;

	[[nodiscard]] bool multi_select() const;

	[[nodiscard]] bool is_selected(const size_t index) const;

	[[nodiscard]] const std::set<size_t>& selected() const;
};

#endif

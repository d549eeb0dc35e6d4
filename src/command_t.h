#ifndef COMMAND_T
#define COMMAND_T

#include "indicator_t.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace Display {
constexpr size_t PromptRows           = 1;
constexpr size_t HelpRows             = 1;
constexpr size_t DefaultCacheCapacity = 64;
} // namespace Display

// ============================================================================
// User actions, decoded from terminal input
// ============================================================================

struct MoveCursor {
	int delta = {};
};
struct PageScroll {
	bool up = {};
};
struct ToggleSelection {
	bool advance = {}; // move the cursor down after toggling
};
struct Confirm {};
struct Cancel {};
struct TypeCharacter {
	std::string ch = {}; // one UTF-8 encoded code point
};
struct Backspace {};
struct ClearQuery {};

using Action = std::variant<MoveCursor, PageScroll, ToggleSelection, Confirm,
                            Cancel, TypeCharacter, Backspace, ClearQuery>;

// ============================================================================
// Session mutations, queued by producers and merged by the renderer
// ============================================================================

struct AddItems {
	std::vector<std::string> texts = {};
	Indicator indicator            = Indicators::None{};
};
struct SetIndicator {
	IndicatorKey key    = {};
	Indicator indicator = {};
};
struct SetStatus {
	GlobalStatus status = {};
};
struct FinishInput {};

using Mutation = std::variant<AddItems, SetIndicator, SetStatus, FinishInput>;

#endif

#ifndef INDICATOR_T
#define INDICATOR_T

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

enum class Color {
	Default,
	Black,
	Red,
	Green,
	Yellow,
	Blue,
	Magenta,
	Cyan,
	White,
	Gray,
};

// ============================================================================
// Per-item indicators
// ============================================================================

namespace Indicators {

struct None {};
struct Spinner {};
struct Success {};
struct Error {};
struct Warning {};

struct Text {
	std::string text = {};
};

struct ColoredText {
	std::string text = {};
	Color color      = Color::Default;
};

} // namespace Indicators

using Indicator = std::variant<Indicators::None,
                               Indicators::Spinner,
                               Indicators::Success,
                               Indicators::Error,
                               Indicators::Warning,
                               Indicators::Text,
                               Indicators::ColoredText>;

// Indicators attach either to every item with the given text or to one
// item by its original index. An index that has not been added yet is
// held and applies to the item that later receives it.
using IndicatorKey = std::variant<std::string, size_t>;

// ============================================================================
// Global status
// ============================================================================

struct Loading {
	std::optional<std::string> message = {};
};

struct Ready {
	std::optional<std::string> message = {};
};

using GlobalStatus = std::variant<Loading, Ready>;

#endif

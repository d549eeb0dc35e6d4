#include "input_handler.h"
#include "timing_t.h"

#include <string>

// ============================================================================
// Input Handler
// ============================================================================

namespace Key {
constexpr int CtrlC  = 0x03;
constexpr int CtrlH  = 0x08;
constexpr int Tab    = 0x09;
constexpr int CtrlN  = 0x0E;
constexpr int CtrlP  = 0x10;
constexpr int CtrlQ  = 0x11;
constexpr int CtrlU  = 0x15;
constexpr int Escape = 0x1B;
constexpr int Space  = 0x20;
constexpr int Delete = 0x7F;
} // namespace Key

InputHandler::InputHandler(Terminal& terminal) : terminal_(terminal) {}

void InputHandler::flush_sequence()
{
	while (terminal_.read_byte(Timing::InputTimeout) != -1) {
	}
}

[[nodiscard]] std::optional<Action> InputHandler::escape_sequence()
{
	const int c1 = terminal_.read_byte(Timing::InputTimeout);
	if (c1 == -1 || c1 == Key::Escape) { // Bare or repeated Escape
		return Cancel{};
	}
	if (c1 != '[' && c1 != 'O') {
		flush_sequence();
		return std::nullopt;
	}

	const int c2 = terminal_.read_byte(Timing::InputTimeout);
	switch (c2) {
	case 'A': return MoveCursor{-1};
	case 'B': return MoveCursor{1};
	case '5':
	case '6': {
		const int c3 = terminal_.read_byte(Timing::InputTimeout);
		if (c3 == '~') {
			return PageScroll{c2 == '5'};
		}
		break;
	}
	case -1: return std::nullopt;
	}

	flush_sequence();
	return std::nullopt;
}

[[nodiscard]] std::optional<Action> InputHandler::multibyte(const int lead)
{
	size_t extra = 0;
	if ((lead & 0xE0) == 0xC0) {
		extra = 1;
	} else if ((lead & 0xF0) == 0xE0) {
		extra = 2;
	} else if ((lead & 0xF8) == 0xF0) {
		extra = 3;
	} else {
		return std::nullopt;
	}

	std::string ch(1, static_cast<char>(lead));
	for (size_t i = 0; i < extra; ++i) {
		const int c = terminal_.read_byte(Timing::InputTimeout);
		if (c == -1 || (c & 0xC0) != 0x80) {
			return std::nullopt;
		}
		ch += static_cast<char>(c);
	}
	return TypeCharacter{std::move(ch)};
}

[[nodiscard]] std::optional<Action> InputHandler::poll(const std::chrono::milliseconds timeout,
                                                       const bool multi_select)
{
	const int c = terminal_.read_byte(timeout);

	switch (c) {
	case -1: return std::nullopt;
	case Key::CtrlC:
	case Key::CtrlQ: return Cancel{};
	case '\r':
	case '\n': return Confirm{};
	case Key::Delete:
	case Key::CtrlH: return Backspace{};
	case Key::CtrlP: return MoveCursor{-1};
	case Key::CtrlN: return MoveCursor{1};
	case Key::CtrlU: return ClearQuery{};
	case Key::Escape: return escape_sequence();
	case Key::Tab:
		if (multi_select) {
			return ToggleSelection{true};
		}
		return std::nullopt;
	case Key::Space:
		if (multi_select) {
			return ToggleSelection{false};
		}
		return TypeCharacter{" "};
	}

	if (c > Key::Space && c < Key::Delete) { // Printable ASCII
		return TypeCharacter{std::string(1, static_cast<char>(c))};
	}
	if (c >= 0x80) {
		return multibyte(c);
	}
	return std::nullopt;
}

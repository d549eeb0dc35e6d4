#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include "command_t.h"
#include "terminal.h"

#include <chrono>
#include <optional>

// ============================================================================
// Input Handler
// ============================================================================

// Turns raw terminal bytes into Actions. Unknown keys and escape sequences
// are consumed and ignored.
class InputHandler {
	Terminal& terminal_;

	void flush_sequence();

	[[nodiscard]] std::optional<Action> escape_sequence();

	[[nodiscard]] std::optional<Action> multibyte(const int lead);

public:
	explicit InputHandler(Terminal& terminal);

	// Waits at most `timeout` for a key.
	[[nodiscard]] std::optional<Action> poll(const std::chrono::milliseconds timeout,
	                                         const bool multi_select);
};

#endif

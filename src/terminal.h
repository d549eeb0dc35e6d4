#ifndef TERMINAL_H
#define TERMINAL_H

#include <chrono>
#include <cstddef>
#include <string_view>

// ============================================================================
// Terminal backend
// ============================================================================

struct TermSize {
	size_t rows = 0;
	size_t cols = 0;

	bool operator==(const TermSize&) const = default;
};

// The render loop is the only caller; implementations need not be
// thread-safe.
class Terminal {
public:
	virtual ~Terminal() = default;

	// Enables raw input. Fullscreen switches to the alternate screen and
	// returns 0; inline mode reserves `rows` lines at the cursor and returns
	// the first reserved row.
	[[nodiscard]] virtual size_t enter(const bool fullscreen, const size_t rows) = 0;

	// Restores the terminal; safe to call more than once.
	virtual void leave() = 0;

	// Next input byte, or -1 when nothing arrived within the timeout.
	[[nodiscard]] virtual int read_byte(const std::chrono::milliseconds timeout) = 0;

	[[nodiscard]] virtual TermSize size() const = 0;

	// True once after each terminal resize.
	[[nodiscard]] virtual bool take_resize() = 0;

	virtual void write(const std::string_view bytes) = 0;

	virtual void flush() = 0;
};

#endif

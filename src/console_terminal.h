#ifndef CONSOLE_TERMINAL_H
#define CONSOLE_TERMINAL_H

#include "terminal.h"

#include <deque>
#include <string>

#ifdef _WIN32
#define NOMINMAX
#include <conio.h>
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

// ============================================================================
// Console Terminal
// ============================================================================

// Talks to the controlling terminal directly, so items may arrive on a
// piped stdin while keys are read from the tty and stdout stays free for
// the selection.
class ConsoleTerminal final : public Terminal {
#ifdef _WIN32
	HANDLE output_      = INVALID_HANDLE_VALUE;
	DWORD old_mode_     = 0;
	TermSize last_size_ = {};
#else
	int fd_           = -1;
	termios old_term_ = {};
#endif
	bool entered_           = false;
	bool fullscreen_        = false;
	std::string out_        = {};
	std::deque<int> queued_ = {};

	[[nodiscard]] size_t cursor_row();

	void write_all(const std::string_view bytes);

public:
	ConsoleTerminal();

	~ConsoleTerminal() override;

	ConsoleTerminal(const ConsoleTerminal&)            = delete;
	ConsoleTerminal& operator=(const ConsoleTerminal&) = delete;

	[[nodiscard]] size_t enter(const bool fullscreen, const size_t rows) override;

	void leave() override;

	[[nodiscard]] int read_byte(const std::chrono::milliseconds timeout) override;

	[[nodiscard]] TermSize size() const override;

	[[nodiscard]] bool take_resize() override;

	void write(const std::string_view bytes) override;

	void flush() override;
};

#endif

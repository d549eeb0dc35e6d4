#include "console_terminal.h"
#include "errors_t.h"
#include "timing_t.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#include <thread>
#else
#include <csignal>
#include <fcntl.h>
#endif

// ============================================================================
// Console Terminal
// ============================================================================

namespace {

using namespace std::string_view_literals;

constexpr TermSize FallbackSize = {.rows = 24, .cols = 80};

#ifndef _WIN32
std::atomic<bool> resize_pending{false};

extern "C" void on_window_change(int)
{
	resize_pending.store(true, std::memory_order_relaxed);
}
#endif

} // namespace

ConsoleTerminal::ConsoleTerminal()
{
#ifdef _WIN32
	output_ = GetStdHandle(STD_OUTPUT_HANDLE);
	if (output_ == INVALID_HANDLE_VALUE || !_isatty(_fileno(stdin))) {
		throw RenderError("not an interactive terminal");
	}
	last_size_ = size();
#else
	fd_ = ::open("/dev/tty", O_RDWR | O_NOCTTY | O_CLOEXEC);
	if (fd_ < 0) {
		throw RenderError(std::string("cannot open /dev/tty: ") + std::strerror(errno));
	}
	if (!isatty(fd_)) {
		::close(fd_);
		fd_ = -1;
		throw RenderError("not an interactive terminal");
	}
#endif
}

ConsoleTerminal::~ConsoleTerminal()
{
	using namespace std::string_view_literals;

	try {
		leave();
	} catch (const std::exception& e) {
		std::cerr << "Terminal restore error: "sv << e.what() << '\n';
	}
#ifndef _WIN32
	if (fd_ >= 0) {
		::close(fd_);
	}
#endif
}

[[nodiscard]] size_t ConsoleTerminal::cursor_row()
{
#ifdef _WIN32
	CONSOLE_SCREEN_BUFFER_INFO csbi = {};
	if (!GetConsoleScreenBufferInfo(output_, &csbi)) {
		return 0;
	}
	return static_cast<size_t>(csbi.dwCursorPosition.Y - csbi.srWindow.Top);
#else
	write("\033[6n"sv);
	flush();

	char buf[32] = {};
	size_t i     = 0;

	while (i < sizeof(buf) - 1) {
		const int c = read_byte(Timing::PollInterval);
		if (c < 0) {
			break;
		}
		buf[i] = static_cast<char>(c);
		if (buf[i] == 'R') {
			break;
		}
		++i;
	}

	size_t row = 1, col = 1;
	if (i > 1 && buf[0] == '\033' && buf[1] == '[') {
		if (std::sscanf(buf + 2, "%zu;%zu", &row, &col) != 2) {
			row = 1;
		}
	}
	return row > 0 ? row - 1 : 0;
#endif
}

void ConsoleTerminal::write_all(const std::string_view bytes)
{
#ifdef _WIN32
	DWORD written = 0;
	if (!WriteFile(output_, bytes.data(), static_cast<DWORD>(bytes.size()), &written, nullptr)) {
		throw RenderError("terminal write failed");
	}
#else
	size_t offset = 0;
	while (offset < bytes.size()) {
		const auto n = ::write(fd_, bytes.data() + offset, bytes.size() - offset);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			throw RenderError(std::string("terminal write failed: ") + std::strerror(errno));
		}
		offset += static_cast<size_t>(n);
	}
#endif
}

[[nodiscard]] size_t ConsoleTerminal::enter(const bool fullscreen, const size_t rows)
{
#ifdef _WIN32
	if (!GetConsoleMode(output_, &old_mode_) ||
	    !SetConsoleMode(output_, old_mode_ | ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
		throw RenderError("cannot enable virtual terminal processing");
	}
#else
	if (tcgetattr(fd_, &old_term_) != 0) {
		throw RenderError("cannot read terminal attributes");
	}

	termios raw = old_term_;
	raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
	raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
	raw.c_cc[VMIN]  = 1;
	raw.c_cc[VTIME] = 0;
	if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
		throw RenderError("cannot switch terminal to raw mode");
	}

	struct sigaction action = {};
	action.sa_handler       = on_window_change;
	sigemptyset(&action.sa_mask);
	sigaction(SIGWINCH, &action, nullptr);
#endif
	entered_    = true;
	fullscreen_ = fullscreen;

	write("\033[?25l"sv);

	if (fullscreen) {
		write("\033[?1049h\033[2J\033[H"sv);
		flush();
		return 0;
	}

	const auto term     = size();
	const size_t height = std::min(rows, term.rows);
	size_t origin       = cursor_row();

	// Scroll the terminal up when the reserved area would run off the bottom.
	if (origin + height > term.rows) {
		write("\r"sv);
		for (size_t i = origin + height; i > term.rows; --i) {
			write("\n"sv);
		}
		origin = term.rows - height;
	}
	flush();
	return origin;
}

void ConsoleTerminal::leave()
{
	if (!entered_) {
		return;
	}
	entered_ = false;

	if (fullscreen_) {
		write("\033[?1049l"sv);
	}
	write("\033[0m\033[?25h"sv);
	flush();

#ifdef _WIN32
	SetConsoleMode(output_, old_mode_);
#else
	signal(SIGWINCH, SIG_DFL);
	if (tcsetattr(fd_, TCSANOW, &old_term_) != 0) {
		throw RenderError("cannot restore terminal attributes");
	}
#endif
}

[[nodiscard]] int ConsoleTerminal::read_byte(const std::chrono::milliseconds timeout)
{
	if (!queued_.empty()) {
		const int c = queued_.front();
		queued_.pop_front();
		return c;
	}

#ifdef _WIN32
	const auto start = std::chrono::steady_clock::now();
	while (!_kbhit()) {
		if (std::chrono::steady_clock::now() - start >= timeout) {
			return -1;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}

	const int c = _getch();
	if (c != 0 && c != 0xE0) {
		return c;
	}

	// Extended keys arrive as a two-byte scan code; translate them into the
	// VT sequences the input handler understands.
	switch (_getch()) {
	case 72: queued_.insert(queued_.end(), {'[', 'A'}); break;
	case 80: queued_.insert(queued_.end(), {'[', 'B'}); break;
	case 73: queued_.insert(queued_.end(), {'[', '5', '~'}); break;
	case 81: queued_.insert(queued_.end(), {'[', '6', '~'}); break;
	default: return -1;
	}
	return 0x1B;
#else
	fd_set fds = {};
	FD_ZERO(&fds);
	FD_SET(fd_, &fds);

	const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
	timeval tv{static_cast<time_t>(usec / 1000000), static_cast<suseconds_t>(usec % 1000000)};

	if (select(fd_ + 1, &fds, nullptr, nullptr, &tv) > 0) {
		unsigned char c = {};
		if (::read(fd_, &c, 1) == 1) {
			return c;
		}
	}
	return -1;
#endif
}

[[nodiscard]] TermSize ConsoleTerminal::size() const
{
#ifdef _WIN32
	CONSOLE_SCREEN_BUFFER_INFO csbi = {};
	if (!GetConsoleScreenBufferInfo(output_, &csbi)) {
		return FallbackSize;
	}
	return {.rows = static_cast<size_t>(csbi.srWindow.Bottom - csbi.srWindow.Top + 1),
	        .cols = static_cast<size_t>(csbi.srWindow.Right - csbi.srWindow.Left + 1)};
#else
	winsize w = {};
	if (ioctl(fd_, TIOCGWINSZ, &w) != 0 || w.ws_row == 0 || w.ws_col == 0) {
		return FallbackSize;
	}
	return {.rows = w.ws_row, .cols = w.ws_col};
#endif
}

[[nodiscard]] bool ConsoleTerminal::take_resize()
{
#ifdef _WIN32
	const auto current = size();
	if (current == last_size_) {
		return false;
	}
	last_size_ = current;
	return true;
#else
	return resize_pending.exchange(false, std::memory_order_relaxed);
#endif
}

void ConsoleTerminal::write(const std::string_view bytes)
{
	out_.append(bytes);
}

void ConsoleTerminal::flush()
{
	if (out_.empty()) {
		return;
	}
	const std::string pending = std::move(out_);
	out_.clear();
	write_all(pending);
}

#ifndef SCREEN_BUFFER_H
#define SCREEN_BUFFER_H

#include "indicator_t.h"

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

// ============================================================================
// Screen Buffer
// ============================================================================

struct Style {
	Color fg       = Color::Default;
	Color bg       = Color::Default;
	bool bold      = false;
	bool dim       = false;
	bool underline = false;

	bool operator==(const Style&) const = default;
};

struct Cell {
	char32_t ch = U' ';
	Style style = {};

	bool operator==(const Cell&) const = default;
};

// Half-open run [begin, end) of changed cells on one row.
struct DiffSpan {
	size_t row   = {};
	size_t begin = {};
	size_t end   = {};

	bool operator==(const DiffSpan&) const = default;
};

// Two equally sized grids: the front one mirrors what the terminal shows,
// the back one receives the next frame. Every cell is one column wide.
class ScreenBuffer {
	std::array<std::vector<Cell>, 2> grids_ = {};
	size_t back_                            = 0;
	size_t rows_                            = 0;
	size_t cols_                            = 0;
	bool front_valid_                       = false;

	[[nodiscard]] size_t offset(const size_t row, const size_t col) const;

public:
	// Reallocates only when the dimensions change. Either way the front
	// grid no longer matches the screen, so the next diff covers everything.
	void resize(const size_t rows, const size_t cols);

	void invalidate();

	[[nodiscard]] size_t rows() const;

	[[nodiscard]] size_t cols() const;

	// Blanks the back grid.
	void clear();

	[[nodiscard]] Cell& at(const size_t row, const size_t col);

	[[nodiscard]] const Cell& at(const size_t row, const size_t col) const;

	[[nodiscard]] const Cell& front_at(const size_t row, const size_t col) const;

	// Writes UTF-8 text from col, clipped at the row end. Returns the
	// column after the last cell written.
	size_t put(const size_t row, const size_t col, const std::string_view text,
	           const Style style);

	void fill(const size_t row, const size_t from, const size_t to, const Style style);

	[[nodiscard]] std::vector<DiffSpan> diff() const;

	// The back grid becomes the front; the new back grid is blank.
	void swap();
};

#endif

#include "screen_buffer.h"
#include "utilities.h"

#include <algorithm>

// ============================================================================
// Screen Buffer
// ============================================================================

[[nodiscard]] size_t ScreenBuffer::offset(const size_t row, const size_t col) const
{
	return row * cols_ + col;
}

void ScreenBuffer::resize(const size_t rows, const size_t cols)
{
	if (rows != rows_ || cols != cols_) {
		rows_ = rows;
		cols_ = cols;
		for (auto& grid : grids_) {
			grid.assign(rows * cols, Cell{});
		}
	}
	invalidate();
}

void ScreenBuffer::invalidate()
{
	front_valid_ = false;
}

[[nodiscard]] size_t ScreenBuffer::rows() const
{
	return rows_;
}

[[nodiscard]] size_t ScreenBuffer::cols() const
{
	return cols_;
}

void ScreenBuffer::clear()
{
	std::ranges::fill(grids_[back_], Cell{});
}

[[nodiscard]] Cell& ScreenBuffer::at(const size_t row, const size_t col)
{
	return grids_[back_][offset(row, col)];
}

[[nodiscard]] const Cell& ScreenBuffer::at(const size_t row, const size_t col) const
{
	return grids_[back_][offset(row, col)];
}

[[nodiscard]] const Cell& ScreenBuffer::front_at(const size_t row, const size_t col) const
{
	return grids_[1 - back_][offset(row, col)];
}

size_t ScreenBuffer::put(const size_t row, size_t col, const std::string_view text,
                         const Style style)
{
	if (row >= rows_) {
		return col;
	}

	size_t pos = 0;
	while (pos < text.size() && col < cols_) {
		auto& cell = at(row, col++);
		cell.ch    = Util::next_code_point(text, pos);
		cell.style = style;
	}
	return col;
}

void ScreenBuffer::fill(const size_t row, const size_t from, const size_t to,
                        const Style style)
{
	if (row >= rows_) {
		return;
	}
	for (size_t col = from; col < std::min(to, cols_); ++col) {
		at(row, col) = {.ch = U' ', .style = style};
	}
}

[[nodiscard]] std::vector<DiffSpan> ScreenBuffer::diff() const
{
	std::vector<DiffSpan> spans = {};

	for (size_t row = 0; row < rows_; ++row) {
		if (!front_valid_) {
			if (cols_ > 0) {
				spans.push_back({.row = row, .begin = 0, .end = cols_});
			}
			continue;
		}

		size_t col = 0;
		while (col < cols_) {
			if (at(row, col) == front_at(row, col)) {
				++col;
				continue;
			}
			const size_t begin = col;
			while (col < cols_ && at(row, col) != front_at(row, col)) {
				++col;
			}
			spans.push_back({.row = row, .begin = begin, .end = col});
		}
	}

	return spans;
}

void ScreenBuffer::swap()
{
	back_        = 1 - back_;
	front_valid_ = true;
	clear();
}

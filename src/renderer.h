#ifndef RENDERER_H
#define RENDERER_H

#include "fuzzy_matcher.h"
#include "screen_buffer.h"
#include "selection_state.h"
#include "session.h"
#include "terminal.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// ============================================================================
// Renderer
// ============================================================================

// Everything one frame shows. Borrowed for the duration of draw().
struct FrameView {
	const Session& session;
	const SelectionState& selection;
	const FilterResult& results;
	std::string_view prompt;
	size_t scroll;
	size_t spinner_frame;
	bool show_help;
	bool show_status;
};

class Renderer {
	Terminal& terminal_;
	ScreenBuffer buffer_ = {};
	size_t origin_       = 0;
	std::string out_     = {};

	// What the terminal currently has; nullopt when unknown.
	std::optional<Style> style_                      = {};
	std::optional<std::pair<size_t, size_t>> cursor_ = {};

	void compose(const FrameView& frame);

	void compose_header(const FrameView& frame);

	void compose_item(const size_t row, const SearchResult& result, const bool current,
	                  const FrameView& frame);

	void compose_help(const size_t row, const bool multi_select);

	void set_style(const Style style);

	void move_to(const size_t row, const size_t col);

public:
	static constexpr std::array<char32_t, 10> SpinnerFrames = {
	        U'⠋', U'⠙', U'⠹', U'⠸', U'⠼', U'⠴', U'⠦', U'⠧', U'⠇', U'⠏'};

	explicit Renderer(Terminal& terminal);

	// Area of rows x cols starting at screen row origin. Forces a full repaint.
	void resize(const size_t rows, const size_t cols, const size_t origin);

	void invalidate();

	// Item rows available in a viewport of the given height.
	[[nodiscard]] static size_t page_size(const size_t rows, const bool show_help);

	// Composes the frame and writes only the cells that changed since the
	// previous one. Returns the number of cells written.
	size_t draw(const FrameView& frame);

	// Blanks the area and leaves the cursor at its first row.
	void erase();

	// UTF-8 text of a row as last drawn, trailing blanks trimmed.
	[[nodiscard]] std::string row_text(const size_t row) const;

	[[nodiscard]] size_t rows() const;
};

#endif

#include "renderer.h"
#include "utilities.h"

#include <algorithm>
#include <type_traits>
#include <variant>

// ============================================================================
// Styles
// ============================================================================

namespace {

using namespace std::string_view_literals;

constexpr Style Prompt   = {.fg = Color::Cyan, .bold = true};
constexpr Style Faint    = {.fg = Color::Gray};
constexpr Style Current  = {.fg = Color::White, .bg = Color::Blue, .bold = true};
constexpr Style TooSmall = {.fg = Color::Yellow, .bold = true};

[[nodiscard]] int color_code(const Color color)
{
	switch (color) {
	case Color::Black: return 30;
	case Color::Red: return 31;
	case Color::Green: return 32;
	case Color::Yellow: return 33;
	case Color::Blue: return 34;
	case Color::Magenta: return 35;
	case Color::Cyan: return 36;
	case Color::White: return 37;
	case Color::Gray: return 90;
	case Color::Default: break;
	}
	return 0;
}

[[nodiscard]] Style with_fg(Style style, const Color fg)
{
	style.fg = fg;
	return style;
}

[[nodiscard]] std::string spinner_glyph(const size_t frame)
{
	std::string glyph = {};
	Util::append_utf8(glyph, Renderer::SpinnerFrames[frame % Renderer::SpinnerFrames.size()]);
	return glyph;
}

} // namespace

// ============================================================================
// Renderer
// ============================================================================

Renderer::Renderer(Terminal& terminal) : terminal_(terminal) {}

void Renderer::resize(const size_t rows, const size_t cols, const size_t origin)
{
	buffer_.resize(rows, cols);
	origin_ = origin;
	invalidate();
}

void Renderer::invalidate()
{
	buffer_.invalidate();
	style_.reset();
	cursor_.reset();
}

[[nodiscard]] size_t Renderer::page_size(const size_t rows, const bool show_help)
{
	const size_t reserved = Display::PromptRows + (show_help ? Display::HelpRows : 0);
	return rows > reserved ? rows - reserved : 0;
}

void Renderer::set_style(const Style style)
{
	if (style_ && *style_ == style) {
		return;
	}

	out_ += "\033[0"sv;
	if (style.bold) {
		out_ += ";1"sv;
	}
	if (style.dim) {
		out_ += ";2"sv;
	}
	if (style.underline) {
		out_ += ";4"sv;
	}
	if (const int fg = color_code(style.fg)) {
		out_ += ';' + std::to_string(fg);
	}
	if (const int bg = color_code(style.bg)) {
		out_ += ';' + std::to_string(bg + 10);
	}
	out_ += 'm';
	style_ = style;
}

void Renderer::move_to(const size_t row, const size_t col)
{
	if (cursor_ && *cursor_ == std::pair{row, col}) {
		return;
	}
	out_ += "\033["sv;
	out_ += std::to_string(origin_ + row + 1);
	out_ += ';';
	out_ += std::to_string(col + 1);
	out_ += 'H';
	cursor_ = std::pair{row, col};
}

void Renderer::compose_header(const FrameView& frame)
{
	const size_t cols = buffer_.cols();

	size_t col = buffer_.put(0, 0, frame.prompt, Prompt);
	col        = buffer_.put(0, col, frame.selection.query(), {});
	col        = buffer_.put(0, col, "_"sv, with_fg({}, Color::Cyan));

	std::string counter = std::to_string(frame.results.size()) + "/" +
	                      std::to_string(frame.session.items().size());

	std::string status = {};
	bool spinning      = false;
	if (frame.show_status) {
		std::visit(
		        [&](auto&& arg) {
			        using T = std::decay_t<decltype(arg)>;

			        if constexpr (std::is_same_v<T, Loading>) {
				        spinning = true;
				        status   = arg.message.value_or("");
			        } else if constexpr (std::is_same_v<T, Ready>) {
				        status = arg.message.value_or("");
			        }
		        },
		        frame.session.status());
	}

	// Right-aligned: [spinner] [message]  matched/total
	const size_t width = Util::utf8_length(counter) + (spinning ? 2 : 0) +
	                     (status.empty() ? 0 : Util::utf8_length(status) + 1);
	if (col + 1 + width > cols) {
		return;
	}

	size_t at = cols - width;
	if (spinning) {
		buffer_.put(0, at, spinner_glyph(frame.spinner_frame), with_fg({}, Color::Yellow));
		at += 2;
	}
	if (!status.empty()) {
		at = buffer_.put(0, at, status, Faint) + 1;
	}
	buffer_.put(0, at, counter, Faint);
}

void Renderer::compose_item(const size_t row, const SearchResult& result, const bool current,
                            const FrameView& frame)
{
	const auto& items = frame.session.items();
	if (result.index >= items.size()) {
		return;
	}
	const auto& item  = items[result.index];
	const size_t cols = buffer_.cols();
	const Style base  = current ? Current : Style{};

	buffer_.fill(row, 0, cols, base);
	if (current) {
		buffer_.put(row, 0, ">"sv, with_fg(base, Color::Cyan));
	}

	size_t col = 2;
	if (frame.selection.multi_select()) {
		const bool marked = frame.selection.is_selected(item.index);
		buffer_.put(row, col, marked ? "●"sv : "○"sv,
		            with_fg(base, marked ? Color::Green : Color::Gray));
		col += 2;
	}

	if (const auto* indicator = frame.session.indicator_for(item.index)) {
		const auto before = col;
		std::visit(
		        [&](auto&& arg) {
			        using T = std::decay_t<decltype(arg)>;

			        if constexpr (std::is_same_v<T, Indicators::Spinner>) {
				        col = buffer_.put(row, col, spinner_glyph(frame.spinner_frame),
				                          with_fg(base, Color::Yellow));
			        } else if constexpr (std::is_same_v<T, Indicators::Success>) {
				        col = buffer_.put(row, col, "✓"sv, with_fg(base, Color::Green));
			        } else if constexpr (std::is_same_v<T, Indicators::Error>) {
				        col = buffer_.put(row, col, "✗"sv, with_fg(base, Color::Red));
			        } else if constexpr (std::is_same_v<T, Indicators::Warning>) {
				        col = buffer_.put(row, col, "⚠"sv, with_fg(base, Color::Yellow));
			        } else if constexpr (std::is_same_v<T, Indicators::Text>) {
				        col = buffer_.put(row, col, arg.text, base);
			        } else if constexpr (std::is_same_v<T, Indicators::ColoredText>) {
				        col = buffer_.put(row, col, arg.text, with_fg(base, arg.color));
			        }
		        },
		        *indicator);
		if (col != before) {
			++col;
		}
	}

	// Matched characters are bold and underlined. Folding keeps byte
	// offsets, so positions in the folded text index the original.
	const auto positions = match_positions(item.folded, Util::to_lower(frame.selection.query()));
	auto next_match      = positions.begin();

	size_t pos = 0;
	while (pos < item.text.size() && col < cols) {
		const size_t start = pos;
		const auto ch      = Util::next_code_point(item.text, pos);

		Style style = base;
		while (next_match != positions.end() && *next_match < start) {
			++next_match;
		}
		if (next_match != positions.end() && *next_match < pos) {
			style.bold      = true;
			style.underline = true;
		}

		// Mark truncation in the last column.
		const bool clipped = (col + 1 == cols) && pos < item.text.size();
		buffer_.at(row, col++) = {.ch = clipped ? U'…' : ch, .style = style};
	}
}

void Renderer::compose_help(const size_t row, const bool multi_select)
{
	const auto help = multi_select
	                          ? "↑/↓ Move  PgUp/PgDn Page  Tab/Space Toggle  Enter Confirm  Esc Cancel"sv
	                          : "↑/↓ Move  PgUp/PgDn Page  Enter Confirm  Esc Cancel"sv;
	buffer_.put(row, 0, help, Faint);
}

void Renderer::compose(const FrameView& frame)
{
	buffer_.clear();

	const size_t rows = buffer_.rows();
	if (rows == 0 || buffer_.cols() == 0) {
		return;
	}

	const size_t page = page_size(rows, frame.show_help);
	if (page == 0) {
		buffer_.put(0, 0, "Terminal too small"sv, TooSmall);
		return;
	}

	compose_header(frame);

	const auto& results = frame.results;
	if (results.empty() && !frame.selection.query().empty() &&
	    !frame.session.items().empty()) {
		buffer_.put(Display::PromptRows, 2, "No matches found."sv, Faint);
	}

	for (size_t i = 0; i < page; ++i) {
		const size_t idx = frame.scroll + i;
		if (idx >= results.size()) {
			break;
		}
		compose_item(Display::PromptRows + i, results[idx], idx == frame.selection.cursor(),
		             frame);
	}

	if (frame.show_help) {
		compose_help(rows - Display::HelpRows, frame.selection.multi_select());
	}
}

size_t Renderer::draw(const FrameView& frame)
{
	compose(frame);

	size_t written = 0;
	for (const auto& span : buffer_.diff()) {
		move_to(span.row, span.begin);
		for (size_t col = span.begin; col < span.end; ++col) {
			const auto& cell = buffer_.at(span.row, col);
			set_style(cell.style);
			Util::append_utf8(out_, cell.ch);
			++written;
		}
		cursor_ = std::pair{span.row, span.end};
	}

	if (!out_.empty()) {
		terminal_.write(out_);
		terminal_.flush();
		out_.clear();
	}

	buffer_.swap();
	return written;
}

void Renderer::erase()
{
	set_style({});
	for (size_t row = 0; row < buffer_.rows(); ++row) {
		move_to(row, 0);
		out_ += "\033[2K"sv;
	}
	move_to(0, 0);

	terminal_.write(out_);
	terminal_.flush();
	out_.clear();
	invalidate();
}

[[nodiscard]] std::string Renderer::row_text(const size_t row) const
{
	std::string text = {};
	if (row >= buffer_.rows()) {
		return text;
	}
	for (size_t col = 0; col < buffer_.cols(); ++col) {
		Util::append_utf8(text, buffer_.front_at(row, col).ch);
	}
	while (!text.empty() && text.back() == ' ') {
		text.pop_back();
	}
	return text;
}

[[nodiscard]] size_t Renderer::rows() const
{
	return buffer_.rows();
}

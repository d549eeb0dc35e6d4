#include "utilities.h"

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

namespace {

[[nodiscard]] size_t encoded_size(const char32_t cp)
{
	if (cp <= 0x7F) {
		return 1;
	}
	if (cp <= 0x7FF) {
		return 2;
	}
	return cp <= 0xFFFF ? 3 : 4;
}

[[nodiscard]] bool even(const char32_t cp)
{
	return (cp & 1) == 0;
}

} // namespace

[[nodiscard]] char32_t fold_case(const char32_t cp)
{
	if (cp < 0x80) {
		return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
	}

	// Latin-1 Supplement
	if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
		return cp + 0x20;
	}

	// Latin Extended-A pairs upper/lower on alternating code points.
	if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
	    (cp >= 0x14A && cp <= 0x177)) {
		return even(cp) ? cp + 1 : cp;
	}
	if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
		return even(cp) ? cp : cp + 1;
	}
	if (cp == 0x178) {
		return 0xFF;
	}

	// Greek
	if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) {
		return cp + 0x20;
	}
	switch (cp) {
	case 0x386: return 0x3AC;
	case 0x388:
	case 0x389:
	case 0x38A: return cp + 0x25;
	case 0x38C: return 0x3CC;
	case 0x38E:
	case 0x38F: return cp + 0x3F;
	}

	// Cyrillic
	if (cp >= 0x410 && cp <= 0x42F) {
		return cp + 0x20;
	}
	if (cp >= 0x400 && cp <= 0x40F) {
		return cp + 0x50;
	}
	return cp;
}

[[nodiscard]] std::string to_lower(const std::string_view s)
{
	std::string result = {};
	result.reserve(s.size());

	for (size_t pos = 0; pos < s.size();) {
		const size_t start = pos;
		const auto cp      = next_code_point(s, pos);
		const auto folded  = fold_case(cp);

		// Malformed and overlong input is copied as is, so the folded text
		// always has the byte length of the original.
		if (folded == cp || encoded_size(folded) != pos - start) {
			result.append(s.substr(start, pos - start));
		} else {
			append_utf8(result, folded);
		}
	}
	return result;
}

[[nodiscard]] std::string_view trim(const std::string_view s)
{
	constexpr std::string_view whitespace = " \t\r\n\v\f";

	const auto first = s.find_first_not_of(whitespace);
	if (first == std::string_view::npos) {
		return {};
	}
	const auto last = s.find_last_not_of(whitespace);
	return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string> split_lines(const std::string_view text)
{
	std::vector<std::string> lines = {};

	size_t start = 0;
	while (start <= text.size()) {
		auto end = text.find('\n', start);
		if (end == std::string_view::npos) {
			end = text.size();
		}

		const auto line = trim(text.substr(start, end - start));
		if (!line.empty()) {
			lines.emplace_back(line);
		}
		start = end + 1;
	}
	return lines;
}

[[nodiscard]] char32_t next_code_point(const std::string_view s, size_t& pos)
{
	constexpr char32_t Replacement = 0xFFFD;

	const auto lead = static_cast<unsigned char>(s[pos]);
	if (lead < 0x80) {
		++pos;
		return lead;
	}

	size_t extra = 0;
	char32_t cp  = 0;
	if ((lead & 0xE0) == 0xC0) {
		extra = 1;
		cp    = lead & 0x1F;
	} else if ((lead & 0xF0) == 0xE0) {
		extra = 2;
		cp    = lead & 0x0F;
	} else if ((lead & 0xF8) == 0xF0) {
		extra = 3;
		cp    = lead & 0x07;
	} else {
		++pos;
		return Replacement;
	}

	if (pos + extra >= s.size()) {
		++pos;
		return Replacement;
	}

	for (size_t i = 1; i <= extra; ++i) {
		const auto c = static_cast<unsigned char>(s[pos + i]);
		if ((c & 0xC0) != 0x80) {
			++pos;
			return Replacement;
		}
		cp = (cp << 6) | (c & 0x3F);
	}

	pos += extra + 1;
	return cp;
}

void append_utf8(std::string& out, const char32_t cp)
{
	if (cp <= 0x7F) {
		out += static_cast<char>(cp);
	} else if (cp <= 0x7FF) {
		out += static_cast<char>(0xC0 | ((cp >> 6) & 0x1F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp <= 0xFFFF) {
		out += static_cast<char>(0xE0 | ((cp >> 12) & 0x0F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | ((cp >> 18) & 0x07));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

bool pop_code_point(std::string& s)
{
	if (s.empty()) {
		return false;
	}

	size_t len = 1;
	while (len < s.size() && len < 4 &&
	       (static_cast<unsigned char>(s[s.size() - len]) & 0xC0) == 0x80) {
		++len;
	}
	s.resize(s.size() - len);
	return true;
}

[[nodiscard]] size_t utf8_length(const std::string_view s)
{
	size_t count = 0;
	for (size_t pos = 0; pos < s.size();) {
		(void)next_code_point(s, pos);
		++count;
	}
	return count;
}

} // namespace Util

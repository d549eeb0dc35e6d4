#ifndef UTILITIES_H
#define UTILITIES_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

// Simple lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and
// Cyrillic letters. Every mapped pair has the same UTF-8 length.
[[nodiscard]] char32_t fold_case(const char32_t cp);

// Case-folded copy with exactly the byte length of s, so byte offsets into
// the result are valid offsets into s.
[[nodiscard]] std::string to_lower(const std::string_view s);

[[nodiscard]] std::string_view trim(const std::string_view s);

// Non-empty, trimmed lines of text.
[[nodiscard]] std::vector<std::string> split_lines(const std::string_view text);

// Decodes the code point starting at pos and advances pos past it.
// Malformed bytes decode to U+FFFD and consume one byte.
[[nodiscard]] char32_t next_code_point(const std::string_view s, size_t& pos);

void append_utf8(std::string& out, const char32_t cp);

// Removes the last UTF-8 code point; returns false on an empty string.
bool pop_code_point(std::string& s);

[[nodiscard]] size_t utf8_length(const std::string_view s);

} // namespace Util

#endif

#ifndef ITEM_READER_H
#define ITEM_READER_H

#include "session.h"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

// ============================================================================
// Item sources
// ============================================================================

enum class SourceKind {
	File,
	Directory,
	Stdin,
	Direct,
};

struct ItemSource {
	SourceKind kind                = SourceKind::Direct;
	std::filesystem::path path     = {};
	std::vector<std::string> items = {};
};

namespace ItemReader {

constexpr size_t StreamBatch = 256;

[[nodiscard]] bool stdin_is_terminal();

// A lone "-", or no arguments with piped stdin, streams stdin. A lone
// existing file or directory is read. Anything else is the item list.
// Throws UsageError when there is nothing to read.
[[nodiscard]] ItemSource resolve(const std::vector<std::string>& positional,
                                 const bool stdin_terminal);

// Non-empty trimmed lines.
[[nodiscard]] std::vector<std::string> read_file(const std::filesystem::path& path);

// Entry names, sorted.
[[nodiscard]] std::vector<std::string> list_directory(const std::filesystem::path& path);

// Items of a non-streaming source. Throws EmptyInputError when it has none.
[[nodiscard]] std::vector<std::string> load(const ItemSource& source);

// Feeds lines to the session as they arrive, then marks input finished.
// Lines are published in batches of up to `batch`; a partial batch is
// published whenever the stream's buffer runs dry. Returns early once the
// session is closed. Throws EmptyInputError when the stream held no items.
void stream(std::istream& in, Session& session, const size_t batch = StreamBatch);

} // namespace ItemReader

#endif

#include "item_reader.h"
#include "errors_t.h"
#include "utilities.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

// ============================================================================
// Item sources
// ============================================================================

namespace ItemReader {

[[nodiscard]] bool stdin_is_terminal()
{
#ifdef _WIN32
	return _isatty(_fileno(stdin)) != 0;
#else
	return isatty(STDIN_FILENO) != 0;
#endif
}

[[nodiscard]] ItemSource resolve(const std::vector<std::string>& positional,
                                 const bool stdin_terminal)
{
	if (positional.empty()) {
		if (stdin_terminal) {
			throw UsageError("no items given and stdin is a terminal");
		}
		return {.kind = SourceKind::Stdin};
	}

	if (positional.size() == 1) {
		const auto& arg = positional.front();
		if (arg == "-") {
			return {.kind = SourceKind::Stdin};
		}

		std::error_code ec = {};
		if (std::filesystem::is_directory(arg, ec)) {
			return {.kind = SourceKind::Directory, .path = arg};
		}
		if (std::filesystem::is_regular_file(arg, ec)) {
			return {.kind = SourceKind::File, .path = arg};
		}
	}

	return {.kind = SourceKind::Direct, .items = positional};
}

[[nodiscard]] std::vector<std::string> read_file(const std::filesystem::path& path)
{
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		throw std::runtime_error("cannot open " + path.string());
	}

	std::ostringstream content;
	content << file.rdbuf();
	if (file.bad()) {
		throw std::runtime_error("cannot read " + path.string());
	}
	return Util::split_lines(content.str());
}

[[nodiscard]] std::vector<std::string> list_directory(const std::filesystem::path& path)
{
	std::vector<std::string> names = {};
	for (const auto& entry : std::filesystem::directory_iterator(path)) {
		names.push_back(entry.path().filename().string());
	}
	std::ranges::sort(names);
	return names;
}

[[nodiscard]] std::vector<std::string> load(const ItemSource& source)
{
	std::vector<std::string> items = {};

	switch (source.kind) {
	case SourceKind::File: items = read_file(source.path); break;
	case SourceKind::Directory: items = list_directory(source.path); break;
	case SourceKind::Direct: items = source.items; break;
	case SourceKind::Stdin: throw std::logic_error("stdin is streamed, not loaded");
	}

	if (items.empty()) {
		throw EmptyInputError("no items to search through");
	}
	return items;
}

void stream(std::istream& in, Session& session, const size_t batch)
{
	std::vector<std::string> pending = {};
	size_t published                 = 0;

	const auto publish = [&] {
		if (!pending.empty()) {
			published += pending.size();
			session.add_batch(std::exchange(pending, {}));
		}
	};

	try {
		std::string line = {};
		while (std::getline(in, line)) {
			const auto item = Util::trim(line);
			if (!item.empty()) {
				pending.emplace_back(item);
			}

			// A full batch goes out at once; a partial one only when the
			// buffered input is exhausted and the next read could block.
			if (pending.size() >= batch || in.rdbuf()->in_avail() <= 0) {
				publish();
			}
		}
		if (in.bad()) {
			throw std::runtime_error("cannot read input");
		}
		publish();
		if (published == 0) {
			throw EmptyInputError("no items found in stdin");
		}
		session.finish_input();
	} catch (const ClosedSessionError&) {
		// The user already decided; the rest of the input is not needed.
		return;
	}
}

} // namespace ItemReader

#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include "config.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Command line
// ============================================================================

struct CommandLine {
	std::vector<std::string> positional     = {};
	bool multi_select                       = false;
	bool no_help                            = false;
	bool show_usage                         = false;
	bool benchmark                          = false; // `benchmark` as the only positional
	std::optional<size_t> height            = {};
	std::optional<size_t> height_percentage = {};
	std::optional<std::string> prompt       = {};
	std::optional<std::string> query        = {};
	std::optional<std::string> config_path  = {};

	// Flags override whatever the config file set.
	void apply(FinderConfig& config) const;
};

// Arguments without the program name. Throws UsageError.
[[nodiscard]] CommandLine parse_command_line(const std::vector<std::string_view>& args);

void print_usage(std::ostream& out, const std::string_view program);

#endif

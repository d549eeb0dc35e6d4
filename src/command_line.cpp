#include "command_line.h"
#include "errors_t.h"

#include <charconv>
#include <limits>

// ============================================================================
// Command line
// ============================================================================

namespace {

[[nodiscard]] size_t parse_count(const std::string_view flag, const std::string_view value,
                                 const size_t max)
{
	size_t result        = 0;
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() ||
	    result == 0 || result > max) {
		throw UsageError("invalid value '" + std::string(value) + "' for " + std::string(flag));
	}
	return result;
}

} // namespace

void CommandLine::apply(FinderConfig& config) const
{
	if (multi_select) {
		config.multi_select = true;
	}
	if (no_help) {
		config.show_help = false;
	}
	if (height) {
		config.height      = *height;
		config.height_mode = HeightMode::Fixed;
	}
	if (height_percentage) {
		config.height_percentage = *height_percentage;
		config.height_mode       = HeightMode::Percentage;
	}
	if (prompt) {
		config.prompt = *prompt;
	}
	if (query) {
		config.query = *query;
	}
}

[[nodiscard]] CommandLine parse_command_line(const std::vector<std::string_view>& args)
{
	CommandLine cli = {};
	bool options    = true;

	for (size_t i = 0; i < args.size(); ++i) {
		auto arg = args[i];

		if (!options || arg == "-" || !arg.starts_with('-')) {
			cli.positional.emplace_back(arg);
			continue;
		}
		if (arg == "--") {
			options = false;
			continue;
		}

		// --flag=value or --flag value
		std::optional<std::string_view> inline_value = {};
		if (const auto eq = arg.find('='); arg.starts_with("--") && eq != std::string_view::npos) {
			inline_value = arg.substr(eq + 1);
			arg          = arg.substr(0, eq);
		}

		const auto value = [&]() -> std::string_view {
			if (inline_value) {
				return *inline_value;
			}
			if (i + 1 >= args.size()) {
				throw UsageError("missing value for " + std::string(arg));
			}
			return args[++i];
		};

		const bool is_switch = arg == "-h" || arg == "--help" || arg == "-m" ||
		                       arg == "--multi-select" || arg == "--no-help";
		if (is_switch && inline_value) {
			throw UsageError(std::string(arg) + " takes no value");
		}

		if (arg == "-h" || arg == "--help") {
			cli.show_usage = true;
		} else if (arg == "-m" || arg == "--multi-select") {
			cli.multi_select = true;
		} else if (arg == "--no-help") {
			cli.no_help = true;
		} else if (arg == "--height") {
			cli.height = parse_count(arg, value(), std::numeric_limits<size_t>::max());
		} else if (arg == "--height-percentage") {
			cli.height_percentage = parse_count(arg, value(), 100);
		} else if (arg == "--prompt") {
			cli.prompt = std::string(value());
		} else if (arg == "--query") {
			cli.query = std::string(value());
		} else if (arg == "--config") {
			cli.config_path = std::string(value());
		} else {
			throw UsageError("unknown option " + std::string(arg));
		}
	}

	if (cli.positional.size() == 1 && cli.positional.front() == "benchmark") {
		cli.benchmark = true;
		cli.positional.clear();
	}
	return cli;
}

void print_usage(std::ostream& out, const std::string_view program)
{
	out << "Usage: " << program << " [options] [<file> | <directory> | - | <item>...]\n"
	    << "       " << program << " benchmark\n"
	    << "\n"
	    << "Input:\n"
	    << "  <file>                    one item per non-empty line\n"
	    << "  <directory>               the directory's entries\n"
	    << "  -                         lines streamed from stdin (default when piped)\n"
	    << "  <item>...                 the arguments themselves\n"
	    << "  benchmark                 time filtering over generated item sets\n"
	    << "\n"
	    << "Options:\n"
	    << "  -m, --multi-select        select several items with Tab or Space\n"
	    << "  --height <lines>          use an inline area of fixed height\n"
	    << "  --height-percentage <p>   use an inline area of p% of the terminal\n"
	    << "  --prompt <text>           prompt shown before the query\n"
	    << "  --query <text>            initial query\n"
	    << "  --config <path>           XML config file\n"
	    << "  --no-help                 hide the key help line\n"
	    << "  -h, --help                show this help\n"
	    << "\n"
	    << "Selected items are printed to stdout, one per line.\n"
	    << "Exit status: 0 selected, 1 error, 2 usage error, 130 cancelled.\n";
}

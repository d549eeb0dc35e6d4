// ff: an interactive fuzzy finder for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "application.h"
#include "benchmark.h"
#include "command_line.h"
#include "config.h"
#include "console_terminal.h"
#include "errors_t.h"
#include "exit_codes_t.h"
#include "item_reader.h"
#include "session.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

// ============================================================================
// Main
// ============================================================================

namespace {

[[nodiscard]] int report(const SelectionOutcome& outcome)
{
	return std::visit(
	        [](auto&& arg) {
		        using T = std::decay_t<decltype(arg)>;

		        if constexpr (std::is_same_v<T, Selected>) {
			        for (const auto& item : arg.items) {
				        std::cout << item << '\n';
			        }
			        std::cout << std::flush;
			        return ExitSuccess;
		        } else {
			        return ExitCancelled;
		        }
	        },
	        outcome);
}

} // namespace

int main(const int argc, char* const argv[])
{
	using namespace std::string_view_literals;

	const std::string_view program = argc > 0 ? argv[0] : "ff";

	// An unsynced std::cin buffers reads, which lets the stdin reader batch
	// lines that are already available.
	std::ios::sync_with_stdio(false);

	try {
		const std::vector<std::string_view> args(argv + std::min(argc, 1), argv + argc);
		const auto cli = parse_command_line(args);
		if (cli.show_usage) {
			print_usage(std::cout, program);
			return ExitSuccess;
		}
		if (cli.benchmark) {
			Benchmark::run(std::cout, {Benchmark::Sizes.begin(), Benchmark::Sizes.end()},
			               Benchmark::Iterations);
			return ExitSuccess;
		}

		auto config = ConfigLoader::load_or_default(cli.config_path);
		cli.apply(config);

		const auto source = ItemReader::resolve(cli.positional,
		                                        ItemReader::stdin_is_terminal());

		auto session = std::make_shared<Session>(config.loading_message,
		                                         config.ready_message);
		if (source.kind != SourceKind::Stdin) {
			session->add_batch(ItemReader::load(source));
			session->finish_input();
		}

		ConsoleTerminal terminal;

		std::jthread producer;
		if (source.kind == SourceKind::Stdin) {
			producer = std::jthread([session] {
				try {
					ItemReader::stream(std::cin, *session);
				} catch (const std::exception&) {
					// Ends the render loop; the error surfaces from await_result().
					session->fail(std::current_exception());
				}
			});
		}

		Application app(terminal, *session, std::move(config));
		app.run();

		// The producer may be blocked on a read that never completes; it
		// keeps the session alive on its own.
		if (producer.joinable()) {
			producer.detach();
		}

		return report(session->await_result());
	} catch (const UsageError& e) {
		std::cerr << "Error: "sv << e.what() << "\n\n"sv;
		print_usage(std::cerr, program);
		return ExitUsage;
	} catch (const std::exception& e) {
		std::cerr << "Fatal error: "sv << e.what() << '\n';
		return ExitError;
	} catch (...) {
		std::cerr << "Unknown fatal error\n"sv;
		return ExitError;
	}
}

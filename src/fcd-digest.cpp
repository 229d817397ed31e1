#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "pipeline.hpp"
#include "timer.hpp"

using namespace fcd_digest;

namespace {

constexpr int exit_input_error = 1;
constexpr int exit_write_error = 2;

[[nodiscard]] auto create_argv_parser() -> argparse::ArgumentParser {
	auto argv_parser = argparse::ArgumentParser("fcd-digest", "0.1.0");
	argv_parser.add_description(
		"Turns a SUMO floating car data trace into trajectories, a congestion map and a "
		"validation report.");

	argv_parser.add_argument("config")
		.default_value(std::string("config.toml"))
		.nargs(argparse::nargs_pattern::optional)
		.help("TOML configuration file");

	argv_parser.add_argument("--fcd").help("FCD trace, overrides input.fcd");
	argv_parser.add_argument("--net").help("SUMO network, overrides input.net");
	argv_parser.add_argument("--out-dir").help("output directory, overrides output.dir");

	argv_parser.add_argument("--no-trajectories")
		.default_value(false)
		.implicit_value(true)
		.nargs(0)
		.help("skip the trajectory export");
	argv_parser.add_argument("--no-congestion")
		.default_value(false)
		.implicit_value(true)
		.nargs(0)
		.help("skip aggregation, the congestion map and the validation report");
	argv_parser.add_argument("--no-progress")
		.default_value(false)
		.implicit_value(true)
		.nargs(0)
		.help("do not draw a progress bar");

	argv_parser.add_argument("-V", "--verbose").default_value(false).implicit_value(true).nargs(0);

	argv_parser.add_argument("--print-config-schema")
		.default_value(false)
		.implicit_value(true)
		.nargs(0)
		.help("print an annotated config.toml and exit");

	return argv_parser;
}

auto apply_overrides(const argparse::ArgumentParser& argv_parser, ProgramOptions& options) -> void {
	if (const auto fcd = argv_parser.present<std::string>("--fcd")) {
		options.fcd_path = *fcd;
	}
	if (const auto net = argv_parser.present<std::string>("--net")) {
		options.net_path = *net;
	}
	if (const auto out_dir = argv_parser.present<std::string>("--out-dir")) {
		options.output.dir = *out_dir;
	}
	if (argv_parser.get<bool>("--no-trajectories")) {
		options.trajectories_enabled = false;
	}
	if (argv_parser.get<bool>("--no-congestion")) {
		options.aggregation_enabled = false;
	}
	if (argv_parser.get<bool>("--no-progress")) {
		options.show_progress = false;
	}
	if (argv_parser.get<bool>("--verbose")) {
		options.verbose = true;
	}
}

} // namespace

auto main(int argc, char** argv) -> int {
	auto argv_parser = create_argv_parser();
	try {
		argv_parser.parse_args(argc, argv);
	} catch (const std::exception& err) {
		spdlog::error("{}", err.what());
		fmt::print(stderr, "{}\n", argv_parser.help().str());
		return exit_input_error;
	}

	if (argv_parser.get<bool>("--print-config-schema")) {
		ProgramOptions::print_toml_schema();
		return EXIT_SUCCESS;
	}

	const auto config_file = std::filesystem::path(argv_parser.get<std::string>("config"));
	auto	   options = ProgramOptions {};
	if (std::filesystem::exists(config_file)) {
		auto loaded = load_config(config_file);
		if (! loaded) {
			spdlog::error("{}", loaded.error());
			return exit_input_error;
		}
		options = std::move(*loaded);
	} else if (argv_parser.is_used("config")) {
		spdlog::error("Configuration file not found: {}", config_file.string());
		return exit_input_error;
	} else {
		spdlog::warn("{} not found, using the built-in defaults", config_file.string());
	}
	apply_overrides(argv_parser, options);

	spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
	if (options.verbose) {
		pprint(options);
	}

	if (! options.trajectories_enabled && ! options.aggregation_enabled) {
		spdlog::warn("Both trajectories and congestion are disabled, nothing to do");
		return EXIT_SUCCESS;
	}

	const auto timer = Timer {};
	const auto result = run_pipeline(options);
	if (! result) {
		spdlog::error("{}", result.error());
		return exit_input_error;
	}

	const auto written = write_artifacts(options, *result);
	if (! written) {
		spdlog::error("{}", written.error());
		return exit_write_error;
	}

	spdlog::info("Done in {}", humantime(timer.elapsed_us()));
	return EXIT_SUCCESS;
}

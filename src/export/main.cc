#include <iostream>
#include <optional>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "csv_exporter.h"
#include "data_locator.h"
#include "time_parse.h"

using namespace Stabping;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Parses an optional --start/--end value. Returns false on malformed input.
bool ParseBound(const cxxopts::ParseResult& result, const std::string& name, int64_t& bound) {
	if (!result.count(name)) {
		return true;
	}
	const std::string text = result[name].as<std::string>();
	std::optional<int64_t> ts = ParseUtcDatetime(text);
	if (!ts.has_value()) {
		LOG(ERROR) << "Invalid datetime: '" << text << "'. Use YYYY-MM-DD [HH:MM[:SS]]";
		return false;
	}
	bound = *ts;
	return true;
}

bool LoadSettings(Configuration& config, const cxxopts::ParseResult& result) {
	if (result.count("settings")) {
		const std::string path = result["settings"].as<std::string>();
		if (!config.loadFromFile(path)) {
			for (const auto& error : config.getValidationErrors()) {
				LOG(ERROR) << "Settings validation error: " << error;
			}
			return false;
		}
		LOG(INFO) << "Loaded settings from " << path;
		return true;
	}
	// Env overrides still apply without a settings file.
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Settings validation error: " << error;
		}
		return false;
	}
	return true;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	FLAGS_logtostderr = 1; // diagnostics on stderr, CSV may go to stdout

	cxxopts::Options options("stabping_export", "Dump stabping tcpping data to CSV");
	options.add_options()
		("start", "Start datetime (UTC): YYYY-MM-DD [HH:MM[:SS]]", cxxopts::value<std::string>())
		("end", "End datetime (UTC): YYYY-MM-DD [HH:MM[:SS]]", cxxopts::value<std::string>())
		("o,output", "Output CSV file (default: stdout)", cxxopts::value<std::string>())
		("config", "Path to stabping_config.json", cxxopts::value<std::string>())
		("settings", "YAML settings file for this tool", cxxopts::value<std::string>())
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		std::cerr << options.help() << std::endl;
		return kExitUsage;
	}
	const cxxopts::ParseResult& result = *parsed;

	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return kExitOk;
	}
	FLAGS_v = result["log_level"].as<int>();

	TimeRange range;
	if (!ParseBound(result, "start", range.start) || !ParseBound(result, "end", range.end)) {
		return kExitUsage;
	}

	Configuration& config = Configuration::getInstance();
	if (!LoadSettings(config, result)) {
		return kExitFailure;
	}

	DataLocator locator(config);
	std::optional<std::string> stabping_config;
	if (result.count("config")) {
		stabping_config = result["config"].as<std::string>();
	}
	auto data_dir = locator.FindDataDir(stabping_config);
	if (!data_dir) {
		return kExitFailure;
	}
	LOG(INFO) << "Using data directory " << data_dir->string();

	auto addresses = locator.ReadAddressIndex(*data_dir);
	if (!addresses) {
		return kExitFailure;
	}
	auto log_bytes = locator.ReadDataFile(*data_dir);
	if (!log_bytes) {
		return kExitFailure;
	}

	const size_t buffer_size = config.getOutputBufferSize();
	std::optional<std::string> output_path;
	if (result.count("output")) {
		output_path = result["output"].as<std::string>();
	}
	SinkFactory open_sink = [&]() -> std::unique_ptr<TextSink> {
		if (output_path) {
			return FdTextSink::OpenFile(*output_path, buffer_size);
		}
		return FdTextSink::Stdout(buffer_size);
	};

	CsvOptions csv_options;
	csv_options.line_terminator = config.getLineTerminator();

	ExportResult exported = ExportCsv(*log_bytes, *addresses, range, open_sink, csv_options);
	switch (exported.status) {
		case ExportStatus::kOk:
		case ExportStatus::kEmpty:
			return kExitOk;
		case ExportStatus::kOutputError:
			return kExitFailure;
	}
	return kExitFailure;
}

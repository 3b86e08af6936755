#include <exception>
#include <iostream>
#include <string>

#include "Config.h"
#include "batch_runner.h"
#include "job_loader.h"
#include "logger.h"

using namespace ShapeKit;

namespace {
	void PrintUsage(const char* program) {
		std::cerr << "Usage: " << program << " <jobs.ini> [--output-dir <dir>] [--ignore-errors] [--verbose | --quiet]"
				  << std::endl;
	}
} // namespace

int main(int argc, char** argv) {
	if (argc < 2) {
		PrintUsage(argv[0]);
		return 1;
	}

	std::string jobs_file;
	std::string output_dir;
	bool        ignore_errors = false;
	logger::setThreshold(logger::LogLevel::INFO);

	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "--output-dir" && i + 1 < argc) {
			output_dir = argv[++i];
		} else if (arg == "--ignore-errors") {
			ignore_errors = true;
		} else if (arg == "--verbose") {
			logger::setThreshold(logger::LogLevel::DEBUG);
		} else if (arg == "--quiet") {
			logger::setThreshold(logger::LogLevel::WARNING);
		} else if (arg == "-h" || arg == "--help") {
			PrintUsage(argv[0]);
			return 0;
		} else if (jobs_file.empty() && arg.rfind("--", 0) != 0) {
			jobs_file = arg;
		} else {
			std::cerr << "Unknown argument: " << arg << std::endl;
			PrintUsage(argv[0]);
			return 1;
		}
	}

	Config config(jobs_file);
	if (!config.Load()) {
		logger::ERROR("Could not open job file {}", jobs_file);
		return 1;
	}

	try {
		auto        jobs = JobLoader::Load(config);
		BatchRunner runner(ignore_errors || JobLoader::IgnoreErrors(config), output_dir);
		BatchReport report = runner.Run(jobs);
		for (const auto& failure : report.failures) {
			std::cerr << "  job " << failure.index + 1 << " [" << failure.name << "]: " << failure.message << std::endl;
		}
		return report.Ok() ? 0 : 2;
	} catch (const std::exception& e) {
		logger::ERROR("Batch aborted: {}", e.what());
		return 1;
	}
}

#include "batch_runner.h"

#include <exception>

#include "logger.h"
#include "obj_io.h"

namespace ShapeKit {

	BatchRunner::BatchRunner(bool ignore_errors, std::filesystem::path output_dir):
		ignore_errors_(ignore_errors), output_dir_(std::move(output_dir)) {}

	std::string BatchRunner::RunOne(const BatchJob& job) const {
		Model                 model = job.Build();
		std::filesystem::path path = output_dir_ / job.OutputName();
		WriteObj(path.string(), model);
		return path.string();
	}

	BatchReport BatchRunner::Run(const std::vector<BatchJob>& jobs) const {
		BatchReport report;
		for (size_t i = 0; i < jobs.size(); ++i) {
			const auto& job = jobs[i];
			if (!ignore_errors_) {
				report.written.push_back(RunOne(job));
				continue;
			}

			try {
				report.written.push_back(RunOne(job));
			} catch (const std::exception& e) {
				logger::ERROR("Job {} '{}' failed: {}", i + 1, job.name, e.what());
				report.failures.push_back(BatchFailure{i, job.name, e.what()});
			}
		}
		logger::INFO("Batch finished: {} written, {} failed", report.written.size(), report.failures.size());
		return report;
	}

} // namespace ShapeKit

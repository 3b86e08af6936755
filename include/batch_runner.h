#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "job_loader.h"

namespace ShapeKit {

	struct BatchFailure {
		size_t      index;
		std::string name;
		std::string message;
	};

	struct BatchReport {
		std::vector<std::string>  written;
		std::vector<BatchFailure> failures;

		bool Ok() const { return failures.empty(); }
	};

	/**
	 * @brief Builds and writes jobs one after another.
	 *
	 * Without ignore_errors the first failing job stops the batch and its
	 * exception propagates. With ignore_errors each failure is logged,
	 * recorded in the report and the batch moves on.
	 */
	class BatchRunner {
	public:
		explicit BatchRunner(bool ignore_errors = false, std::filesystem::path output_dir = {});

		BatchReport Run(const std::vector<BatchJob>& jobs) const;

	private:
		bool                  ignore_errors_;
		std::filesystem::path output_dir_;

		std::string RunOne(const BatchJob& job) const;
	};

} // namespace ShapeKit

#pragma once

#include <map>
#include <string>
#include <vector>

#include "Config.h"
#include "model.h"

namespace ShapeKit {

	/**
	 * @brief One model described by a job file section.
	 *
	 * Settings hold the section's keys merged over the [global] section.
	 * Nothing is parsed until Build, so a broken job only fails itself.
	 */
	struct BatchJob {
		std::string                        name;
		std::map<std::string, std::string> settings;

		/**
		 * @brief Output file name: the "output" key, or the job name, with
		 * ".obj" appended when missing.
		 */
		std::string OutputName() const;

		/**
		 * @brief Create the model and append its perturbations.
		 *
		 * Perturbations are appended in a fixed order: sine, noise, bumps,
		 * custom. The "enabled" vector, when present, indexes that order.
		 * Throws ConfigurationError for unknown keys and bad values, and
		 * PlacementError when bumps cannot be placed.
		 */
		Model Build() const;
	};

	class JobLoader {
	public:
		/**
		 * @brief One job per section other than [global], in file order.
		 */
		static std::vector<BatchJob> Load(const Config& config);

		// Batch-wide "ignore_errors" flag of the [global] section.
		static bool IgnoreErrors(const Config& config);

		static bool IsJobKey(const std::string& key);
	};

} // namespace ShapeKit

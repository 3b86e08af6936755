#include "job_loader.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "component_rows.h"
#include "errors.h"
#include "logger.h"
#include "obj_io.h"

namespace ShapeKit {

	namespace {
		const std::string kGlobalSection = "global";

		constexpr std::array kJobKeys = {
			"shape",
			"sine",
			"modulator",
			"noise",
			"noise_modulator",
			"bumps",
			"custom_matrix",
			"custom_image",
			"custom_amplitude",
			"output",
			"enabled",
		};

		// Batch-level keys are only read from [global].
		bool IsBatchKey(const std::string& key) {
			return key == "ignore_errors";
		}

		std::vector<bool> ParseMask(const std::string& text) {
			std::vector<bool> mask;
			for (double v : ParseNumberList(text, "enabled")) {
				if (v != 0.0 && v != 1.0)
					throw ConfigurationError("option 'enabled' expects 0 or 1 per perturbation");
				mask.push_back(v == 1.0);
			}
			return mask;
		}

		Field ParseMatrix(const std::string& text) {
			auto rows = ParseComponentRows(text, "custom_matrix");
			if (rows.empty())
				throw ConfigurationError("option 'custom_matrix' is empty");
			Field map(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(rows.front().size()));
			for (size_t i = 0; i < rows.size(); ++i) {
				if (rows[i].size() != rows.front().size())
					throw ConfigurationError("option 'custom_matrix': rows must all have the same length");
				for (size_t j = 0; j < rows[i].size(); ++j)
					map(i, j) = rows[i][j];
			}
			return map;
		}
	} // namespace

	bool JobLoader::IsJobKey(const std::string& key) {
		return std::find(kJobKeys.begin(), kJobKeys.end(), key) != kJobKeys.end();
	}

	bool JobLoader::IgnoreErrors(const Config& config) {
		return config.GetBool(kGlobalSection, "ignore_errors", false);
	}

	std::vector<BatchJob> JobLoader::Load(const Config& config) {
		const auto global = config.GetSection(kGlobalSection);

		std::vector<BatchJob> jobs;
		for (const auto& section : config.GetSections()) {
			if (section == kGlobalSection)
				continue;

			BatchJob job;
			job.name = section;
			for (const auto& [key, value] : global) {
				if (!IsBatchKey(key))
					job.settings[key] = value;
			}
			for (const auto& [key, value] : config.GetSection(section))
				job.settings[key] = value;
			jobs.push_back(std::move(job));
		}
		logger::INFO("Loaded {} jobs from {}", jobs.size(), config.GetFilename());
		return jobs;
	}

	std::string BatchJob::OutputName() const {
		auto it = settings.find("output");
		return WithObjExtension(it != settings.end() && !it->second.empty() ? it->second : name);
	}

	Model BatchJob::Build() const {
		auto get = [this](const std::string& key) -> const std::string* {
			auto it = settings.find(key);
			return it != settings.end() ? &it->second : nullptr;
		};

		ModelOptions options;
		for (const auto& [key, value] : settings) {
			if (ModelOptions::IsOptionKey(key))
				options.Apply(key, value);
			else if (!JobLoader::IsJobKey(key))
				throw ConfigurationError("job '" + name + "': unknown option '" + key + "'");
		}

		const std::string* shape = get("shape");
		if (!shape)
			throw ConfigurationError("job '" + name + "': no shape given");

		if (get("modulator") && !get("sine"))
			throw ConfigurationError("job '" + name + "': 'modulator' needs 'sine' carriers");
		if (get("noise_modulator") && !get("noise"))
			throw ConfigurationError("job '" + name + "': 'noise_modulator' needs 'noise' components");
		if (get("custom_matrix") && get("custom_image"))
			throw ConfigurationError("job '" + name + "': give either 'custom_matrix' or 'custom_image', not both");

		Model model = Model::Create(ParseShapeKind(*shape), options);

		if (const auto* sine = get("sine")) {
			std::vector<SineComponent> modulators;
			if (const auto* mod = get("modulator"))
				modulators = SineComponent::Modulators(ParseComponentRows(*mod, "modulator"));
			model.AddSine(SineComponent::Carriers(ParseComponentRows(*sine, "sine")), modulators);
		}

		if (const auto* noise = get("noise")) {
			std::vector<SineComponent> modulators;
			if (const auto* mod = get("noise_modulator"))
				modulators = SineComponent::Modulators(ParseComponentRows(*mod, "noise_modulator"));
			model.AddNoise(NoiseComponent::FromRows(ParseComponentRows(*noise, "noise")), modulators);
		}

		if (const auto* bumps = get("bumps")) {
			std::vector<BumpType> types;
			for (const auto& row : ParseComponentRows(*bumps, "bumps"))
				types.push_back(BumpType::Gaussian(row));
			model.AddBumps(types);
		}

		double peak = 0.1;
		if (const auto* amplitude = get("custom_amplitude")) {
			auto values = ParseNumberList(*amplitude, "custom_amplitude");
			if (values.size() != 1)
				throw ConfigurationError("job '" + name + "': 'custom_amplitude' expects one number");
			peak = values.front();
		}
		if (const auto* matrix = get("custom_matrix"))
			model.AddCustom(ParseMatrix(*matrix), peak);
		if (const auto* image = get("custom_image"))
			model.AddCustom(ImageFile{*image}, peak);

		if (const auto* enabled = get("enabled"))
			model.SetEnabledMask(ParseMask(*enabled));

		return model;
	}

} // namespace ShapeKit

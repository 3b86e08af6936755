#include "model.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "errors.h"
#include "logger.h"

namespace ShapeKit {

	namespace {
		template <typename Component>
		std::string DescribeRows(const std::vector<Component>& components) {
			std::stringstream ss;
			for (size_t k = 0; k < components.size(); ++k) {
				const auto& c = components[k];
				if (k > 0)
					ss << "; ";
				if constexpr (std::is_same_v<Component, SineComponent>) {
					ss << c.frequency << " " << c.amplitude << " " << c.phase << " " << c.orientation << " " << c.group;
				} else if constexpr (std::is_same_v<Component, NoiseComponent>) {
					ss << c.frequency << " " << c.frequency_bandwidth << " " << c.orientation << " "
					   << c.orientation_bandwidth << " " << c.amplitude << " " << c.group;
				} else {
					ss << c.count << " " << c.cutoff;
					for (double p : c.params)
						ss << " " << p;
				}
			}
			return ss.str();
		}
	} // namespace

	std::string_view PerturbationName(PerturbationKind kind) {
		switch (kind) {
		case PerturbationKind::Sine:
			return "sine";
		case PerturbationKind::Noise:
			return "noise";
		case PerturbationKind::Bumps:
			return "bumps";
		case PerturbationKind::Custom:
			return "custom";
		}
		return "unknown";
	}

	Model::Model(std::shared_ptr<const ShapeGrid> grid, const ModelOptions& options):
		grid_(std::move(grid)), options_(options), rng_(options.seed ? *options.seed : std::random_device{}()) {}

	Model Model::Create(ShapeKind kind, const ModelOptions& options) {
		auto grid = MakeShapeGrid(kind, options.shape);
		logger::INFO("Created {} grid {}x{}", ShapeName(kind), grid->Rows(), grid->Cols());
		return Model(std::move(grid), options);
	}

	template <typename Component>
	void Model::CheckAmplitudes(const std::vector<Component>& components, const char* what) const {
		auto limit = grid_->AmplitudeLimit();
		for (size_t k = 0; k < components.size(); ++k) {
			if (!std::isfinite(components[k].amplitude)) {
				std::stringstream ss;
				ss << ShapeName(Shape()) << ": " << what << " component " << k + 1 << " amplitude "
				   << components[k].amplitude << " is not finite";
				throw AmplitudeError(ss.str());
			}
			if (limit && std::abs(components[k].amplitude) >= *limit) {
				std::stringstream ss;
				ss << ShapeName(Shape()) << ": " << what << " component " << k + 1 << " amplitude "
				   << components[k].amplitude << " must be below the base radius " << *limit;
				throw AmplitudeError(ss.str());
			}
		}
	}

	void Model::AddSine(const std::vector<SineComponent>& carriers, const std::vector<SineComponent>& modulators) {
		CheckAmplitudes(carriers, "sine");
		Field field = ComposeSines(carriers, modulators, grid_->ModulationX(), grid_->ModulationY());
		std::string label = "sine [" + DescribeRows(carriers) + "]";
		if (!modulators.empty())
			label += " modulators [" + DescribeRows(modulators) + "]";
		Append(PerturbationKind::Sine, std::move(label), field);
	}

	void Model::AddNoise(const std::vector<NoiseComponent>& components, const std::vector<SineComponent>& modulators) {
		CheckAmplitudes(components, "noise");
		const auto&      spacing = grid_->ModulationSpacing();
		NoiseSynthesizer synth(grid_->Rows(), grid_->Cols(), spacing.x, spacing.y);
		Field field = synth.Compose(components, modulators, grid_->ModulationX(), grid_->ModulationY(), rng_);
		std::string label = "noise [" + DescribeRows(components) + "]";
		if (!modulators.empty())
			label += " modulators [" + DescribeRows(modulators) + "]";
		Append(PerturbationKind::Noise, std::move(label), field);
	}

	void Model::AddBumps(const std::vector<BumpType>& types) {
		BumpPlacer placer(*grid_, options_.min_distance, options_.overlap);
		Field      field = placer.Evaluate(types, GaussianProfile, rng_);
		Append(PerturbationKind::Bumps, "bumps [" + DescribeRows(types) + "]", field);
	}

	void Model::AddCustom(const CustomInput& input, double peak) {
		CustomProfileAdapter adapter(*grid_, options_.min_distance, options_.overlap);
		Field                field = adapter.Evaluate(input, peak, rng_);

		std::string label;
		if (const auto* function = std::get_if<CustomFunction>(&input)) {
			label = "custom function [" + DescribeRows(function->types) + "]";
		} else if (const auto* map = std::get_if<Field>(&input)) {
			label = "custom map " + std::to_string(map->rows()) + "x" + std::to_string(map->cols()) + " peak " +
				logger::stringify(peak);
		} else {
			label = "custom image " + std::get<ImageFile>(input).path + " peak " + logger::stringify(peak);
		}
		Append(PerturbationKind::Custom, std::move(label), field);
	}

	void Model::Append(PerturbationKind kind, std::string label, const Field& field) {
		perturbations_.push_back(Perturbation{
			.kind = kind,
			.label = std::move(label),
			.field = grid_->PreparePerturbation(field),
			.enabled = true,
		});
		logger::DEBUG("Appended {} perturbation {}", PerturbationName(kind), perturbations_.size());
		Invalidate();
	}

	void Model::Invalidate() {
		derived_.reset();
		mesh_.reset();
	}

	void Model::SetEnabled(size_t index, bool enabled) {
		if (index >= perturbations_.size()) {
			throw std::out_of_range(
				"perturbation " + std::to_string(index) + " does not exist, model has " +
				std::to_string(perturbations_.size())
			);
		}
		if (perturbations_[index].enabled != enabled) {
			perturbations_[index].enabled = enabled;
			Invalidate();
		}
	}

	void Model::SetEnabledMask(const std::vector<bool>& mask) {
		if (mask.size() != perturbations_.size()) {
			throw ConfigurationError(
				"enabled mask has " + std::to_string(mask.size()) + " entries, model has " +
				std::to_string(perturbations_.size()) + " perturbations"
			);
		}
		for (size_t k = 0; k < mask.size(); ++k)
			SetEnabled(k, mask[k]);
	}

	std::vector<bool> Model::EnabledMask() const {
		std::vector<bool> mask;
		mask.reserve(perturbations_.size());
		for (const auto& p : perturbations_)
			mask.push_back(p.enabled);
		return mask;
	}

	const Field& Model::Derived() const {
		if (!derived_) {
			Field derived = grid_->Base();
			for (const auto& p : perturbations_) {
				if (p.enabled)
					derived += p.field;
			}
			derived_ = std::move(derived);
		}
		return *derived_;
	}

	const MeshBuffer& Model::Mesh() const {
		if (!mesh_) {
			mesh_ = MeshAssembler::Assemble(*grid_, Derived(), options_.compute_normals, options_.material.has_value());
			logger::DEBUG(
				"Assembled {} mesh: {} vertices, {} faces",
				ShapeName(Shape()),
				mesh_->vertices.size(),
				mesh_->faces.size()
			);
		}
		return *mesh_;
	}

} // namespace ShapeKit

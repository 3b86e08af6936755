#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "bump_placer.h"
#include "custom_profile.h"
#include "grid_field.h"
#include "mesh_assembler.h"
#include "model_options.h"
#include "noise_synthesizer.h"
#include "shape_grid.h"
#include "sine_components.h"

namespace ShapeKit {

	enum class PerturbationKind { Sine, Noise, Bumps, Custom };

	std::string_view PerturbationName(PerturbationKind kind);

	/**
	 * @brief One appended perturbation field and its enable flag.
	 */
	struct Perturbation {
		PerturbationKind kind;
		std::string      label;
		Field            field;
		bool             enabled = true;
	};

	/**
	 * @brief A base shape plus an ordered list of perturbation fields.
	 *
	 * The derived field is base + the sum of the enabled fields. The mesh is
	 * built from the derived field on first request and cached until the
	 * field list or the enable mask changes. Models are values: a copy shares
	 * the immutable grid and owns its own fields and random engine.
	 */
	class Model {
	public:
		/**
		 * @brief Build the unperturbed model of a shape.
		 *
		 * Throws ConfigurationError when the options do not describe a valid
		 * grid for the shape.
		 */
		static Model Create(ShapeKind kind, const ModelOptions& options = {});

		ShapeKind Shape() const { return grid_->Kind(); }

		const ShapeGrid& Grid() const { return *grid_; }

		const ModelOptions& Options() const { return options_; }

		/**
		 * @brief Append the sum of sine carriers, modulated per group.
		 *
		 * On the sphere and the torus every carrier amplitude must stay below
		 * the base radius; AmplitudeError is thrown before anything is added.
		 */
		void AddSine(const std::vector<SineComponent>& carriers, const std::vector<SineComponent>& modulators = {});

		// Append filtered noise, same amplitude rule as AddSine.
		void AddNoise(const std::vector<NoiseComponent>& components, const std::vector<SineComponent>& modulators = {});

		/**
		 * @brief Append Gaussian bumps placed with the model's minimum
		 * distance and overlap policy.
		 */
		void AddBumps(const std::vector<BumpType>& types);

		/**
		 * @brief Append a custom profile, map or image.
		 * @param peak Largest absolute value of a map or image after scaling.
		 */
		void AddCustom(const CustomInput& input, double peak = 0.1);

		const std::vector<Perturbation>& Perturbations() const { return perturbations_; }

		size_t PerturbationCount() const { return perturbations_.size(); }

		// Throws std::out_of_range for an index past the perturbation list.
		void SetEnabled(size_t index, bool enabled);

		/**
		 * @brief Set every flag at once; the mask length must equal the
		 * perturbation count (ConfigurationError otherwise).
		 */
		void SetEnabledMask(const std::vector<bool>& mask);

		std::vector<bool> EnabledMask() const;

		const Field& Derived() const;

		const MeshBuffer& Mesh() const;

	private:
		Model(std::shared_ptr<const ShapeGrid> grid, const ModelOptions& options);

		void Append(PerturbationKind kind, std::string label, const Field& field);
		void Invalidate();

		template <typename Component>
		void CheckAmplitudes(const std::vector<Component>& components, const char* what) const;

		std::shared_ptr<const ShapeGrid> grid_;
		ModelOptions                     options_;
		std::mt19937                     rng_;
		std::vector<Perturbation>        perturbations_;

		mutable std::optional<Field>      derived_;
		mutable std::optional<MeshBuffer> mesh_;
	};

} // namespace ShapeKit

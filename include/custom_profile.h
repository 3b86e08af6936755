#pragma once

#include <random>
#include <string>
#include <variant>
#include <vector>

#include "bump_placer.h"
#include "grid_field.h"
#include "shape_grid.h"

namespace ShapeKit {

	/**
	 * @brief User profile placed like bumps: each type contributes count
	 * copies of profile(distance, type.params) within type.cutoff.
	 */
	struct CustomFunction {
		ProfileFunction       profile;
		std::vector<BumpType> types;
	};

	// Path to an image read as a grayscale height map.
	struct ImageFile {
		std::string path;
	};

	// Exactly one kind of custom input per call; a Field is a height map.
	using CustomInput = std::variant<CustomFunction, Field, ImageFile>;

	/**
	 * @brief Bilinear resampling of a map onto rows x cols samples that span
	 * the same extent (corners map to corners).
	 */
	Field ResampleBilinear(const Field& map, int rows, int cols);

	/**
	 * @brief Scale a map so that its largest absolute value equals peak.
	 *
	 * An all-zero map stays zero and a warning is logged.
	 */
	Field ScaleToPeak(const Field& map, double peak);

	class CustomProfileAdapter {
	public:
		CustomProfileAdapter(const ShapeGrid& grid, double min_distance, OverlapPolicy overlap);

		/**
		 * @brief Evaluate a custom input on the grid.
		 *
		 * peak applies to maps and images; function profiles carry their own
		 * amplitude in the type parameters. Throws ConfigurationError for an
		 * empty map, a function without a callable, or an unreadable image.
		 */
		Field Evaluate(const CustomInput& input, double peak, std::mt19937& rng) const;

	private:
		const ShapeGrid& grid_;
		BumpPlacer       placer_;

		Field FromMap(const Field& map, double peak) const;
	};

} // namespace ShapeKit

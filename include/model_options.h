#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "bump_placer.h"
#include "shape_grid.h"

namespace ShapeKit {

	// Material library file and material name written as mtllib / usemtl.
	struct MaterialRef {
		std::string file;
		std::string name;
	};

	/**
	 * @brief Creation options of a model.
	 *
	 * Options are set from key/value strings ("npoints" = "64 128") as they
	 * appear in job files. Every option has a default, so an empty set of
	 * options builds the default model of a shape.
	 */
	struct ModelOptions {
		ShapeParams                shape;
		double                     min_distance = 0.0;
		OverlapPolicy              overlap = OverlapPolicy::Sum;
		std::optional<uint32_t>    seed;
		bool                       compute_normals = false;
		std::optional<MaterialRef> material;

		/**
		 * @brief Set one option from its string form.
		 *
		 * Throws ConfigurationError for unknown keys, malformed values and
		 * vectors of the wrong length.
		 */
		void Apply(const std::string& key, const std::string& value);

		static bool IsOptionKey(const std::string& key);
	};

} // namespace ShapeKit

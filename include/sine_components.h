#pragma once

#include <map>
#include <vector>

#include "component_rows.h"
#include "grid_field.h"

namespace ShapeKit {

	/**
	 * @brief One sinusoidal component, carrier or modulator.
	 *
	 * Evaluates amplitude * sin(2*pi*frequency*(x*cos(orientation) + y*sin(orientation)) + phase).
	 * Phase and orientation are stored in degrees.
	 */
	struct SineComponent {
		double frequency = 0.0;
		double amplitude = 0.1;
		double phase = 0.0;
		double orientation = 0.0;
		int    group = 0;

		/**
		 * @brief Build a carrier from a row of 1 to 5 values.
		 * Missing amplitude, phase, orientation, group default to 0.1, 0, 0, 0.
		 */
		static SineComponent Carrier(const ComponentRow& row);

		/**
		 * @brief Build a modulator from a row of 1 to 5 values.
		 * Missing amplitude, phase, orientation, group default to 1, 0, 0, 0.
		 */
		static SineComponent Modulator(const ComponentRow& row);

		static std::vector<SineComponent> Carriers(const std::vector<ComponentRow>& rows);
		static std::vector<SineComponent> Modulators(const std::vector<ComponentRow>& rows);

		Field Evaluate(const Field& x, const Field& y) const;
	};

	/**
	 * @brief Combine per-group carrier sums with their modulators.
	 *
	 * Group 0 sums are added as they are. A nonzero group is multiplied by
	 * the sum of the modulators sharing its id, or added unmodulated when no
	 * modulator has that id. Modulators of group 0 finally multiply the whole
	 * accumulated result.
	 */
	Field CombineGroups(
		const std::map<int, Field>&       group_sums,
		const std::vector<SineComponent>& modulators,
		const Field&                      x,
		const Field&                      y
	);

	/**
	 * @brief Sum carriers by group, apply modulators, return one field.
	 *
	 * x and y are the two modulation coordinate fields of the grid; the
	 * result has their shape. No carriers gives a zero field.
	 */
	Field ComposeSines(
		const std::vector<SineComponent>& carriers,
		const std::vector<SineComponent>& modulators,
		const Field&                      x,
		const Field&                      y
	);

} // namespace ShapeKit

#pragma once

#include <vector>

#include <glm/glm.hpp>

namespace ShapeKit {
	namespace Spline {

		glm::dvec3 CatmullRom(double t, const glm::dvec3& p0, const glm::dvec3& p1, const glm::dvec3& p2, const glm::dvec3& p3);

		/**
		 * @brief Sample a Catmull-Rom curve through points at count evenly spaced parameters.
		 *
		 * The first and last samples are the end points. End tangents are
		 * extrapolated from the first and last segments.
		 */
		std::vector<glm::dvec3> ResampleCatmullRom(const std::vector<glm::dvec3>& points, int count);

		/**
		 * @brief Linear resampling of an open curve to count samples, ends kept.
		 */
		std::vector<double> ResampleLinear(const std::vector<double>& values, int count);

		/**
		 * @brief Linear resampling of a closed curve: values[k] sits at k/K of
		 * the period and sample j at j/count; the last value connects back to the first.
		 */
		std::vector<double> ResamplePeriodic(const std::vector<double>& values, int count);

	} // namespace Spline
} // namespace ShapeKit

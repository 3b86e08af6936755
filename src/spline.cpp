#include "spline.h"

#include <algorithm>
#include <cmath>

namespace ShapeKit {
	namespace Spline {

		glm::dvec3
		CatmullRom(double t, const glm::dvec3& p0, const glm::dvec3& p1, const glm::dvec3& p2, const glm::dvec3& p3) {
			return 0.5 *
				((2.0 * p1) + (-p0 + p2) * t + (2.0 * p0 - 5.0 * p1 + 4.0 * p2 - p3) * (t * t) +
			     (-p0 + 3.0 * p1 - 3.0 * p2 + p3) * (t * t * t));
		}

		std::vector<glm::dvec3> ResampleCatmullRom(const std::vector<glm::dvec3>& points, int count) {
			std::vector<glm::dvec3> samples;
			if (points.empty() || count <= 0)
				return samples;
			samples.reserve(count);
			if (points.size() == 1 || count == 1) {
				samples.assign(count, points.front());
				return samples;
			}

			const size_t segments = points.size() - 1;
			for (int i = 0; i < count; ++i) {
				double s = static_cast<double>(i) / (count - 1) * segments;
				size_t seg = std::min(static_cast<size_t>(std::floor(s)), segments - 1);
				double t = s - seg;

				const auto& p1 = points[seg];
				const auto& p2 = points[seg + 1];
				glm::dvec3  p0 = seg > 0 ? points[seg - 1] : p1 - (p2 - p1);
				glm::dvec3  p3 = seg + 2 < points.size() ? points[seg + 2] : p2 + (p2 - p1);
				samples.push_back(CatmullRom(t, p0, p1, p2, p3));
			}
			return samples;
		}

		std::vector<double> ResampleLinear(const std::vector<double>& values, int count) {
			std::vector<double> samples;
			if (values.empty() || count <= 0)
				return samples;
			samples.reserve(count);
			if (values.size() == 1 || count == 1) {
				samples.assign(count, values.front());
				return samples;
			}

			const size_t last = values.size() - 1;
			for (int i = 0; i < count; ++i) {
				double s = static_cast<double>(i) / (count - 1) * last;
				size_t k = std::min(static_cast<size_t>(std::floor(s)), last - 1);
				double t = s - k;
				samples.push_back((1.0 - t) * values[k] + t * values[k + 1]);
			}
			return samples;
		}

		std::vector<double> ResamplePeriodic(const std::vector<double>& values, int count) {
			std::vector<double> samples;
			if (values.empty() || count <= 0)
				return samples;
			samples.reserve(count);

			const size_t n = values.size();
			for (int j = 0; j < count; ++j) {
				double s = static_cast<double>(j) / count * n;
				size_t k = static_cast<size_t>(std::floor(s)) % n;
				double t = s - std::floor(s);
				samples.push_back((1.0 - t) * values[k] + t * values[(k + 1) % n]);
			}
			return samples;
		}

	} // namespace Spline
} // namespace ShapeKit

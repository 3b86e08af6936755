#include "custom_profile.h"

#include <algorithm>
#include <cmath>

#include "errors.h"
#include "image_loader.h"
#include "logger.h"

namespace ShapeKit {

	namespace {
		// Source position of target sample index when both axes span the same extent.
		double SourcePosition(int index, int count, Eigen::Index source_count) {
			if (count <= 1 || source_count <= 1)
				return 0.0;
			return static_cast<double>(index) * (source_count - 1) / (count - 1);
		}
	} // namespace

	Field ResampleBilinear(const Field& map, int rows, int cols) {
		if (map.rows() == rows && map.cols() == cols)
			return map;

		Field out(rows, cols);
		for (int i = 0; i < rows; ++i) {
			const double       sy = SourcePosition(i, rows, map.rows());
			const Eigen::Index y0 = std::min<Eigen::Index>(static_cast<Eigen::Index>(sy), map.rows() - 1);
			const Eigen::Index y1 = std::min<Eigen::Index>(y0 + 1, map.rows() - 1);
			const double       ty = sy - y0;
			for (int j = 0; j < cols; ++j) {
				const double       sx = SourcePosition(j, cols, map.cols());
				const Eigen::Index x0 = std::min<Eigen::Index>(static_cast<Eigen::Index>(sx), map.cols() - 1);
				const Eigen::Index x1 = std::min<Eigen::Index>(x0 + 1, map.cols() - 1);
				const double       tx = sx - x0;

				const double top = (1.0 - tx) * map(y0, x0) + tx * map(y0, x1);
				const double bottom = (1.0 - tx) * map(y1, x0) + tx * map(y1, x1);
				out(i, j) = (1.0 - ty) * top + ty * bottom;
			}
		}
		return out;
	}

	Field ScaleToPeak(const Field& map, double peak) {
		const double max_abs = map.size() > 0 ? map.abs().maxCoeff() : 0.0;
		if (max_abs == 0.0) {
			logger::WARNING("Custom map is all zero, the perturbation is flat");
			return Field::Zero(map.rows(), map.cols());
		}
		return map * (peak / max_abs);
	}

	CustomProfileAdapter::CustomProfileAdapter(const ShapeGrid& grid, double min_distance, OverlapPolicy overlap):
		grid_(grid), placer_(grid, min_distance, overlap) {}

	Field CustomProfileAdapter::FromMap(const Field& map, double peak) const {
		if (map.size() == 0)
			throw ConfigurationError("custom map is empty");
		if (!map.allFinite())
			throw ConfigurationError("custom map contains non-finite values");
		return ScaleToPeak(ResampleBilinear(map, grid_.Rows(), grid_.Cols()), peak);
	}

	Field CustomProfileAdapter::Evaluate(const CustomInput& input, double peak, std::mt19937& rng) const {
		if (const auto* function = std::get_if<CustomFunction>(&input)) {
			if (!function->profile)
				throw ConfigurationError("custom profile function is empty");
			return placer_.Evaluate(function->types, function->profile, rng);
		}
		if (const auto* map = std::get_if<Field>(&input))
			return FromMap(*map, peak);

		const auto& image = std::get<ImageFile>(input);
		return FromMap(LoadGrayscaleImage(image.path), peak);
	}

} // namespace ShapeKit

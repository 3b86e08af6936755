#include "bump_placer.h"

#include <cmath>

#include "errors.h"
#include "logger.h"

namespace ShapeKit {

	namespace {
		constexpr int kCandidatesPerBump = 30;

		int CountFromValue(double value) {
			if (value < 0.0 || std::floor(value) != value)
				throw ConfigurationError("bump type: count must be a non-negative integer");
			return static_cast<int>(value);
		}
	} // namespace

	double GaussianProfile(double distance, const std::vector<double>& params) {
		const double amplitude = params.size() > 0 ? params[0] : 0.1;
		const double sigma = params.size() > 1 ? params[1] : 0.1;
		return amplitude * std::exp(-(distance * distance) / (2.0 * sigma * sigma));
	}

	BumpType BumpType::Gaussian(const ComponentRow& row) {
		BumpType type;
		if (row.size() == 3) {
			type.count = CountFromValue(row[0]);
			type.params = {row[1], row[2]};
			type.cutoff = 3.5 * row[2];
		} else if (row.size() == 4) {
			type.count = CountFromValue(row[0]);
			type.cutoff = row[1];
			type.params = {row[2], row[3]};
		} else {
			throw ConfigurationError(
				"gaussian bump: expected {count, amplitude, sigma} or {count, cutoff, amplitude, sigma}, got " +
				std::to_string(row.size()) + " values"
			);
		}
		if (type.params[1] <= 0.0)
			throw ConfigurationError("gaussian bump: sigma must be positive");
		if (type.cutoff <= 0.0)
			throw ConfigurationError("gaussian bump: cutoff must be positive");
		return type;
	}

	BumpType BumpType::Custom(const ComponentRow& row) {
		if (row.size() < 2) {
			throw ConfigurationError(
				"bump type: expected {count, cutoff, params...}, got " + std::to_string(row.size()) + " values"
			);
		}
		BumpType type;
		type.count = CountFromValue(row[0]);
		type.cutoff = row[1];
		type.params.assign(row.begin() + 2, row.end());
		if (type.cutoff <= 0.0)
			throw ConfigurationError("bump type: cutoff must be positive");
		return type;
	}

	BumpPlacer::BumpPlacer(const ShapeGrid& grid, double min_distance, OverlapPolicy overlap):
		grid_(grid), min_distance_(min_distance), overlap_(overlap) {}

	std::vector<DomainPoint>
	BumpPlacer::PlaceCenters(const BumpType& type, size_t type_index, std::mt19937& rng) const {
		std::vector<DomainPoint> centers;
		if (type.count <= 0)
			return centers;
		centers.reserve(type.count);

		if (min_distance_ <= 0.0) {
			for (int k = 0; k < type.count; ++k)
				centers.push_back(grid_.RandomPoint(rng));
			return centers;
		}

		const int candidates = kCandidatesPerBump * type.count;
		for (int k = 0; k < candidates && static_cast<int>(centers.size()) < type.count; ++k) {
			DomainPoint candidate = grid_.RandomPoint(rng);
			bool        accepted = true;
			for (const auto& c : centers) {
				if (grid_.Distance(candidate, c) < min_distance_) {
					accepted = false;
					break;
				}
			}
			if (accepted)
				centers.push_back(candidate);
		}

		if (static_cast<int>(centers.size()) < type.count) {
			throw PlacementError(
				"bump type " + std::to_string(type_index + 1) + ": placed only " + std::to_string(centers.size()) +
				" of " + std::to_string(type.count) + " bumps at minimum distance " + std::to_string(min_distance_) +
				"; reduce the number of bumps or 'mindist'"
			);
		}
		return centers;
	}

	void BumpPlacer::Accumulate(Field& total, const Field& contribution) const {
		if (overlap_ == OverlapPolicy::Sum) {
			total += contribution;
		} else {
			total = (contribution.abs() > total.abs()).select(contribution, total);
		}
	}

	Field BumpPlacer::Evaluate(const std::vector<BumpType>& types, const ProfileFunction& profile, std::mt19937& rng)
		const {
		Field total = Field::Zero(grid_.Rows(), grid_.Cols());
		for (size_t t = 0; t < types.size(); ++t) {
			const auto& type = types[t];
			auto        centers = PlaceCenters(type, t, rng);
			logger::DEBUG("Placed {} bumps of type {} on the {}", centers.size(), t + 1, ShapeName(grid_.Kind()));

			for (const auto& center : centers) {
				Field distance = grid_.DistanceField(center);
				Field bump = Field::Zero(distance.rows(), distance.cols());
				for (Eigen::Index i = 0; i < distance.rows(); ++i) {
					for (Eigen::Index j = 0; j < distance.cols(); ++j) {
						if (distance(i, j) < type.cutoff)
							bump(i, j) = profile(distance(i, j), type.params);
					}
				}
				Accumulate(total, bump);
			}
		}
		return total;
	}

} // namespace ShapeKit

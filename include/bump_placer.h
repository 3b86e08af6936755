#pragma once

#include <functional>
#include <random>
#include <vector>

#include "component_rows.h"
#include "grid_field.h"
#include "shape_grid.h"

namespace ShapeKit {

	/**
	 * @brief Radial bump profile: value at surface distance d for the
	 * parameters of one bump type.
	 */
	using ProfileFunction = std::function<double(double, const std::vector<double>&)>;

	// amplitude * exp(-d^2 / (2 sigma^2)) with params {amplitude, sigma}.
	double GaussianProfile(double distance, const std::vector<double>& params);

	enum class OverlapPolicy { Sum, Max };

	/**
	 * @brief count bumps, each adding the profile within cutoff of its center.
	 */
	struct BumpType {
		int                 count = 0;
		double              cutoff = 0.0;
		std::vector<double> params;

		/**
		 * @brief Gaussian bump row, either {count, amplitude, sigma} with a
		 * cutoff of 3.5 sigma, or {count, cutoff, amplitude, sigma}.
		 */
		static BumpType Gaussian(const ComponentRow& row);

		/**
		 * @brief Row for a user profile: {count, cutoff, params...}.
		 */
		static BumpType Custom(const ComponentRow& row);
	};

	/**
	 * @brief Places bump centers on a shape's native domain and sums their
	 * profiles over the grid.
	 */
	class BumpPlacer {
	public:
		/**
		 * @param min_distance Minimum surface distance between centers of the
		 *        same bump type; 0 places centers independently.
		 */
		BumpPlacer(const ShapeGrid& grid, double min_distance, OverlapPolicy overlap);

		/**
		 * @brief Draw the centers of one bump type.
		 *
		 * With a minimum distance, 30 candidates per bump are drawn and
		 * accepted greedily. Throws PlacementError when fewer than count
		 * candidates survive; type_index only names the type in the message.
		 */
		std::vector<DomainPoint> PlaceCenters(const BumpType& type, size_t type_index, std::mt19937& rng) const;

		Field Evaluate(const std::vector<BumpType>& types, const ProfileFunction& profile, std::mt19937& rng) const;

	private:
		const ShapeGrid& grid_;
		double           min_distance_;
		OverlapPolicy    overlap_;

		void Accumulate(Field& total, const Field& contribution) const;
	};

} // namespace ShapeKit

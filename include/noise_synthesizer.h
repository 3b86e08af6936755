#pragma once

#include <cmath>
#include <random>
#include <vector>

#include "component_rows.h"
#include "grid_field.h"
#include "sine_components.h"

namespace ShapeKit {

	/**
	 * @brief Band-pass filtered noise component.
	 *
	 * Row layout: {frequency, frequency_bandwidth, orientation,
	 * orientation_bandwidth, amplitude, group}. Bandwidths are full widths at
	 * half height, in octaves and degrees. An infinite orientation bandwidth
	 * gives isotropic noise.
	 */
	struct NoiseComponent {
		double frequency = 0.0;
		double frequency_bandwidth = 1.0;
		double orientation = 0.0;
		double orientation_bandwidth = 30.0;
		double amplitude = 0.1;
		int    group = 0;

		static NoiseComponent              FromRow(const ComponentRow& row);
		static std::vector<NoiseComponent> FromRows(const std::vector<ComponentRow>& rows);

		bool IsIsotropic() const { return !std::isfinite(orientation_bandwidth); }
	};

	class NoiseSynthesizer {
	public:
		/**
		 * @param rows, cols Grid size.
		 * @param dx Spacing between columns in modulation coordinates.
		 * @param dy Spacing between rows in modulation coordinates.
		 */
		NoiseSynthesizer(int rows, int cols, double dx, double dy);

		/**
		 * @brief One filtered noise field, normalized to unit peak and scaled
		 * by the component amplitude.
		 *
		 * Draws fresh white noise from rng on every call.
		 */
		Field Synthesize(const NoiseComponent& component, std::mt19937& rng) const;

		/**
		 * @brief Sum components by group and apply sine modulators exactly
		 * like ComposeSines does for carriers.
		 */
		Field Compose(
			const std::vector<NoiseComponent>& components,
			const std::vector<SineComponent>&  modulators,
			const Field&                       x,
			const Field&                       y,
			std::mt19937&                      rng
		) const;

		// Frequency-domain gain for one component, laid out like the FFT output.
		Field FilterFor(const NoiseComponent& component) const;

	private:
		int    rows_;
		int    cols_;
		double dx_;
		double dy_;

		static double FftFrequency(int index, int count, double spacing);
	};

} // namespace ShapeKit

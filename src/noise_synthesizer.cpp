#include "noise_synthesizer.h"

#include <cmath>
#include <complex>
#include <map>
#include <numbers>
#include <string>

#include <unsupported/Eigen/FFT>

#include "errors.h"
#include "logger.h"

namespace ShapeKit {

	namespace {
		using ComplexGrid = Eigen::Array<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

		enum class Direction { Forward, Inverse };

		// 2D transform as 1D transforms over rows, then columns.
		void Transform2D(ComplexGrid& grid, Direction direction) {
			Eigen::FFT<double>                fft;
			std::vector<std::complex<double>> in;
			std::vector<std::complex<double>> out;

			in.resize(grid.cols());
			for (Eigen::Index r = 0; r < grid.rows(); ++r) {
				for (Eigen::Index c = 0; c < grid.cols(); ++c)
					in[c] = grid(r, c);
				if (direction == Direction::Forward)
					fft.fwd(out, in);
				else
					fft.inv(out, in);
				for (Eigen::Index c = 0; c < grid.cols(); ++c)
					grid(r, c) = out[c];
			}

			in.resize(grid.rows());
			for (Eigen::Index c = 0; c < grid.cols(); ++c) {
				for (Eigen::Index r = 0; r < grid.rows(); ++r)
					in[r] = grid(r, c);
				if (direction == Direction::Forward)
					fft.fwd(out, in);
				else
					fft.inv(out, in);
				for (Eigen::Index r = 0; r < grid.rows(); ++r)
					grid(r, c) = out[r];
			}
		}

		double RaisedCosine(double distance, double full_width) {
			if (std::abs(distance) >= full_width)
				return 0.0;
			return 0.5 * (1.0 + std::cos(std::numbers::pi * distance / full_width));
		}

		NoiseComponent NoiseFromRow(const ComponentRow& row, const std::string& what) {
			auto           filled = FillRow(row, {1.0, 0.0, 30.0, 0.1, 0.0}, what);
			NoiseComponent c;
			c.frequency = filled[0];
			c.frequency_bandwidth = filled[1];
			c.orientation = filled[2];
			c.orientation_bandwidth = filled[3];
			c.amplitude = filled[4];
			c.group = GroupFromValue(filled[5], what);
			if (c.frequency_bandwidth <= 0.0) {
				throw ConfigurationError(what + ": frequency bandwidth must be positive");
			}
			if (!(c.orientation_bandwidth > 0.0)) {
				throw ConfigurationError(what + ": orientation bandwidth must be positive");
			}
			return c;
		}
	} // namespace

	NoiseComponent NoiseComponent::FromRow(const ComponentRow& row) {
		return NoiseFromRow(row, "noise component");
	}

	std::vector<NoiseComponent> NoiseComponent::FromRows(const std::vector<ComponentRow>& rows) {
		std::vector<NoiseComponent> out;
		out.reserve(rows.size());
		for (size_t k = 0; k < rows.size(); ++k)
			out.push_back(NoiseFromRow(rows[k], "noise component " + std::to_string(k + 1)));
		return out;
	}

	NoiseSynthesizer::NoiseSynthesizer(int rows, int cols, double dx, double dy):
		rows_(rows), cols_(cols), dx_(dx > 0.0 ? dx : 1.0), dy_(dy > 0.0 ? dy : 1.0) {}

	double NoiseSynthesizer::FftFrequency(int index, int count, double spacing) {
		int k = index <= count / 2 ? index : index - count;
		return k / (count * spacing);
	}

	Field NoiseSynthesizer::FilterFor(const NoiseComponent& component) const {
		Field filter = Field::Zero(rows_, cols_);
		if (component.frequency <= 0.0)
			return filter;

		const double log_f0 = std::log2(component.frequency);
		const double theta0 = component.orientation * std::numbers::pi / 180.0;
		const double or_width = component.orientation_bandwidth * std::numbers::pi / 180.0;

		for (int r = 0; r < rows_; ++r) {
			const double fy = FftFrequency(r, rows_, dy_);
			for (int c = 0; c < cols_; ++c) {
				const double fx = FftFrequency(c, cols_, dx_);
				const double f = std::hypot(fx, fy);
				if (f == 0.0)
					continue;

				double gain = RaisedCosine(std::log2(f) - log_f0, component.frequency_bandwidth);
				if (gain == 0.0)
					continue;

				if (!component.IsIsotropic()) {
					// Angular distance modulo pi keeps the filter symmetric, so the
					// filtered spectrum stays Hermitian.
					double d = std::remainder(std::atan2(fy, fx) - theta0, std::numbers::pi);
					gain *= RaisedCosine(d, or_width);
				}
				filter(r, c) = gain;
			}
		}
		return filter;
	}

	Field NoiseSynthesizer::Synthesize(const NoiseComponent& component, std::mt19937& rng) const {
		if (component.amplitude == 0.0)
			return Field::Zero(rows_, cols_);

		std::normal_distribution<double> white(0.0, 1.0);
		ComplexGrid                      spectrum(rows_, cols_);
		for (int r = 0; r < rows_; ++r) {
			for (int c = 0; c < cols_; ++c)
				spectrum(r, c) = std::complex<double>(white(rng), 0.0);
		}

		Transform2D(spectrum, Direction::Forward);
		spectrum *= FilterFor(component).cast<std::complex<double>>();
		Transform2D(spectrum, Direction::Inverse);

		Field        noise = spectrum.real();
		const double peak = noise.abs().maxCoeff();
		if (peak < 1e-12) {
			logger::WARNING(
				"Noise filter at frequency {} passes no energy on a {}x{} grid",
				component.frequency,
				rows_,
				cols_
			);
			return Field::Zero(rows_, cols_);
		}
		return component.amplitude * noise / peak;
	}

	Field NoiseSynthesizer::Compose(
		const std::vector<NoiseComponent>& components,
		const std::vector<SineComponent>&  modulators,
		const Field&                       x,
		const Field&                       y,
		std::mt19937&                      rng
	) const {
		if (components.empty())
			return Field::Zero(rows_, cols_);

		std::map<int, Field> group_sums;
		for (const auto& component : components) {
			Field noise = Synthesize(component, rng);
			auto  it = group_sums.find(component.group);
			if (it == group_sums.end())
				group_sums.emplace(component.group, std::move(noise));
			else
				it->second += noise;
		}
		return CombineGroups(group_sums, modulators, x, y);
	}

} // namespace ShapeKit

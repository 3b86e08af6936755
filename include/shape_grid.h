#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "grid_field.h"
#include "sine_components.h"

namespace ShapeKit {

	/**
	 * @brief The fixed set of base shapes.
	 */
	enum class ShapeKind { Sphere, Plane, Disk, Torus, Cylinder, Revolution, Extrusion, Worm };

	std::string_view ShapeName(ShapeKind kind);

	// Throws ConfigurationError for names outside the fixed set.
	ShapeKind ParseShapeKind(const std::string& name);

	// Cylinder, revolution, extrusion and worm share one grid implementation.
	bool IsTubeShape(ShapeKind kind);

	enum class DiskCoords { Polar, Cartesian };

	enum class CurveCombine { Multiply, Add };

	/**
	 * @brief Creation-time parameters of a shape grid.
	 *
	 * Zero rows/cols select the shape's default resolution. Fields that do
	 * not apply to a shape must be left at their defaults.
	 */
	struct ShapeParams {
		int rows = 0;
		int cols = 0;

		// plane
		double width = 1.0;
		double height = 0.0; // 0: width * rows / cols

		// disk
		DiskCoords disk_coords = DiskCoords::Polar;

		// torus
		double                     minor_radius = 0.4;
		double                     major_radius = 1.0;
		std::vector<SineComponent> major_radius_components;

		// cylinder family
		double                 tube_height = 0.0; // 0: 2*pi
		std::vector<double>    rcurve;
		std::vector<double>    ecurve;
		std::vector<glm::dvec3> spine;
		CurveCombine           curve_combine = CurveCombine::Multiply;
		CurveCombine           perturbation_combine = CurveCombine::Add;
		bool                   caps = false;
	};

	/**
	 * @brief Connectivity of a parameter grid as seen by the mesh assembler.
	 */
	struct GridTopology {
		int  rows = 0;
		int  cols = 0;
		bool wrap_cols = false;
		bool wrap_rows = false;
		bool caps = false;
	};

	// A point in a shape's native parameter domain, e.g. (azimuth, elevation).
	using DomainPoint = glm::dvec2;

	/**
	 * @brief Native parameter grid of one base shape.
	 *
	 * A grid is immutable after construction and can be shared between
	 * models. Subclasses fill the protected fields in their constructors.
	 */
	class ShapeGrid {
	public:
		virtual ~ShapeGrid() = default;

		virtual ShapeKind Kind() const = 0;

		int Rows() const { return static_cast<int>(base_.rows()); }

		int Cols() const { return static_cast<int>(base_.cols()); }

		/**
		 * @brief Unperturbed radius or height over the grid.
		 */
		const Field& Base() const { return base_; }

		/**
		 * @brief Coordinates handed to sine and noise components.
		 *
		 * Angular axes are expressed in turns (angle / 2pi) so a frequency of
		 * f means f cycles per full circle.
		 */
		const Field& ModulationX() const { return mod_x_; }

		const Field& ModulationY() const { return mod_y_; }

		// Spacing of the modulation coordinates between neighbouring columns (x) and rows (y).
		const glm::dvec2& ModulationSpacing() const { return mod_spacing_; }

		virtual GridTopology Topology() const = 0;

		/**
		 * @brief Map a derived field (base + perturbations) to vertex positions.
		 *
		 * Returns rows * cols positions in row-major order, followed by cap
		 * centers when the topology has caps.
		 */
		virtual std::vector<glm::dvec3> ToCartesian(const Field& derived) const = 0;

		/**
		 * @brief Uniform random point of the native domain.
		 */
		virtual DomainPoint RandomPoint(std::mt19937& rng) const = 0;

		/**
		 * @brief Surface distance between two domain points.
		 */
		virtual double Distance(const DomainPoint& a, const DomainPoint& b) const = 0;

		/**
		 * @brief Distance from center to every grid sample.
		 */
		virtual Field DistanceField(const DomainPoint& center) const = 0;

		/**
		 * @brief Largest radius modulation amplitude the shape tolerates, if any.
		 */
		virtual std::optional<double> AmplitudeLimit() const { return std::nullopt; }

		/**
		 * @brief Hook applied to a new perturbation before it is stored.
		 */
		virtual Field PreparePerturbation(const Field& perturbation) const { return perturbation; }

	protected:
		Field      base_;
		Field      mod_x_;
		Field      mod_y_;
		glm::dvec2 mod_spacing_{1.0, 1.0};
	};

	/**
	 * @brief Build the grid for a shape kind.
	 *
	 * Throws ConfigurationError for bad resolutions, missing or misplaced
	 * profile curves and options that do not apply to the shape.
	 */
	std::shared_ptr<const ShapeGrid> MakeShapeGrid(ShapeKind kind, const ShapeParams& params);

} // namespace ShapeKit

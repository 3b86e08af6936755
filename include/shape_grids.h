#pragma once

#include <vector>

#include "shape_grid.h"

namespace ShapeKit {

	/**
	 * @brief Unit sphere over azimuth (columns, wraps) and elevation (rows).
	 *
	 * Azimuth runs from -pi to pi - 2pi/n, elevation from -pi/2 to pi/2, so
	 * the first and last rows are the poles. Bump distances are great-circle
	 * angles.
	 */
	class SphereGrid: public ShapeGrid {
	public:
		SphereGrid(int rows, int cols);

		ShapeKind Kind() const override { return ShapeKind::Sphere; }

		GridTopology Topology() const override;
		std::vector<glm::dvec3> ToCartesian(const Field& derived) const override;
		DomainPoint             RandomPoint(std::mt19937& rng) const override;
		double                  Distance(const DomainPoint& a, const DomainPoint& b) const override;
		Field                   DistanceField(const DomainPoint& center) const override;

		std::optional<double> AmplitudeLimit() const override { return 1.0; }

	private:
		Field azimuth_;
		Field elevation_;
		// Unit direction of every sample, for great-circle distances.
		Field ux_, uy_, uz_;
	};

	/**
	 * @brief Flat rectangle in the xy plane, perturbed along z.
	 */
	class PlaneGrid: public ShapeGrid {
	public:
		PlaneGrid(int rows, int cols, double width, double height);

		ShapeKind Kind() const override { return ShapeKind::Plane; }

		GridTopology Topology() const override;
		std::vector<glm::dvec3> ToCartesian(const Field& derived) const override;
		DomainPoint             RandomPoint(std::mt19937& rng) const override;
		double                  Distance(const DomainPoint& a, const DomainPoint& b) const override;
		Field                   DistanceField(const DomainPoint& center) const override;

	private:
		double width_;
		double height_;
	};

	/**
	 * @brief Unit disk in the xz plane, perturbed along y.
	 *
	 * Polar mode samples angle (columns, wraps) by radius (rows, center
	 * first). Cartesian mode samples a square and maps it onto the disk.
	 * Domain points are disk-plane coordinates in both modes.
	 */
	class DiskGrid: public ShapeGrid {
	public:
		DiskGrid(int rows, int cols, DiskCoords coords);

		ShapeKind Kind() const override { return ShapeKind::Disk; }

		GridTopology Topology() const override;
		std::vector<glm::dvec3> ToCartesian(const Field& derived) const override;
		DomainPoint             RandomPoint(std::mt19937& rng) const override;
		double                  Distance(const DomainPoint& a, const DomainPoint& b) const override;
		Field                   DistanceField(const DomainPoint& center) const override;

		DiskCoords Coords() const { return coords_; }

	private:
		DiskCoords coords_;
		// Disk-plane position of each sample; vertices are (px, height, pz)
		// and domain points are (px, pz).
		Field px_;
		Field pz_;
	};

	/**
	 * @brief Torus over major angle (columns) and minor angle (rows), both wrapping.
	 *
	 * The derived field is the minor radius. The major radius is a separate
	 * function of the major angle, optionally modulated by sine carriers.
	 */
	class TorusGrid: public ShapeGrid {
	public:
		TorusGrid(
			int                               rows,
			int                               cols,
			double                            minor_radius,
			double                            major_radius,
			const std::vector<SineComponent>& major_components
		);

		ShapeKind Kind() const override { return ShapeKind::Torus; }

		GridTopology Topology() const override;
		std::vector<glm::dvec3> ToCartesian(const Field& derived) const override;
		DomainPoint             RandomPoint(std::mt19937& rng) const override;
		double                  Distance(const DomainPoint& a, const DomainPoint& b) const override;
		Field                   DistanceField(const DomainPoint& center) const override;

		std::optional<double> AmplitudeLimit() const override { return minor_radius_; }

		// Major radius per column.
		const std::vector<double>& MajorRadius() const { return major_; }

	private:
		double              minor_radius_;
		std::vector<double> theta_;
		std::vector<double> phi_;
		std::vector<double> major_;
	};

	/**
	 * @brief Cylinder, surface of revolution, extrusion and worm.
	 *
	 * Angle runs over the columns (wraps), height over the rows. The base
	 * radius combines the radius-vs-height curve (rcurve) and the
	 * radius-vs-angle curve (ecurve). A spine curve offsets the cross section
	 * of each row. Caps close both ends with a fan around a center vertex.
	 */
	class TubeGrid: public ShapeGrid {
	public:
		TubeGrid(ShapeKind kind, int rows, int cols, const ShapeParams& params);

		ShapeKind Kind() const override { return kind_; }

		GridTopology Topology() const override;
		std::vector<glm::dvec3> ToCartesian(const Field& derived) const override;
		DomainPoint             RandomPoint(std::mt19937& rng) const override;
		double                  Distance(const DomainPoint& a, const DomainPoint& b) const override;
		Field                   DistanceField(const DomainPoint& center) const override;
		Field                   PreparePerturbation(const Field& perturbation) const override;

	private:
		ShapeKind               kind_;
		bool                    caps_;
		bool                    scale_perturbations_;
		double                  tube_height_;
		std::vector<double>     theta_;
		std::vector<double>     y_;
		std::vector<glm::dvec3> spine_;
	};

} // namespace ShapeKit

#include "shape_grids.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "errors.h"
#include "logger.h"
#include "spline.h"

namespace ShapeKit {

	namespace {
		constexpr double kPi = std::numbers::pi;
		constexpr double kTwoPi = 2.0 * std::numbers::pi;

		// Periodic axis: n samples from -pi, the seam sample is not repeated.
		double WrappedAngle(int index, int count) {
			return -kPi + kTwoPi * index / count;
		}

		double OpenAxis(int index, int count, double lo, double hi) {
			return lo + (hi - lo) * index / (count - 1);
		}

		double WrapAngle(double d) {
			return std::remainder(d, kTwoPi);
		}

		void CheckFieldShape(const ShapeGrid& grid, const Field& derived) {
			if (derived.rows() != grid.Rows() || derived.cols() != grid.Cols()) {
				throw std::invalid_argument(
					std::string(ShapeName(grid.Kind())) + ": field is " + std::to_string(derived.rows()) + "x" +
					std::to_string(derived.cols()) + ", grid is " + std::to_string(grid.Rows()) + "x" +
					std::to_string(grid.Cols())
				);
			}
		}

		// Row-major sample of fn(row, col) into a field.
		template <typename Fn>
		Field Tabulate(int rows, int cols, Fn&& fn) {
			Field f(rows, cols);
			for (int i = 0; i < rows; ++i) {
				for (int j = 0; j < cols; ++j)
					f(i, j) = fn(i, j);
			}
			return f;
		}
	} // namespace

	std::string_view ShapeName(ShapeKind kind) {
		switch (kind) {
		case ShapeKind::Sphere:
			return "sphere";
		case ShapeKind::Plane:
			return "plane";
		case ShapeKind::Disk:
			return "disk";
		case ShapeKind::Torus:
			return "torus";
		case ShapeKind::Cylinder:
			return "cylinder";
		case ShapeKind::Revolution:
			return "revolution";
		case ShapeKind::Extrusion:
			return "extrusion";
		case ShapeKind::Worm:
			return "worm";
		}
		return "unknown";
	}

	ShapeKind ParseShapeKind(const std::string& name) {
		std::string lower = name;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
		for (auto kind :
		     {ShapeKind::Sphere,
		      ShapeKind::Plane,
		      ShapeKind::Disk,
		      ShapeKind::Torus,
		      ShapeKind::Cylinder,
		      ShapeKind::Revolution,
		      ShapeKind::Extrusion,
		      ShapeKind::Worm}) {
			if (lower == ShapeName(kind))
				return kind;
		}
		throw ConfigurationError("unknown shape '" + name + "'");
	}

	bool IsTubeShape(ShapeKind kind) {
		return kind == ShapeKind::Cylinder || kind == ShapeKind::Revolution || kind == ShapeKind::Extrusion ||
			kind == ShapeKind::Worm;
	}

	// ---------------------------------------------------------------- sphere

	SphereGrid::SphereGrid(int rows, int cols) {
		azimuth_ = Tabulate(rows, cols, [&](int, int j) { return WrappedAngle(j, cols); });
		elevation_ = Tabulate(rows, cols, [&](int i, int) { return OpenAxis(i, rows, -kPi / 2.0, kPi / 2.0); });

		base_ = Field::Ones(rows, cols);
		mod_x_ = azimuth_ / kTwoPi;
		mod_y_ = elevation_ / kTwoPi;
		mod_spacing_ = glm::dvec2(1.0 / cols, 0.5 / (rows - 1));

		ux_ = elevation_.cos() * azimuth_.cos();
		uy_ = elevation_.cos() * azimuth_.sin();
		uz_ = elevation_.sin();
	}

	GridTopology SphereGrid::Topology() const {
		return GridTopology{.rows = Rows(), .cols = Cols(), .wrap_cols = true, .wrap_rows = false, .caps = false};
	}

	std::vector<glm::dvec3> SphereGrid::ToCartesian(const Field& derived) const {
		CheckFieldShape(*this, derived);
		std::vector<glm::dvec3> out;
		out.reserve(derived.size());
		for (int i = 0; i < Rows(); ++i) {
			for (int j = 0; j < Cols(); ++j) {
				const double r = derived(i, j);
				out.emplace_back(r * ux_(i, j), r * uy_(i, j), r * uz_(i, j));
			}
		}
		return out;
	}

	DomainPoint SphereGrid::RandomPoint(std::mt19937& rng) const {
		std::uniform_real_distribution<double> unit(0.0, 1.0);
		const double                           theta = -kPi + kTwoPi * unit(rng);
		const double                           phi = std::asin(2.0 * unit(rng) - 1.0);
		return DomainPoint(theta, phi);
	}

	double SphereGrid::Distance(const DomainPoint& a, const DomainPoint& b) const {
		const double c = std::sin(a.y) * std::sin(b.y) + std::cos(a.y) * std::cos(b.y) * std::cos(a.x - b.x);
		return std::acos(std::clamp(c, -1.0, 1.0));
	}

	Field SphereGrid::DistanceField(const DomainPoint& center) const {
		const double cx = std::cos(center.y) * std::cos(center.x);
		const double cy = std::cos(center.y) * std::sin(center.x);
		const double cz = std::sin(center.y);
		Field        dot = ux_ * cx + uy_ * cy + uz_ * cz;
		return dot.max(-1.0).min(1.0).acos();
	}

	// ----------------------------------------------------------------- plane

	PlaneGrid::PlaneGrid(int rows, int cols, double width, double height): width_(width), height_(height) {
		mod_x_ = Tabulate(rows, cols, [&](int, int j) { return OpenAxis(j, cols, -width / 2.0, width / 2.0); });
		mod_y_ = Tabulate(rows, cols, [&](int i, int) { return OpenAxis(i, rows, -height / 2.0, height / 2.0); });
		base_ = Field::Zero(rows, cols);
		mod_spacing_ = glm::dvec2(width / (cols - 1), height / (rows - 1));
	}

	GridTopology PlaneGrid::Topology() const {
		return GridTopology{.rows = Rows(), .cols = Cols(), .wrap_cols = false, .wrap_rows = false, .caps = false};
	}

	std::vector<glm::dvec3> PlaneGrid::ToCartesian(const Field& derived) const {
		CheckFieldShape(*this, derived);
		std::vector<glm::dvec3> out;
		out.reserve(derived.size());
		for (int i = 0; i < Rows(); ++i) {
			for (int j = 0; j < Cols(); ++j)
				out.emplace_back(mod_x_(i, j), mod_y_(i, j), derived(i, j));
		}
		return out;
	}

	DomainPoint PlaneGrid::RandomPoint(std::mt19937& rng) const {
		std::uniform_real_distribution<double> x(-width_ / 2.0, width_ / 2.0);
		std::uniform_real_distribution<double> y(-height_ / 2.0, height_ / 2.0);
		const double                           px = x(rng);
		return DomainPoint(px, y(rng));
	}

	double PlaneGrid::Distance(const DomainPoint& a, const DomainPoint& b) const {
		return glm::length(a - b);
	}

	Field PlaneGrid::DistanceField(const DomainPoint& center) const {
		return ((mod_x_ - center.x).square() + (mod_y_ - center.y).square()).sqrt();
	}

	// ------------------------------------------------------------------ disk

	DiskGrid::DiskGrid(int rows, int cols, DiskCoords coords): coords_(coords) {
		base_ = Field::Zero(rows, cols);
		if (coords == DiskCoords::Polar) {
			Field theta = Tabulate(rows, cols, [&](int, int j) { return WrappedAngle(j, cols); });
			Field r = Tabulate(rows, cols, [&](int i, int) { return OpenAxis(i, rows, 0.0, 1.0); });
			px_ = r * theta.cos();
			pz_ = r * theta.sin();
			mod_x_ = theta / kTwoPi;
			mod_y_ = r;
			mod_spacing_ = glm::dvec2(1.0 / cols, 1.0 / (rows - 1));
		} else {
			Field x = Tabulate(rows, cols, [&](int, int j) { return OpenAxis(j, cols, -1.0, 1.0); });
			Field y = Tabulate(rows, cols, [&](int i, int) { return OpenAxis(i, rows, -1.0, 1.0); });
			// Square to disk: edges of the square land on the unit circle.
			Field mx = x * (1.0 - y.square() / 2.0).sqrt();
			Field my = y * (1.0 - x.square() / 2.0).sqrt();
			px_ = mx;
			pz_ = -my;
			mod_x_ = mx;
			mod_y_ = my;
			mod_spacing_ = glm::dvec2(2.0 / (cols - 1), 2.0 / (rows - 1));
		}
	}

	GridTopology DiskGrid::Topology() const {
		return GridTopology{
			.rows = Rows(),
			.cols = Cols(),
			.wrap_cols = coords_ == DiskCoords::Polar,
			.wrap_rows = false,
			.caps = false
		};
	}

	std::vector<glm::dvec3> DiskGrid::ToCartesian(const Field& derived) const {
		CheckFieldShape(*this, derived);
		std::vector<glm::dvec3> out;
		out.reserve(derived.size());
		for (int i = 0; i < Rows(); ++i) {
			for (int j = 0; j < Cols(); ++j)
				out.emplace_back(px_(i, j), derived(i, j), pz_(i, j));
		}
		return out;
	}

	DomainPoint DiskGrid::RandomPoint(std::mt19937& rng) const {
		std::uniform_real_distribution<double> unit(0.0, 1.0);
		const double                           r = std::sqrt(unit(rng));
		const double                           theta = kTwoPi * unit(rng);
		return DomainPoint(r * std::cos(theta), r * std::sin(theta));
	}

	double DiskGrid::Distance(const DomainPoint& a, const DomainPoint& b) const {
		return glm::length(a - b);
	}

	Field DiskGrid::DistanceField(const DomainPoint& center) const {
		return ((px_ - center.x).square() + (pz_ - center.y).square()).sqrt();
	}

	// ----------------------------------------------------------------- torus

	TorusGrid::TorusGrid(
		int                               rows,
		int                               cols,
		double                            minor_radius,
		double                            major_radius,
		const std::vector<SineComponent>& major_components
	):
		minor_radius_(minor_radius) {
		theta_.resize(cols);
		phi_.resize(rows);
		for (int j = 0; j < cols; ++j)
			theta_[j] = WrappedAngle(j, cols);
		for (int i = 0; i < rows; ++i)
			phi_[i] = WrappedAngle(i, rows);

		base_ = Field::Constant(rows, cols, minor_radius);
		mod_x_ = Tabulate(rows, cols, [&](int, int j) { return theta_[j] / kTwoPi; });
		mod_y_ = Tabulate(rows, cols, [&](int i, int) { return phi_[i] / kTwoPi; });
		mod_spacing_ = glm::dvec2(1.0 / cols, 1.0 / rows);

		// The major radius only varies with the major angle.
		Field along = mod_x_.topRows(1);
		Field major = major_radius + ComposeSines(major_components, {}, along, Field::Zero(1, cols));
		major_.assign(major.data(), major.data() + cols);
	}

	GridTopology TorusGrid::Topology() const {
		return GridTopology{.rows = Rows(), .cols = Cols(), .wrap_cols = true, .wrap_rows = true, .caps = false};
	}

	std::vector<glm::dvec3> TorusGrid::ToCartesian(const Field& derived) const {
		CheckFieldShape(*this, derived);
		std::vector<glm::dvec3> out;
		out.reserve(derived.size());
		for (int i = 0; i < Rows(); ++i) {
			const double cp = std::cos(phi_[i]);
			const double sp = std::sin(phi_[i]);
			for (int j = 0; j < Cols(); ++j) {
				const double r = derived(i, j);
				const double ring = major_[j] + r * cp;
				out.emplace_back(ring * std::cos(theta_[j]), ring * std::sin(theta_[j]), r * sp);
			}
		}
		return out;
	}

	DomainPoint TorusGrid::RandomPoint(std::mt19937& rng) const {
		std::uniform_real_distribution<double> angle(-kPi, kPi);
		const double                           theta = angle(rng);
		return DomainPoint(theta, angle(rng));
	}

	double TorusGrid::Distance(const DomainPoint& a, const DomainPoint& b) const {
		return std::hypot(WrapAngle(a.x - b.x), WrapAngle(a.y - b.y));
	}

	Field TorusGrid::DistanceField(const DomainPoint& center) const {
		return Tabulate(Rows(), Cols(), [&](int i, int j) {
			return Distance(DomainPoint(theta_[j], phi_[i]), center);
		});
	}

	// ------------------------------------------------------------------ tube

	TubeGrid::TubeGrid(ShapeKind kind, int rows, int cols, const ShapeParams& params):
		kind_(kind),
		caps_(params.caps),
		scale_perturbations_(params.perturbation_combine == CurveCombine::Multiply),
		tube_height_(params.tube_height > 0.0 ? params.tube_height : kTwoPi) {
		theta_.resize(cols);
		y_.resize(rows);
		for (int j = 0; j < cols; ++j)
			theta_[j] = WrappedAngle(j, cols);
		for (int i = 0; i < rows; ++i)
			y_[i] = OpenAxis(i, rows, -tube_height_ / 2.0, tube_height_ / 2.0);

		const bool add = params.curve_combine == CurveCombine::Add;
		const double identity = add ? 0.0 : 1.0;

		std::vector<double> along_height(rows, identity);
		std::vector<double> along_angle(cols, identity);
		if (!params.rcurve.empty())
			along_height = Spline::ResampleLinear(params.rcurve, rows);
		if (!params.ecurve.empty())
			along_angle = Spline::ResamplePeriodic(params.ecurve, cols);

		if (params.rcurve.empty() && params.ecurve.empty()) {
			base_ = Field::Ones(rows, cols);
		} else {
			base_ = Tabulate(rows, cols, [&](int i, int j) {
				return add ? along_height[i] + along_angle[j] : along_height[i] * along_angle[j];
			});
		}

		if (!params.spine.empty())
			spine_ = Spline::ResampleCatmullRom(params.spine, rows);
		else
			spine_.assign(rows, glm::dvec3(0.0));

		mod_x_ = Tabulate(rows, cols, [&](int, int j) { return theta_[j] / kTwoPi; });
		mod_y_ = Tabulate(rows, cols, [&](int i, int) { return y_[i] / kTwoPi; });
		mod_spacing_ = glm::dvec2(1.0 / cols, tube_height_ / (rows - 1) / kTwoPi);
	}

	GridTopology TubeGrid::Topology() const {
		return GridTopology{.rows = Rows(), .cols = Cols(), .wrap_cols = true, .wrap_rows = false, .caps = caps_};
	}

	std::vector<glm::dvec3> TubeGrid::ToCartesian(const Field& derived) const {
		CheckFieldShape(*this, derived);
		std::vector<glm::dvec3> out;
		out.reserve(derived.size() + (caps_ ? 2 : 0));
		for (int i = 0; i < Rows(); ++i) {
			const glm::dvec3& s = spine_[i];
			for (int j = 0; j < Cols(); ++j) {
				const double r = derived(i, j);
				out.emplace_back(r * std::cos(theta_[j]) + s.x, y_[i] + s.y, -r * std::sin(theta_[j]) + s.z);
			}
		}
		if (caps_) {
			out.push_back(spine_.front() + glm::dvec3(0.0, y_.front(), 0.0));
			out.push_back(spine_.back() + glm::dvec3(0.0, y_.back(), 0.0));
		}
		return out;
	}

	DomainPoint TubeGrid::RandomPoint(std::mt19937& rng) const {
		std::uniform_real_distribution<double> angle(-kPi, kPi);
		std::uniform_real_distribution<double> height(-tube_height_ / 2.0, tube_height_ / 2.0);
		const double                           theta = angle(rng);
		return DomainPoint(theta, height(rng));
	}

	double TubeGrid::Distance(const DomainPoint& a, const DomainPoint& b) const {
		return std::hypot(WrapAngle(a.x - b.x), a.y - b.y);
	}

	Field TubeGrid::DistanceField(const DomainPoint& center) const {
		return Tabulate(Rows(), Cols(), [&](int i, int j) { return Distance(DomainPoint(theta_[j], y_[i]), center); });
	}

	Field TubeGrid::PreparePerturbation(const Field& perturbation) const {
		if (scale_perturbations_)
			return perturbation * base_;
		return perturbation;
	}

	// --------------------------------------------------------------- factory

	namespace {
		void RequireResolution(ShapeKind kind, int rows, int cols, bool wrap_rows, bool wrap_cols) {
			const int min_rows = wrap_rows ? 3 : 2;
			const int min_cols = wrap_cols ? 3 : 2;
			if (rows < min_rows || cols < min_cols) {
				throw ConfigurationError(
					std::string(ShapeName(kind)) + ": npoints must be at least " + std::to_string(min_rows) + "x" +
					std::to_string(min_cols) + ", got " + std::to_string(rows) + "x" + std::to_string(cols)
				);
			}
		}

		void ValidateTubeCurves(ShapeKind kind, const ShapeParams& params) {
			const std::string name(ShapeName(kind));
			const bool        has_curve = !params.rcurve.empty() || !params.ecurve.empty() || !params.spine.empty();
			switch (kind) {
			case ShapeKind::Cylinder:
				if (has_curve)
					throw ConfigurationError("cylinder: profile curves are not accepted, use revolution, extrusion or worm");
				break;
			case ShapeKind::Revolution:
				if (params.rcurve.empty())
					throw ConfigurationError(name + ": rcurve is required");
				break;
			case ShapeKind::Extrusion:
				if (params.ecurve.empty())
					throw ConfigurationError(name + ": ecurve is required");
				break;
			case ShapeKind::Worm:
				if (params.spine.empty())
					throw ConfigurationError(name + ": spine is required");
				break;
			default:
				break;
			}
			if (params.tube_height < 0.0)
				throw ConfigurationError(name + ": height must be positive");
		}
	} // namespace

	std::shared_ptr<const ShapeGrid> MakeShapeGrid(ShapeKind kind, const ShapeParams& params) {
		const std::string name(ShapeName(kind));
		const int         default_rows = kind == ShapeKind::Sphere ? 128 : 256;
		const int         rows = params.rows > 0 ? params.rows : default_rows;
		const int         cols = params.cols > 0 ? params.cols : 256;

		if (params.caps && !IsTubeShape(kind))
			throw ConfigurationError(name + ": caps only apply to cylinder, revolution, extrusion and worm");
		if (!IsTubeShape(kind) && (!params.rcurve.empty() || !params.ecurve.empty() || !params.spine.empty()))
			throw ConfigurationError(name + ": profile curves only apply to revolution, extrusion and worm");
		if (kind != ShapeKind::Torus && !params.major_radius_components.empty())
			throw ConfigurationError(name + ": major radius modulation only applies to the torus");

		switch (kind) {
		case ShapeKind::Sphere:
			RequireResolution(kind, rows, cols, false, true);
			return std::make_shared<SphereGrid>(rows, cols);

		case ShapeKind::Plane: {
			RequireResolution(kind, rows, cols, false, false);
			if (params.width <= 0.0 || params.height < 0.0)
				throw ConfigurationError("plane: width and height must be positive");
			const double height = params.height > 0.0 ? params.height : params.width * rows / cols;
			return std::make_shared<PlaneGrid>(rows, cols, params.width, height);
		}

		case ShapeKind::Disk:
			RequireResolution(kind, rows, cols, false, params.disk_coords == DiskCoords::Polar);
			return std::make_shared<DiskGrid>(rows, cols, params.disk_coords);

		case ShapeKind::Torus: {
			RequireResolution(kind, rows, cols, true, true);
			if (params.minor_radius <= 0.0 || params.major_radius <= 0.0)
				throw ConfigurationError("torus: radii must be positive");
			if (params.minor_radius >= params.major_radius) {
				logger::WARNING(
					"Torus minor radius {} reaches the major radius {}, the surface self-intersects",
					params.minor_radius,
					params.major_radius
				);
			}
			for (size_t k = 0; k < params.major_radius_components.size(); ++k) {
				if (std::abs(params.major_radius_components[k].amplitude) >= params.major_radius) {
					throw AmplitudeError(
						"torus: major radius component " + std::to_string(k + 1) + " amplitude must be below " +
						std::to_string(params.major_radius)
					);
				}
			}
			return std::make_shared<TorusGrid>(
				rows,
				cols,
				params.minor_radius,
				params.major_radius,
				params.major_radius_components
			);
		}

		case ShapeKind::Cylinder:
		case ShapeKind::Revolution:
		case ShapeKind::Extrusion:
		case ShapeKind::Worm:
			RequireResolution(kind, rows, cols, false, true);
			ValidateTubeCurves(kind, params);
			return std::make_shared<TubeGrid>(kind, rows, cols, params);
		}
		throw ConfigurationError("unknown shape");
	}

} // namespace ShapeKit

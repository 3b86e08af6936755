#include "model_options.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

#include "component_rows.h"
#include "errors.h"

namespace ShapeKit {

	namespace {
		constexpr std::array kOptionKeys = {
			"npoints",
			"mindist",
			"overlap",
			"seed",
			"caps",
			"normals",
			"material",
			"width",
			"height",
			"coords",
			"minor_radius",
			"major_radius",
			"major_radius_sine",
			"tube_height",
			"curve_combine",
			"perturbation_combine",
			"rcurve",
			"ecurve",
			"spine",
		};

		std::string Lower(std::string s) {
			std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
			return s;
		}

		std::string Trim(const std::string& s) {
			const char* ws = " \t\r\n";
			size_t      begin = s.find_first_not_of(ws);
			if (begin == std::string::npos)
				return "";
			return s.substr(begin, s.find_last_not_of(ws) - begin + 1);
		}

		double ParseScalar(const std::string& key, const std::string& value) {
			auto values = ParseNumberList(value, key);
			if (values.size() != 1)
				throw ConfigurationError("option '" + key + "' expects one number, got " + std::to_string(values.size()));
			return values.front();
		}

		int ParseCount(const std::string& key, double value) {
			if (value < 1.0 || std::floor(value) != value)
				throw ConfigurationError("option '" + key + "' expects positive integers");
			return static_cast<int>(value);
		}

		bool ParseFlag(const std::string& key, const std::string& value) {
			const std::string v = Lower(Trim(value));
			if (v == "true" || v == "1" || v == "yes" || v == "on")
				return true;
			if (v == "false" || v == "0" || v == "no" || v == "off")
				return false;
			throw ConfigurationError("option '" + key + "' expects a boolean, got '" + value + "'");
		}

		CurveCombine ParseCombine(const std::string& key, const std::string& value) {
			const std::string v = Lower(Trim(value));
			if (v == "multiply")
				return CurveCombine::Multiply;
			if (v == "add")
				return CurveCombine::Add;
			throw ConfigurationError("option '" + key + "' expects 'multiply' or 'add', got '" + value + "'");
		}
	} // namespace

	bool ModelOptions::IsOptionKey(const std::string& key) {
		return std::find(kOptionKeys.begin(), kOptionKeys.end(), key) != kOptionKeys.end();
	}

	void ModelOptions::Apply(const std::string& key, const std::string& value) {
		if (key == "npoints") {
			auto values = ParseNumberList(value, key);
			if (values.size() != 2)
				throw ConfigurationError("option 'npoints' expects two values (rows, columns), got " + std::to_string(values.size()));
			shape.rows = ParseCount(key, values[0]);
			shape.cols = ParseCount(key, values[1]);
		} else if (key == "mindist") {
			min_distance = ParseScalar(key, value);
			if (min_distance < 0.0)
				throw ConfigurationError("option 'mindist' must not be negative");
		} else if (key == "overlap") {
			const std::string v = Lower(Trim(value));
			if (v == "sum")
				overlap = OverlapPolicy::Sum;
			else if (v == "max")
				overlap = OverlapPolicy::Max;
			else
				throw ConfigurationError("option 'overlap' expects 'sum' or 'max', got '" + value + "'");
		} else if (key == "seed") {
			const double s = ParseScalar(key, value);
			if (s < 0.0 || std::floor(s) != s || s > 4294967295.0)
				throw ConfigurationError("option 'seed' expects a non-negative 32-bit integer");
			seed = static_cast<uint32_t>(s);
		} else if (key == "caps") {
			shape.caps = ParseFlag(key, value);
		} else if (key == "normals") {
			compute_normals = ParseFlag(key, value);
		} else if (key == "material") {
			std::string cleaned = value;
			std::replace(cleaned.begin(), cleaned.end(), ',', ' ');
			std::stringstream        ss(cleaned);
			std::vector<std::string> parts;
			std::string              part;
			while (ss >> part)
				parts.push_back(part);
			if (parts.size() != 2)
				throw ConfigurationError("option 'material' expects a file name and a material name");
			material = MaterialRef{parts[0], parts[1]};
		} else if (key == "width") {
			shape.width = ParseScalar(key, value);
		} else if (key == "height") {
			shape.height = ParseScalar(key, value);
		} else if (key == "coords") {
			const std::string v = Lower(Trim(value));
			if (v == "polar")
				shape.disk_coords = DiskCoords::Polar;
			else if (v == "cartesian")
				shape.disk_coords = DiskCoords::Cartesian;
			else
				throw ConfigurationError("option 'coords' expects 'polar' or 'cartesian', got '" + value + "'");
		} else if (key == "minor_radius") {
			shape.minor_radius = ParseScalar(key, value);
		} else if (key == "major_radius") {
			shape.major_radius = ParseScalar(key, value);
		} else if (key == "major_radius_sine") {
			shape.major_radius_components = SineComponent::Carriers(ParseComponentRows(value, key));
		} else if (key == "tube_height") {
			shape.tube_height = ParseScalar(key, value);
		} else if (key == "curve_combine") {
			shape.curve_combine = ParseCombine(key, value);
		} else if (key == "perturbation_combine") {
			shape.perturbation_combine = ParseCombine(key, value);
		} else if (key == "rcurve") {
			shape.rcurve = ParseNumberList(value, key);
		} else if (key == "ecurve") {
			shape.ecurve = ParseNumberList(value, key);
		} else if (key == "spine") {
			shape.spine.clear();
			for (const auto& row : ParseComponentRows(value, key)) {
				if (row.size() != 3)
					throw ConfigurationError("option 'spine' expects rows of three values (x y z)");
				shape.spine.emplace_back(row[0], row[1], row[2]);
			}
		} else {
			throw ConfigurationError("unknown option '" + key + "'");
		}
	}

} // namespace ShapeKit

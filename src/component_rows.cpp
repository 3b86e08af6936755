#include "component_rows.h"

#include <cmath>
#include <sstream>

#include "errors.h"

namespace ShapeKit {

	namespace {
		std::vector<std::string> Split(const std::string& text, char sep) {
			std::vector<std::string> parts;
			std::stringstream        ss(text);
			std::string              part;
			while (std::getline(ss, part, sep)) {
				parts.push_back(part);
			}
			return parts;
		}
	} // namespace

	std::vector<double> ParseNumberList(const std::string& text, const std::string& option_name) {
		std::string cleaned = text;
		for (auto& c : cleaned) {
			if (c == ',' || c == '[' || c == ']')
				c = ' ';
		}

		std::vector<double> values;
		std::stringstream   ss(cleaned);
		std::string         token;
		while (ss >> token) {
			try {
				size_t used = 0;
				double v = std::stod(token, &used);
				if (used != token.size() || std::isnan(v))
					throw std::invalid_argument(token);
				values.push_back(v);
			} catch (const std::logic_error&) {
				throw ConfigurationError("option '" + option_name + "': '" + token + "' is not a number");
			}
		}
		return values;
	}

	std::vector<ComponentRow> ParseComponentRows(const std::string& text, const std::string& option_name) {
		std::vector<ComponentRow> rows;
		for (const auto& part : Split(text, ';')) {
			auto row = ParseNumberList(part, option_name);
			if (!row.empty())
				rows.push_back(std::move(row));
		}
		return rows;
	}

	ComponentRow FillRow(const ComponentRow& row, const std::vector<double>& defaults, const std::string& what) {
		if (row.empty() || row.size() > defaults.size() + 1) {
			throw ConfigurationError(
				what + ": expected 1 to " + std::to_string(defaults.size() + 1) + " values, got " +
				std::to_string(row.size())
			);
		}
		ComponentRow filled = row;
		for (size_t col = row.size(); col <= defaults.size(); ++col) {
			filled.push_back(defaults[col - 1]);
		}
		return filled;
	}

	int GroupFromValue(double value, const std::string& what) {
		if (value < 0.0 || std::floor(value) != value) {
			throw ConfigurationError(what + ": group index must be a non-negative integer");
		}
		return static_cast<int>(value);
	}

} // namespace ShapeKit

#pragma once

#include <string>
#include <vector>

namespace ShapeKit {

	// One row of a component parameter table, e.g. {frequency, amplitude, phase, orientation, group}.
	using ComponentRow = std::vector<double>;

	/**
	 * @brief Parse "8 .1 0 0; 4 1 0 90 1" style tables.
	 *
	 * Rows are separated by ';' and values by whitespace or ','. Throws
	 * ConfigurationError naming the option on a non-numeric value.
	 */
	std::vector<ComponentRow> ParseComponentRows(const std::string& text, const std::string& option_name);

	// Parse a flat list of numbers ("1 0.9 0.8"), used for curves and vectors.
	std::vector<double> ParseNumberList(const std::string& text, const std::string& option_name);

	/**
	 * @brief Fill missing trailing columns from defaults.
	 *
	 * The row must hold between 1 and defaults.size() + 1 values (the first
	 * column never has a default).
	 */
	ComponentRow FillRow(const ComponentRow& row, const std::vector<double>& defaults, const std::string& what);

	// Group ids are stored as doubles in rows; reject fractional and negative ids.
	int GroupFromValue(double value, const std::string& what);

} // namespace ShapeKit

#pragma once

#include <stdexcept>
#include <string>

namespace ShapeKit {

	/**
	 * @brief Bad input detected before a model is touched: unknown shape,
	 * malformed option, wrong-length vector, bad component row.
	 */
	class ConfigurationError: public std::invalid_argument {
	public:
		explicit ConfigurationError(const std::string& what): std::invalid_argument(what) {}
	};

	/**
	 * @brief A radius modulation whose amplitude would reach the base radius.
	 */
	class AmplitudeError: public ConfigurationError {
	public:
		explicit AmplitudeError(const std::string& what): ConfigurationError(what) {}
	};

	/**
	 * @brief Minimum-distance bump placement could not find enough centers.
	 *
	 * Recoverable: retry with fewer bumps or a smaller minimum distance.
	 */
	class PlacementError: public std::runtime_error {
	public:
		explicit PlacementError(const std::string& what): std::runtime_error(what) {}
	};

} // namespace ShapeKit

#pragma once

#include <string>

#include "grid_field.h"

namespace ShapeKit {

	/**
	 * @brief Load an image file as a grayscale field in [0, 1].
	 *
	 * Color channels are averaged and alpha is ignored. Rows are flipped so
	 * that row 0 is the bottom image row. Throws ConfigurationError when the
	 * file cannot be read or decoded.
	 */
	Field LoadGrayscaleImage(const std::string& path);

} // namespace ShapeKit

#pragma once

#include <Eigen/Core>

namespace ShapeKit {

	/**
	 * @brief Scalar field over a shape's parameter grid.
	 *
	 * Rows run along the slow (non-periodic) axis, columns along the fast
	 * axis. Storage is row-major so the flattened order matches the vertex
	 * buffer order.
	 */
	using Field = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace ShapeKit

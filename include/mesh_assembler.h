#pragma once

#include <vector>

#include <glm/glm.hpp>

#include "grid_field.h"
#include "shape_grid.h"

namespace ShapeKit {

	/**
	 * @brief Final triangle mesh of a model.
	 *
	 * Face indices are 0-based into vertices. uv_faces index uvs with the
	 * same triangle order as faces. normals and the uv arrays are empty when
	 * they were not requested.
	 */
	struct MeshBuffer {
		std::vector<glm::dvec3> vertices;
		std::vector<glm::uvec3> faces;
		std::vector<glm::dvec3> normals;
		std::vector<glm::dvec2> uvs;
		std::vector<glm::uvec3> uv_faces;

		bool HasNormals() const { return !normals.empty(); }

		bool HasTextureCoords() const { return !uvs.empty(); }
	};

	struct TextureLayout {
		std::vector<glm::dvec2> uvs;
		std::vector<glm::uvec3> faces;
	};

	class MeshAssembler {
	public:
		/**
		 * @brief Two triangles per grid quad, wrapping periodic axes, plus a
		 * fan per cap around the two center vertices that follow the grid.
		 */
		static std::vector<glm::uvec3> BuildFaces(const GridTopology& topology);

		/**
		 * @brief Texture coordinates with the seam column (and row) duplicated.
		 *
		 * Wrapped axes get one more texture sample than grid samples so u and
		 * v run over the full [0, 1]. Cap centers get (0.5, 0) and (0.5, 1).
		 */
		static TextureLayout BuildTextureLayout(const GridTopology& topology);

		/**
		 * @brief Area-weighted vertex normals.
		 *
		 * Degenerate faces contribute nothing; vertices touched only by
		 * degenerate faces keep a zero normal and are reported in a warning.
		 */
		static std::vector<glm::dvec3>
		ComputeVertexNormals(const std::vector<glm::dvec3>& vertices, const std::vector<glm::uvec3>& faces);

		static MeshBuffer Assemble(const ShapeGrid& grid, const Field& derived, bool normals, bool texture_coords);
	};

} // namespace ShapeKit

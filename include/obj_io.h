#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "model.h"

namespace ShapeKit {

	/**
	 * @brief Vertex positions and 0-based triangles read back from an OBJ file.
	 */
	struct ObjMesh {
		std::vector<glm::dvec3> vertices;
		std::vector<glm::uvec3> faces;
	};

	// Append ".obj" unless the name already ends with it.
	std::string WithObjExtension(const std::string& filename);

	/**
	 * @brief Write a model's mesh as OBJ text.
	 *
	 * Emits header comments, mtllib/usemtl when the model has a material,
	 * then v, vt, vn and f sections. Faces are 1-based and use the a, a//a,
	 * a/t or a/t/a form depending on which optional arrays are present.
	 */
	void WriteObj(std::ostream& out, const Model& model);

	// Throws std::runtime_error when the file cannot be written.
	void WriteObj(const std::string& path, const Model& model);

	/**
	 * @brief Read vertex positions and triangles of an OBJ file.
	 *
	 * Throws std::runtime_error when the file holds no vertices or a face
	 * that is not a triangle.
	 */
	ObjMesh ReadObj(const std::string& path);

} // namespace ShapeKit

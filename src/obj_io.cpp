#include "obj_io.h"

#include <cinolib/io/read_OBJ.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "logger.h"

namespace ShapeKit {

	namespace {
		std::string FormatVec3(const char* tag, const glm::dvec3& v) {
			char buffer[128];
			std::snprintf(buffer, sizeof(buffer), "%s %8.6f %8.6f %8.6f\n", tag, v.x, v.y, v.z);
			return buffer;
		}

		std::string FormatVec2(const char* tag, const glm::dvec2& v) {
			char buffer[96];
			std::snprintf(buffer, sizeof(buffer), "%s %8.6f %8.6f\n", tag, v.x, v.y);
			return buffer;
		}

		const char* YesNo(bool value) {
			return value ? "Yes" : "No";
		}
	} // namespace

	std::string WithObjExtension(const std::string& filename) {
		const std::string ext = ".obj";
		if (filename.size() >= ext.size() && filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0)
			return filename;
		return filename + ext;
	}

	void WriteObj(std::ostream& out, const Model& model) {
		const MeshBuffer& mesh = model.Mesh();
		const bool        uv = mesh.HasTextureCoords();
		const bool        normals = mesh.HasNormals();

		out << "# Created with ShapeKit.\n";
		out << "# Shape: " << ShapeName(model.Shape()) << ".\n";
		out << "#\n# Number of vertices: " << mesh.vertices.size() << ".\n";
		out << "# Number of faces: " << mesh.faces.size() << ".\n";
		out << "# Texture (uv) coordinates defined: " << YesNo(uv) << ".\n";
		out << "# Vertex normals included: " << YesNo(normals) << ".\n";
		const auto& perturbations = model.Perturbations();
		if (!perturbations.empty()) {
			out << "#\n# Perturbations (in order of application):\n";
			for (size_t k = 0; k < perturbations.size(); ++k) {
				out << "#  " << k + 1 << " (" << (perturbations[k].enabled ? "enabled" : "disabled")
				    << "): " << perturbations[k].label << "\n";
			}
		}

		if (model.Options().material) {
			out << "\nmtllib " << model.Options().material->file << "\n";
			out << "usemtl " << model.Options().material->name << "\n";
		}

		out << "\n# Vertices:\n";
		for (const auto& v : mesh.vertices)
			out << FormatVec3("v", v);
		out << "# End vertices\n";

		if (uv) {
			out << "\n# Texture coordinates:\n";
			for (const auto& t : mesh.uvs)
				out << FormatVec2("vt", t);
			out << "# End texture coordinates\n";
		}

		if (normals) {
			out << "\n# Normals:\n";
			for (const auto& n : mesh.normals)
				out << FormatVec3("vn", n);
			out << "# End normals\n";
		}

		out << "\n# Faces:\n";
		for (size_t k = 0; k < mesh.faces.size(); ++k) {
			const glm::uvec3 f = mesh.faces[k] + 1u;
			out << "f";
			for (int c = 0; c < 3; ++c) {
				out << " " << f[c];
				if (uv) {
					out << "/" << mesh.uv_faces[k][c] + 1u;
					if (normals)
						out << "/" << f[c];
				} else if (normals) {
					out << "//" << f[c];
				}
			}
			out << "\n";
		}
		out << "# End faces\n";
	}

	void WriteObj(const std::string& path, const Model& model) {
		std::ofstream file(path);
		if (!file.is_open())
			throw std::runtime_error("Could not open '" + path + "' for writing");
		WriteObj(file, model);
		if (!file)
			throw std::runtime_error("Failed while writing '" + path + "'");
		logger::INFO("Wrote {} ({} vertices, {} faces)", path, model.Mesh().vertices.size(), model.Mesh().faces.size());
	}

	ObjMesh ReadObj(const std::string& path) {
		std::vector<cinolib::vec3d>    verts;
		std::vector<std::vector<uint>> polys;
		cinolib::read_OBJ(path.c_str(), verts, polys);
		if (verts.empty())
			throw std::runtime_error("Failed to read OBJ file or file is empty: " + path);

		ObjMesh mesh;
		mesh.vertices.reserve(verts.size());
		for (const auto& v : verts)
			mesh.vertices.emplace_back(v.x(), v.y(), v.z());

		mesh.faces.reserve(polys.size());
		for (const auto& p : polys) {
			if (p.size() != 3)
				throw std::runtime_error(path + ": face with " + std::to_string(p.size()) + " vertices, expected triangles");
			mesh.faces.emplace_back(p[0], p[1], p[2]);
		}
		return mesh;
	}

} // namespace ShapeKit

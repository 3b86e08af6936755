#include "mesh_assembler.h"

#include "logger.h"

namespace ShapeKit {

	std::vector<glm::uvec3> MeshAssembler::BuildFaces(const GridTopology& topology) {
		const unsigned m = static_cast<unsigned>(topology.rows);
		const unsigned n = static_cast<unsigned>(topology.cols);
		const unsigned row_quads = topology.wrap_rows ? m : m - 1;
		const unsigned col_quads = topology.wrap_cols ? n : n - 1;

		auto v = [n](unsigned i, unsigned j) { return i * n + j; };

		std::vector<glm::uvec3> faces;
		faces.reserve(2 * row_quads * col_quads + (topology.caps ? 2 * n : 0));
		for (unsigned i = 0; i < row_quads; ++i) {
			const unsigned i1 = (i + 1) % m;
			for (unsigned j = 0; j < col_quads; ++j) {
				const unsigned j1 = (j + 1) % n;
				faces.emplace_back(v(i, j), v(i1, j1), v(i1, j));
				faces.emplace_back(v(i, j), v(i, j1), v(i1, j1));
			}
		}

		if (topology.caps) {
			const unsigned bottom = m * n;
			const unsigned top = m * n + 1;
			for (unsigned j = 0; j < n; ++j)
				faces.emplace_back(bottom, v(0, (j + 1) % n), v(0, j));
			for (unsigned j = 0; j < n; ++j)
				faces.emplace_back(top, v(m - 1, j), v(m - 1, (j + 1) % n));
		}
		return faces;
	}

	TextureLayout MeshAssembler::BuildTextureLayout(const GridTopology& topology) {
		const unsigned m = static_cast<unsigned>(topology.rows);
		const unsigned n = static_cast<unsigned>(topology.cols);
		const unsigned mt = topology.wrap_rows ? m + 1 : m;
		const unsigned nt = topology.wrap_cols ? n + 1 : n;
		const unsigned row_quads = topology.wrap_rows ? m : m - 1;
		const unsigned col_quads = topology.wrap_cols ? n : n - 1;

		auto t = [nt](unsigned i, unsigned j) { return i * nt + j; };

		TextureLayout layout;
		layout.uvs.reserve(mt * nt + (topology.caps ? 2 : 0));
		for (unsigned i = 0; i < mt; ++i) {
			for (unsigned j = 0; j < nt; ++j)
				layout.uvs.emplace_back(static_cast<double>(j) / (nt - 1), static_cast<double>(i) / (mt - 1));
		}

		layout.faces.reserve(2 * row_quads * col_quads + (topology.caps ? 2 * n : 0));
		for (unsigned i = 0; i < row_quads; ++i) {
			for (unsigned j = 0; j < col_quads; ++j) {
				layout.faces.emplace_back(t(i, j), t(i + 1, j + 1), t(i + 1, j));
				layout.faces.emplace_back(t(i, j), t(i, j + 1), t(i + 1, j + 1));
			}
		}

		if (topology.caps) {
			const unsigned bottom = mt * nt;
			const unsigned top = mt * nt + 1;
			layout.uvs.emplace_back(0.5, 0.0);
			layout.uvs.emplace_back(0.5, 1.0);
			for (unsigned j = 0; j < n; ++j)
				layout.faces.emplace_back(bottom, t(0, j + 1), t(0, j));
			for (unsigned j = 0; j < n; ++j)
				layout.faces.emplace_back(top, t(mt - 1, j), t(mt - 1, j + 1));
		}
		return layout;
	}

	std::vector<glm::dvec3> MeshAssembler::ComputeVertexNormals(
		const std::vector<glm::dvec3>& vertices,
		const std::vector<glm::uvec3>& faces
	) {
		std::vector<glm::dvec3> normals(vertices.size(), glm::dvec3(0.0));
		size_t                  degenerate = 0;
		for (const auto& f : faces) {
			const glm::dvec3 n = glm::cross(vertices[f.y] - vertices[f.x], vertices[f.z] - vertices[f.x]);
			if (glm::dot(n, n) == 0.0) {
				++degenerate;
				continue;
			}
			normals[f.x] += n;
			normals[f.y] += n;
			normals[f.z] += n;
		}
		if (degenerate > 0)
			logger::DEBUG("{} of {} faces are degenerate and were skipped for normals", degenerate, faces.size());

		size_t orphaned = 0;
		for (auto& n : normals) {
			const double len = glm::length(n);
			if (len > 0.0)
				n /= len;
			else
				++orphaned;
		}
		if (orphaned > 0)
			logger::WARNING("{} vertices have no well-defined normal and keep a zero normal", orphaned);
		return normals;
	}

	MeshBuffer MeshAssembler::Assemble(const ShapeGrid& grid, const Field& derived, bool normals, bool texture_coords) {
		const GridTopology topology = grid.Topology();

		MeshBuffer mesh;
		mesh.vertices = grid.ToCartesian(derived);
		mesh.faces = BuildFaces(topology);
		if (normals)
			mesh.normals = ComputeVertexNormals(mesh.vertices, mesh.faces);
		if (texture_coords) {
			TextureLayout layout = BuildTextureLayout(topology);
			mesh.uvs = std::move(layout.uvs);
			mesh.uv_faces = std::move(layout.faces);
		}
		return mesh;
	}

} // namespace ShapeKit

// mesh_input.hpp - Triangle mesh input contract and primitive builders
//
// The solid-modeling layer hands over vertices, triangle indices and an
// optional material id per triangle (ids refer to a MaterialLibrary).
// Triangles without an id use the mesh's default material.

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

#include "global_function.hpp"
#include "structure_material.hpp"

struct TriangleMesh {
    std::vector<std::array<float, 3>> vertices;
    std::vector<std::array<std::uint32_t, 3>> triangles;
    std::vector<MaterialId> triangle_material;   // empty, or one per triangle
    MaterialId default_material{ 0 };

    size_t triangle_count() const { return triangles.size(); }

    MaterialId material_of(size_t t) const {
        return t < triangle_material.size() ? triangle_material[t] : default_material;
    }

    // Bounding box over the vertices referenced by valid triangles
    AABB bounding_box() const {
        AABB bb{ 0, 0, 0, 0, 0, 0 };
        bool first = true;
        for (const auto& tri : triangles) {
            for (std::uint32_t v : tri) {
                if (v >= vertices.size()) continue;
                const auto& p = vertices[v];
                AABB pb{ p[0], p[0], p[1], p[1], p[2], p[2] };
                bb = first ? pb : bb.merge(pb);
                first = false;
            }
        }
        return bb;
    }
};

// ==================== Primitive builders ====================
// Outward-oriented closed surfaces, appended to an existing mesh.
namespace MeshBuilder {

inline void pad_material_tags(TriangleMesh& mesh) {
    if (mesh.triangle_material.size() < mesh.triangles.size()) {
        mesh.triangle_material.resize(mesh.triangles.size(), mesh.default_material);
    }
}

inline void append_box(TriangleMesh& mesh, const AABB& b, MaterialId material) {
    pad_material_tags(mesh);
    const auto base = std::uint32_t(mesh.vertices.size());
    const float x0 = float(b.x0), x1 = float(b.x1);
    const float y0 = float(b.y0), y1 = float(b.y1);
    const float z0 = float(b.z0), z1 = float(b.z1);
    mesh.vertices.insert(mesh.vertices.end(), {
        {x0, y0, z0}, {x1, y0, z0}, {x1, y1, z0}, {x0, y1, z0},
        {x0, y0, z1}, {x1, y0, z1}, {x1, y1, z1}, {x0, y1, z1}
    });
    static const std::uint32_t faces[12][3] = {
        {0, 2, 1}, {0, 3, 2},   // -z
        {4, 5, 6}, {4, 6, 7},   // +z
        {0, 1, 5}, {0, 5, 4},   // -y
        {3, 7, 6}, {3, 6, 2},   // +y
        {0, 4, 7}, {0, 7, 3},   // -x
        {1, 2, 6}, {1, 6, 5}    // +x
    };
    for (const auto& f : faces) {
        mesh.triangles.push_back({ base + f[0], base + f[1], base + f[2] });
        mesh.triangle_material.push_back(material);
    }
}

// UV sphere with n_lat latitude bands and n_lon longitude segments
inline void append_sphere(TriangleMesh& mesh, real cx, real cy, real cz, real r,
                          MaterialId material, int n_lat = 24, int n_lon = 48) {
    pad_material_tags(mesh);
    const auto base = std::uint32_t(mesh.vertices.size());
    const real pi = PhysConst::PI;

    mesh.vertices.push_back({ float(cx), float(cy), float(cz + r) });   // north pole
    for (int a = 1; a < n_lat; ++a) {
        const real th = pi * real(a) / real(n_lat);
        for (int b = 0; b < n_lon; ++b) {
            const real ph = 2.0 * pi * real(b) / real(n_lon);
            mesh.vertices.push_back({ float(cx + r * std::sin(th) * std::cos(ph)),
                                      float(cy + r * std::sin(th) * std::sin(ph)),
                                      float(cz + r * std::cos(th)) });
        }
    }
    mesh.vertices.push_back({ float(cx), float(cy), float(cz - r) });   // south pole
    const std::uint32_t south = std::uint32_t(mesh.vertices.size() - 1);

    auto ring = [&](int a, int b) {
        return base + 1 + std::uint32_t((a - 1) * n_lon + ((b + n_lon) % n_lon));
    };
    auto push = [&](std::uint32_t p, std::uint32_t q, std::uint32_t s) {
        mesh.triangles.push_back({ p, q, s });
        mesh.triangle_material.push_back(material);
    };

    for (int b = 0; b < n_lon; ++b) push(base, ring(1, b), ring(1, b + 1));
    for (int a = 1; a < n_lat - 1; ++a) {
        for (int b = 0; b < n_lon; ++b) {
            push(ring(a, b), ring(a + 1, b), ring(a + 1, b + 1));
            push(ring(a, b), ring(a + 1, b + 1), ring(a, b + 1));
        }
    }
    for (int b = 0; b < n_lon; ++b) push(ring(n_lat - 1, b), south, ring(n_lat - 1, b + 1));
}

// Exact volume of a closed triangulated surface (divergence theorem)
inline real enclosed_volume(const TriangleMesh& mesh, MaterialId material) {
    real vol = 0;
    for (size_t t = 0; t < mesh.triangles.size(); ++t) {
        if (mesh.material_of(t) != material) continue;
        const auto& tri = mesh.triangles[t];
        const auto& a = mesh.vertices[tri[0]];
        const auto& b = mesh.vertices[tri[1]];
        const auto& c = mesh.vertices[tri[2]];
        vol += (real(a[0]) * (real(b[1]) * c[2] - real(b[2]) * c[1])
              - real(a[1]) * (real(b[0]) * c[2] - real(b[2]) * c[0])
              + real(a[2]) * (real(b[0]) * c[1] - real(b[1]) * c[0])) / 6.0;
    }
    return std::abs(vol);
}

} // namespace MeshBuilder

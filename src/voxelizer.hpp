// voxelizer.hpp - Triangle mesh -> material grid (parity scan-line voxelization)
//
// Each material region (triangles sharing a material id) is classified by the
// crossing-number test along grid lines. Triangles are binned per column
// (pair of transverse cell indices) by their bounding boxes, so one column
// only intersects the triangles that can reach it; the sorted crossings of a
// column classify every cell on that line at once.
//
// Ties (a line through a triangle edge or vertex) are re-cast with a fixed
// sequence of small transverse offsets; a column that stays ambiguous is
// outside the region. Regions whose edges are not all shared by exactly two
// triangles are classified by a majority vote of the three axis directions.

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>
#include <algorithm>

#include "global_function.hpp"
#include "omp_config.hpp"
#include "errors.hpp"
#include "structure_material.hpp"
#include "mesh_input.hpp"

// Outcome counters; non-empty warnings never abort the run
struct VoxelReport {
    size_t regions{};
    size_t triangles_used{};
    size_t degenerate_triangles{};
    size_t invalid_triangles{};
    size_t ambiguous_columns_resolved{};   // tie removed by perturbation
    size_t ambiguous_columns_outside{};    // still tied, cells left outside
    size_t open_edges{};                   // edges not shared by exactly two triangles
    size_t vote_resolved_cells{};          // non-manifold cells decided by axis vote
    std::vector<MaterialId> non_manifold_regions;
    std::vector<std::string> warnings;

    bool clean() const { return warnings.empty(); }
};

struct VoxelizeResult {
    MaterialGrid grid;
    VoxelReport report;
};

inline constexpr real MAX_AXIS_CELLS = 4294967296.0;

// Core grid covering the mesh bounding box plus `margin` vacuum cells per face
inline GridGeometry plan_grid(const TriangleMesh& mesh, real cell_size, size_t margin,
                              size_t npml, real length_unit)
{
    if (mesh.triangles.empty()) {
        throw MeshError("[Voxelizer] mesh has no triangles");
    }
    if (!(cell_size > 0.0)) {
        throw ConfigError("cell_size", "must be positive");
    }
    const AABB bb = mesh.bounding_box();
    GridGeometry g;
    size_t n[3];
    for (int a = 0; a < 3; ++a) {
        // Clamped so the cast stays defined; the memory check rejects such grids
        const real cells = std::clamp<real>(std::ceil(bb.extent(a) / cell_size - 1e-9), 0.0, MAX_AXIS_CELLS);
        n[a] = NumericUtils::sat_add(std::max<size_t>(1, size_t(cells)), NumericUtils::sat_mul(2, margin));
        g.origin[a] = bb.lo(a) - real(margin) * cell_size;
    }
    g.Nx = n[0]; g.Ny = n[1]; g.Nz = n[2];
    g.npml = npml;
    g.cell_size = cell_size;
    g.dx = cell_size * length_unit;
    g.inv_dx = 1.0 / g.dx;
    return g;
}

namespace VoxelDetail {

struct Tri {
    real p[3][3];
};

// Tie-breaking offsets (fractions of a cell) tried in order
inline constexpr real kPerturb[4][2] = {
    { 0.0, 0.0 }, { 3.7e-5, 1.9e-5 }, { -2.3e-5, 4.1e-5 }, { 5.3e-5, -3.1e-5 }
};

enum class Hit { None, Crossing, Tie };

// Intersect the line {coord b = pb, coord c = pc} with a triangle.
inline Hit intersect_line(const Tri& t, int a, int b, int c, real pb, real pc, real& coord_a) {
    auto edge = [&](int u, int v) {
        return (t.p[v][b] - t.p[u][b]) * (pc - t.p[u][c]) - (t.p[v][c] - t.p[u][c]) * (pb - t.p[u][b]);
    };
    real w0 = edge(1, 2);
    real w1 = edge(2, 0);
    real w2 = edge(0, 1);
    real area = w0 + w1 + w2;

    // Edge-on to the line: its neighbours carry the crossing
    const real span = std::abs(t.p[1][b] - t.p[0][b]) + std::abs(t.p[2][b] - t.p[0][b])
                    + std::abs(t.p[1][c] - t.p[0][c]) + std::abs(t.p[2][c] - t.p[0][c]);
    if (std::abs(area) <= 1e-12 * span * span) return Hit::None;
    if (area < 0) { w0 = -w0; w1 = -w1; w2 = -w2; area = -area; }

    const real tol = 1e-9 * area;
    if (w0 < -tol || w1 < -tol || w2 < -tol) return Hit::None;
    if (w0 <= tol || w1 <= tol || w2 <= tol) return Hit::Tie;

    coord_a = (w0 * t.p[0][a] + w1 * t.p[1][a] + w2 * t.p[2][a]) / area;
    return Hit::Crossing;
}

inline std::uint64_t edge_key(std::uint32_t u, std::uint32_t v) {
    if (u > v) std::swap(u, v);
    return (std::uint64_t(u) << 32) | v;
}

// Count edges not shared by exactly two triangles
inline size_t count_open_edges(const std::vector<std::array<std::uint32_t, 3>>& tris) {
    std::unordered_map<std::uint64_t, std::uint32_t> use;
    use.reserve(tris.size() * 2);
    for (const auto& t : tris) {
        ++use[edge_key(t[0], t[1])];
        ++use[edge_key(t[1], t[2])];
        ++use[edge_key(t[2], t[0])];
    }
    size_t open = 0;
    for (const auto& kv : use) {
        if (kv.second != 2) ++open;
    }
    return open;
}

// Parity classification along axis `a`; votes[cell] = 1 inside, 0 outside, -1 tied.
// Cells never reached by a triangle column stay untouched (caller pre-fills 0).
inline void classify_axis(const std::vector<Tri>& tris, const GridGeometry& g, int a,
                          std::vector<std::int8_t>& votes,
                          size_t& resolved_columns, size_t& tied_columns)
{
    const int b = (a + 1) % 3, c = (a + 2) % 3;
    const size_t N[3] = { g.Nx, g.Ny, g.Nz };
    const real cs = g.cell_size;

    // ---- Column binning by triangle bounding box ----
    std::vector<std::vector<std::uint32_t>> buckets(N[b] * N[c]);
    auto col_range = [&](real lo, real hi, int axis, long& first, long& last) {
        first = long(std::ceil((lo - g.origin[axis]) / cs - 0.5 - 0.01));
        last = long(std::floor((hi - g.origin[axis]) / cs - 0.5 + 0.01));
        first = std::max(first, 0L);
        last = std::min(last, long(N[axis]) - 1);
    };
    for (size_t t = 0; t < tris.size(); ++t) {
        const Tri& tr = tris[t];
        long b0, b1, c0, c1;
        col_range(std::min({ tr.p[0][b], tr.p[1][b], tr.p[2][b] }),
                  std::max({ tr.p[0][b], tr.p[1][b], tr.p[2][b] }), b, b0, b1);
        col_range(std::min({ tr.p[0][c], tr.p[1][c], tr.p[2][c] }),
                  std::max({ tr.p[0][c], tr.p[1][c], tr.p[2][c] }), c, c0, c1);
        for (long ib = b0; ib <= b1; ++ib)
            for (long ic = c0; ic <= c1; ++ic)
                buckets[size_t(ib) * N[c] + size_t(ic)].push_back(std::uint32_t(t));
    }

    auto cell_id = [&](size_t n, size_t ib, size_t ic) {
        size_t ijk[3];
        ijk[a] = n; ijk[b] = ib; ijk[c] = ic;
        return idx3(ijk[0], ijk[1], ijk[2], g.Ny, g.Nz);
    };

    size_t resolved = 0, tied = 0;

#if FDTD_OMP_ENABLED
#pragma omp parallel for reduction(+:resolved, tied) schedule(dynamic, 4)
#endif
    for (long ibl = 0; ibl < long(N[b]); ++ibl) {
        const size_t ib = size_t(ibl);
        std::vector<real> crossings;
        for (size_t ic = 0; ic < N[c]; ++ic) {
            const auto& bucket = buckets[ib * N[c] + ic];
            if (bucket.empty()) continue;

            bool ambiguous = true;
            for (int attempt = 0; attempt < 4 && ambiguous; ++attempt) {
                const real pb = g.origin[b] + (real(ib) + 0.5 + kPerturb[attempt][0]) * cs;
                const real pc = g.origin[c] + (real(ic) + 0.5 + kPerturb[attempt][1]) * cs;
                crossings.clear();
                ambiguous = false;
                for (std::uint32_t t : bucket) {
                    real x = 0;
                    const Hit h = intersect_line(tris[t], a, b, c, pb, pc, x);
                    if (h == Hit::Tie) { ambiguous = true; break; }
                    if (h == Hit::Crossing) crossings.push_back(x);
                }
                if (!ambiguous && attempt > 0) ++resolved;
            }

            if (ambiguous) {
                ++tied;
                for (size_t n = 0; n < N[a]; ++n) votes[cell_id(n, ib, ic)] = -1;
                continue;
            }

            std::sort(crossings.begin(), crossings.end());
            for (size_t n = 0; n < N[a]; ++n) {
                // Ray origin nudged along +a so a centre lying on the surface is not a tie
                const real x0 = g.origin[a] + (real(n) + 0.5 + 1e-7) * cs;
                const size_t beyond = size_t(crossings.end()
                    - std::upper_bound(crossings.begin(), crossings.end(), x0));
                votes[cell_id(n, ib, ic)] = std::int8_t(beyond % 2);
            }
        }
    }
    resolved_columns += resolved;
    tied_columns += tied;
}

} // namespace VoxelDetail

// ==================== Voxelization entry point ====================
inline VoxelizeResult voxelize(const TriangleMesh& mesh, const MaterialLibrary& library,
                               const GridGeometry& geo, bool verbose = true)
{
    using namespace VoxelDetail;
    VoxelizeResult out;
    VoxelReport& rep = out.report;
    MaterialGrid& grid = out.grid;

    grid.library = library;
    grid.cell_size = geo.cell_size;
    for (int a = 0; a < 3; ++a) grid.origin[a] = geo.origin[a];
    grid.allocate(geo.Nx, geo.Ny, geo.Nz);

    // ---- Group valid triangles by material ----
    std::vector<std::vector<Tri>> region_tris(library.size());
    std::vector<std::vector<std::array<std::uint32_t, 3>>> region_idx(library.size());
    for (size_t t = 0; t < mesh.triangles.size(); ++t) {
        const auto& tri = mesh.triangles[t];
        const MaterialId mid = mesh.material_of(t);
        if (mid >= library.size()) {
            throw MeshError("[Voxelizer] triangle " + std::to_string(t)
                            + " references unknown material id " + std::to_string(mid));
        }
        if (tri[0] >= mesh.vertices.size() || tri[1] >= mesh.vertices.size()
            || tri[2] >= mesh.vertices.size()) {
            ++rep.invalid_triangles;
            continue;
        }
        Tri tr;
        for (int v = 0; v < 3; ++v)
            for (int a = 0; a < 3; ++a) tr.p[v][a] = real(mesh.vertices[tri[v]][a]);

        const real e1[3] = { tr.p[1][0] - tr.p[0][0], tr.p[1][1] - tr.p[0][1], tr.p[1][2] - tr.p[0][2] };
        const real e2[3] = { tr.p[2][0] - tr.p[0][0], tr.p[2][1] - tr.p[0][1], tr.p[2][2] - tr.p[0][2] };
        const real cx = e1[1] * e2[2] - e1[2] * e2[1];
        const real cy = e1[2] * e2[0] - e1[0] * e2[2];
        const real cz = e1[0] * e2[1] - e1[1] * e2[0];
        if (std::sqrt(cx * cx + cy * cy + cz * cz) <= 1e-12 * geo.cell_size * geo.cell_size) {
            ++rep.degenerate_triangles;
            continue;
        }
        region_tris[mid].push_back(tr);
        region_idx[mid].push_back(tri);
        ++rep.triangles_used;
    }

    // ---- Region order: ascending (priority, id); later regions overwrite ----
    std::vector<MaterialId> order;
    for (size_t m = 0; m < library.size(); ++m) {
        if (!region_tris[m].empty()) order.push_back(MaterialId(m));
    }
    std::stable_sort(order.begin(), order.end(), [&](MaterialId l, MaterialId r) {
        return library.at(l).priority < library.at(r).priority;
    });
    rep.regions = order.size();

    const size_t N = grid.cell_count();
    std::vector<std::int8_t> votes[3];

    for (MaterialId mid : order) {
        const auto& tris = region_tris[mid];
        const size_t open = count_open_edges(region_idx[mid]);
        rep.open_edges += open;
        size_t inside = 0;

        if (open == 0) {
            votes[0].assign(N, 0);
            classify_axis(tris, geo, 0, votes[0],
                          rep.ambiguous_columns_resolved, rep.ambiguous_columns_outside);
            for (size_t id = 0; id < N; ++id) {
                if (votes[0][id] == 1) { grid.ids[id] = mid; ++inside; }
            }
        } else {
            rep.non_manifold_regions.push_back(mid);
            for (int a = 0; a < 3; ++a) {
                votes[a].assign(N, 0);
                classify_axis(tris, geo, a, votes[a],
                              rep.ambiguous_columns_resolved, rep.ambiguous_columns_outside);
            }
            for (size_t id = 0; id < N; ++id) {
                int ins = 0, outs = 0;
                for (int a = 0; a < 3; ++a) {
                    if (votes[a][id] == 1) ++ins;
                    else if (votes[a][id] == 0) ++outs;
                }
                if (ins > 0 && outs > 0) ++rep.vote_resolved_cells;
                if (ins > outs) { grid.ids[id] = mid; ++inside; }
            }
            std::ostringstream w;
            w << "region '" << library.at(mid).name << "' is not closed (" << open
              << " open edges); classified by three-axis majority vote";
            rep.warnings.push_back(w.str());
        }

        if (verbose) {
            std::cout << "[Voxelizer] region '" << library.at(mid).name << "' (id " << mid << "): "
                      << tris.size() << " triangles, " << inside << " cells inside"
                      << (open ? " [non-manifold]" : "") << "\n";
        }
    }

    if (rep.invalid_triangles > 0) {
        rep.warnings.push_back(std::to_string(rep.invalid_triangles)
                               + " triangles reference missing vertices and were skipped");
    }
    if (rep.degenerate_triangles > 0) {
        rep.warnings.push_back(std::to_string(rep.degenerate_triangles)
                               + " degenerate triangles skipped");
    }
    if (rep.ambiguous_columns_outside > 0) {
        rep.warnings.push_back(std::to_string(rep.ambiguous_columns_outside)
                               + " grid lines stayed ambiguous after perturbation; treated as outside");
    }

    if (verbose) {
        std::cout << "[Voxelizer] grid " << grid.nx << " x " << grid.ny << " x " << grid.nz
                  << ", " << rep.regions << " regions, " << rep.triangles_used << " triangles, "
                  << rep.ambiguous_columns_resolved << " ties resolved\n";
        for (const auto& w : rep.warnings) {
            std::cout << "[WARNING] [Voxelizer] " << w << "\n";
        }
    }
    return out;
}

// structure_material.hpp - Material palette, voxel material grid and coefficient baking

#pragma once

#include <vector>
#include <string>
#include <cmath>
#include <cstdint>
#include <optional>
#include <algorithm>
#include <limits>
#include <iostream>
#include <utility>

#include "global_function.hpp"
#include "errors.hpp"
#include "omp_config.hpp"

using MaterialId = std::uint16_t;

struct Material {
    std::string name{ "vacuum" };
    real eps_r{ 1.0 };    // Relative permittivity
    real mu_r{ 1.0 };     // Relative permeability
    real sigma{ 0.0 };    // Electrical conductivity (S/m)
    real sigma_m{ 0.0 };  // Magnetic loss (rarely used)
    bool is_pec{ false }; // Perfect conductor: E forced to zero on every touching edge
    int priority{ 0 };    // Overlap resolution: higher wins, ties go to the later id

    // Phase velocity (m/s); a perfect conductor carries no wave
    real wave_speed() const {
        return PhysConst::C0 / std::sqrt(eps_r * mu_r);
    }
};

inline Material make_dielectric(const std::string& name, real eps_r, real sigma = 0.0, real mu_r = 1.0) {
    Material m;
    m.name = name;
    m.eps_r = eps_r;
    m.mu_r = mu_r;
    m.sigma = sigma;
    return m;
}

inline Material make_pec(const std::string& name = "pec") {
    Material m;
    m.name = name;
    m.is_pec = true;
    return m;
}

struct AABB {
    real x0, x1, y0, y1, z0, z1;

    AABB merge(const AABB& other) const {
        return {
            std::min(x0, other.x0), std::max(x1, other.x1),
            std::min(y0, other.y0), std::max(y1, other.y1),
            std::min(z0, other.z0), std::max(z1, other.z1)
        };
    }

    real lo(int axis) const { return axis == 0 ? x0 : (axis == 1 ? y0 : z0); }
    real hi(int axis) const { return axis == 0 ? x1 : (axis == 1 ? y1 : z1); }
    real extent(int axis) const { return hi(axis) - lo(axis); }
};

// ==================== Material palette ====================
// Id 0 is always vacuum. Names are unique; adding an existing name returns its id.
struct MaterialLibrary {
    std::vector<Material> materials{ Material{} };

    MaterialId add(const Material& m) {
        if (auto id = find(m.name)) return *id;
        if (materials.size() >= std::numeric_limits<MaterialId>::max()) {
            throw ConfigError("materials", "palette is full");
        }
        materials.push_back(m);
        return MaterialId(materials.size() - 1);
    }

    std::optional<MaterialId> find(const std::string& name) const {
        for (size_t n = 0; n < materials.size(); ++n) {
            if (materials[n].name == name) return MaterialId(n);
        }
        return std::nullopt;
    }

    const Material& at(MaterialId id) const {
        if (id >= materials.size()) {
            throw ConfigError("materials", "unknown material id " + std::to_string(id));
        }
        return materials[id];
    }

    size_t size() const { return materials.size(); }

    // vacuum, pec, copper, fr4, alumina, ptfe
    static MaterialLibrary with_builtins() {
        MaterialLibrary lib;
        lib.add(make_pec("pec"));
        lib.add(make_dielectric("copper", 1.0, 5.8e7));
        lib.add(make_dielectric("fr4", 4.4, 1e-3));
        lib.add(make_dielectric("alumina", 9.8));
        lib.add(make_dielectric("ptfe", 2.1));
        return lib;
    }
};

// ==================== Voxel material grid ====================
// One material id per core cell. Cell (i,j,k) spans
// origin + [i, i+1) * cell_size on x (likewise y, z), in mesh units.
struct MaterialGrid {
    size_t nx{}, ny{}, nz{};
    real cell_size{};
    real origin[3]{ 0, 0, 0 };
    std::vector<MaterialId> ids;
    MaterialLibrary library;

    void allocate(size_t Nx, size_t Ny, size_t Nz) {
        nx = Nx; ny = Ny; nz = Nz;
        ids.assign(nx * ny * nz, MaterialId(0));
    }

    size_t cell_count() const { return nx * ny * nz; }

    MaterialId id_at(size_t i, size_t j, size_t k) const { return ids[idx3(i, j, k, ny, nz)]; }

    const Material& material_at(size_t i, size_t j, size_t k) const {
        return library.at(id_at(i, j, k));
    }

    real cell_center(int axis, size_t n) const {
        return origin[axis] + (real(n) + 0.5) * cell_size;
    }

    // Assign cells [lo, hi) on every axis
    void fill_box(const CellIndex& lo, const CellIndex& hi, MaterialId id) {
        for (size_t i = lo.i; i < std::min(hi.i, nx); ++i)
            for (size_t j = lo.j; j < std::min(hi.j, ny); ++j)
                for (size_t k = lo.k; k < std::min(hi.k, nz); ++k)
                    ids[idx3(i, j, k, ny, nz)] = id;
    }

    size_t count(MaterialId id) const {
        return size_t(std::count(ids.begin(), ids.end(), id));
    }

    real fraction(MaterialId id) const {
        return ids.empty() ? 0.0 : real(count(id)) / real(ids.size());
    }

    // Distinct ids actually present in the grid
    std::vector<MaterialId> present_ids() const {
        std::vector<char> seen(library.size(), 0);
        for (MaterialId id : ids) seen[id] = 1;
        std::vector<MaterialId> out;
        for (size_t n = 0; n < seen.size(); ++n) {
            if (seen[n]) out.push_back(MaterialId(n));
        }
        return out;
    }
};

// All-vacuum grid matching the core of geo
inline MaterialGrid make_vacuum_grid(const GridGeometry& geo,
                                     MaterialLibrary library = MaterialLibrary::with_builtins()) {
    MaterialGrid g;
    g.library = std::move(library);
    g.cell_size = geo.cell_size;
    for (int a = 0; a < 3; ++a) g.origin[a] = geo.origin[a];
    g.allocate(geo.Nx, geo.Ny, geo.Nz);
    return g;
}

// Fastest phase velocity among the non-PEC materials present (never below c0)
inline real max_wave_speed(const MaterialGrid& grid) {
    real v = PhysConst::C0;
    for (MaterialId id : grid.present_ids()) {
        const Material& m = grid.library.at(id);
        if (m.is_pec) continue;
        v = std::max(v, m.wave_speed());
    }
    return v;
}

// ==================== Coefficient baking ====================
// E coefficients use the average of the four cells sharing the edge, H
// coefficients the two cells sharing the face. CPML cells inherit the
// nearest core cell. Conductive loss uses the exponential update
//   a = exp(-sigma dt / eps),  b = (1 - a) / sigma   (-> dt / eps as sigma -> 0)
// An edge touching any PEC cell gets a = b = 0.
inline void bake_coefficients(const MaterialGrid& grid, const GridGeometry& geo, real dt,
                              MaterialGrids& mg, bool verbose = true)
{
    const size_t NxT = geo.NxT(), NyT = geo.NyT(), NzT = geo.NzT();
    const long npml = long(geo.npml);
    mg.allocate(NxT, NyT, NzT);

    auto core_mat = [&](long I, long J, long K) -> const Material& {
        const size_t ic = size_t(std::clamp(I - npml, 0L, long(grid.nx) - 1));
        const size_t jc = size_t(std::clamp(J - npml, 0L, long(grid.ny) - 1));
        const size_t kc = size_t(std::clamp(K - npml, 0L, long(grid.nz) - 1));
        return grid.library.materials[grid.id_at(ic, jc, kc)];
    };

    auto e_coeff = [&](const Material* cells[4], real& a, real& b) {
        real eps = 0, sg = 0;
        bool pec = false;
        for (int c = 0; c < 4; ++c) {
            eps += cells[c]->eps_r * PhysConst::EPS0;
            sg += cells[c]->sigma;
            pec = pec || cells[c]->is_pec;
        }
        eps *= 0.25; sg *= 0.25;
        if (pec) { a = 0.0; b = 0.0; return; }
        const real x = sg * dt / eps;
        a = std::exp(-x);
        b = (x > 1e-12) ? (1.0 - a) / sg : dt / eps;
    };

    auto h_coeff = [&](const Material& m0, const Material& m1, real& a, real& b) {
        const real mu = 0.5 * (m0.mu_r + m1.mu_r) * PhysConst::MU0;
        const real sm = 0.5 * (m0.sigma_m + m1.sigma_m);
        const real x = sm * dt / mu;
        a = std::exp(-x);
        b = (x > 1e-12) ? (1.0 - a) / sm : dt / mu;
    };

#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (long I = 0; I < long(NxT); ++I)
        for (long J = 0; J < long(NyT); ++J)
            for (long K = 0; K < long(NzT); ++K) {
                const size_t id = idx3(size_t(I), size_t(J), size_t(K), NyT, NzT);

                // Ex (i+1/2, j, k): cells (i, j-1..j, k-1..k)
                const Material* ex[4] = { &core_mat(I, J - 1, K - 1), &core_mat(I, J, K - 1),
                                          &core_mat(I, J - 1, K), &core_mat(I, J, K) };
                e_coeff(ex, mg.aEx[id], mg.bEx[id]);
                // Ey (i, j+1/2, k): cells (i-1..i, j, k-1..k)
                const Material* ey[4] = { &core_mat(I - 1, J, K - 1), &core_mat(I, J, K - 1),
                                          &core_mat(I - 1, J, K), &core_mat(I, J, K) };
                e_coeff(ey, mg.aEy[id], mg.bEy[id]);
                // Ez (i, j, k+1/2): cells (i-1..i, j-1..j, k)
                const Material* ez[4] = { &core_mat(I - 1, J - 1, K), &core_mat(I, J - 1, K),
                                          &core_mat(I - 1, J, K), &core_mat(I, J, K) };
                e_coeff(ez, mg.aEz[id], mg.bEz[id]);

                h_coeff(core_mat(I - 1, J, K), core_mat(I, J, K), mg.aHx[id], mg.bHx[id]);
                h_coeff(core_mat(I, J - 1, K), core_mat(I, J, K), mg.aHy[id], mg.bHy[id]);
                h_coeff(core_mat(I, J, K - 1), core_mat(I, J, K), mg.aHz[id], mg.bHz[id]);
            }

    const size_t N = NxT * NyT * NzT;
    for (size_t id = 0; id < N; ++id) {
        if (mg.bEx[id] == 0.0) mg.pec_Ex.push_back(id);
        if (mg.bEy[id] == 0.0) mg.pec_Ey.push_back(id);
        if (mg.bEz[id] == 0.0) mg.pec_Ez.push_back(id);
    }

    if (verbose) {
        std::cout << "[Grid] Coefficients baked: " << NxT << " x " << NyT << " x " << NzT
                  << " (" << N << " cells), PEC edges = "
                  << (mg.pec_Ex.size() + mg.pec_Ey.size() + mg.pec_Ez.size()) << "\n";
    }
}

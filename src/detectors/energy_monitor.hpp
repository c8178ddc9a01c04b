// energy_monitor.hpp - Total electromagnetic energy inside a box

#pragma once

#include "idetector.hpp"
#include "../omp_config.hpp"
#include <cmath>

namespace Detectors {

// ======================= Total electromagnetic energy detector inside box =======================
// U = 1/2 sum (eps |E|^2 + mu |H|^2) dV over the node box [i0,i1]x[j0,j1]x[k0,k1].
// eps and mu are recovered from the update coefficients (eps = dt/bE,
// mu = dt/bH), exact for lossless cells. The coefficient arrays must outlive
// the monitor.
struct EnergyMonitor final : public IDetector {
    std::size_t NyT{}, NzT{};
    std::size_t i0{}, i1{}, j0{}, j1{}, k0{}, k1{};
    real dV{};
    real dt{};

    const MaterialGrids& mg;

    std::vector<real> energy;     // One entry per recorded step

    // Box defaults to the core region of the grid
    EnergyMonitor(const GridGeometry& geo, const MaterialGrids& mg_, real dt_)
        : NyT(geo.NyT()), NzT(geo.NzT()),
          i0(geo.npml), i1(geo.npml + geo.Nx),
          j0(geo.npml), j1(geo.npml + geo.Ny),
          k0(geo.npml), k1(geo.npml + geo.Nz),
          dV(geo.dx * geo.dx * geo.dx), dt(dt_), mg(mg_)
    {}

    void record_after_E(std::size_t n, real dt_step,
        const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
        const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz) override
    {
        (void)n; (void)dt_step;
        energy.push_back(total_energy(Ex, Ey, Ez, Hx, Hy, Hz));
    }

    real total_energy(
        const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
        const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz) const
    {
        double U = 0.0;  // Accumulate in double to reduce error

#if FDTD_OMP_ENABLED
#pragma omp parallel for reduction(+:U)
#endif
        for (long il = long(i0); il <= long(i1); ++il) {
            const std::size_t i = std::size_t(il);
            for (std::size_t j = j0; j <= j1; ++j)
                for (std::size_t k = k0; k <= k1; ++k) {
                    const std::size_t id = idx3(i, j, k, NyT, NzT);

                    const double e_part =
                        0.5 * (safe_inv(mg.bEx[id]) * Ex[id] * Ex[id] +
                               safe_inv(mg.bEy[id]) * Ey[id] * Ey[id] +
                               safe_inv(mg.bEz[id]) * Ez[id] * Ez[id]);

                    const double h_part =
                        0.5 * (safe_inv(mg.bHx[id]) * Hx[id] * Hx[id] +
                               safe_inv(mg.bHy[id]) * Hy[id] * Hy[id] +
                               safe_inv(mg.bHz[id]) * Hz[id] * Hz[id]);

                    U += e_part + h_part;
                }
        }
        return real(U) * dt * dV;   // eps = dt / bE, mu = dt / bH
    }

    std::string name() const override { return "EnergyMonitor"; }

private:
    static real safe_inv(real x) { return (std::abs(x) > 1e-30) ? (1.0 / x) : 0.0; }
};

// ==================== Export ====================
// <dir>/energy_time.csv with one "t, U" row per recorded step (t = (n + 1) dt)
inline void write_energy_csv(const fs::path& dir, const std::vector<real>& energy, real dt) {
    create_detector_directory(dir);
    const fs::path path = dir / "energy_time.csv";
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[ERR] open " << path << " failed.\n";
        throw IoError("cannot open " + path.string());
    }
    ofs << "t, U_box\n";
    for (std::size_t n = 0; n < energy.size(); ++n) {
        ofs << std::setprecision(18) << real(n + 1) * dt << "," << energy[n] << "\n";
    }
    if (!ofs) throw IoError("write failed: " + path.string());
}

} // namespace Detectors

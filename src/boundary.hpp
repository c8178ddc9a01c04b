// boundary.hpp - Boundary conditions
//
// The grid is always backed by a perfect conductor on its outermost nodes.
// With npml > 0 an RC-CPML shell absorbs outgoing waves before they reach
// it; with npml == 0 the conductor itself is the boundary (closed cavity).

#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <string>
#include <memory>
#include <algorithm>
#include <iostream>

#include "global_function.hpp"
#include "omp_config.hpp"

// === Only two types ===
enum class BcType { PEC, CPML_RC };

// === CPML common configuration ===
struct CPMLConfig {
    int   npml = 8;            // Thickness (cells)
    real  m = 3.0;             // σ/κ polynomial order
    real  Rerr = 1e-8;         // Target reflection
    real  alpha0 = 0.05;       // α_max = alpha0 * c0 / Δs
    real  kappa_max = 5.0;     // κ_max
    bool  alpha_linear = true; // α linear distribution
};

struct BoundaryParams {
    BcType type = BcType::CPML_RC;
    CPMLConfig cpml;
};

// === Boundary interface ===
struct IBoundary {
    virtual ~IBoundary() = default;

    // PML correction called after main core update
    virtual void apply_after_H(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) {
        (void)Ex; (void)Ey; (void)Ez; (void)Hx; (void)Hy; (void)Hz;
    }

    virtual void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) = 0;

    // Re-impose the outer conductor after sources have written into E
    virtual void enforce_walls(std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez) {
        (void)Ex; (void)Ey; (void)Ez;
    }

    // To make PML increment scaling consistent with main core, bind MaterialGrids' bE/bH
    virtual void bind_material_coeffs(
        const std::vector<real>*, const std::vector<real>*, const std::vector<real>*,
        const std::vector<real>*, const std::vector<real>*, const std::vector<real>*) {
    }

    virtual std::string name() const = 0;
};

// === PEC boundary ===
// Tangential E on the outer faces (and E edges lying outside them) held at zero
struct PECBoundary final : public IBoundary {
    size_t Nx_, Ny_, Nz_;
    explicit PECBoundary(size_t Nx, size_t Ny, size_t Nz) : Nx_(Nx), Ny_(Ny), Nz_(Nz) {}

    void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override {
        (void)Hx; (void)Hy; (void)Hz;
        enforce_walls(Ex, Ey, Ez);
    }

    void enforce_walls(std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez) override {
        for (size_t j = 0; j < Ny_; ++j)
            for (size_t k = 0; k < Nz_; ++k) {
            Ey[idx3(0, j, k, Ny_, Nz_)] = Ez[idx3(0, j, k, Ny_, Nz_)] = 0.0;
            Ex[idx3(Nx_ - 1, j, k, Ny_, Nz_)] = Ey[idx3(Nx_ - 1, j, k, Ny_, Nz_)] = Ez[idx3(Nx_ - 1, j, k, Ny_, Nz_)] = 0.0;
        }
        for (size_t i = 0; i < Nx_; ++i)
            for (size_t k = 0; k < Nz_; ++k) {
            Ex[idx3(i, 0, k, Ny_, Nz_)] = Ez[idx3(i, 0, k, Ny_, Nz_)] = 0.0;
            Ex[idx3(i, Ny_ - 1, k, Ny_, Nz_)] = Ey[idx3(i, Ny_ - 1, k, Ny_, Nz_)] = Ez[idx3(i, Ny_ - 1, k, Ny_, Nz_)] = 0.0;
        }
        for (size_t i = 0; i < Nx_; ++i)
            for (size_t j = 0; j < Ny_; ++j) {
            Ex[idx3(i, j, 0, Ny_, Nz_)] = Ey[idx3(i, j, 0, Ny_, Nz_)] = 0.0;
            Ex[idx3(i, j, Nz_ - 1, Ny_, Nz_)] = Ey[idx3(i, j, Nz_ - 1, Ny_, Nz_)] = Ez[idx3(i, j, Nz_ - 1, Ny_, Nz_)] = 0.0;
        }
    }

    std::string name() const override { return "PEC"; }
};

// === RC-CPML boundary ===
// ψ memory exists only inside the absorbing slabs. Along each axis the slab
// holds the left layers [0, npml) and the right layers [npml + Ncore, NT),
// i.e. 2*npml + 1 node planes.
struct CPMLBoundary final : public IBoundary {

    // Core & total dimensions (nodes)
    size_t NxC_, NyC_, NzC_;
    int    npml_;
    size_t NxT_, NyT_, NzT_;

    real dx_, dt_, eps0_, mu0_, c0_;

    // 1D coefficients along each axis: E side at integer nodes, H side at half nodes
    std::vector<real> kEx_, kEy_, kEz_, kHx_, kHy_, kHz_;
    std::vector<real> bEx_, cEx_, bEy_, cEy_, bEz_, cEz_;
    std::vector<real> bHx_, cHx_, bHy_, cHy_, bHz_, cHz_;

    // ψ slabs (named <field component>_<derivative axis>)
    std::vector<real> psi_Ex_y_, psi_Ex_z_;
    std::vector<real> psi_Ey_z_, psi_Ey_x_;
    std::vector<real> psi_Ez_x_, psi_Ez_y_;
    std::vector<real> psi_Hx_y_, psi_Hx_z_;
    std::vector<real> psi_Hy_z_, psi_Hy_x_;
    std::vector<real> psi_Hz_x_, psi_Hz_y_;

    // Bind main core bE/bH (nullable, falls back to dt/eps0 or dt/mu0 if null)
    const std::vector<real>* bEx_mg_{ nullptr };
    const std::vector<real>* bEy_mg_{ nullptr };
    const std::vector<real>* bEz_mg_{ nullptr };
    const std::vector<real>* bHx_mg_{ nullptr };
    const std::vector<real>* bHy_mg_{ nullptr };
    const std::vector<real>* bHz_mg_{ nullptr };

    CPMLBoundary(size_t NxCore, size_t NyCore, size_t NzCore,
        real dx, real dt, real eps0, real mu0, real c0,
        const CPMLConfig& cfg)

        : NxC_(NxCore), NyC_(NyCore), NzC_(NzCore),
        npml_(cfg.npml),
        NxT_(NxCore + 2 * cfg.npml + 1),
        NyT_(NyCore + 2 * cfg.npml + 1),
        NzT_(NzCore + 2 * cfg.npml + 1),
        dx_(dx), dt_(dt), eps0_(eps0), mu0_(mu0), c0_(c0)
    {
        const size_t L = slab_len();
        psi_Ey_x_.assign(L * NyT_ * NzT_, 0.0); psi_Ez_x_.assign(L * NyT_ * NzT_, 0.0);
        psi_Hy_x_.assign(L * NyT_ * NzT_, 0.0); psi_Hz_x_.assign(L * NyT_ * NzT_, 0.0);
        psi_Ex_y_.assign(NxT_ * L * NzT_, 0.0); psi_Ez_y_.assign(NxT_ * L * NzT_, 0.0);
        psi_Hx_y_.assign(NxT_ * L * NzT_, 0.0); psi_Hz_y_.assign(NxT_ * L * NzT_, 0.0);
        psi_Ex_z_.assign(NxT_ * NyT_ * L, 0.0); psi_Ey_z_.assign(NxT_ * NyT_ * L, 0.0);
        psi_Hx_z_.assign(NxT_ * NyT_ * L, 0.0); psi_Hy_z_.assign(NxT_ * NyT_ * L, 0.0);

        build_profiles_and_coeffs(cfg);
    }

    // Bytes held by the ψ slabs for a given core size (used before allocation)
    static size_t estimate_bytes(size_t NxCore, size_t NyCore, size_t NzCore, size_t npml) {
        const size_t L = 2 * npml + 1;
        const size_t NxT = NxCore + L, NyT = NyCore + L, NzT = NzCore + L;
        using NumericUtils::sat_add;
        using NumericUtils::sat_mul;
        const size_t faces = sat_add(sat_add(sat_mul(NyT, NzT), sat_mul(NxT, NzT)), sat_mul(NxT, NyT));
        return sat_mul(4 * sizeof(real) * L, faces);
    }

    void bind_material_coeffs(
        const std::vector<real>* bEx, const std::vector<real>* bEy, const std::vector<real>* bEz,
        const std::vector<real>* bHx, const std::vector<real>* bHy, const std::vector<real>* bHz) override {
        bEx_mg_ = bEx; bEy_mg_ = bEy; bEz_mg_ = bEz;
        bHx_mg_ = bHx; bHy_mg_ = bHy; bHz_mg_ = bHz;
    }

    std::string name() const override { return "CPML_RC"; }

    // === Correction after H ===
    void apply_after_H(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override
    {
        using namespace fdtd_math;
        const size_t NxT = NxT_, NyT = NyT_, NzT = NzT_;
        const size_t sI = NyT * NzT, sJ = NzT, sK = 1;
        const size_t L = slab_len();
        const real inv = 1.0 / dx_;
        const real* Exp = Ex.data();
        const real* Eyp = Ey.data();
        const real* Ezp = Ez.data();

        // ---- x slabs: Hy -= b(ψ(dEz/dx)), Hz -= b(ψ(dEy/dx)) ----
        for_slab(NxT, NxC_, [&](size_t i, size_t li) {
            if (i > NxT - 2) return;
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
            for (long jl = 0; jl < long(NyT); ++jl) {
                const size_t j = size_t(jl);
                for (size_t k = 0; k < NzT; ++k) {
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(li, j, k, NyT, NzT);
                    if (k <= NzT - 2) {
                        const real d = diff_p(Ezp, id, sI, inv);
                        real& p = psi_Hy_x_[ps]; p = bHx_[i] * p + cHx_[i] * d;
                        Hy[id] -= bh(bHy_mg_, id) * (-(d / kHx_[i] + p - d));
                    }
                    if (j <= NyT - 2) {
                        const real d = diff_p(Eyp, id, sI, inv);
                        real& p = psi_Hz_x_[ps]; p = bHx_[i] * p + cHx_[i] * d;
                        Hz[id] -= bh(bHz_mg_, id) * (d / kHx_[i] + p - d);
                    }
                }
            }
        });

        // ---- y slabs: Hx -= b(ψ(dEz/dy)), Hz += b(ψ(dEx/dy)) ----
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
        for (long il = 0; il < long(NxT); ++il) {
            const size_t i = size_t(il);
            for_slab(NyT, NyC_, [&](size_t j, size_t lj) {
                if (j > NyT - 2) return;
                for (size_t k = 0; k < NzT; ++k) {
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(i, lj, k, L, NzT);
                    if (k <= NzT - 2) {
                        const real d = diff_p(Ezp, id, sJ, inv);
                        real& p = psi_Hx_y_[ps]; p = bHy_[j] * p + cHy_[j] * d;
                        Hx[id] -= bh(bHx_mg_, id) * (d / kHy_[j] + p - d);
                    }
                    if (i <= NxT - 2) {
                        const real d = diff_p(Exp, id, sJ, inv);
                        real& p = psi_Hz_y_[ps]; p = bHy_[j] * p + cHy_[j] * d;
                        Hz[id] -= bh(bHz_mg_, id) * (-(d / kHy_[j] + p - d));
                    }
                }
            });
        }

        // ---- z slabs: Hx += b(ψ(dEy/dz)), Hy -= b(ψ(dEx/dz)) ----
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
        for (long il = 0; il < long(NxT); ++il) {
            const size_t i = size_t(il);
            for (size_t j = 0; j < NyT; ++j) {
                for_slab(NzT, NzC_, [&](size_t k, size_t lk) {
                    if (k > NzT - 2) return;
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(i, j, lk, NyT, L);
                    if (j <= NyT - 2) {
                        const real d = diff_p(Eyp, id, sK, inv);
                        real& p = psi_Hx_z_[ps]; p = bHz_[k] * p + cHz_[k] * d;
                        Hx[id] -= bh(bHx_mg_, id) * (-(d / kHz_[k] + p - d));
                    }
                    if (i <= NxT - 2) {
                        const real d = diff_p(Exp, id, sK, inv);
                        real& p = psi_Hy_z_[ps]; p = bHz_[k] * p + cHz_[k] * d;
                        Hy[id] -= bh(bHy_mg_, id) * (d / kHz_[k] + p - d);
                    }
                });
            }
        }
    }

    // === Correction after E ===
    void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override
    {
        using namespace fdtd_math;
        const size_t NxT = NxT_, NyT = NyT_, NzT = NzT_;
        const size_t sI = NyT * NzT, sJ = NzT, sK = 1;
        const size_t L = slab_len();
        const real inv = 1.0 / dx_;
        const real* Hxp = Hx.data();
        const real* Hyp = Hy.data();
        const real* Hzp = Hz.data();

        // ---- x slabs: Ey -= b(ψ(dHz/dx)), Ez += b(ψ(dHy/dx)) ----
        for_slab(NxT, NxC_, [&](size_t i, size_t li) {
            if (i < 1 || i > NxT - 2) return;
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
            for (long jl = 0; jl < long(NyT); ++jl) {
                const size_t j = size_t(jl);
                for (size_t k = 0; k < NzT; ++k) {
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(li, j, k, NyT, NzT);
                    if (j <= NyT - 2 && k >= 1 && k <= NzT - 2) {
                        const real d = diff_m(Hzp, id, sI, inv);
                        real& p = psi_Ey_x_[ps]; p = bEx_[i] * p + cEx_[i] * d;
                        Ey[id] += be(bEy_mg_, id) * (-(d / kEx_[i] + p - d));
                    }
                    if (j >= 1 && j <= NyT - 2 && k <= NzT - 2) {
                        const real d = diff_m(Hyp, id, sI, inv);
                        real& p = psi_Ez_x_[ps]; p = bEx_[i] * p + cEx_[i] * d;
                        Ez[id] += be(bEz_mg_, id) * (d / kEx_[i] + p - d);
                    }
                }
            }
        });

        // ---- y slabs: Ex += b(ψ(dHz/dy)), Ez -= b(ψ(dHx/dy)) ----
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
        for (long il = 0; il < long(NxT); ++il) {
            const size_t i = size_t(il);
            for_slab(NyT, NyC_, [&](size_t j, size_t lj) {
                if (j < 1 || j > NyT - 2) return;
                for (size_t k = 0; k < NzT; ++k) {
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(i, lj, k, L, NzT);
                    if (i <= NxT - 2 && k >= 1 && k <= NzT - 2) {
                        const real d = diff_m(Hzp, id, sJ, inv);
                        real& p = psi_Ex_y_[ps]; p = bEy_[j] * p + cEy_[j] * d;
                        Ex[id] += be(bEx_mg_, id) * (d / kEy_[j] + p - d);
                    }
                    if (i >= 1 && i <= NxT - 2 && k <= NzT - 2) {
                        const real d = diff_m(Hxp, id, sJ, inv);
                        real& p = psi_Ez_y_[ps]; p = bEy_[j] * p + cEy_[j] * d;
                        Ez[id] += be(bEz_mg_, id) * (-(d / kEy_[j] + p - d));
                    }
                }
            });
        }

        // ---- z slabs: Ex -= b(ψ(dHy/dz)), Ey += b(ψ(dHx/dz)) ----
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
        for (long il = 0; il < long(NxT); ++il) {
            const size_t i = size_t(il);
            for (size_t j = 0; j < NyT; ++j) {
                for_slab(NzT, NzC_, [&](size_t k, size_t lk) {
                    if (k < 1 || k > NzT - 2) return;
                    const size_t id = idx3(i, j, k, NyT, NzT);
                    const size_t ps = idx3(i, j, lk, NyT, L);
                    if (i <= NxT - 2 && j >= 1 && j <= NyT - 2) {
                        const real d = diff_m(Hyp, id, sK, inv);
                        real& p = psi_Ex_z_[ps]; p = bEz_[k] * p + cEz_[k] * d;
                        Ex[id] += be(bEx_mg_, id) * (-(d / kEz_[k] + p - d));
                    }
                    if (i >= 1 && i <= NxT - 2 && j <= NyT - 2) {
                        const real d = diff_m(Hxp, id, sK, inv);
                        real& p = psi_Ey_z_[ps]; p = bEz_[k] * p + cEz_[k] * d;
                        Ey[id] += be(bEy_mg_, id) * (d / kEz_[k] + p - d);
                    }
                });
            }
        }
    }

private:
    size_t slab_len() const { return 2 * size_t(npml_) + 1; }

    real bh(const std::vector<real>* mg, size_t id) const { return mg ? (*mg)[id] : (dt_ / mu0_); }
    real be(const std::vector<real>* mg, size_t id) const { return mg ? (*mg)[id] : (dt_ / eps0_); }

    // Visit the slab node planes along one axis: f(global index, slab index)
    template<typename F>
    void for_slab(size_t NT, size_t Ncore, F&& f) const {
        const size_t np = size_t(npml_);
        for (size_t n = 0; n < np; ++n) f(n, n);
        for (size_t n = np + Ncore; n < NT; ++n) f(n, n - Ncore);
    }

    void build_profiles_and_coeffs(const CPMLConfig& cfg) {
        const real sigma_max = ((cfg.m + 1.0) * std::log(1.0 / cfg.Rerr) * eps0_ * c0_)
                             / (2.0 * real(npml_) * dx_);
        const real alpha_max = cfg.alpha0 * c0_ / dx_;

        // Normalized depth into the absorber: 0 at the core interface, 1 at the wall
        auto depth = [&](real x, size_t Ncore) -> real {
            const real lo = real(npml_);
            const real hi = real(npml_) + real(Ncore);
            if (x < lo) return std::min<real>(1.0, (lo - x) / real(npml_));
            if (x > hi) return std::min<real>(1.0, (x - hi) / real(npml_));
            return 0.0;
        };

        // Single-pole recursive coefficients; σ normalized by ε0 on both sides
        // (matched magnetic conductivity σ* = σ μ0 / ε0)
        auto fill = [&](size_t NT, size_t Ncore, real offset,
                        std::vector<real>& kap, std::vector<real>& b, std::vector<real>& c) {
            kap.assign(NT, 1.0); b.assign(NT, 1.0); c.assign(NT, 0.0);
            for (size_t n = 0; n < NT; ++n) {
                const real d = depth(real(n) + offset, Ncore);
                if (d <= 0.0) continue;
                const real dm = std::pow(d, cfg.m);
                const real sig_n = sigma_max * dm / eps0_;
                const real k = 1.0 + (cfg.kappa_max - 1.0) * dm;
                const real a = cfg.alpha_linear ? alpha_max * (1.0 - d)
                                                : alpha_max * std::pow(1.0 - d, cfg.m);
                real bb = std::exp(-(sig_n / k + a) * dt_);
                bb = std::max<real>(bb, 1e-30);
                real cc = 0.0;
                if (std::abs(sig_n) > 1e-30 || std::abs(a) > 1e-30) {
                    cc = (sig_n * (bb - 1.0)) / (k * (sig_n + k * a));
                }
                kap[n] = k; b[n] = bb; c[n] = cc;
            }
        };

        fill(NxT_, NxC_, 0.0, kEx_, bEx_, cEx_);
        fill(NyT_, NyC_, 0.0, kEy_, bEy_, cEy_);
        fill(NzT_, NzC_, 0.0, kEz_, bEz_, cEz_);
        fill(NxT_, NxC_, 0.5, kHx_, bHx_, cHx_);
        fill(NyT_, NyC_, 0.5, kHy_, bHy_, cHy_);
        fill(NzT_, NzC_, 0.5, kHz_, bHz_, cHz_);
    }
};

// === Factory ===
inline std::unique_ptr<IBoundary> make_boundary(
    const BoundaryParams& params,
    size_t NxCore, size_t NyCore, size_t NzCore,
    real dx, real dt, real eps0, real mu0, real c0)
{
    switch (params.type) {
    case BcType::PEC:
        return std::make_unique<PECBoundary>(NxCore + 1, NyCore + 1, NzCore + 1);
    case BcType::CPML_RC:
    default:
        return std::make_unique<CPMLBoundary>(NxCore, NyCore, NzCore, dx, dt, eps0, mu0, c0, params.cpml);
    }
}

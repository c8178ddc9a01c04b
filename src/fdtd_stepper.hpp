// fdtd_stepper.hpp - Core FDTD time-stepping functions
//
// Node-indexed Yee grid of NxT x NyT x NzT entries per component. Each
// component is advanced only where its full curl stencil exists; the
// remaining entries (tangential E on the outer faces) stay at zero and
// form the perfect-conductor backing wall.

#pragma once
#include <cstddef>
#include <vector>
#include "omp_config.hpp"
#include "global_function.hpp"

// Six field components on the total grid
struct YeeFields {
    size_t NxT{}, NyT{}, NzT{};
    std::vector<real> Ex, Ey, Ez;
    std::vector<real> Hx, Hy, Hz;

    void allocate(size_t Nx, size_t Ny, size_t Nz) {
        NxT = Nx; NyT = Ny; NzT = Nz;
        const size_t N = NxT * NyT * NzT;
        Ex.assign(N, 0.0); Ey.assign(N, 0.0); Ez.assign(N, 0.0);
        Hx.assign(N, 0.0); Hy.assign(N, 0.0); Hz.assign(N, 0.0);
    }

    void release() {
        YeeFields empty;
        std::swap(*this, empty);
    }

    std::vector<real>& component(FieldComponent fc) {
        switch (fc) {
        case FieldComponent::Ex: return Ex;
        case FieldComponent::Ey: return Ey;
        case FieldComponent::Ez: return Ez;
        case FieldComponent::Hx: return Hx;
        case FieldComponent::Hy: return Hy;
        case FieldComponent::Hz: return Hz;
        }
        return Ez;
    }

    const std::vector<real>& component(FieldComponent fc) const {
        return const_cast<YeeFields*>(this)->component(fc);
    }
};

template<typename Real>
inline void fdtd_update_H(
    size_t NxT, size_t NyT, size_t NzT,
    Real inv_d,
    const Real* __restrict aHx, const Real* __restrict bHx,
    const Real* __restrict aHy, const Real* __restrict bHy,
    const Real* __restrict aHz, const Real* __restrict bHz,
    const Real* __restrict Ex, const Real* __restrict Ey, const Real* __restrict Ez,
    Real* __restrict Hx, Real* __restrict Hy, Real* __restrict Hz)
{
    using namespace fdtd_math;
    const size_t sI = NyT * NzT;
    const size_t sJ = NzT;
    const size_t sK = 1;

    // Hx (i, j+1/2, k+1/2)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 0; i < (int)NxT; ++i)
        for (size_t j = 0; j + 1 < NyT; ++j)
            for (size_t k = 0; k + 1 < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_p(Ez, id, sJ, inv_d) - diff_p(Ey, id, sK, inv_d);
                Hx[id] = aHx[id] * Hx[id] - bHx[id] * curl;
            }

    // Hy (i+1/2, j, k+1/2)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 0; i < (int)(NxT - 1); ++i)
        for (size_t j = 0; j < NyT; ++j)
            for (size_t k = 0; k + 1 < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_p(Ex, id, sK, inv_d) - diff_p(Ez, id, sI, inv_d);
                Hy[id] = aHy[id] * Hy[id] - bHy[id] * curl;
            }

    // Hz (i+1/2, j+1/2, k)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 0; i < (int)(NxT - 1); ++i)
        for (size_t j = 0; j + 1 < NyT; ++j)
            for (size_t k = 0; k < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_p(Ey, id, sI, inv_d) - diff_p(Ex, id, sJ, inv_d);
                Hz[id] = aHz[id] * Hz[id] - bHz[id] * curl;
            }
}

template<typename Real>
inline void fdtd_update_E(
    size_t NxT, size_t NyT, size_t NzT,
    Real inv_d,
    const Real* __restrict aEx, const Real* __restrict bEx,
    const Real* __restrict aEy, const Real* __restrict bEy,
    const Real* __restrict aEz, const Real* __restrict bEz,
    Real* __restrict Ex, Real* __restrict Ey, Real* __restrict Ez,
    const Real* __restrict Hx, const Real* __restrict Hy, const Real* __restrict Hz)
{
    using namespace fdtd_math;
    const size_t sI = NyT * NzT;
    const size_t sJ = NzT;
    const size_t sK = 1;

    // Ex (i+1/2, j, k)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 0; i < (int)(NxT - 1); ++i)
        for (size_t j = 1; j + 1 < NyT; ++j)
            for (size_t k = 1; k + 1 < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_m(Hz, id, sJ, inv_d) - diff_m(Hy, id, sK, inv_d);
                Ex[id] = aEx[id] * Ex[id] + bEx[id] * curl;
            }

    // Ey (i, j+1/2, k)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 1; i < (int)(NxT - 1); ++i)
        for (size_t j = 0; j + 1 < NyT; ++j)
            for (size_t k = 1; k + 1 < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_m(Hx, id, sK, inv_d) - diff_m(Hz, id, sI, inv_d);
                Ey[id] = aEy[id] * Ey[id] + bEy[id] * curl;
            }

    // Ez (i, j, k+1/2)
#if FDTD_OMP_ENABLED
#pragma omp parallel for
#endif
    for (int i = 1; i < (int)(NxT - 1); ++i)
        for (size_t j = 1; j + 1 < NyT; ++j)
            for (size_t k = 0; k + 1 < NzT; ++k) {
                const size_t id = idx3((size_t)i, j, k, NyT, NzT);
                const Real curl = diff_m(Hy, id, sI, inv_d) - diff_m(Hx, id, sJ, inv_d);
                Ez[id] = aEz[id] * Ez[id] + bEz[id] * curl;
            }
}

// Hold every E edge touching a perfect conductor at zero
inline void fdtd_zero_pec_edges(const MaterialGrids& mg,
    std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez)
{
    for (size_t id : mg.pec_Ex) Ex[id] = 0.0;
    for (size_t id : mg.pec_Ey) Ey[id] = 0.0;
    for (size_t id : mg.pec_Ez) Ez[id] = 0.0;
}

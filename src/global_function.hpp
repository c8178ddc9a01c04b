// global_function.hpp - Global utility functions and common definitions
//
// This file contains:
// - Type definitions (real)
// - Physical constants
// - 3D indexing utilities
// - Numerical helper functions
// - Uniform cubic grid geometry and per-component coefficient storage

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <cmath>
#include <algorithm>
#include <numbers>
#include <limits>

// ============================================================================
//                              TYPE DEFINITIONS
// ============================================================================

// Floating point precision for all FDTD calculations
using real = double;

// ============================================================================
//                           PHYSICAL CONSTANTS
// ============================================================================

namespace PhysConst {
    inline constexpr real PI   = std::numbers::pi_v<real>;
    inline constexpr real C0   = 299792458.0;              // Speed of light (m/s)
    inline constexpr real EPS0 = 8.854187817e-12;          // Vacuum permittivity (F/m)
    inline constexpr real MU0  = 4.0 * PI * 1e-7;          // Vacuum permeability (H/m)
    inline constexpr real Z0   = 376.730313668;            // Vacuum impedance (Ohm)
}

// 3D index calculation
constexpr inline std::size_t idx3(std::size_t i, std::size_t j, std::size_t k,
    std::size_t Ny, std::size_t Nz) noexcept {
    return (i * Ny + j) * Nz + k;
}

// ---- Inline optimization ----
#if defined(_MSC_VER)
#define FDTD_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define FDTD_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define FDTD_ALWAYS_INLINE inline
#endif

// ---- Spatial difference functions: forward + backward ----
namespace fdtd_math {

    // Forward difference along the axis with stride s
    template<typename T>
    FDTD_ALWAYS_INLINE T diff_p(const T* __restrict F, std::size_t id, std::size_t s, T inv_d) {
        return (F[id + s] - F[id]) * inv_d;
    }

    // Backward difference along the axis with stride s
    template<typename T>
    FDTD_ALWAYS_INLINE T diff_m(const T* __restrict F, std::size_t id, std::size_t s, T inv_d) {
        return (F[id] - F[id - s]) * inv_d;
    }

}

// ============================================================================
//                         NUMERICAL HELPER FUNCTIONS
// ============================================================================

namespace NumericUtils {

// Get maximum absolute value in a vector
template<typename T>
inline T max_abs(const std::vector<T>& v) {
    T max_val = 0;
    for (const auto& val : v) {
        max_val = std::max(max_val, std::abs(val));
    }
    return max_val;
}

// Safe division (returns 0 if denominator is too small)
inline real safe_div(real numerator, real denominator, real threshold = 1e-30) {
    return (std::abs(denominator) > threshold) ? (numerator / denominator) : 0.0;
}

// Smallest power of two >= n
inline size_t next_pow2(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

// Size arithmetic clamped at SIZE_MAX instead of wrapping
inline constexpr size_t sat_mul(size_t a, size_t b) {
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a) return std::numeric_limits<size_t>::max();
    return a * b;
}

inline constexpr size_t sat_add(size_t a, size_t b) {
    return (b > std::numeric_limits<size_t>::max() - a) ? std::numeric_limits<size_t>::max() : a + b;
}

} // namespace NumericUtils

// ==================== Yee component identity ====================
// E components live on cell edges, H components on cell faces:
//   Ex (i+1/2, j, k)      Hx (i, j+1/2, k+1/2)
//   Ey (i, j+1/2, k)      Hy (i+1/2, j, k+1/2)
//   Ez (i, j, k+1/2)      Hz (i+1/2, j+1/2, k)
enum class FieldComponent : std::uint8_t { Ex, Ey, Ez, Hx, Hy, Hz };

inline const char* field_component_name(FieldComponent fc) {
    switch (fc) {
    case FieldComponent::Ex: return "Ex";
    case FieldComponent::Ey: return "Ey";
    case FieldComponent::Ez: return "Ez";
    case FieldComponent::Hx: return "Hx";
    case FieldComponent::Hy: return "Hy";
    case FieldComponent::Hz: return "Hz";
    }
    return "Unknown";
}

inline bool is_electric(FieldComponent fc) {
    return fc == FieldComponent::Ex || fc == FieldComponent::Ey || fc == FieldComponent::Ez;
}

// Integer cell coordinate (core region unless stated otherwise)
struct CellIndex {
    std::size_t i{}, j{}, k{};
};

struct MaterialGrids {
    size_t NxT{}, NyT{}, NzT{};

    // --- E field update coefficients, one per cell, stored at field component location ---
    std::vector<real> aEx, bEx;
    std::vector<real> aEy, bEy;
    std::vector<real> aEz, bEz;

    // --- H field update coefficients ---
    std::vector<real> aHx, bHx;
    std::vector<real> aHy, bHy;
    std::vector<real> aHz, bHz;

    // Linear indices of E edges touching a perfect conductor (re-zeroed after sources)
    std::vector<size_t> pec_Ex, pec_Ey, pec_Ez;

    void allocate(size_t Nx, size_t Ny, size_t Nz) {
        NxT = Nx; NyT = Ny; NzT = Nz;
        const size_t N = NxT * NyT * NzT;
        aEx.assign(N, 1); bEx.assign(N, 0);
        aEy.assign(N, 1); bEy.assign(N, 0);
        aEz.assign(N, 1); bEz.assign(N, 0);
        aHx.assign(N, 1); bHx.assign(N, 0);
        aHy.assign(N, 1); bHy.assign(N, 0);
        aHz.assign(N, 1); bHz.assign(N, 0);
        pec_Ex.clear(); pec_Ey.clear(); pec_Ez.clear();
    }

    void release() {
        MaterialGrids empty;
        std::swap(*this, empty);
    }
};

// Uniform cubic grid: core region of Nx x Ny x Nz cells wrapped in npml CPML layers.
// Arrays are indexed by grid node, so each axis holds cells + 1 entries; the
// outermost nodes carry the perfect-conductor backing wall.
struct GridGeometry {
    size_t Nx{}, Ny{}, Nz{};        // Core cells
    size_t npml{};                  // CPML layers per face
    real cell_size{};               // Cell size in mesh units
    real dx{};                      // Cell size (m)
    real inv_dx{};                  // 1/dx
    real origin[3]{ 0, 0, 0 };      // Core corner in mesh units

    size_t NxT() const { return NumericUtils::sat_add(Nx, 2 * npml + 1); }
    size_t NyT() const { return NumericUtils::sat_add(Ny, 2 * npml + 1); }
    size_t NzT() const { return NumericUtils::sat_add(Nz, 2 * npml + 1); }
    // Saturate at SIZE_MAX for absurd extents
    size_t total_cells() const { return NumericUtils::sat_mul(NumericUtils::sat_mul(NxT(), NyT()), NzT()); }
    size_t core_cells() const { return NumericUtils::sat_mul(NumericUtils::sat_mul(Nx, Ny), Nz); }

    // Core cell -> total-grid linear index
    size_t total_index(const CellIndex& c) const {
        return idx3(c.i + npml, c.j + npml, c.k + npml, NyT(), NzT());
    }

    bool contains_core(const CellIndex& c) const {
        return c.i < Nx && c.j < Ny && c.k < Nz;
    }

    // Box of Nx x Ny x Nz cells with its corner at the origin
    static GridGeometry uniform(size_t nx, size_t ny, size_t nz, real cell_size,
                                size_t npml, real length_unit = 1.0) {
        GridGeometry g;
        g.Nx = nx; g.Ny = ny; g.Nz = nz;
        g.npml = npml;
        g.cell_size = cell_size;
        g.dx = cell_size * length_unit;
        g.inv_dx = 1.0 / g.dx;
        return g;
    }
};

// ============================================================================
//                          UNIT CONVERSION UTILITIES
// ============================================================================

namespace UnitConv {

inline constexpr real s_to_ns(real s) { return s * 1e9; }
inline constexpr real s_to_ps(real s) { return s * 1e12; }
inline constexpr real hz_to_ghz(real f) { return f * 1e-9; }

} // namespace UnitConv

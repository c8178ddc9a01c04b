// user_config.hpp - Compile-time defaults for every tunable of a study
//
// Runtime values come from Config::SimulationParams (params.hpp), which is
// seeded from the constants below. A config file only needs the keys it
// wants to change.

#pragma once

#include <cstddef>
#include <string>

namespace UserConfig {

// ============================================================================
//                         1. DOMAIN AND GRID SETTINGS
// ============================================================================

// Mesh coordinates and cell_size are multiplied by this to obtain meters
constexpr double LENGTH_UNIT = 1.0;

// Extra vacuum cells between the mesh bounding box and the CPML
constexpr size_t DOMAIN_MARGIN = 4;

// Guidance only: fewer cells per shortest wavelength logs a warning
constexpr double RECOMMENDED_CELLS_PER_WAVELENGTH = 10.0;


// ============================================================================
//                         2. TIME STEPPING SETTINGS
// ============================================================================

// Fraction of the 3D Courant limit dx / (v_max * sqrt(3))
constexpr double CFL_FACTOR = 0.99;

// Console progress line every N steps (0 = off)
constexpr size_t PROGRESS_INTERVAL = 500;

// Worker threads for the spatial sweep (0 = OpenMP default)
constexpr int NUM_THREADS = 0;


// ============================================================================
//                         3. BOUNDARY CONDITIONS (CPML)
// ============================================================================

constexpr int    CPML_NPML = 8;             // PML thickness in cells (0 = PEC box)
constexpr double CPML_M = 3.0;              // Polynomial grading order
constexpr double CPML_RERR = 1e-8;          // Target reflection coefficient
constexpr double CPML_ALPHA0 = 0.05;        // alpha_max = ALPHA0 * c0 / dx
constexpr double CPML_KAPPA_MAX = 5.0;      // Maximum kappa


// ============================================================================
//                         4. SOURCE CONFIGURATION
// ============================================================================

constexpr double SOURCE_AMPLITUDE = 1.0;    // Peak soft-source value (field units)

// Gaussian pulse: tau = 1 / (pi * bandwidth), t0 = T0_TAUS * tau,
// pulse considered finished at t0 + TAIL_TAUS * tau
constexpr double SOURCE_T0_TAUS = 4.0;
constexpr double SOURCE_TAIL_TAUS = 4.0;


// ============================================================================
//                         5. DETECTOR / OUTPUT CONFIGURATION
// ============================================================================

// Output directory tag (results saved to <OUTPUT_DIR>/<RUN_TAG>/)
inline const std::string OUTPUT_DIR = "frames";
inline const std::string RUN_TAG = "mesh_fdtd_output";

// Free-decay early stop: 0 disables, otherwise stop once the primary probe
// envelope drops below DECAY_THRESHOLD * peak after the source has ended
constexpr double DECAY_THRESHOLD = 0.0;
constexpr size_t DECAY_WINDOW_STEPS = 200;


// ============================================================================
//                         6. SPECTRAL EXTRACTION
// ============================================================================

// Local maxima below this fraction of the band maximum are ignored
constexpr double PEAK_THRESHOLD_FRACTION = 0.1;

// Zero padding: FFT length >= ZERO_PAD_FACTOR * usable samples (power of two)
constexpr size_t ZERO_PAD_FACTOR = 4;

// Fewer usable samples than this is rejected
constexpr size_t MIN_SPECTRAL_SAMPLES = 16;

// Incident magnitude below this fraction of its maximum gives a zero ratio
constexpr double REFLECTION_FLOOR = 1e-6;


// ============================================================================
//                         7. STABILITY MONITOR THRESHOLDS
// ============================================================================

// How often (steps) the field maxima are checked for divergence
constexpr size_t STABILITY_MONITOR_INTERVAL = 10;

// Divergence when any |E| exceeds this multiple of the largest source
// amplitude (|H| is compared against the same bound divided by Z0)
constexpr double DIVERGENCE_FACTOR = 1e4;


// ============================================================================
//                         8. RESOURCE LIMITS
// ============================================================================

// Grids whose estimated field + coefficient memory exceeds this are rejected
constexpr size_t MEMORY_BUDGET_BYTES = size_t(4) << 30;   // 4 GiB

} // namespace UserConfig

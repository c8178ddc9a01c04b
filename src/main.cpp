// main.cpp - Resonance study of a PEC box cavity loaded with a dielectric sphere
//
// Usage: mesh_fdtd [config-file]
// Without a config file the built-in defaults below are used. The demo
// geometry (mm units) is always the same; the config file may change the
// grid, excitation, probes and output.
//
// Exit code: 0 success, 1 configuration/resource/input error, 2 divergence.

#include "user_config.hpp"          // Compile-time defaults
#include "params.hpp"               // Runtime parameter record and config reader
#include "mesh_input.hpp"           // Triangle mesh and primitive builders
#include "structure_material.hpp"   // Material palette
#include "study.hpp"                // Full pipeline
#include "omp_config.hpp"           // OpenMP configuration
#include "errors.hpp"

#include <iostream>
#include <iomanip>
#include <cmath>

namespace {

// ==================== Demo geometry ====================
// PEC shell (1 mm walls) around an air interior holding an alumina sphere
constexpr real CAVITY_X = 24.0, CAVITY_Y = 20.0, CAVITY_Z = 10.0;   // Interior (mm)
constexpr real WALL = 1.0;
constexpr real SPHERE_R = 2.5;

TriangleMesh build_demo_geometry(MaterialLibrary& lib) {
    Material air = make_dielectric("cavity_air", 1.0);
    air.priority = 1;
    Material sphere = make_dielectric("sphere_alumina", 9.8);
    sphere.priority = 2;

    const MaterialId pec_id = *lib.find("pec");
    const MaterialId air_id = lib.add(air);
    const MaterialId sphere_id = lib.add(sphere);

    TriangleMesh mesh;
    MeshBuilder::append_box(mesh, { 0.0, CAVITY_X + 2 * WALL, 0.0, CAVITY_Y + 2 * WALL,
                                    0.0, CAVITY_Z + 2 * WALL }, pec_id);
    MeshBuilder::append_box(mesh, { WALL, WALL + CAVITY_X, WALL, WALL + CAVITY_Y,
                                    WALL, WALL + CAVITY_Z }, air_id);
    MeshBuilder::append_sphere(mesh, WALL + 0.5 * CAVITY_X, WALL + 0.5 * CAVITY_Y,
                               WALL + 0.5 * CAVITY_Z, SPHERE_R, sphere_id);
    return mesh;
}

// Core cell containing the point (mm) for the demo mesh, whose bounding box starts at 0
CellIndex demo_cell(const Config::SimulationParams& P, real x, real y, real z) {
    const real m = real(P.domain_margin);
    auto n = [&](real v) { return size_t(std::floor(v / P.cell_size + m)); };
    return { n(x), n(y), n(z) };
}

Config::SimulationParams default_params() {
    Config::SimulationParams P;
    P.length_unit = 1e-3;                 // mm
    P.cell_size = 0.5;
    P.center_frequency = 10e9;
    P.bandwidth = 6e9;
    P.max_simulation_time = 10e-9;
    P.decay_threshold = 0.0;

    P.source_position = demo_cell(P, WALL + 7.0, WALL + 6.0, WALL + 0.5 * CAVITY_Z);
    P.source_component = FieldComponent::Ez;

    Config::ProbeSpec probe0;
    probe0.name = "probe0";
    probe0.cell = demo_cell(P, WALL + 17.0, WALL + 14.0, WALL + 0.5 * CAVITY_Z);
    probe0.component = FieldComponent::Ez;
    P.probes.push_back(probe0);

    Config::ProbeSpec probe1;
    probe1.name = "probe1";
    probe1.cell = demo_cell(P, WALL + 5.0, WALL + 15.0, WALL + 0.5 * CAVITY_Z);
    probe1.component = FieldComponent::Ez;
    P.probes.push_back(probe1);

    P.snapshot.enabled = true;
    P.snapshot.plane = Detectors::SlicePlane::XY;
    P.snapshot.component = FieldComponent::Ez;

    P.output_dir = UserConfig::OUTPUT_DIR;
    P.run_tag = UserConfig::RUN_TAG;
    return P;
}

// Analytic TM110 frequency of the empty interior, for reference
real empty_cavity_tm110() {
    const real a = CAVITY_X * 1e-3, b = CAVITY_Y * 1e-3;
    return 0.5 * PhysConst::C0 * std::sqrt(1.0 / (a * a) + 1.0 / (b * b));
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "Mesh FDTD Resonance Study\n";
    std::cout << "========================================\n\n";

#if FDTD_OMP_ENABLED
    std::cout << "OpenMP enabled, max threads = " << omp_get_max_threads() << "\n";
#else
    std::cout << "OpenMP NOT enabled\n";
#endif

    try {
        // ===== 1. Parameters =====
        Config::SimulationParams P;
        if (argc > 1) {
            std::cout << "[Config] Loading " << argv[1] << "\n";
            P = Config::load_config_file(argv[1]);
        } else {
            std::cout << "[Config] No config file given, using built-in defaults\n";
            P = default_params();
        }

        // ===== 2. Geometry =====
        MaterialLibrary lib = MaterialLibrary::with_builtins();
        TriangleMesh mesh = build_demo_geometry(lib);
        std::cout << "[Geometry] " << mesh.triangle_count() << " triangles, "
                  << lib.size() << " materials\n";

        // ===== 3. Study =====
        const Study::StudyResult R = Study::run_study(mesh, lib, P);

        if (R.run.status == RunStatus::Diverged) {
            const auto& d = *R.run.divergence;
            std::cerr << "[FATAL] Diverged at step " << d.step << " in " << field_component_name(d.component)
                      << " (|value| = " << d.magnitude << ", threshold " << d.threshold << ")\n";
            std::cerr << "        Check cell_size / cfl_factor and the PML settings.\n";
            return 2;
        }

        // ===== 4. Report =====
        std::cout << "\n========================================\n";
        std::cout << "Study Complete\n";
        std::cout << "========================================\n";
        std::cout << "  steps = " << R.run.steps_completed << ", dt = " << UnitConv::s_to_ps(R.run.dt) << " ps\n";
        std::cout << "  empty-cavity TM110 = " << UnitConv::hz_to_ghz(empty_cavity_tm110()) << " GHz\n";
        if (!R.resonances.empty()) {
            const auto& p = R.resonances.front();
            std::cout << "  strongest resonance = " << std::setprecision(6) << UnitConv::hz_to_ghz(p.frequency)
                      << " GHz (Q = " << p.q_factor << ")\n";
        }
        if (R.reflection) {
            std::cout << "  reflection coefficient over " << R.reflection->frequency.size() << " bins\n";
        }
        if (!R.output_path.empty()) std::cout << "  Output: " << R.output_path.string() << "/\n";
        return 0;
    }
    catch (const FdtdError& e) {
        std::cerr << "[ERR] " << error_kind_name(e.kind()) << " error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "[ERR] " << e.what() << "\n";
        return 1;
    }
}

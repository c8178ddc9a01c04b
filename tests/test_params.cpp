// test_params.cpp - Unit tests for the parameter record and config reader
//
// This test program validates:
// 1. Config text parsing (units, repeated probe keys, comments)
// 2. Missing required keys and malformed values raise ConfigError(key)
// 3. Unrecognized keys are ignored
// 4. validate(): hard errors versus warnings
// 5. CFL time step, step count and source bandwidth relation
// 6. Position checks against the planned grid
// 7. Memory budget rejection before allocation

#include <iostream>
#include <vector>
#include <cmath>
#include <iomanip>
#include <string>
#include <limits>
#include <algorithm>
#include <functional>

#include "params.hpp"

// ANSI color codes for output
#define GREEN "\033[32m"
#define RED "\033[31m"
#define YELLOW "\033[33m"
#define RESET "\033[0m"
#define BOLD "\033[1m"

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

std::vector<TestResult> all_results;

void report_test(const std::string& name, bool passed, const std::string& msg = "") {
    all_results.push_back({name, passed, msg});
    if (passed) {
        std::cout << GREEN << "[PASS] " << RESET << name;
    } else {
        std::cout << RED << "[FAIL] " << RESET << name;
    }
    if (!msg.empty()) {
        std::cout << " - " << msg;
    }
    std::cout << "\n";
}

// Helper: run f and return the key of the ConfigError it throws ("<none>" if it does not)
std::string config_error_key(const std::function<void()>& f) {
    try {
        f();
    } catch (const ConfigError& e) {
        return e.key();
    }
    return "<none>";
}

const std::string BASE_CONFIG =
    "cell_size = 0.5\n"
    "length_unit = 1e-3\n"
    "center_frequency = 10e9\n"
    "max_simulation_time = 5e-9\n"
    "verbose = false\n";

// ==================== Test 1: Config Text Parsing ====================
bool test_parse_config() {
    std::cout << "\n" << BOLD << "=== Test 1: Config Text Parsing ===" << RESET << "\n";

    const std::string text =
        "# cavity study\n"
        "cell_size = 0.5          # mm\n"
        "length_unit = 1e-3\n"
        "pml_thickness = 6\n"
        "domain_margin = 3\n"
        "center_frequency = 12e9\n"
        "bandwidth = 4e9\n"
        "max_simulation_time = 2e-9\n"
        "source_position = 4, 5, 6\n"
        "source_component = Hz\n"
        "source_waveform = cw\n"
        "probe_position = 1 2 3\n"
        "probe_component = Ex\n"
        "probe_name = near\n"
        "probe_position = 7, 8, 9\n"
        "snapshot_plane = xz\n"
        "snapshot_index = 4\n"
        "memory_budget_mb = 256\n"
        "verbose = false\n";

    auto P = Config::parse_config_text(text);

    bool grid = P.cell_size == 0.5 && P.length_unit == 1e-3 && P.bp.cpml.npml == 6
             && P.domain_margin == 3 && std::abs(P.dx() - 5e-4) < 1e-15;
    report_test("Grid keys", grid);

    bool excitation = P.center_frequency == 12e9 && P.bandwidth == 4e9
                   && P.source_position && P.source_position->i == 4 && P.source_position->k == 6
                   && P.source_component == FieldComponent::Hz
                   && P.source_waveform == Sources::Waveform::ContinuousWave;
    report_test("Excitation keys", excitation);

    bool probes = P.probes.size() == 2
               && P.probes[0].name == "near" && P.probes[0].component == FieldComponent::Ex
               && P.probes[0].cell.j == 2
               && P.probes[1].name == "probe1" && P.probes[1].component == FieldComponent::Ez
               && P.probes[1].cell.i == 7;
    report_test("Repeated probe keys paired in order", probes,
                std::to_string(P.probes.size()) + " probes");

    bool snapshot = P.snapshot.enabled && P.snapshot.plane == Detectors::SlicePlane::XZ
                 && P.snapshot.index && *P.snapshot.index == 4;
    report_test("Snapshot keys", snapshot);

    bool budget = P.memory_budget_bytes == size_t(256) * 1024 * 1024;
    report_test("memory_budget_mb converted to bytes", budget);

    return grid && excitation && probes && snapshot && budget;
}

// ==================== Test 2: Required and Malformed Keys ====================
bool test_required_and_malformed() {
    std::cout << "\n" << BOLD << "=== Test 2: Required and Malformed Keys ===" << RESET << "\n";

    const std::string k1 = config_error_key([] {
        Config::parse_config_text("center_frequency = 1e9\nmax_steps = 10\n");
    });
    report_test("Missing cell_size", k1 == "cell_size", k1);

    const std::string k2 = config_error_key([] {
        Config::parse_config_text("cell_size = 1\nmax_steps = 10\n");
    });
    report_test("Missing center_frequency", k2 == "center_frequency", k2);

    const std::string k3 = config_error_key([] {
        Config::parse_config_text("cell_size = 1\ncenter_frequency = 1e9\n");
    });
    report_test("Missing duration", k3 == "max_simulation_time", k3);

    const std::string k4 = config_error_key([] {
        Config::parse_config_text(BASE_CONFIG + "cfl_factor = fast\n");
    });
    report_test("Non-numeric value names its key", k4 == "cfl_factor", k4);

    const std::string k5 = config_error_key([] {
        Config::parse_config_text(BASE_CONFIG + "probe_position = 1, 2\n");
    });
    report_test("Two indices for a position", k5 == "probe_position", k5);

    const std::string k6 = config_error_key([] {
        Config::parse_config_text(BASE_CONFIG + "source_component = Ew\n");
    });
    report_test("Unknown component", k6 == "source_component", k6);

    const std::string k7 = config_error_key([] {
        Config::parse_config_text("cell_size = -0.5\ncenter_frequency = 1e9\nmax_steps = 10\n");
    });
    report_test("Negative cell size", k7 == "cell_size", k7);

    const std::string k8 = config_error_key([] {
        Config::parse_config_text(BASE_CONFIG + "probe_component = Ez\n");
    });
    report_test("Probe component without a position", k8 == "probe_component", k8);

    const std::string k9 = config_error_key([] {
        Config::parse_config_text(BASE_CONFIG + "max_steps = -3\n");
    });
    report_test("Negative step count", k9 == "max_steps", k9);

    bool missing_file = false;
    try {
        Config::load_config_file("does/not/exist.cfg");
    } catch (const ConfigError&) {
        missing_file = true;
    }
    report_test("Missing config file raises ConfigError", missing_file);

    return k1 == "cell_size" && k2 == "center_frequency" && k3 == "max_simulation_time"
        && k4 == "cfl_factor" && k5 == "probe_position" && k6 == "source_component"
        && k7 == "cell_size" && k8 == "probe_component" && k9 == "max_steps" && missing_file;
}

// ==================== Test 3: Unrecognized Keys ====================
bool test_unrecognized_keys() {
    std::cout << "\n" << BOLD << "=== Test 3: Unrecognized Keys ===" << RESET << "\n";

    auto P = Config::parse_config_text(BASE_CONFIG + "mesh_accuracy = 3\nscript = run()\n");
    bool ignored = P.ignored_keys.size() == 2 && P.ignored_keys[0] == "mesh_accuracy";
    report_test("Unknown keys collected and ignored", ignored,
                std::to_string(P.ignored_keys.size()) + " keys");
    bool intact = P.cell_size == 0.5 && P.center_frequency == 10e9;
    report_test("Known keys unaffected", intact);
    return ignored && intact;
}

// ==================== Test 4: Validation ====================
bool test_validation() {
    std::cout << "\n" << BOLD << "=== Test 4: Validation ===" << RESET << "\n";

    auto P = Config::parse_config_text(BASE_CONFIG);
    auto w = Config::validate(P);
    bool clean = w.empty();
    report_test("Well-resolved config has no warnings", clean, std::to_string(w.size()) + " warnings");

    // 50 GHz plus the 25 GHz default bandwidth leaves 8 cells per wavelength at 0.5 mm
    auto coarse = P;
    coarse.center_frequency = 50e9;
    auto wc = Config::validate(coarse);
    bool resolution_warn = std::any_of(wc.begin(), wc.end(), [](const std::string& s) {
        return s.find("cells per vacuum wavelength") != std::string::npos;
    });
    report_test("Coarse resolution is a warning only", resolution_warn);

    auto hot = P;
    hot.cfl_factor = 1.5;
    auto wh = Config::validate(hot);
    bool cfl_warn = std::any_of(wh.begin(), wh.end(), [](const std::string& s) {
        return s.find("Courant") != std::string::npos;
    });
    report_test("cfl_factor >= 1 is a warning", cfl_warn);

    auto short_run = P;
    short_run.max_simulation_time = 0.2e-9;
    auto ws = Config::validate(short_run);
    bool decay_warn = std::any_of(ws.begin(), ws.end(), [](const std::string& s) {
        return s.find("no free decay") != std::string::npos;
    });
    report_test("Run shorter than the pulse is a warning", decay_warn);

    auto bad_cfl = P;
    bad_cfl.cfl_factor = 0.0;
    const std::string k1 = config_error_key([&] { Config::validate(bad_cfl); });
    report_test("cfl_factor = 0 rejected", k1 == "cfl_factor", k1);

    auto bad_freq = P;
    bad_freq.center_frequency = -1.0;
    const std::string k2 = config_error_key([&] { Config::validate(bad_freq); });
    report_test("Negative frequency rejected", k2 == "center_frequency", k2);

    auto no_time = P;
    no_time.max_simulation_time = 0.0;
    const std::string k3 = config_error_key([&] { Config::validate(no_time); });
    report_test("No duration rejected", k3 == "max_simulation_time", k3);

    auto dup = P;
    dup.probes.push_back({ "a", { 1, 1, 1 }, FieldComponent::Ez });
    dup.probes.push_back({ "a", { 2, 2, 2 }, FieldComponent::Ez });
    const std::string k4 = config_error_key([&] { Config::validate(dup); });
    report_test("Duplicate probe names rejected", k4 == "probe_name", k4);

    auto refl = P;
    refl.probes.push_back({ "inc", { 1, 1, 1 }, FieldComponent::Ez });
    refl.reflection_incident_probe = "inc";
    refl.reflection_reflected_probe = "ref";
    const std::string k5 = config_error_key([&] { Config::validate(refl); });
    report_test("Unknown reflection probe rejected", k5 == "reflection_reflected_probe", k5);

    auto band = P;
    band.spectrum_fmin = 5e9;
    band.spectrum_fmax = 4e9;
    const std::string k6 = config_error_key([&] { Config::validate(band); });
    report_test("Inverted spectrum band rejected", k6 == "spectrum_fmax", k6);

    auto decay = P;
    decay.decay_threshold = 1.0;
    const std::string k7 = config_error_key([&] { Config::validate(decay); });
    report_test("decay_threshold outside [0, 1) rejected", k7 == "decay_threshold", k7);

    // Probe names become file names and JSON strings
    bool names_rejected = true;
    for (const std::string bad : { "../../escaped", "sub/probe", "a\\b", "say \"hi\"", "tab\there", ".." }) {
        auto named = P;
        named.probes.push_back({ bad, { 1, 1, 1 }, FieldComponent::Ez });
        const std::string k = config_error_key([&] { Config::validate(named); });
        if (k != "probe_name") {
            names_rejected = false;
            std::cout << "  accepted probe name '" << bad << "' (" << k << ")\n";
        }
    }
    report_test("Unsafe probe names rejected", names_rejected);

    auto from_text = Config::parse_config_text(BASE_CONFIG + "probe_position = 1, 1, 1\nprobe_name = ../../escaped\n");
    const std::string k8 = config_error_key([&] { Config::validate(from_text); });
    report_test("Path-like probe name from a config file rejected", k8 == "probe_name", k8);

    auto plain = P;
    plain.probes.push_back({ "port_1.in", { 1, 1, 1 }, FieldComponent::Ez });
    const std::string k9 = config_error_key([&] { Config::validate(plain); });
    report_test("Plain probe name with a dot accepted", k9 == "<none>", k9);

    auto tag = P;
    tag.output_dir = "out";
    tag.run_tag = "../elsewhere";
    const std::string k10 = config_error_key([&] { Config::validate(tag); });
    report_test("Path-like run_tag rejected", k10 == "run_tag", k10);

    return clean && resolution_warn && cfl_warn && decay_warn
        && k1 == "cfl_factor" && k2 == "center_frequency" && k3 == "max_simulation_time"
        && k4 == "probe_name" && k5 == "reflection_reflected_probe" && k6 == "spectrum_fmax"
        && k7 == "decay_threshold" && names_rejected && k8 == "probe_name" && k9 == "<none>"
        && k10 == "run_tag";
}

// ==================== Test 5: Time Step and Source Width ====================
bool test_time_step() {
    std::cout << "\n" << BOLD << "=== Test 5: CFL Time Step and Source Width ===" << RESET << "\n";

    auto P = Config::parse_config_text(BASE_CONFIG);
    const real dx = P.dx();

    const real dt_vac = Config::compute_dt(P);
    const real bound = dx / (Config::c0 * std::sqrt(3.0));
    bool within = dt_vac <= bound && std::abs(dt_vac - 0.99 * bound) < 1e-12 * bound;
    report_test("dt = 0.99 * Courant bound in vacuum", within,
                std::to_string(dt_vac * 1e12) + " ps");

    // A material faster than light (eps_r < 1) tightens dt
    const real dt_fast = Config::compute_dt(P, 2.0 * Config::c0);
    bool faster = std::abs(dt_fast - 0.5 * dt_vac) < 1e-12 * dt_vac;
    report_test("dt scales with the fastest wave speed", faster);

    // Slower materials never relax the bound below vacuum
    bool slow = Config::compute_dt(P, 0.5 * Config::c0) == dt_vac;
    report_test("Slow materials keep the vacuum bound", slow);

    P.max_steps = 100;
    bool steps_cap = Config::step_count(P, dt_vac) == 100;
    P.max_steps = 0;
    const size_t n_time = Config::step_count(P, dt_vac);
    bool steps_time = n_time == size_t(std::ceil(5e-9 / dt_vac - 1e-9));
    report_test("Step count from max_steps or duration", steps_cap && steps_time,
                std::to_string(n_time) + " steps");

    // Narrower bandwidth gives a longer pulse
    Sources::SourceConfig wide, narrow;
    wide.frequency = narrow.frequency = 10e9;
    wide.bandwidth = 8e9;
    narrow.bandwidth = 2e9;
    bool inverse = std::abs(narrow.get_tau() / wide.get_tau() - 4.0) < 1e-12
                && narrow.get_end_time() > wide.get_end_time();
    report_test("Pulse width inversely proportional to bandwidth", inverse);

    bool auto_bw = std::abs(P.effective_bandwidth() - 5e9) < 1.0;
    report_test("Bandwidth defaults to half the center frequency", auto_bw);

    return within && faster && slow && steps_cap && steps_time && inverse && auto_bw;
}

// ==================== Test 6: Position Checks ====================
bool test_position_checks() {
    std::cout << "\n" << BOLD << "=== Test 6: Position Checks ===" << RESET << "\n";

    auto P = Config::parse_config_text(BASE_CONFIG);
    GridGeometry geo = GridGeometry::uniform(20, 16, 12, 0.5, 8, 1e-3);

    P.source_position = CellIndex{ 19, 15, 11 };
    P.probes.push_back({ "p", { 0, 0, 0 }, FieldComponent::Ez });
    bool ok = config_error_key([&] { Config::check_positions(P, geo); }) == "<none>";
    report_test("Corner cells accepted", ok);

    auto bad_src = P;
    bad_src.source_position = CellIndex{ 20, 0, 0 };
    const std::string k1 = config_error_key([&] { Config::check_positions(bad_src, geo); });
    report_test("Source outside the domain", k1 == "source_position", k1);

    auto bad_probe = P;
    bad_probe.probes.push_back({ "q", { 0, 16, 0 }, FieldComponent::Hx });
    const std::string k2 = config_error_key([&] { Config::check_positions(bad_probe, geo); });
    report_test("Probe outside the domain", k2 == "probe_position", k2);

    auto bad_slice = P;
    bad_slice.snapshot.enabled = true;
    bad_slice.snapshot.plane = Detectors::SlicePlane::XY;
    bad_slice.snapshot.index = 12;
    const std::string k3 = config_error_key([&] { Config::check_positions(bad_slice, geo); });
    report_test("Snapshot index past the normal extent", k3 == "snapshot_index", k3);

    auto centre = Config::parse_config_text(BASE_CONFIG);
    const CellIndex c = centre.source_cell(geo);
    bool default_centre = c.i == 10 && c.j == 8 && c.k == 6;
    report_test("Source defaults to the core centre", default_centre);

    return ok && k1 == "source_position" && k2 == "probe_position" && k3 == "snapshot_index" && default_centre;
}

// ==================== Test 7: Memory Budget ====================
bool test_memory_budget() {
    std::cout << "\n" << BOLD << "=== Test 7: Memory Budget ===" << RESET << "\n";

    GridGeometry small = GridGeometry::uniform(32, 32, 32, 1.0, 8, 1e-3);
    const size_t est = Config::estimate_memory_bytes(small);
    const size_t nodes = small.total_cells();
    bool plausible = est > nodes * 18 * sizeof(real) && est < nodes * 24 * sizeof(real);
    report_test("Estimate covers fields, coefficients and CPML", plausible,
                std::to_string(est >> 20) + " MiB");

    bool fits = true;
    try {
        Config::check_memory_budget(small, UserConfig::MEMORY_BUDGET_BYTES);
    } catch (const ResourceError&) {
        fits = false;
    }
    report_test("Small grid within the default budget", fits);

    // 2000 x 400 x 400 core cells: far beyond 4 GiB, largest axis x
    GridGeometry huge = GridGeometry::uniform(2000, 400, 400, 1.0, 8, 1e-3);
    bool rejected = false, axis_ok = false, dims_ok = false;
    try {
        Config::check_memory_budget(huge, UserConfig::MEMORY_BUDGET_BYTES);
    } catch (const ResourceError& e) {
        rejected = e.kind() == ErrorKind::Resource && e.bytes_required() > e.budget();
        axis_ok = e.offending_axis() == 'x';
        dims_ok = e.dims()[0] == huge.NxT() && e.dims()[2] == huge.NzT();
        std::cout << "  " << e.what() << "\n";
    }
    report_test("Oversized grid raises ResourceError", rejected);
    report_test("Offending axis reported", axis_ok && dims_ok);

    GridGeometry tall = GridGeometry::uniform(50, 50, 900, 1.0, 8, 1e-3);
    bool z_axis = false;
    try {
        Config::check_memory_budget(tall, size_t(64) << 20);
    } catch (const ResourceError& e) {
        z_axis = e.offending_axis() == 'z';
    }
    report_test("Largest axis z detected", z_axis);

    // 2^22 nodes per axis: the node count exceeds 64 bits and must saturate, not wrap
    GridGeometry vast = GridGeometry::uniform(4194303, 4194303, 4194303, 1.0, 0, 1e-3);
    bool saturated = vast.total_cells() == std::numeric_limits<size_t>::max()
                  && Config::estimate_memory_bytes(vast) == std::numeric_limits<size_t>::max();
    bool vast_rejected = false;
    try {
        Config::check_memory_budget(vast, std::numeric_limits<size_t>::max() - 1);
    } catch (const ResourceError& e) {
        vast_rejected = e.bytes_required() > e.budget();
    }
    report_test("Overflowing node count saturates and is rejected", saturated && vast_rejected);

    return plausible && fits && rejected && axis_ok && dims_ok && z_axis && saturated && vast_rejected;
}

int main() {
    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "     SIMULATION PARAMETERS - UNIT TEST SUITE                          \n"
              << "======================================================================\n"
              << RESET;

    test_parse_config();
    test_required_and_malformed();
    test_unrecognized_keys();
    test_validation();
    test_time_step();
    test_position_checks();
    test_memory_budget();

    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "                       TEST SUMMARY                                   \n"
              << "======================================================================\n"
              << RESET;

    int passed = 0, failed = 0;
    for (const auto& r : all_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "\nTotal tests: " << all_results.size() << "\n";
    std::cout << GREEN << "Passed: " << passed << RESET << "\n";
    if (failed > 0) {
        std::cout << RED << "Failed: " << failed << RESET << "\n";
        std::cout << "\nFailed tests:\n";
        for (const auto& r : all_results) {
            if (!r.passed) {
                std::cout << RED << "  - " << r.name << RESET;
                if (!r.message.empty()) std::cout << ": " << r.message;
                std::cout << "\n";
            }
        }
    }

    bool all_passed = (failed == 0);
    std::cout << "\n" << (all_passed ? GREEN : RED) << BOLD
              << "Overall: " << (all_passed ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << RESET << "\n\n";

    return all_passed ? 0 : 1;
}

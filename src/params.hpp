// params.hpp - Simulation configuration and parameter file
//
// This file contains the strongly typed parameter record of one study, the
// key = value config reader, validation, the CFL time step, position checks
// against the planned grid and the pre-allocation memory budget check.
// Defaults are read from user_config.hpp.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <cmath>
#include <cctype>
#include <algorithm>
#include <limits>
#include <array>

#include "global_function.hpp"
#include "user_config.hpp"
#include "errors.hpp"
#include "boundary.hpp"
#include "structure_material.hpp"
#include "sources/isource.hpp"
#include "detectors/field_slice.hpp"

namespace Config {

    // -------------------------- Basic Parameters (from PhysConst) --------------------------

    inline constexpr real PI   = PhysConst::PI;
    inline constexpr real c0   = PhysConst::C0;     // Speed of light (m/s)
    inline constexpr real eps0 = PhysConst::EPS0;   // Vacuum permittivity (F/m)
    inline constexpr real mu0  = PhysConst::MU0;    // Vacuum permeability (H/m)

    // -------------------------- Probe and snapshot requests --------------------------
    struct ProbeSpec {
        std::string name;
        CellIndex cell{};                                 // Core cell indices
        FieldComponent component = FieldComponent::Ez;
    };

    struct SnapshotSpec {
        bool enabled = false;
        Detectors::SlicePlane plane = Detectors::SlicePlane::XY;
        FieldComponent component = FieldComponent::Ez;
        std::optional<size_t> index;                      // Core cell along the normal (default: middle)
    };

    // -------------------------- Unified simulation parameters --------------------------
    struct SimulationParams {

        // ===== Grid =====
        real cell_size = 0.0;                             // Mesh units (required)
        real length_unit = UserConfig::LENGTH_UNIT;       // Meters per mesh unit
        size_t domain_margin = UserConfig::DOMAIN_MARGIN; // Vacuum cells around the mesh bounding box

        // ===== Boundary conditions (PEC and CPML) =====
        BoundaryParams bp = [] {
            BoundaryParams p;
            p.type = BcType::CPML_RC;
            p.cpml.npml = UserConfig::CPML_NPML;
            p.cpml.m = UserConfig::CPML_M;
            p.cpml.Rerr = UserConfig::CPML_RERR;
            p.cpml.alpha0 = UserConfig::CPML_ALPHA0;
            p.cpml.kappa_max = UserConfig::CPML_KAPPA_MAX;
            p.cpml.alpha_linear = true;
            return p;
        }();

        // ===== Excitation =====
        real center_frequency = 0.0;                      // Hz (required)
        real bandwidth = 0.0;                             // Hz, 0 = half the center frequency
        std::optional<CellIndex> source_position;         // Default: middle of the core
        FieldComponent source_component = FieldComponent::Ez;
        real source_amplitude = UserConfig::SOURCE_AMPLITUDE;
        Sources::Waveform source_waveform = Sources::Waveform::GaussianPulse;

        // ===== Time stepping =====
        real max_simulation_time = 0.0;                   // s (this or max_steps required)
        size_t max_steps = 0;
        real cfl_factor = UserConfig::CFL_FACTOR;         // dt = cfl_factor * dx / (v_max sqrt(3))
        real decay_threshold = UserConfig::DECAY_THRESHOLD;
        size_t progress_interval = UserConfig::PROGRESS_INTERVAL;
        int num_threads = UserConfig::NUM_THREADS;

        // ===== Probes and diagnostics =====
        std::vector<ProbeSpec> probes;
        SnapshotSpec snapshot;
        bool track_energy = true;

        // ===== Stability and resources =====
        real divergence_factor = UserConfig::DIVERGENCE_FACTOR;
        size_t divergence_check_interval = UserConfig::STABILITY_MONITOR_INTERVAL;
        size_t memory_budget_bytes = UserConfig::MEMORY_BUDGET_BYTES;

        // ===== Spectral extraction =====
        real spectrum_fmin = 0.0;                         // 0 = DC
        real spectrum_fmax = 0.0;                         // 0 = Nyquist
        std::string reflection_incident_probe;
        std::string reflection_reflected_probe;

        // ===== Output =====
        // Results saved to <output_dir>/<run_tag>/ (nothing written when output_dir is empty)
        std::string output_dir;
        std::string run_tag = UserConfig::RUN_TAG;
        bool verbose = true;

        // Keys present in the config text that are not recognized (ignored)
        std::vector<std::string> ignored_keys;

        // ====== Derived quantities ======
        real dx() const { return cell_size * length_unit; }
        size_t npml() const { return size_t(std::max(bp.cpml.npml, 0)); }
        real effective_bandwidth() const { return bandwidth > 0.0 ? bandwidth : 0.5 * center_frequency; }

        // Source cell, defaulting to the middle of the core
        CellIndex source_cell(const GridGeometry& geo) const {
            return source_position ? *source_position : CellIndex{ geo.Nx / 2, geo.Ny / 2, geo.Nz / 2 };
        }

        Sources::SourceConfig source_config(const GridGeometry& geo) const {
            Sources::SourceConfig sc;
            sc.amplitude = source_amplitude;
            sc.frequency = center_frequency;
            sc.bandwidth = effective_bandwidth();
            sc.waveform = source_waveform;
            sc.component = source_component;
            sc.cell = source_cell(geo);
            return sc;
        }

        const ProbeSpec* find_probe(const std::string& name) const {
            for (const auto& p : probes) if (p.name == name) return &p;
            return nullptr;
        }
    };

    // ==================== Value parsing ====================

    namespace detail {

    inline std::string trim(const std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    inline std::string lower(std::string s) {
        for (auto& ch : s) ch = char(std::tolower(static_cast<unsigned char>(ch)));
        return s;
    }

    inline real parse_real(const std::string& key, const std::string& v) {
        size_t used = 0;
        real out = 0.0;
        try {
            out = std::stod(v, &used);
        } catch (const std::exception&) {
            throw ConfigError(key, "expected a number, got '" + v + "'");
        }
        if (used != v.size() || !std::isfinite(out)) {
            throw ConfigError(key, "expected a number, got '" + v + "'");
        }
        return out;
    }

    inline size_t parse_count(const std::string& key, const std::string& v) {
        if (v.empty() || v[0] == '-') throw ConfigError(key, "expected a non-negative integer, got '" + v + "'");
        size_t used = 0;
        unsigned long long out = 0;
        try {
            out = std::stoull(v, &used);
        } catch (const std::exception&) {
            throw ConfigError(key, "expected a non-negative integer, got '" + v + "'");
        }
        if (used != v.size()) throw ConfigError(key, "expected a non-negative integer, got '" + v + "'");
        return size_t(out);
    }

    inline bool parse_bool(const std::string& key, const std::string& v) {
        const std::string s = lower(v);
        if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
        if (s == "false" || s == "0" || s == "no" || s == "off") return false;
        throw ConfigError(key, "expected true/false, got '" + v + "'");
    }

    inline FieldComponent parse_component(const std::string& key, const std::string& v) {
        const std::string s = lower(v);
        if (s == "ex") return FieldComponent::Ex;
        if (s == "ey") return FieldComponent::Ey;
        if (s == "ez") return FieldComponent::Ez;
        if (s == "hx") return FieldComponent::Hx;
        if (s == "hy") return FieldComponent::Hy;
        if (s == "hz") return FieldComponent::Hz;
        throw ConfigError(key, "unknown field component '" + v + "' (Ex, Ey, Ez, Hx, Hy, Hz)");
    }

    // "i, j, k" or "i j k"
    inline CellIndex parse_cell(const std::string& key, const std::string& v) {
        std::string s = v;
        std::replace(s.begin(), s.end(), ',', ' ');
        std::istringstream iss(s);
        std::string tok;
        std::vector<size_t> n;
        while (iss >> tok) n.push_back(parse_count(key, tok));
        if (n.size() != 3) throw ConfigError(key, "expected three cell indices, got '" + v + "'");
        return { n[0], n[1], n[2] };
    }

    inline real parse_positive(const std::string& key, const std::string& v) {
        const real x = parse_real(key, v);
        if (!(x > 0.0)) throw ConfigError(key, "must be positive");
        return x;
    }

    } // namespace detail

    // ==================== Config text reader ====================
    // One "key = value" per line, '#' starts a comment. probe_position,
    // probe_component and probe_name may repeat and are paired in order.
    inline SimulationParams parse_config_text(const std::string& text, const std::string& origin = "<config>") {
        using namespace detail;
        SimulationParams P;

        std::vector<CellIndex> probe_pos;
        std::vector<FieldComponent> probe_comp;
        std::vector<std::string> probe_names;
        bool has_cell = false, has_freq = false, has_time = false, has_steps = false;

        std::istringstream in(text);
        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            const auto hash = line.find('#');
            if (hash != std::string::npos) line.erase(hash);
            line = trim(line);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string::npos) {
                throw ConfigError("", origin + ":" + std::to_string(line_no) + ": expected 'key = value'");
            }
            const std::string key = lower(trim(line.substr(0, eq)));
            const std::string val = trim(line.substr(eq + 1));
            if (val.empty()) throw ConfigError(key, "empty value");

            if (key == "cell_size")                 { P.cell_size = parse_positive(key, val); has_cell = true; }
            else if (key == "length_unit")          P.length_unit = parse_positive(key, val);
            else if (key == "pml_thickness")        P.bp.cpml.npml = int(parse_count(key, val));
            else if (key == "domain_margin")        P.domain_margin = parse_count(key, val);
            else if (key == "center_frequency")     { P.center_frequency = parse_positive(key, val); has_freq = true; }
            else if (key == "bandwidth")            P.bandwidth = parse_positive(key, val);
            else if (key == "max_simulation_time")  { P.max_simulation_time = parse_positive(key, val); has_time = true; }
            else if (key == "max_steps")            { P.max_steps = parse_count(key, val); has_steps = P.max_steps > 0; }
            else if (key == "cfl_factor")           P.cfl_factor = parse_positive(key, val);
            else if (key == "source_position")      P.source_position = parse_cell(key, val);
            else if (key == "source_component")     P.source_component = parse_component(key, val);
            else if (key == "source_amplitude")     P.source_amplitude = parse_real(key, val);
            else if (key == "source_waveform") {
                const std::string w = lower(val);
                if (w == "gaussian" || w == "pulse") P.source_waveform = Sources::Waveform::GaussianPulse;
                else if (w == "cw" || w == "continuous") P.source_waveform = Sources::Waveform::ContinuousWave;
                else throw ConfigError(key, "unknown waveform '" + val + "' (gaussian, cw)");
            }
            else if (key == "probe_position")       probe_pos.push_back(parse_cell(key, val));
            else if (key == "probe_component")      probe_comp.push_back(parse_component(key, val));
            else if (key == "probe_name")           probe_names.push_back(val);
            else if (key == "divergence_factor")    P.divergence_factor = parse_positive(key, val);
            else if (key == "divergence_check_interval") P.divergence_check_interval = parse_count(key, val);
            else if (key == "memory_budget_mb")     P.memory_budget_bytes = size_t(parse_positive(key, val) * 1024.0 * 1024.0);
            else if (key == "decay_threshold")      P.decay_threshold = parse_real(key, val);
            else if (key == "snapshot_plane") {
                auto plane = Detectors::parse_slice_plane(lower(val));
                if (!plane) throw ConfigError(key, "expected xy, xz or yz, got '" + val + "'");
                P.snapshot.enabled = true;
                P.snapshot.plane = *plane;
            }
            else if (key == "snapshot_component")   { P.snapshot.component = parse_component(key, val); P.snapshot.enabled = true; }
            else if (key == "snapshot_index")       { P.snapshot.index = parse_count(key, val); P.snapshot.enabled = true; }
            else if (key == "reflection_incident_probe")  P.reflection_incident_probe = val;
            else if (key == "reflection_reflected_probe") P.reflection_reflected_probe = val;
            else if (key == "spectrum_fmin")        P.spectrum_fmin = parse_real(key, val);
            else if (key == "spectrum_fmax")        P.spectrum_fmax = parse_real(key, val);
            else if (key == "run_tag")              P.run_tag = val;
            else if (key == "output_dir")           P.output_dir = val;
            else if (key == "verbose")              P.verbose = parse_bool(key, val);
            else if (key == "track_energy")         P.track_energy = parse_bool(key, val);
            else if (key == "progress_interval")    P.progress_interval = parse_count(key, val);
            else if (key == "num_threads")          P.num_threads = int(parse_count(key, val));
            else                                    P.ignored_keys.push_back(key);
        }

        // ---- Required parameters ----
        if (!has_cell) throw ConfigError("cell_size", "missing required parameter");
        if (!has_freq) throw ConfigError("center_frequency", "missing required parameter");
        if (!has_time && !has_steps) {
            throw ConfigError("max_simulation_time", "missing required parameter (or max_steps)");
        }

        // ---- Pair repeated probe keys ----
        if (probe_comp.size() > probe_pos.size()) {
            throw ConfigError("probe_component", "more components than probe_position entries");
        }
        if (probe_names.size() > probe_pos.size()) {
            throw ConfigError("probe_name", "more names than probe_position entries");
        }
        for (size_t n = 0; n < probe_pos.size(); ++n) {
            ProbeSpec ps;
            ps.cell = probe_pos[n];
            ps.component = n < probe_comp.size() ? probe_comp[n] : FieldComponent::Ez;
            ps.name = n < probe_names.size() ? probe_names[n] : ("probe" + std::to_string(n));
            P.probes.push_back(ps);
        }

        if (P.verbose) {
            for (const auto& k : P.ignored_keys) {
                std::cout << "[Config] Ignoring unrecognized key '" << k << "'\n";
            }
        }
        return P;
    }

    inline SimulationParams load_config_file(const std::filesystem::path& path) {
        std::ifstream ifs(path);
        if (!ifs) throw ConfigError("config_file", "cannot open " + path.string());
        std::stringstream buf;
        buf << ifs.rdbuf();
        return parse_config_text(buf.str(), path.string());
    }

    // ==================== Validation ====================
    // Hard errors throw ConfigError; soft problems come back as warnings.
    // Names that become file names under <output_dir>/<run_tag>/ and JSON strings
    inline bool is_safe_file_stem(const std::string& name) {
        if (name.empty() || name == "." || name.find("..") != std::string::npos) return false;
        for (unsigned char ch : name) {
            if (ch < 0x20 || ch == 0x7f || ch == '/' || ch == '\\' || ch == '"') return false;
        }
        return true;
    }

    inline std::vector<std::string> validate(const SimulationParams& P) {
        std::vector<std::string> warnings;

        if (!(P.cell_size > 0.0))        throw ConfigError("cell_size", "must be positive");
        if (!(P.length_unit > 0.0))      throw ConfigError("length_unit", "must be positive");
        if (!(P.center_frequency > 0.0)) throw ConfigError("center_frequency", "must be positive");
        if (P.bandwidth < 0.0)           throw ConfigError("bandwidth", "must be positive");
        if (!(P.max_simulation_time > 0.0) && P.max_steps == 0) {
            throw ConfigError("max_simulation_time", "a positive duration or max_steps is required");
        }
        if (P.max_simulation_time < 0.0) throw ConfigError("max_simulation_time", "must be positive");
        if (!(P.cfl_factor > 0.0))       throw ConfigError("cfl_factor", "must be positive");
        if (P.bp.cpml.npml < 0)          throw ConfigError("pml_thickness", "must not be negative");
        if (!(P.divergence_factor > 0.0)) throw ConfigError("divergence_factor", "must be positive");
        if (P.divergence_check_interval == 0) throw ConfigError("divergence_check_interval", "must be at least 1");
        if (P.memory_budget_bytes == 0)  throw ConfigError("memory_budget_mb", "must be positive");
        if (P.decay_threshold < 0.0 || P.decay_threshold >= 1.0) {
            throw ConfigError("decay_threshold", "must lie in [0, 1)");
        }
        if (P.spectrum_fmin < 0.0 || P.spectrum_fmax < 0.0) {
            throw ConfigError("spectrum_fmin", "band limits must not be negative");
        }
        if (P.spectrum_fmax > 0.0 && P.spectrum_fmax <= P.spectrum_fmin) {
            throw ConfigError("spectrum_fmax", "must exceed spectrum_fmin");
        }

        for (size_t a = 0; a < P.probes.size(); ++a) {
            if (P.probes[a].name.empty()) throw ConfigError("probe_name", "empty probe name");
            if (!is_safe_file_stem(P.probes[a].name)) {
                throw ConfigError("probe_name", "probe name must not contain path separators, '..', quotes or control characters");
            }
            for (size_t b = a + 1; b < P.probes.size(); ++b) {
                if (P.probes[a].name == P.probes[b].name) {
                    throw ConfigError("probe_name", "duplicate probe name '" + P.probes[a].name + "'");
                }
            }
        }

        if (!P.output_dir.empty() && !is_safe_file_stem(P.run_tag)) {
            throw ConfigError("run_tag", "must be a plain directory name");
        }

        const bool want_refl = !P.reflection_incident_probe.empty() || !P.reflection_reflected_probe.empty();
        if (want_refl) {
            if (!P.find_probe(P.reflection_incident_probe)) {
                throw ConfigError("reflection_incident_probe", "no probe named '" + P.reflection_incident_probe + "'");
            }
            if (!P.find_probe(P.reflection_reflected_probe)) {
                throw ConfigError("reflection_reflected_probe", "no probe named '" + P.reflection_reflected_probe + "'");
            }
        }

        // ---- Warnings ----
        if (P.cfl_factor >= 1.0) {
            std::ostringstream oss;
            oss << "cfl_factor = " << P.cfl_factor << " is at or above the Courant limit; the run may diverge";
            warnings.push_back(oss.str());
        }

        const real f_hi = P.center_frequency + P.effective_bandwidth();
        const real cells_per_lambda = (c0 / f_hi) / P.dx();
        if (cells_per_lambda < UserConfig::RECOMMENDED_CELLS_PER_WAVELENGTH) {
            std::ostringstream oss;
            oss << std::setprecision(3) << cells_per_lambda << " cells per vacuum wavelength at "
                << UnitConv::hz_to_ghz(f_hi) << " GHz (recommended >= "
                << UserConfig::RECOMMENDED_CELLS_PER_WAVELENGTH << ")";
            warnings.push_back(oss.str());
        }

        if (P.source_waveform == Sources::Waveform::GaussianPulse) {
            const real tau = Sources::tau_from_bandwidth(P.effective_bandwidth());
            const real t_end = (UserConfig::SOURCE_T0_TAUS + UserConfig::SOURCE_TAIL_TAUS) * tau;
            real duration = P.max_simulation_time;
            if (P.max_steps > 0) {
                const real dt_vac = P.cfl_factor * P.dx() / (c0 * std::sqrt(3.0));
                const real by_steps = real(P.max_steps) * dt_vac;
                duration = (duration > 0.0) ? std::min(duration, by_steps) : by_steps;
            }
            if (duration < t_end) {
                std::ostringstream oss;
                oss << "source pulse lasts " << UnitConv::s_to_ps(t_end) << " ps but the run ends at "
                    << UnitConv::s_to_ps(duration) << " ps; no free decay will be observed";
                warnings.push_back(oss.str());
            }
        }

        return warnings;
    }

    // ==================== Time step ====================
    // dt = cfl_factor * dx / (v_max sqrt(3)), never user supplied
    inline real compute_dt(const SimulationParams& P, real v_max = c0) {
        return P.cfl_factor * P.dx() / (std::max(v_max, c0) * std::sqrt(3.0));
    }

    // Steps for the requested duration (the smaller of max_steps and max_simulation_time)
    inline size_t step_count(const SimulationParams& P, real dt) {
        size_t n = std::numeric_limits<size_t>::max();
        if (P.max_steps > 0) n = P.max_steps;
        if (P.max_simulation_time > 0.0) {
            n = std::min(n, size_t(std::ceil(P.max_simulation_time / dt - 1e-9)));
        }
        return std::max<size_t>(n, 1);
    }

    // ==================== Position checks ====================
    inline void check_positions(const SimulationParams& P, const GridGeometry& geo) {
        auto describe = [&](const CellIndex& c) {
            std::ostringstream oss;
            oss << "(" << c.i << ", " << c.j << ", " << c.k << ") outside the "
                << geo.Nx << " x " << geo.Ny << " x " << geo.Nz << " cell domain";
            return oss.str();
        };

        const CellIndex src = P.source_cell(geo);
        if (!geo.contains_core(src)) throw ConfigError("source_position", describe(src));

        for (const auto& p : P.probes) {
            if (!geo.contains_core(p.cell)) {
                throw ConfigError("probe_position", "probe '" + p.name + "' at " + describe(p.cell));
            }
        }

        if (P.snapshot.enabled && P.snapshot.index) {
            const size_t extent = Detectors::slice_normal_extent(geo, P.snapshot.plane);
            if (*P.snapshot.index >= extent) {
                throw ConfigError("snapshot_index", std::to_string(*P.snapshot.index)
                                  + " outside the " + std::to_string(extent) + " cells along the plane normal");
            }
        }
    }

    // ==================== Memory budget ====================
    // Six field arrays, twelve coefficient arrays and the material ids per
    // node, plus the CPML memory slabs. Saturates instead of wrapping.
    inline size_t estimate_memory_bytes(const GridGeometry& geo) {
        using NumericUtils::sat_add;
        using NumericUtils::sat_mul;
        size_t bytes = sat_mul(geo.total_cells(), 18 * sizeof(real));
        bytes = sat_add(bytes, sat_mul(geo.core_cells(), sizeof(MaterialId)));
        if (geo.npml > 0) bytes = sat_add(bytes, CPMLBoundary::estimate_bytes(geo.Nx, geo.Ny, geo.Nz, geo.npml));
        return bytes;
    }

    inline void check_memory_budget(const GridGeometry& geo, size_t budget_bytes) {
        const size_t need = estimate_memory_bytes(geo);
        if (need <= budget_bytes) return;

        const std::array<size_t, 3> dims{ geo.NxT(), geo.NyT(), geo.NzT() };
        char axis = 'x';
        size_t largest = dims[0];
        if (dims[1] > largest) { axis = 'y'; largest = dims[1]; }
        if (dims[2] > largest) { axis = 'z'; largest = dims[2]; }

        std::ostringstream oss;
        oss << "[Resource] grid " << dims[0] << " x " << dims[1] << " x " << dims[2]
            << " nodes needs " << (need >> 20) << " MiB, budget is " << (budget_bytes >> 20)
            << " MiB; largest axis " << axis << " (" << largest << " nodes)";
        throw ResourceError(oss.str(), dims, axis, need, budget_bytes);
    }

    // Print the resolved parameters
    inline void print_summary(const SimulationParams& P, const GridGeometry& geo, real dt, size_t n_steps) {
        std::cout << "\n[Grid] Core: " << geo.Nx << " x " << geo.Ny << " x " << geo.Nz
                  << " cells, npml = " << geo.npml << ", total " << geo.NxT() << " x "
                  << geo.NyT() << " x " << geo.NzT() << " nodes\n";
        std::cout << "[Grid] dx = " << geo.dx * 1e3 << " mm, memory estimate "
                  << (estimate_memory_bytes(geo) >> 20) << " MiB\n";
        std::cout << "[Time] dt = " << UnitConv::s_to_ps(dt) << " ps, steps = " << n_steps
                  << " (" << UnitConv::s_to_ns(dt * real(n_steps)) << " ns)\n";
        std::cout << "[Time] CFL factor S = " << P.cfl_factor << "\n";
        std::cout << "[Source] f0 = " << UnitConv::hz_to_ghz(P.center_frequency) << " GHz, bandwidth "
                  << UnitConv::hz_to_ghz(P.effective_bandwidth()) << " GHz\n";
    }

} // namespace Config

// simulation.hpp - One FDTD run: setup, stepping state machine, results
//
// Uninitialized -> Ready (grid and coefficients built) -> Running ->
// Completed | Diverged | Cancelled. Every configuration and memory check
// happens in initialize() before the first field array is allocated. A
// Diverged or Cancelled run releases its field memory; the probe series
// gathered so far stay readable and are returned marked incomplete.

#pragma once

#include <vector>
#include <memory>
#include <atomic>
#include <optional>
#include <functional>
#include <chrono>
#include <string>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cmath>

#include "global_function.hpp"
#include "omp_config.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "structure_material.hpp"
#include "boundary.hpp"
#include "fdtd_stepper.hpp"
#include "stability_monitor.hpp"
#include "sources/soft_source.hpp"
#include "detectors/point_field_detector.hpp"
#include "detectors/energy_monitor.hpp"
#include "detectors/field_slice.hpp"

enum class RunState { Uninitialized, Ready, Running, Completed, Diverged, Cancelled };

inline const char* run_state_name(RunState s) {
    switch (s) {
    case RunState::Uninitialized: return "Uninitialized";
    case RunState::Ready:         return "Ready";
    case RunState::Running:       return "Running";
    case RunState::Completed:     return "Completed";
    case RunState::Diverged:      return "Diverged";
    case RunState::Cancelled:     return "Cancelled";
    }
    return "Unknown";
}

enum class RunStatus { Completed, Diverged, Cancelled };

inline const char* run_status_name(RunStatus s) {
    switch (s) {
    case RunStatus::Completed: return "Completed";
    case RunStatus::Diverged:  return "Diverged";
    case RunStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// Shared flag observed between steps. Copies refer to the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct RunResult {
    RunStatus status{ RunStatus::Completed };
    size_t steps_completed{};
    size_t steps_planned{};
    real dt{};
    real simulated_time{};
    std::vector<Detectors::ProbeRecord> probes;
    bool complete{ false };                         // false for Diverged and Cancelled runs
    bool stopped_on_decay{ false };
    std::optional<DivergenceInfo> divergence;
    std::optional<Detectors::FieldSlice> snapshot;
    std::vector<real> energy;                       // Empty unless track_energy
    real final_energy{};
    double wall_seconds{};

    const Detectors::ProbeRecord* find_probe(const std::string& name) const {
        for (const auto& p : probes) if (p.name == name) return &p;
        return nullptr;
    }
};

class Simulation;
using StepObserver = std::function<void(size_t, const Simulation&)>;

class Simulation {
public:
    Simulation(Config::SimulationParams P, MaterialGrid grid, GridGeometry geo)
        : P_(std::move(P)), grid_(std::move(grid)), geo_(geo) {}

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // ==================== Setup ====================
    void initialize() {
        require(state_ == RunState::Uninitialized, "initialize");

        if (grid_.nx != geo_.Nx || grid_.ny != geo_.Ny || grid_.nz != geo_.Nz) {
            throw ConfigError("grid", "material grid does not match the planned geometry");
        }
        if (grid_.library.size() == 0) throw ConfigError("grid", "material grid has no materials");

        // ---- Checks before allocation ----
        Config::check_positions(P_, geo_);
        Config::check_memory_budget(geo_, P_.memory_budget_bytes);

        // ---- Time step from the fastest material present ----
        const real v_max = max_wave_speed(grid_);
        dt_ = Config::compute_dt(P_, v_max);
        n_steps_ = Config::step_count(P_, dt_);

        const int threads = fdtd_configure_threads(P_.num_threads);
        if (P_.verbose) {
            Config::print_summary(P_, geo_, dt_, n_steps_);
            std::cout << "[Time] v_max = " << v_max << " m/s, threads = " << threads << "\n";
        }

        // ---- Coefficients and boundary ----
        bake_coefficients(grid_, geo_, dt_, mg_, P_.verbose);

        BoundaryParams bp = P_.bp;
        bp.cpml.npml = int(geo_.npml);
        if (geo_.npml == 0) bp.type = BcType::PEC;
        bc_ = make_boundary(bp, geo_.Nx, geo_.Ny, geo_.Nz, geo_.dx, dt_,
                            PhysConst::EPS0, PhysConst::MU0, PhysConst::C0);
        bc_->bind_material_coeffs(&mg_.bEx, &mg_.bEy, &mg_.bEz, &mg_.bHx, &mg_.bHy, &mg_.bHz);
        if (P_.verbose) std::cout << "[Grid] Boundary: " << bc_->name() << "\n";

        fields_.allocate(geo_.NxT(), geo_.NyT(), geo_.NzT());

        // ---- Source, monitor, probes ----
        source_ = Sources::make_soft_source(P_.source_config(geo_), geo_, P_.verbose);
        monitor_ = std::make_unique<StabilityMonitor>(
            source_->peak_amplitude(), P_.divergence_factor, P_.divergence_check_interval);
        if (P_.verbose) monitor_->print_config();

        probes_.clear();
        for (const auto& spec : P_.probes) {
            Detectors::PointFieldDetectorConfig pc;
            pc.name = spec.name;
            pc.cell = spec.cell;
            pc.component = spec.component;
            probes_.push_back(Detectors::make_point_probe(pc, geo_, dt_, n_steps_, P_.verbose));
        }
        if (P_.track_energy) energy_ = std::make_unique<Detectors::EnergyMonitor>(geo_, mg_, dt_);

        n_ = 0;
        t_ = 0.0;
        probe_peak_ = 0.0;
        stopped_on_decay_ = false;
        state_ = RunState::Ready;
    }

    // ==================== One leapfrog step ====================
    // Returns true while further steps may follow.
    bool step() {
        if (state_ == RunState::Ready) state_ = RunState::Running;
        require(state_ == RunState::Running, "step");

        const size_t NxT = geo_.NxT(), NyT = geo_.NyT(), NzT = geo_.NzT();
        auto& F = fields_;

        // H at t + dt/2
        fdtd_update_H<real>(NxT, NyT, NzT, geo_.inv_dx,
            mg_.aHx.data(), mg_.bHx.data(), mg_.aHy.data(), mg_.bHy.data(),
            mg_.aHz.data(), mg_.bHz.data(),
            F.Ex.data(), F.Ey.data(), F.Ez.data(),
            F.Hx.data(), F.Hy.data(), F.Hz.data());
        bc_->apply_after_H(F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz);

        // E at t + dt
        fdtd_update_E<real>(NxT, NyT, NzT, geo_.inv_dx,
            mg_.aEx.data(), mg_.bEx.data(), mg_.aEy.data(), mg_.bEy.data(),
            mg_.aEz.data(), mg_.bEz.data(),
            F.Ex.data(), F.Ey.data(), F.Ez.data(),
            F.Hx.data(), F.Hy.data(), F.Hz.data());
        bc_->apply_after_E(F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz);

        // Soft source, then conductors
        source_->inject(t_, F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz);
        fdtd_zero_pec_edges(mg_, F.Ex, F.Ey, F.Ez);
        bc_->enforce_walls(F.Ex, F.Ey, F.Ez);

        for (auto& p : probes_) p->record_after_E(n_, dt_, F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz);
        if (energy_) energy_->record_after_E(n_, dt_, F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz);

        if (monitor_->due(n_, n_steps_ - 1) &&
            !monitor_->check_stability(n_, NyT, NzT, F.Ex, F.Ey, F.Ez, F.Hx, F.Hy, F.Hz)) {
            ++n_;
            t_ += dt_;
            finish(RunState::Diverged);
            return false;
        }

        ++n_;
        t_ += dt_;

        if (n_ >= n_steps_) {
            finish(RunState::Completed);
            return false;
        }
        if (decayed()) {
            stopped_on_decay_ = true;
            if (P_.verbose) {
                std::cout << "[Time] Probe '" << probes_.front()->record.name
                          << "' decayed below " << P_.decay_threshold << " of its peak at step " << n_ << "\n";
            }
            finish(RunState::Completed);
            return false;
        }
        return true;
    }

    // ==================== Full run ====================
    RunResult run(const CancellationToken& token = CancellationToken(),
                  const StepObserver& observer = StepObserver())
    {
        require(state_ == RunState::Ready || state_ == RunState::Running, "run");

        const auto t_start = std::chrono::high_resolution_clock::now();
        auto last_monitor_time = t_start;

        if (P_.verbose) {
            std::cout << "\n========================================\n";
            std::cout << "Starting FDTD Time-Stepping\n";
#if FDTD_OMP_ENABLED
            std::cout << "Mode: OpenMP parallelized, " << omp_get_max_threads() << " threads\n";
#else
            std::cout << "Mode: SERIAL\n";
#endif
            std::cout << "========================================\n\n";
        }

        bool more = true;
        while (more) {
            if (token.is_cancelled()) {
                if (P_.verbose) std::cout << "[Time] Cancelled before step " << n_ << "\n";
                finish(RunState::Cancelled);
                break;
            }

            more = step();
            if (observer) observer(n_ - 1, *this);

            if (P_.verbose && more && P_.progress_interval > 0 && n_ % P_.progress_interval == 0) {
                auto current_time = std::chrono::high_resolution_clock::now();
                double elapsed_seconds = std::chrono::duration<double>(current_time - last_monitor_time).count();
                last_monitor_time = current_time;

                real max_E = monitor_->get_max_E(fields_.Ex, fields_.Ey, fields_.Ez);
                // Formatted apart so the caller's stream flags are left alone
                std::ostringstream line;
                line << "step " << n_ << " | max|E| = " << std::scientific << std::setprecision(3) << max_E
                     << " | time = " << std::fixed << std::setprecision(3) << elapsed_seconds << " s";
                std::cout << line.str() << "\n";
            }
        }

        RunResult R = collect_result();
        R.wall_seconds = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t_start).count();

        if (P_.verbose) {
            std::cout << "\n========================================\n";
            std::cout << "Simulation " << run_status_name(R.status) << "\n";
            std::cout << "========================================\n";
            std::cout << "  steps = " << R.steps_completed << " / " << R.steps_planned << "\n";
            std::cout << "  dt = " << UnitConv::s_to_ps(R.dt) << " ps\n";
            std::cout << "  t_total = " << UnitConv::s_to_ns(R.simulated_time) << " ns\n";
            std::ostringstream wall;
            wall << std::fixed << std::setprecision(2) << R.wall_seconds;
            std::cout << "  wall = " << wall.str() << " s\n";
        }
        return R;
    }

    // Results so far; valid in any state after initialize()
    RunResult collect_result() const {
        RunResult R;
        switch (state_) {
        case RunState::Diverged:  R.status = RunStatus::Diverged; break;
        case RunState::Cancelled: R.status = RunStatus::Cancelled; break;
        default:                  R.status = RunStatus::Completed; break;
        }
        R.complete = (state_ == RunState::Completed);
        R.steps_completed = n_;
        R.steps_planned = n_steps_;
        R.dt = dt_;
        R.simulated_time = t_;
        R.stopped_on_decay = stopped_on_decay_;
        R.probes = probe_records();
        if (state_ == RunState::Diverged && monitor_) R.divergence = monitor_->info;
        if (final_snapshot_) R.snapshot = *final_snapshot_;
        if (energy_) {
            R.energy = energy_->energy;
            if (!R.energy.empty()) R.final_energy = R.energy.back();
        }
        return R;
    }

    // ==================== Inspection ====================
    // Slice of the current field state (index along the plane normal, core cells)
    Detectors::FieldSlice snapshot(Detectors::SlicePlane plane, FieldComponent component,
                                   std::optional<size_t> index = std::nullopt) const
    {
        if (!fields_allocated()) {
            throw StateError(std::string("[Simulation] no field state to snapshot in state ") + run_state_name(state_));
        }
        const size_t idx = index ? *index : Detectors::slice_normal_extent(geo_, plane) / 2;
        return Detectors::capture_slice(geo_, plane, component, idx, n_, fields_.component(component));
    }

    // Field value at a core cell
    real field_at(FieldComponent component, const CellIndex& cell) const {
        if (!fields_allocated()) {
            throw StateError(std::string("[Simulation] no field state in state ") + run_state_name(state_));
        }
        if (!geo_.contains_core(cell)) throw ConfigError("cell", "outside the core region");
        return fields_.component(component)[geo_.total_index(cell)];
    }

    std::vector<Detectors::ProbeRecord> probe_records() const {
        std::vector<Detectors::ProbeRecord> out;
        out.reserve(probes_.size());
        for (const auto& p : probes_) out.push_back(p->record);
        return out;
    }

    RunState state() const { return state_; }
    size_t steps_completed() const { return n_; }
    size_t steps_planned() const { return n_steps_; }
    real dt() const { return dt_; }
    real time() const { return t_; }
    real source_end_time() const { return source_ ? source_->end_time() : 0.0; }
    bool fields_allocated() const { return !fields_.Ex.empty(); }
    const GridGeometry& geometry() const { return geo_; }
    const MaterialGrids& coefficients() const { return mg_; }
    const YeeFields& fields() const { return fields_; }
    const Config::SimulationParams& params() const { return P_; }

    // Free field, coefficient and CPML memory (probe series are kept)
    void release() {
        fields_.release();
        mg_.release();
        bc_.reset();
    }

private:
    void require(bool ok, const char* op) const {
        if (!ok) {
            throw StateError(std::string("[Simulation] ") + op + "() not allowed in state " + run_state_name(state_));
        }
    }

    void finish(RunState terminal) {
        state_ = terminal;
        if (terminal == RunState::Completed) {
            if (P_.snapshot.enabled) {
                final_snapshot_ = snapshot(P_.snapshot.plane, P_.snapshot.component, P_.snapshot.index);
            }
        } else {
            release();
        }
    }

    // Free-decay early stop on the first probe after the source has ended
    bool decayed() {
        if (P_.decay_threshold <= 0.0 || probes_.empty()) return false;
        const auto& s = probes_.front()->record.samples;
        if (s.empty()) return false;
        probe_peak_ = std::max(probe_peak_, std::abs(s.back()));

        const size_t W = UserConfig::DECAY_WINDOW_STEPS;
        const real t_end = source_->end_time();
        if (!std::isfinite(t_end) || t_ < t_end + real(W) * dt_ || s.size() < W) return false;
        if (probe_peak_ <= 0.0) return false;

        real window_max = 0.0;
        for (size_t m = s.size() - W; m < s.size(); ++m) window_max = std::max(window_max, std::abs(s[m]));
        return window_max < P_.decay_threshold * probe_peak_;
    }

    Config::SimulationParams P_;
    MaterialGrid grid_;
    GridGeometry geo_;

    RunState state_{ RunState::Uninitialized };
    real dt_{};
    real t_{};
    size_t n_{};
    size_t n_steps_{};
    real probe_peak_{};
    bool stopped_on_decay_{ false };

    MaterialGrids mg_;
    YeeFields fields_;
    std::unique_ptr<IBoundary> bc_;
    std::unique_ptr<Sources::ISource> source_;
    std::unique_ptr<StabilityMonitor> monitor_;
    std::vector<std::unique_ptr<Detectors::PointProbe>> probes_;
    std::unique_ptr<Detectors::EnergyMonitor> energy_;
    std::optional<Detectors::FieldSlice> final_snapshot_;
};

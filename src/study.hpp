// study.hpp - Mesh to resonances: the full study pipeline and its background runner
//
// run_study(): validate -> plan grid -> position and memory checks ->
// voxelize -> simulate -> spectra per probe -> resonances -> optional
// reflection coefficient -> optional export.
//
// StudyRunner owns one worker thread. A new submission supersedes the run in
// flight: it is cancelled and joined before the next one starts.

#pragma once

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <thread>
#include <mutex>
#include <exception>
#include <filesystem>
#include <iostream>
#include <cmath>

#include "global_function.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "mesh_input.hpp"
#include "voxelizer.hpp"
#include "simulation.hpp"
#include "spectral.hpp"
#include "detectors/point_field_detector.hpp"
#include "detectors/energy_monitor.hpp"
#include "detectors/field_slice.hpp"

namespace Study {

namespace fs = std::filesystem;

struct ProbeSpectrum {
    std::string probe;
    Spectral::Spectrum spectrum;
    std::vector<Spectral::Peak> peaks;
};

struct StudyResult {
    GridGeometry geometry;
    VoxelReport voxel_report;
    std::vector<std::string> warnings;
    RunResult run;
    real source_end_time{};
    std::vector<ProbeSpectrum> spectra;             // Empty unless the run completed
    std::vector<Spectral::Peak> resonances;         // From the first probe
    std::optional<Spectral::ReflectionResult> reflection;
    fs::path output_path;                           // Empty when nothing was written

    const ProbeSpectrum* find_spectrum(const std::string& probe) const {
        for (const auto& s : spectra) if (s.probe == probe) return &s;
        return nullptr;
    }
};

// ==================== Spectral analysis of a finished run ====================
inline void analyze(StudyResult& out, const Config::SimulationParams& P) {
    Spectral::SpectrumOptions opt;
    opt.fmin = P.spectrum_fmin;
    opt.fmax = P.spectrum_fmax;

    // Free decay starts once the source has ended
    const real t_free = std::isfinite(out.source_end_time) ? out.source_end_time : 0.0;

    for (const auto& rec : out.run.probes) {
        opt.start_time = t_free;
        const size_t m0 = Spectral::usable_start_index(rec.size(), rec.dt, t_free, rec.time_offset);
        if (rec.size() - m0 < UserConfig::MIN_SPECTRAL_SAMPLES) {
            out.warnings.push_back("probe '" + rec.name + "' has too little free decay, using the full series");
            opt.start_time = 0.0;
        }

        // A series too short even in full gets no spectrum; the run itself is kept
        ProbeSpectrum ps;
        ps.probe = rec.name;
        try {
            ps.spectrum = Spectral::compute_spectrum(rec, opt);
        } catch (const SpectralError& e) {
            out.warnings.push_back("probe '" + rec.name + "' has no spectrum: " + e.what());
            if (P.verbose) std::cout << "[WARNING] " << out.warnings.back() << "\n";
            continue;
        }
        ps.peaks = Spectral::find_peaks(ps.spectrum);
        out.spectra.push_back(std::move(ps));
    }

    if (!out.spectra.empty()) {
        out.resonances = out.spectra.front().peaks;
        if (P.verbose) Spectral::print_peaks(out.spectra.front().probe, out.resonances);
    }

    if (!P.reflection_incident_probe.empty() && !P.reflection_reflected_probe.empty()) {
        const auto* inc = out.run.find_probe(P.reflection_incident_probe);
        const auto* ref = out.run.find_probe(P.reflection_reflected_probe);
        if (!inc || !ref) {
            throw ConfigError("reflection_incident_probe", "reflection probes not recorded");
        }
        Spectral::SpectrumOptions ropt;
        ropt.fmin = P.spectrum_fmin;
        ropt.fmax = P.spectrum_fmax;
        ropt.hann_window = false;
        try {
            out.reflection = Spectral::reflection_coefficient(*inc, *ref, ropt);
        } catch (const SpectralError& e) {
            out.warnings.push_back(std::string("no reflection coefficient: ") + e.what());
            if (P.verbose) std::cout << "[WARNING] " << out.warnings.back() << "\n";
        }
    }
}

// ==================== Export ====================
// Everything lands in <output_dir>/<run_tag>/
inline void export_results(StudyResult& out, const Config::SimulationParams& P) {
    const fs::path dir = fs::path(P.output_dir) / P.run_tag;

    Detectors::write_probe_records(dir, out.run.probes, out.run.steps_completed, out.run.complete);
    if (!out.run.energy.empty()) Detectors::write_energy_csv(dir, out.run.energy, out.run.dt);
    if (out.run.snapshot) Detectors::write_slice(dir, *out.run.snapshot);
    for (const auto& ps : out.spectra) Spectral::write_spectrum_csv(dir, ps.probe, ps.spectrum);
    if (out.reflection) Spectral::write_reflection_csv(dir, *out.reflection);

    out.output_path = dir;
    if (P.verbose) std::cout << "[Study] Output: " << dir.string() << "/\n";
}

// ==================== Pipeline ====================
inline StudyResult run_study(const TriangleMesh& mesh, const MaterialLibrary& library,
                             const Config::SimulationParams& P,
                             const CancellationToken& token = CancellationToken(),
                             const StepObserver& observer = StepObserver())
{
    StudyResult out;

    out.warnings = Config::validate(P);

    out.geometry = plan_grid(mesh, P.cell_size, P.domain_margin, P.npml(), P.length_unit);
    Config::check_positions(P, out.geometry);
    Config::check_memory_budget(out.geometry, P.memory_budget_bytes);

    VoxelizeResult vox = voxelize(mesh, library, out.geometry, P.verbose);
    out.voxel_report = vox.report;
    for (const auto& w : vox.report.warnings) out.warnings.push_back("[Voxelizer] " + w);

    if (P.verbose) {
        for (const auto& w : out.warnings) std::cout << "[WARNING] " << w << "\n";
    }

    Simulation sim(P, std::move(vox.grid), out.geometry);
    sim.initialize();
    out.source_end_time = sim.source_end_time();
    out.run = sim.run(token, observer);

    if (out.run.complete) {
        analyze(out, P);
    } else if (P.verbose) {
        std::cout << "[Study] Run " << run_status_name(out.run.status) << " after "
                  << out.run.steps_completed << " steps; probe data kept, no spectra\n";
    }

    if (!P.output_dir.empty()) export_results(out, P);
    return out;
}

// ==================== Background runner ====================
class StudyRunner {
public:
    StudyRunner() = default;
    StudyRunner(const StudyRunner&) = delete;
    StudyRunner& operator=(const StudyRunner&) = delete;

    ~StudyRunner() { cancel_and_join(); }

    // Start a study; any run still in flight is cancelled and joined first
    void submit(TriangleMesh mesh, MaterialLibrary library, Config::SimulationParams P) {
        cancel_and_join();

        token_ = CancellationToken();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latest_.reset();
            error_ = nullptr;
        }

        worker_ = std::thread([this, mesh = std::move(mesh), library = std::move(library),
                               P = std::move(P), token = token_]() {
            std::shared_ptr<const StudyResult> result;
            std::exception_ptr error;
            try {
                result = std::make_shared<const StudyResult>(run_study(mesh, library, P, token));
            } catch (...) {
                error = std::current_exception();   // rethrown from wait()
            }
            std::lock_guard<std::mutex> lock(mutex_);
            latest_ = std::move(result);
            error_ = error;
        });
    }

    // Block until the current study finishes; rethrows its error if it failed
    std::shared_ptr<const StudyResult> wait() {
        if (worker_.joinable()) worker_.join();
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) std::rethrow_exception(error_);
        return latest_;
    }

    void cancel() { token_.cancel(); }

private:
    void cancel_and_join() {
        if (worker_.joinable()) {
            token_.cancel();
            worker_.join();
        }
    }

    std::thread worker_;
    CancellationToken token_;
    std::mutex mutex_;
    std::shared_ptr<const StudyResult> latest_;
    std::exception_ptr error_;
};

} // namespace Study

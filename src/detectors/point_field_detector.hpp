// point_field_detector.hpp - Point field time series probe

#pragma once

#include "idetector.hpp"
#include <sstream>
#include <memory>

namespace Detectors {

// Time series of one component at one cell. Sample m was taken at
// time_offset + m * dt (E components: offset dt, H components: dt / 2).
struct ProbeRecord {
    std::string name;
    CellIndex cell{};                               // Core cell
    FieldComponent component{FieldComponent::Ez};
    real dt{};
    real time_offset{};
    std::vector<real> samples;

    std::size_t size() const { return samples.size(); }

    std::vector<real> times() const {
        std::vector<real> t(samples.size());
        for (std::size_t m = 0; m < t.size(); ++m) t[m] = time_offset + real(m) * dt;
        return t;
    }
};

struct PointFieldDetectorConfig {
    std::string name = "point_probe";
    CellIndex cell{};                               // Core cell indices
    FieldComponent component = FieldComponent::Ez;
};

struct PointProbe final : public IDetector {
    std::size_t NyT{}, NzT{};
    std::size_t i0{}, j0{}, k0{};                   // Total-grid node
    ProbeRecord record;
    std::string detector_name{"PointProbe"};

    PointProbe() = default;

    void initialize(const PointFieldDetectorConfig& config, const GridGeometry& geo,
                    real dt, std::size_t expected_steps, bool verbose)
    {
        NyT = geo.NyT(); NzT = geo.NzT();
        i0 = config.cell.i + geo.npml;
        j0 = config.cell.j + geo.npml;
        k0 = config.cell.k + geo.npml;

        record.name = config.name;
        record.cell = config.cell;
        record.component = config.component;
        record.dt = dt;
        record.time_offset = is_electric(config.component) ? dt : 0.5 * dt;
        record.samples.clear();
        record.samples.reserve(expected_steps);

        std::ostringstream oss;
        oss << "PointProbe[" << config.name << "," << field_component_name(config.component)
            << "]@(" << config.cell.i << "," << config.cell.j << "," << config.cell.k << ")";
        detector_name = oss.str();

        if (verbose) {
            std::cout << "[Probe] " << detector_name << " -> grid node ("
                      << i0 << ", " << j0 << ", " << k0 << ")\n";
        }
    }

    void record_after_E(std::size_t n, real dt,
        const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
        const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz) override
    {
        (void)n; (void)dt;
        const std::size_t idx = idx3(i0, j0, k0, NyT, NzT);
        record.samples.push_back(sample_component(record.component, idx, Ex, Ey, Ez, Hx, Hy, Hz));
    }

    std::string name() const override { return detector_name; }
};

inline std::unique_ptr<PointProbe> make_point_probe(
    const PointFieldDetectorConfig& config,
    const GridGeometry& geo,
    real dt,
    std::size_t expected_steps = 0,
    bool verbose = true)
{
    auto det = std::make_unique<PointProbe>();
    det->initialize(config, geo, dt, expected_steps, verbose);
    return det;
}

// ==================== Export ====================
// <dir>/<name>_<comp>_ts.bin (float64 samples) for each record, plus
// <dir>/metadata.json describing all of them.
inline void write_probe_records(const fs::path& dir,
                                const std::vector<ProbeRecord>& records,
                                std::size_t steps_completed,
                                bool complete)
{
    create_detector_directory(dir);

    for (const auto& rec : records) {
        const fs::path path = dir / (rec.name + "_" + field_component_name(rec.component) + "_ts.bin");
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) {
            std::cerr << "[ERR] Failed to open " << path << "\n";
            throw IoError("cannot open " + path.string());
        }
        write_f64_series(ofs, rec.samples);
        if (!ofs) throw IoError("write failed: " + path.string());
    }

    const fs::path json_path = dir / "metadata.json";
    std::ofstream ofs(json_path);
    if (!ofs) {
        std::cerr << "[ERR] Failed to open " << json_path << "\n";
        throw IoError("cannot open " + json_path.string());
    }

    ofs << std::setprecision(15);
    ofs << "{\n";
    ofs << "  \"detector_type\": \"PointProbe\",\n";
    ofs << "  \"steps_completed\": " << steps_completed << ",\n";
    ofs << "  \"complete\": " << (complete ? "true" : "false") << ",\n";
    ofs << "  \"dtype\": \"float64\",\n";
    ofs << "  \"probes\": [";
    for (std::size_t p = 0; p < records.size(); ++p) {
        const auto& rec = records[p];
        if (p > 0) ofs << ",";
        ofs << "\n    {\"name\": \"" << rec.name << "\""
            << ", \"component\": \"" << field_component_name(rec.component) << "\""
            << ", \"cell\": [" << rec.cell.i << ", " << rec.cell.j << ", " << rec.cell.k << "]"
            << ", \"dt\": " << std::setprecision(18) << rec.dt
            << ", \"time_offset\": " << rec.time_offset << std::setprecision(15)
            << ", \"samples\": " << rec.samples.size()
            << ", \"file\": \"" << rec.name << "_" << field_component_name(rec.component) << "_ts.bin\"}";
    }
    ofs << "\n  ],\n";
    ofs << "  \"note\": \"time series of field components at single cells\"\n";
    ofs << "}\n";
    if (!ofs) throw IoError("write failed: " + json_path.string());
}

} // namespace Detectors

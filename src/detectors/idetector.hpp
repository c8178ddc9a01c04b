// idetector.hpp - Probe interface and shared output helpers
//
// Probes only read the fields. They are sampled once per step, after the
// source and the conductor edges have been applied, so a sample taken at
// step n holds E at (n+1)dt and H at (n+1/2)dt.

#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <cstddef>
#include <iomanip>

#include "../global_function.hpp"
#include "../errors.hpp"

namespace fs = std::filesystem;

namespace Detectors {

// ==================== Probe interface ====================
struct IDetector {
    virtual ~IDetector() = default;

    virtual void record_after_E(std::size_t n, real dt,
        const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
        const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz) = 0;

    virtual std::string name() const = 0;
};

// ==================== Helpers ====================

// One component of the six field arrays at a flat node index
inline real sample_component(FieldComponent component, std::size_t node,
    const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
    const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz)
{
    const std::vector<real>* src = &Ex;
    switch (component) {
    case FieldComponent::Ex: src = &Ex; break;
    case FieldComponent::Ey: src = &Ey; break;
    case FieldComponent::Ez: src = &Ez; break;
    case FieldComponent::Hx: src = &Hx; break;
    case FieldComponent::Hy: src = &Hy; break;
    case FieldComponent::Hz: src = &Hz; break;
    }
    return (*src)[node];
}

// Raw little-endian float64 series
inline void write_f64_series(std::ofstream& ofs, const std::vector<real>& values) {
    for (real v : values) {
        const double d = static_cast<double>(v);
        ofs.write(reinterpret_cast<const char*>(&d), sizeof(double));
    }
}

inline void create_detector_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[ERR] Cannot create output directory " << dir << ": " << ec.message() << "\n";
        throw IoError("cannot create directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace Detectors

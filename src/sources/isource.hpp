// isource.hpp - Source interface and common definitions
//
// This file defines the base interface for all electromagnetic sources
// in the FDTD simulation.

#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>
#include <memory>
#include <string>

#include "../global_function.hpp"
#include "../user_config.hpp"

namespace Sources {

// ==================== Waveform types ====================
enum class Waveform {
    GaussianPulse,   // A*exp(-((t-t0)/tau)^2)*sin(2*pi*f0*(t-t0))
    ContinuousWave   // A*sin(2*pi*f0*t) with raised-cosine turn-on over tau
};

inline const char* waveform_name(Waveform w) {
    switch (w) {
    case Waveform::GaussianPulse: return "gaussian";
    case Waveform::ContinuousWave: return "cw";
    }
    return "unknown";
}

// ==================== Source interface ====================
struct ISource {
    virtual ~ISource() = default;

    // Add the source contribution at time t into the field arrays (soft source)
    virtual void inject(real t,
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) = 0;

    // Get source name for logging/debugging
    virtual std::string name() const { return "ISource"; }

    // Peak amplitude, the reference for divergence detection
    virtual real peak_amplitude() const = 0;

    // Time after which the source contributes nothing significant (infinity for CW)
    virtual real end_time() const = 0;
};

// ==================== Waveform computation utilities ====================

// Gaussian 1/e half-width from the requested bandwidth. Narrower bandwidth
// gives a proportionally longer pulse.
inline real tau_from_bandwidth(real bandwidth) {
    return 1.0 / (PhysConst::PI * bandwidth);
}

// Compute waveform value at time t
inline real compute_waveform(Waveform type, real t, real A, real f0, real tau, real t0) {
    using std::exp;
    using std::sin;
    const real pi = PhysConst::PI;

    switch (type) {
    case Waveform::GaussianPulse: {
        const real x = (t - t0) / tau;
        return A * exp(-x * x) * sin(2 * pi * f0 * (t - t0));
    }
    case Waveform::ContinuousWave: {
        if (t <= 0) return 0;
        const real envelope = (t < tau) ? (0.5 * (1 - std::cos(pi * t / tau))) : 1.0;
        return A * envelope * sin(2 * pi * f0 * t);
    }
    }
    return 0;
}

// ==================== Source configuration structure ====================
struct SourceConfig {
    real amplitude = UserConfig::SOURCE_AMPLITUDE;   // Peak amplitude (V/m for E, A/m for H)
    real frequency = 0.0;                            // Center frequency (Hz)
    real bandwidth = 0.0;                            // Bandwidth (Hz), 0 means frequency / 2
    Waveform waveform = Waveform::GaussianPulse;
    FieldComponent component = FieldComponent::Ez;

    // Core cell indices
    CellIndex cell{};

    real get_bandwidth() const {
        return bandwidth > 0.0 ? bandwidth : 0.5 * frequency;
    }

    real get_tau() const { return tau_from_bandwidth(get_bandwidth()); }

    real get_t0() const { return UserConfig::SOURCE_T0_TAUS * get_tau(); }

    real get_end_time() const {
        if (waveform == Waveform::ContinuousWave) return std::numeric_limits<real>::infinity();
        return get_t0() + UserConfig::SOURCE_TAIL_TAUS * get_tau();
    }
};

} // namespace Sources

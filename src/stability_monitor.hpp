// stability_monitor.hpp - Numerical stability monitoring for FDTD simulation
//
// Monitors simulation health and detects divergence early:
// - NaN/Inf detection in all six field components
// - Magnitude threshold relative to the strongest source
//
// |E| is bounded by DIVERGENCE_FACTOR * max source amplitude; |H| by the same
// bound divided by Z0. Exceeding either ends the run as Diverged.

#pragma once

#include <vector>
#include <cmath>
#include <iostream>
#include <algorithm>
#include <limits>
#include "global_function.hpp"
#include "user_config.hpp"

// What tripped the monitor (kept with the partial results of a diverged run)
struct DivergenceInfo {
    size_t step{};                              // Step index at which the check failed
    FieldComponent component{FieldComponent::Ex};
    CellIndex cell{};                           // Total-grid node
    real magnitude{};                           // |value| (infinity for NaN/Inf)
    real threshold{};
    bool non_finite{ false };
};

struct StabilityMonitor {
    real max_E_threshold;
    real max_H_threshold;
    size_t check_interval;

    DivergenceInfo info{};                      // Filled when a check fails

    // Thresholds from the strongest source amplitude
    StabilityMonitor(real source_amplitude,
                     real factor = UserConfig::DIVERGENCE_FACTOR,
                     size_t interval = UserConfig::STABILITY_MONITOR_INTERVAL)
        : max_E_threshold(factor * std::max<real>(source_amplitude, 1e-30))
        , max_H_threshold(factor * std::max<real>(source_amplitude, 1e-30) / PhysConst::Z0)
        , check_interval(std::max<size_t>(interval, 1))
    {}

    // Whether step n (0-based) is a check point; the last step is always checked
    bool due(size_t step, size_t last_step) const {
        return ((step + 1) % check_interval == 0) || step == last_step;
    }

    // Full check over the total grid - returns true if the simulation may continue
    bool check_stability(
        size_t step, size_t NyT, size_t NzT,
        const std::vector<real>& Ex, const std::vector<real>& Ey, const std::vector<real>& Ez,
        const std::vector<real>& Hx, const std::vector<real>& Hy, const std::vector<real>& Hz)
    {
        const std::vector<real>* fields[6] = { &Ex, &Ey, &Ez, &Hx, &Hy, &Hz };

        for (int c = 0; c < 6; ++c) {
            const auto fc = FieldComponent(c);
            const std::vector<real>& F = *fields[c];
            const real limit = is_electric(fc) ? max_E_threshold : max_H_threshold;

            size_t arg = 0;
            real peak = 0.0;
            bool bad = false;
            for (size_t n = 0; n < F.size(); ++n) {
                const real v = F[n];
                if (!std::isfinite(v)) { arg = n; bad = true; break; }
                const real a = std::abs(v);
                if (a > peak) { peak = a; arg = n; }
            }

            if (bad || peak > limit) {
                info.step = step;
                info.component = fc;
                info.cell = { arg / (NyT * NzT), (arg / NzT) % NyT, arg % NzT };
                info.magnitude = bad ? std::numeric_limits<real>::infinity() : peak;
                info.threshold = limit;
                info.non_finite = bad;

                std::cerr << "[FATAL] Step " << step << ": "
                          << (bad ? "NaN/Inf detected in " : "divergence in ")
                          << field_component_name(fc) << " at (" << info.cell.i << ", "
                          << info.cell.j << ", " << info.cell.k << ")";
                if (!bad) std::cerr << ": " << peak << " > " << limit;
                std::cerr << "\n";
                return false;
            }
        }

        return true;
    }

    // Get current max E-field for progress reporting
    real get_max_E(const std::vector<real>& Ex,
                   const std::vector<real>& Ey,
                   const std::vector<real>& Ez) const {
        return std::max({NumericUtils::max_abs(Ex),
                        NumericUtils::max_abs(Ey),
                        NumericUtils::max_abs(Ez)});
    }

    // Print configuration
    void print_config() const {
        std::cout << "Stability monitor initialized\n";
        std::cout << "  - E-field threshold: " << max_E_threshold << " V/m\n";
        std::cout << "  - H-field threshold: " << max_H_threshold << " A/m\n";
        std::cout << "  - Check interval: " << check_interval << " steps\n\n";
    }
};

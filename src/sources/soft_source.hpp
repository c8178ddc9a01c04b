// soft_source.hpp - Additive point source
//
// A soft source adds the waveform value into one field component at a single
// grid location every step. It never overwrites the field, so waves
// scattered back to the source cell pass through it undisturbed.
//
// Usage:
//   auto src = Sources::make_soft_source(config, geo);
//   src->inject(t, Ex, Ey, Ez, Hx, Hy, Hz);

#pragma once

#include "isource.hpp"
#include <iostream>
#include <sstream>

namespace Sources {

// ==================== Soft Source ====================
struct SoftSource final : public ISource {
    // Total-grid indices and dimensions
    std::size_t i{}, j{}, k{};
    std::size_t NyT{}, NzT{};

    // Source parameters
    real A{};             // Peak amplitude
    real f0{};            // Carrier frequency (Hz)
    real tau{};           // Gaussian time constant (s)
    real t0{};            // Pulse center time (s)
    real t_end{};         // Negligible amplitude beyond this time (s)
    Waveform waveform{Waveform::GaussianPulse};
    FieldComponent component{FieldComponent::Ez};

    std::string source_name{"SoftSource"};

    SoftSource() = default;

    SoftSource(std::size_t ii, std::size_t jj, std::size_t kk,
               std::size_t NyTot, std::size_t NzTot,
               real A_, real f0_, real tau_, real t0_, real t_end_,
               Waveform wf = Waveform::GaussianPulse,
               FieldComponent fc = FieldComponent::Ez)
        : i(ii), j(jj), k(kk), NyT(NyTot), NzT(NzTot),
          A(A_), f0(f0_), tau(tau_), t0(t0_), t_end(t_end_),
          waveform(wf), component(fc)
    {
        std::ostringstream oss;
        oss << "SoftSource[" << field_component_name(component) << "]@(" << i << "," << j << "," << k << ")";
        source_name = oss.str();
    }

    inline real waveform_value(real t) const {
        return compute_waveform(waveform, t, A, f0, tau, t0);
    }

    void inject(real t,
                std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
                std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override
    {
        const std::size_t id = idx3(i, j, k, NyT, NzT);
        const real v = waveform_value(t);

        switch (component) {
        case FieldComponent::Ex: Ex[id] += v; break;
        case FieldComponent::Ey: Ey[id] += v; break;
        case FieldComponent::Ez: Ez[id] += v; break;
        case FieldComponent::Hx: Hx[id] += v; break;
        case FieldComponent::Hy: Hy[id] += v; break;
        case FieldComponent::Hz: Hz[id] += v; break;
        }
    }

    std::string name() const override { return source_name; }
    real peak_amplitude() const override { return std::abs(A); }
    real end_time() const override { return t_end; }
};

// ==================== Factory function ====================
// Create a soft source at a core cell. The cell must already have been
// validated against the grid (Config::check_positions).
inline std::unique_ptr<ISource> make_soft_source(
    const SourceConfig& config,
    const GridGeometry& geo,
    bool verbose = true)
{
    const std::size_t i = config.cell.i + geo.npml;
    const std::size_t j = config.cell.j + geo.npml;
    const std::size_t k = config.cell.k + geo.npml;

    const real tau = config.get_tau();
    const real t0 = (config.waveform == Waveform::GaussianPulse) ? config.get_t0() : 0.0;

    auto src = std::make_unique<SoftSource>(
        i, j, k, geo.NyT(), geo.NzT(),
        config.amplitude, config.frequency, tau, t0, config.get_end_time(),
        config.waveform, config.component
    );

    if (verbose) {
        std::cout << "[Source] Created " << src->name() << ":\n";
        std::cout << "  Core cell: (" << config.cell.i << ", " << config.cell.j << ", " << config.cell.k << ")\n";
        std::cout << "  Amplitude: " << config.amplitude << "\n";
        std::cout << "  Frequency: " << UnitConv::hz_to_ghz(config.frequency) << " GHz, bandwidth "
                  << UnitConv::hz_to_ghz(config.get_bandwidth()) << " GHz\n";
        std::cout << "  Waveform: " << waveform_name(config.waveform) << "\n";
        std::cout << "  t0: " << UnitConv::s_to_ps(t0) << " ps, tau: " << UnitConv::s_to_ps(tau) << " ps\n";
    }

    return src;
}

} // namespace Sources

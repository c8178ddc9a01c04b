// spectral.hpp - Resonance and reflection extraction from probe time series
//
// Pipeline: usable window (samples at or after start_time) -> optional Hann
// window -> zero padding to a power of two -> radix-2 FFT -> one-sided
// spectrum on 0..Nyquist. Peaks are local maxima of the magnitude inside the
// [fmin, fmax] band.

#pragma once

#include <vector>
#include <complex>
#include <cmath>
#include <algorithm>
#include <string>
#include <sstream>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <filesystem>

#include "global_function.hpp"
#include "user_config.hpp"
#include "errors.hpp"
#include "detectors/point_field_detector.hpp"

namespace Spectral {

using cplx = std::complex<real>;

struct SpectrumOptions {
    real start_time = 0.0;       // Samples before this time are discarded (s)
    real fmin = 0.0;             // Band of interest (Hz)
    real fmax = 0.0;             // 0 = Nyquist
    bool hann_window = true;
    size_t zero_pad_factor = UserConfig::ZERO_PAD_FACTOR;
};

struct Spectrum {
    std::vector<real> frequency;     // Hz, 0..Nyquist
    std::vector<real> magnitude;     // |X(f)| * dt
    std::vector<real> phase;         // rad
    real df{};
    real nyquist{};
    size_t fft_size{};
    size_t samples_used{};
    size_t band_lo{}, band_hi{};     // Inclusive bin range of [fmin, fmax]

    size_t size() const { return frequency.size(); }
};

struct Peak {
    real frequency{};    // Hz (parabolic sub-bin refinement)
    real magnitude{};
    real q_factor{};     // f / half-power width (0 when the width is unresolved)
    size_t bin{};
};

struct ReflectionResult {
    std::vector<real> frequency;
    std::vector<real> magnitude;     // |R / I|
    std::vector<real> phase;         // arg(R / I), rad
    std::vector<real> magnitude_db;  // 20 log10 |R / I|
    size_t band_lo{}, band_hi{};
};

// ==================== FFT ====================

// In-place iterative radix-2 FFT (size must be a power of two)
inline void fft_inplace(std::vector<cplx>& a) {
    const size_t n = a.size();
    if (n < 2) return;

    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(a[i], a[j]);
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        const real ang = -2.0 * PhysConst::PI / real(len);
        const cplx wlen(std::cos(ang), std::sin(ang));
        for (size_t i = 0; i < n; i += len) {
            cplx w(1.0, 0.0);
            for (size_t k = 0; k < len / 2; ++k) {
                const cplx u = a[i + k];
                const cplx v = a[i + k + len / 2] * w;
                a[i + k] = u + v;
                a[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

// Index of the first sample taken at or after start_time
inline size_t usable_start_index(size_t n_samples, real dt, real start_time, real time_offset) {
    if (start_time <= time_offset) return 0;
    const real m = std::ceil((start_time - time_offset) / dt - 1e-9);
    return std::min(n_samples, size_t(m));
}

inline void band_bins(real df, size_t n_bins, real fmin, real fmax, size_t& lo, size_t& hi) {
    const real nyq = df * real(n_bins - 1);
    const real f1 = (fmax > 0.0) ? std::min(fmax, nyq) : nyq;
    const real f0 = std::clamp<real>(fmin, 0.0, f1);
    lo = size_t(std::ceil(f0 / df - 1e-9));
    hi = std::min(n_bins - 1, size_t(std::floor(f1 / df + 1e-9)));
    if (lo > hi) lo = hi;
}

// Windowed, zero-padded complex one-sided spectrum (bins 0..N/2)
inline std::vector<cplx> one_sided_transform(const real* x, size_t count, real dt,
                                             bool hann, size_t pad_factor, size_t& fft_size)
{
    fft_size = NumericUtils::next_pow2(std::max<size_t>(count * std::max<size_t>(pad_factor, 1), 2));
    std::vector<cplx> buf(fft_size, cplx(0.0, 0.0));
    for (size_t m = 0; m < count; ++m) {
        real w = 1.0;
        if (hann && count > 1) {
            w = 0.5 * (1.0 - std::cos(2.0 * PhysConst::PI * real(m) / real(count - 1)));
        }
        buf[m] = cplx(x[m] * w, 0.0);
    }
    fft_inplace(buf);
    buf.resize(fft_size / 2 + 1);
    for (auto& v : buf) v *= dt;
    return buf;
}

// ==================== Spectrum ====================

inline Spectrum compute_spectrum(const std::vector<real>& samples, real dt,
                                 const SpectrumOptions& opt = {}, real time_offset = 0.0)
{
    if (!(dt > 0.0)) throw SpectralError("time step must be positive");

    const size_t m0 = usable_start_index(samples.size(), dt, opt.start_time, time_offset);
    const size_t count = samples.size() - m0;
    if (count < UserConfig::MIN_SPECTRAL_SAMPLES) {
        std::ostringstream oss;
        oss << "only " << count << " usable samples (need " << UserConfig::MIN_SPECTRAL_SAMPLES << ")";
        throw SpectralError(oss.str());
    }

    Spectrum s;
    s.samples_used = count;
    const auto X = one_sided_transform(samples.data() + m0, count, dt,
                                       opt.hann_window, opt.zero_pad_factor, s.fft_size);

    s.df = 1.0 / (real(s.fft_size) * dt);
    s.nyquist = 0.5 / dt;
    const size_t nb = X.size();
    s.frequency.resize(nb);
    s.magnitude.resize(nb);
    s.phase.resize(nb);
    for (size_t k = 0; k < nb; ++k) {
        s.frequency[k] = real(k) * s.df;
        s.magnitude[k] = std::abs(X[k]);
        s.phase[k] = std::arg(X[k]);
    }
    band_bins(s.df, nb, opt.fmin, opt.fmax, s.band_lo, s.band_hi);
    return s;
}

inline Spectrum compute_spectrum(const Detectors::ProbeRecord& rec, const SpectrumOptions& opt = {}) {
    return compute_spectrum(rec.samples, rec.dt, opt, rec.time_offset);
}

// ==================== Peaks ====================

// Local maxima inside the band above threshold_fraction * band maximum,
// strongest first
inline std::vector<Peak> find_peaks(const Spectrum& s,
                                    real threshold_fraction = UserConfig::PEAK_THRESHOLD_FRACTION)
{
    std::vector<Peak> peaks;
    if (s.size() < 3) return peaks;

    real band_max = 0.0;
    for (size_t k = s.band_lo; k <= s.band_hi; ++k) band_max = std::max(band_max, s.magnitude[k]);
    if (band_max <= 0.0) return peaks;
    const real threshold = threshold_fraction * band_max;
    const auto& mag = s.magnitude;

    const size_t k_lo = std::max<size_t>(s.band_lo, 1);
    const size_t k_hi = std::min(s.band_hi, s.size() - 2);
    for (size_t k = k_lo; k <= k_hi; ++k) {
        if (!(mag[k] > mag[k - 1] && mag[k] >= mag[k + 1] && mag[k] > threshold)) continue;

        // Parabolic refinement on log magnitude (exact for a Gaussian-shaped peak)
        real delta = 0.0;
        real peak_mag = mag[k];
        if (mag[k - 1] > 0.0 && mag[k + 1] > 0.0) {
            const real a = std::log(mag[k - 1]), b = std::log(mag[k]), c = std::log(mag[k + 1]);
            const real den = a - 2.0 * b + c;
            if (den < 0.0) {
                delta = std::clamp<real>(0.5 * (a - c) / den, -0.5, 0.5);
                peak_mag = std::exp(b - 0.25 * (a - c) * delta);
            }
        }

        // Half-power crossings, linearly interpolated between bins
        const real half = peak_mag / std::sqrt(2.0);
        size_t lo = k, hi = k;
        while (lo > 0 && mag[lo] > half) --lo;
        while (hi + 1 < s.size() && mag[hi] > half) ++hi;
        real q = 0.0;
        if (mag[lo] <= half && mag[hi] <= half) {
            const real f_lo = s.frequency[lo] + s.df * NumericUtils::safe_div(half - mag[lo], mag[lo + 1] - mag[lo]);
            const real f_hi = s.frequency[hi] - s.df * NumericUtils::safe_div(half - mag[hi], mag[hi - 1] - mag[hi]);
            const real width = f_hi - f_lo;
            if (width > 0.0) q = (real(k) + delta) * s.df / width;
        }

        Peak p;
        p.frequency = (real(k) + delta) * s.df;
        p.magnitude = peak_mag;
        p.q_factor = q;
        p.bin = k;
        peaks.push_back(p);
    }

    std::sort(peaks.begin(), peaks.end(),
              [](const Peak& x, const Peak& y) { return x.magnitude > y.magnitude; });
    return peaks;
}

// Strongest local maximum inside the band, or the band maximum when none qualifies
inline Peak global_peak(const Spectrum& s) {
    const auto peaks = find_peaks(s, 0.0);
    if (!peaks.empty()) return peaks.front();
    Peak p;
    for (size_t k = s.band_lo; k <= s.band_hi && k < s.size(); ++k) {
        if (s.magnitude[k] > p.magnitude) {
            p.magnitude = s.magnitude[k];
            p.frequency = s.frequency[k];
            p.bin = k;
        }
    }
    return p;
}

// ==================== Reflection coefficient ====================

// Both series must share dt, length and start time.
inline void check_alignment(size_t n_inc, real dt_inc, real t0_inc,
                            size_t n_ref, real dt_ref, real t0_ref)
{
    if (std::abs(dt_inc - dt_ref) > 1e-9 * std::max(std::abs(dt_inc), std::abs(dt_ref))) {
        std::ostringstream oss;
        oss << "time steps differ (" << dt_inc << " vs " << dt_ref << ")";
        throw SpectralError(oss.str());
    }
    if (n_inc != n_ref) {
        std::ostringstream oss;
        oss << "series lengths differ (" << n_inc << " vs " << n_ref << ")";
        throw SpectralError(oss.str());
    }
    if (std::abs(t0_inc - t0_ref) > 1e-6 * dt_inc) {
        std::ostringstream oss;
        oss << "start times differ (" << t0_inc << " vs " << t0_ref << " s)";
        throw SpectralError(oss.str());
    }
}

inline ReflectionResult reflection_coefficient(
    const std::vector<real>& incident, real dt_inc, real t0_inc,
    const std::vector<real>& reflected, real dt_ref, real t0_ref,
    const SpectrumOptions& opt = {})
{
    check_alignment(incident.size(), dt_inc, t0_inc, reflected.size(), dt_ref, t0_ref);
    if (!(dt_inc > 0.0)) throw SpectralError("time step must be positive");

    const size_t m0 = usable_start_index(incident.size(), dt_inc, opt.start_time, t0_inc);
    const size_t count = incident.size() - m0;
    if (count < UserConfig::MIN_SPECTRAL_SAMPLES) {
        throw SpectralError("too few usable samples for a reflection coefficient");
    }

    size_t n_fft = 0;
    const auto I = one_sided_transform(incident.data() + m0, count, dt_inc,
                                       opt.hann_window, opt.zero_pad_factor, n_fft);
    const auto R = one_sided_transform(reflected.data() + m0, count, dt_inc,
                                       opt.hann_window, opt.zero_pad_factor, n_fft);

    real inc_max = 0.0;
    for (const auto& v : I) inc_max = std::max(inc_max, std::abs(v));
    const real floor = UserConfig::REFLECTION_FLOOR * inc_max;

    ReflectionResult out;
    const size_t nb = I.size();
    const real df = 1.0 / (real(n_fft) * dt_inc);
    out.frequency.resize(nb);
    out.magnitude.assign(nb, 0.0);
    out.phase.assign(nb, 0.0);
    out.magnitude_db.resize(nb);
    for (size_t k = 0; k < nb; ++k) {
        out.frequency[k] = real(k) * df;
        if (std::abs(I[k]) > floor && floor > 0.0) {
            const cplx g = R[k] / I[k];
            out.magnitude[k] = std::abs(g);
            out.phase[k] = std::arg(g);
        }
        out.magnitude_db[k] = 20.0 * std::log10(std::max<real>(out.magnitude[k], 1e-10));
    }
    band_bins(df, nb, opt.fmin, opt.fmax, out.band_lo, out.band_hi);
    return out;
}

inline ReflectionResult reflection_coefficient(const Detectors::ProbeRecord& incident,
                                               const Detectors::ProbeRecord& reflected,
                                               const SpectrumOptions& opt = {})
{
    return reflection_coefficient(incident.samples, incident.dt, incident.time_offset,
                                  reflected.samples, reflected.dt, reflected.time_offset, opt);
}

// Console summary of the strongest resonances
inline void print_peaks(const std::string& label, const std::vector<Peak>& peaks, size_t max_count = 5) {
    std::cout << "[Spectral] " << label << ": " << peaks.size() << " resonance(s)\n";
    for (size_t n = 0; n < peaks.size() && n < max_count; ++n) {
        std::cout << "  f = " << UnitConv::hz_to_ghz(peaks[n].frequency) << " GHz"
                  << "  |X| = " << peaks[n].magnitude
                  << "  Q = " << peaks[n].q_factor << "\n";
    }
}

// ==================== Export ====================

// <dir>/<name>_spectrum.csv: frequency, magnitude, phase
inline void write_spectrum_csv(const std::filesystem::path& dir, const std::string& name, const Spectrum& s) {
    Detectors::create_detector_directory(dir);
    const auto path = dir / (name + "_spectrum.csv");
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[ERR] open " << path << " failed.\n";
        throw IoError("cannot open " + path.string());
    }
    ofs << "f_Hz, magnitude, phase_rad\n";
    ofs << std::setprecision(12);
    for (size_t k = 0; k < s.size(); ++k) {
        ofs << s.frequency[k] << "," << s.magnitude[k] << "," << s.phase[k] << "\n";
    }
    if (!ofs) throw IoError("write failed: " + path.string());
}

// <dir>/reflection.csv: frequency, |S11|, S11 in dB, phase
inline void write_reflection_csv(const std::filesystem::path& dir, const ReflectionResult& r) {
    Detectors::create_detector_directory(dir);
    const auto path = dir / "reflection.csv";
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[ERR] open " << path << " failed.\n";
        throw IoError("cannot open " + path.string());
    }
    ofs << "f_Hz, magnitude, magnitude_dB, phase_rad\n";
    ofs << std::setprecision(12);
    for (size_t k = r.band_lo; k <= r.band_hi && k < r.frequency.size(); ++k) {
        ofs << r.frequency[k] << "," << r.magnitude[k] << "," << r.magnitude_db[k] << "," << r.phase[k] << "\n";
    }
    if (!ofs) throw IoError("write failed: " + path.string());
}

} // namespace Spectral

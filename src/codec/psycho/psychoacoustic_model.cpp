#include "psychoacoustic_model.hpp"
#include <algorithm>
#include <cmath>
#include "utils/logger.hpp"

namespace Spectral {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kBarkHz = 600.0;
constexpr double kBarkDivisor = 7.0;
constexpr double kUpwardSlopeDb = 25.0;   // per Bark, masker below maskee
constexpr double kDownwardSlopeDb = 15.0; // per Bark, masker above maskee
constexpr double kTonalMaskingOffset = 14.5;
constexpr double kAthReference = 0.001;
constexpr float kMagnitudeEps = 1e-10f;

double bark_to_hz(double bark) {
    return kBarkHz * std::sinh(bark / kBarkDivisor);
}

double hz_to_bark(double hz) {
    return kBarkDivisor * std::asinh(hz / kBarkHz);
}

double wrap_phase(double p) {
    p = std::fmod(p + kPi, 2.0 * kPi);
    if (p < 0.0) p += 2.0 * kPi;
    return p - kPi;
}
}

PsychoacousticModel::PsychoacousticModel(uint32_t sample_rate, uint32_t frame_size)
    : sample_rate(sample_rate),
      frame_size(frame_size),
      bins(frame_size / 2) {
    this->build_bands();
    this->build_spreading();
    this->build_absolute_threshold();
    this->reset();
}

void PsychoacousticModel::reset() {
    this->prev_magnitude.assign(this->bins, 0.0f);
    this->prev_phase.assign(this->bins, 0.0f);
    this->tonality.assign(this->bins, 0.0f);
}

void PsychoacousticModel::build_bands() {
    this->critical_bands.clear();
    if (this->bins == 0) return;

    const double nyquist = static_cast<double>(this->sample_rate) / 2.0;
    const double bin_hz = nyquist / static_cast<double>(this->bins);

    for (int i = 0; i < MAX_CRITICAL_BANDS; ++i) {
        const double freq = bark_to_hz(static_cast<double>(i));
        if (freq > nyquist) break;

        const double next_freq = (i + 1 < MAX_CRITICAL_BANDS)
            ? bark_to_hz(static_cast<double>(i + 1))
            : nyquist;
        const size_t start = static_cast<size_t>(std::lround(freq / bin_hz));
        const size_t end = std::min(static_cast<size_t>(std::lround(next_freq / bin_hz)), this->bins);
        if (start < end) {
            this->critical_bands.push_back({start, end, static_cast<float>(freq)});
        }
    }
}

void PsychoacousticModel::build_spreading() {
    const size_t n = this->critical_bands.size();
    this->spread.assign(n * n, 0.0f);
    for (size_t masker = 0; masker < n; ++masker) {
        const double masker_bark = hz_to_bark(this->critical_bands[masker].center_freq);
        for (size_t maskee = 0; maskee < n; ++maskee) {
            const double dz = hz_to_bark(this->critical_bands[maskee].center_freq) - masker_bark;
            const double db = (dz >= 0.0) ? -kUpwardSlopeDb * dz : kDownwardSlopeDb * dz;
            this->spread[masker * n + maskee] = static_cast<float>(std::pow(10.0, db / 10.0));
        }
    }
}

void PsychoacousticModel::build_absolute_threshold() {
    this->ath.assign(this->bins, 0.0f);
    if (this->bins == 0) return;

    const double bin_hz = (static_cast<double>(this->sample_rate) / 2.0) / static_cast<double>(this->bins);
    for (size_t i = 0; i < this->bins; ++i) {
        // bin centre, never DC, so the low-frequency branch stays finite
        const double freq = (static_cast<double>(i) + 0.5) * bin_hz;
        const double db = absolute_threshold_db(freq);
        this->ath[i] = static_cast<float>(std::pow(10.0, db / 20.0) * kAthReference);
    }
}

double PsychoacousticModel::absolute_threshold_db(double freq_hz) {
    const double khz = freq_hz / 1000.0;
    if (khz < 1.0) {
        const double d = khz - 3.3;
        return 3.64 * std::pow(khz, -0.8) - 6.5 * std::exp(-0.6 * d * d);
    }
    return -3.0 + 0.6 * std::log(khz);
}

float PsychoacousticModel::spreading(size_t masker, size_t maskee) const {
    const size_t n = this->critical_bands.size();
    if (masker >= n || maskee >= n) return 0.0f;
    return this->spread[masker * n + maskee];
}

std::vector<float> PsychoacousticModel::analyze(const std::vector<float>& spectrum_real,
                                                const std::vector<float>& spectrum_imag) {
    const size_t n = spectrum_real.size();
    if (n != this->bins) {
        // geometry changed under us; history no longer lines up
        this->bins = n;
        this->build_absolute_threshold();
        this->reset();
    }

    std::vector<float> magnitude(n);
    std::vector<float> phase(n);
    for (size_t i = 0; i < n; ++i) {
        const float re = spectrum_real[i];
        const float im = (i < spectrum_imag.size()) ? spectrum_imag[i] : 0.0f;
        magnitude[i] = std::sqrt(re * re + im * im);
        phase[i] = std::atan2(im, re);
    }

    this->calculate_tonality(magnitude, phase);

    std::vector<float> thresholds(n, 0.0f);
    this->calculate_masking(magnitude, thresholds);

    for (size_t i = 0; i < n; ++i) {
        thresholds[i] = std::max(thresholds[i], this->ath[i]);
    }

    this->prev_magnitude.swap(magnitude);
    this->prev_phase.swap(phase);

    return thresholds;
}

void PsychoacousticModel::calculate_tonality(const std::vector<float>& magnitude,
                                             const std::vector<float>& phase) {
    const size_t n = magnitude.size();
    this->tonality.assign(n, 0.0f);
    // edge bins have no neighbour pair and stay at 0
    for (size_t i = 1; i + 1 < n; ++i) {
        const double mag_pred = 2.0 * this->prev_magnitude[i] - this->prev_magnitude[i - 1];
        const double mag_err = std::fabs(magnitude[i] - mag_pred);

        const double phase_pred = 2.0 * this->prev_phase[i] - this->prev_phase[i - 1];
        const double phase_err = std::fabs(wrap_phase(phase[i] - phase_pred));

        const double err = mag_err / (magnitude[i] + kMagnitudeEps) + phase_err / kPi;
        const double t = 1.0 - std::min(err, 1.0);
        this->tonality[i] = static_cast<float>(std::max(t, 0.0));
    }
}

void PsychoacousticModel::calculate_masking(const std::vector<float>& magnitude,
                                            std::vector<float>& thresholds) const {
    const size_t nb = this->critical_bands.size();
    std::vector<double> band_energy(nb, 0.0);
    std::vector<double> band_tonality(nb, 0.0);

    for (size_t b = 0; b < nb; ++b) {
        const CriticalBand& band = this->critical_bands[b];
        const size_t end = std::min(band.end_bin, magnitude.size());
        double energy = 0.0;
        double tone = 0.0;
        size_t count = 0;
        for (size_t bin = band.start_bin; bin < end; ++bin) {
            energy += static_cast<double>(magnitude[bin]) * magnitude[bin];
            tone += this->tonality[bin];
            ++count;
        }
        band_energy[b] = energy;
        band_tonality[b] = (count > 0) ? tone / static_cast<double>(count) : 0.0;
    }

    for (size_t b = 0; b < nb; ++b) {
        double masked = 0.0;
        for (size_t m = 0; m < nb; ++m) {
            masked += band_energy[m] * this->spread[m * nb + b];
        }

        const double tone_factor = 1.0 + kTonalMaskingOffset * band_tonality[b];
        const float threshold = static_cast<float>(std::sqrt(masked / tone_factor));

        const CriticalBand& band = this->critical_bands[b];
        const size_t end = std::min(band.end_bin, thresholds.size());
        for (size_t bin = band.start_bin; bin < end; ++bin) {
            thresholds[bin] = threshold;
        }
    }

    LDE_TRACE_LOG("[psy] bands=" << nb << " bins=" << magnitude.size() << "\n");
}

} // namespace Spectral

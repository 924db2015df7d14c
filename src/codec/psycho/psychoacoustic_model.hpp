#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Spectral {

constexpr int MAX_CRITICAL_BANDS = 24;

struct CriticalBand {
    size_t start_bin;
    size_t end_bin; // exclusive
    float center_freq;
};

// Masking-threshold estimator. Holds the previous frame's magnitude/phase
// for the tonality predictor, so one instance belongs to exactly one channel
// of one stream.
class PsychoacousticModel {
public:
    PsychoacousticModel(uint32_t sample_rate, uint32_t frame_size);

    // Returns one strictly positive threshold per bin. spectrum_imag may be
    // shorter than spectrum_real; missing entries count as zero.
    std::vector<float> analyze(const std::vector<float>& spectrum_real,
                               const std::vector<float>& spectrum_imag);

    void reset();

    const std::vector<CriticalBand>& bands() const { return this->critical_bands; }
    size_t band_count() const { return this->critical_bands.size(); }
    // Linear power gain from masker band to maskee band.
    float spreading(size_t masker, size_t maskee) const;
    const std::vector<float>& last_tonality() const { return this->tonality; }

    // dB SPL, two-piece approximation split at 1 kHz.
    static double absolute_threshold_db(double freq_hz);

private:
    uint32_t sample_rate;
    uint32_t frame_size;
    size_t bins;
    std::vector<CriticalBand> critical_bands;
    std::vector<float> spread; // masker-major

    std::vector<float> prev_magnitude;
    std::vector<float> prev_phase;
    std::vector<float> tonality;
    std::vector<float> ath; // linear floor per bin

    void build_bands();
    void build_spreading();
    void build_absolute_threshold();

    void calculate_tonality(const std::vector<float>& magnitude,
                            const std::vector<float>& phase);
    void calculate_masking(const std::vector<float>& magnitude,
                           std::vector<float>& thresholds) const;
};

} // namespace Spectral

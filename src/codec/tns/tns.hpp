#pragma once
#include <vector>
#include "codec/lpc/lpc.hpp"

namespace Spectral {

constexpr int TNS_DEFAULT_ORDER = 4;
constexpr int TNS_MAX_ORDER = LPC::MAX_ORDER;

// Prediction filter run across frequency. Coefficients are derived from the
// current spectrum on every call; nothing carries over between frames.
class TemporalNoiseShaping {
public:
    explicit TemporalNoiseShaping(int order = TNS_DEFAULT_ORDER, bool enabled = true);

    void apply(std::vector<float>& coeffs);

    void set_enabled(bool enabled);
    bool is_enabled() const;
    int get_order() const;

    // Coefficients used by the most recent apply(), all zero when the
    // spectrum was silent or the filter did not run.
    const std::vector<double>& get_filter_coeffs() const;

private:
    LPC lpc;
    bool enabled;
    std::vector<double> filter_coeffs;
};

} // namespace Spectral

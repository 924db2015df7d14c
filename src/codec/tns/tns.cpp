#include "tns.hpp"
#include "utils/logger.hpp"

namespace Spectral {

TemporalNoiseShaping::TemporalNoiseShaping(int order, bool enabled)
    : lpc(order),
      enabled(enabled),
      filter_coeffs(static_cast<size_t>(lpc.get_order()), 0.0) {}

void TemporalNoiseShaping::set_enabled(bool enabled) {
    this->enabled = enabled;
}

bool TemporalNoiseShaping::is_enabled() const {
    return this->enabled;
}

int TemporalNoiseShaping::get_order() const {
    return this->lpc.get_order();
}

const std::vector<double>& TemporalNoiseShaping::get_filter_coeffs() const {
    return this->filter_coeffs;
}

void TemporalNoiseShaping::apply(std::vector<float>& coeffs) {
    this->filter_coeffs.assign(static_cast<size_t>(this->lpc.get_order()), 0.0);

    const size_t order = static_cast<size_t>(this->lpc.get_order());
    if (!this->enabled || order == 0 || coeffs.size() < order) {
        return;
    }

    int used_order = 0;
    double gain = 1.0;
    if (!this->lpc.analyze(coeffs, this->filter_coeffs, &used_order, &gain)) {
        return;
    }
    LDE_TRACE_LOG("[tns] order=" << used_order << " gain=" << gain << "\n");

    // in place: bins before i have already been filtered
    for (size_t i = order; i < coeffs.size(); ++i) {
        double prediction = 0.0;
        for (size_t j = 0; j < order; ++j) {
            prediction += this->filter_coeffs[j] * static_cast<double>(coeffs[i - j - 1]);
        }
        coeffs[i] = static_cast<float>(static_cast<double>(coeffs[i]) - prediction);
    }
}

} // namespace Spectral

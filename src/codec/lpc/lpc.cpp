#include "lpc.hpp"
#include <algorithm>

LPC::LPC(int order)
    : order(std::max(0, std::min(order, MAX_ORDER)))
{
}

int LPC::get_order() const {
    return this->order;
}

void LPC::autocorrelation(const std::vector<float>& signal,
                          int lags,
                          std::vector<double>& R) const {
    const size_t N = signal.size();
    R.assign(static_cast<size_t>(lags) + 1, 0.0);
    for (int k = 0; k <= lags; ++k) {
        double sum = 0.0;
        for (size_t n = static_cast<size_t>(k); n < N; ++n) {
            sum += static_cast<double>(signal[n]) *
                   static_cast<double>(signal[n - k]);
        }
        R[k] = sum;
    }
}

int LPC::levinson_durbin(const std::vector<double>& R,
                         int lags,
                         std::vector<double>& a,
                         double* residual_energy) const {
    a.assign(static_cast<size_t>(lags), 0.0);
    std::vector<double> prev(static_cast<size_t>(lags), 0.0);

    double E = R[0];
    int reached = 0;
    for (int i = 0; i < lags; ++i) {
        double acc = R[i + 1];
        for (int j = 0; j < i; ++j) {
            acc += prev[j] * R[i - j];
        }

        const double k = -acc / E;
        a[i] = k;
        for (int j = 0; j < i; ++j) {
            a[j] = prev[j] + k * prev[i - 1 - j];
        }
        for (int j = 0; j <= i; ++j) {
            prev[j] = a[j];
        }

        E *= (1.0 - k * k);
        reached = i + 1;
        if (E <= 0.0) break;
    }

    if (residual_energy) *residual_energy = E;
    return reached;
}

bool LPC::analyze(const std::vector<float>& signal,
                  std::vector<double>& coeffs,
                  int* used_order,
                  double* prediction_gain) const {
    int lags = this->order;
    if (!signal.empty() && static_cast<size_t>(lags) > signal.size() - 1) {
        lags = static_cast<int>(signal.size() - 1);
    }

    coeffs.assign(static_cast<size_t>(this->order), 0.0);
    if (used_order) *used_order = 0;
    if (prediction_gain) *prediction_gain = 1.0;
    if (signal.empty() || lags <= 0) return false;

    std::vector<double> R;
    this->autocorrelation(signal, lags, R);
    if (R[0] == 0.0) return false;

    std::vector<double> a;
    double E = R[0];
    const int reached = this->levinson_durbin(R, lags, a, &E);
    for (int i = 0; i < lags; ++i) {
        coeffs[i] = a[i];
    }

    if (used_order) *used_order = reached;
    if (prediction_gain && E > 0.0) *prediction_gain = R[0] / E;
    return true;
}

#pragma once
#include <vector>
#include <cstdint>

// Autocorrelation + Levinson-Durbin over float sequences. Coefficients are
// returned in error-filter form, A(z) = 1 + a[0] z^-1 + ... + a[p-1] z^-p.
class LPC {
public:
    static constexpr int MAX_ORDER = 8;

    explicit LPC(int order);

    int get_order() const;

    // Returns false (and zeroes coeffs) when the sequence has no energy.
    bool analyze(const std::vector<float>& signal,
                 std::vector<double>& coeffs,
                 int* used_order = nullptr,
                 double* prediction_gain = nullptr) const;

    void autocorrelation(const std::vector<float>& signal,
                         int lags,
                         std::vector<double>& R) const;

    // Returns the order actually reached before the residual energy
    // stopped being positive.
    int levinson_durbin(const std::vector<double>& R,
                        int lags,
                        std::vector<double>& a,
                        double* residual_energy = nullptr) const;

private:
    int order;
};

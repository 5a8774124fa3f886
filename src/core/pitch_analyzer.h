#pragma once
#ifndef PL_PITCH_ANALYZER_H
#define PL_PITCH_ANALYZER_H

// F0 (fundamental frequency) estimation using the YIN algorithm.
// Reference: de Cheveigné & Kawahara (2002), JASA 111(4).

#include <vector>
#include <cmath>
#include <algorithm>

namespace pl {
namespace dsp {

// ----------------------------------------------------------------
// YIN pitch detector for a single analysis window
// ----------------------------------------------------------------
class PitchAnalyzer {
public:
    // sample_rate: 16000, min_f0: 60 Hz, max_f0: 500 Hz
    explicit PitchAnalyzer(int sample_rate = 16000,
                           float min_f0    = 60.0f,
                           float max_f0    = 500.0f,
                           float threshold = 0.15f)
        : sr_(sample_rate), min_f0_(min_f0), max_f0_(max_f0), threshold_(threshold) {
        min_period_ = static_cast<int>(sr_ / max_f0_);
        max_period_ = static_cast<int>(sr_ / min_f0_);
    }

    // Returns F0 in Hz, or 0 when the window is unvoiced.
    float estimate(const float* frame, int N) const {
        int max_lag = max_period_;
        if (max_lag >= N / 2) max_lag = N / 2 - 1;
        const int min_lag = min_period_;
        if (min_lag >= max_lag || min_lag < 1) return 0.0f;

        const std::vector<double> cmnd = cmnd_function(frame, N, max_lag);
        const int length = max_lag + 1;

        // Absolute threshold: first dip below threshold, then descend to its minimum
        int best_tau = -1;
        for (int tau = min_lag; tau < length - 1; ++tau) {
            if (cmnd[tau] < threshold_) {
                while (tau + 1 < length && cmnd[tau + 1] < cmnd[tau]) ++tau;
                best_tau = tau;
                break;
            }
        }
        if (best_tau < 1) return 0.0f;

        // Parabolic interpolation for sub-sample accuracy
        double refined = best_tau;
        if (best_tau < length - 1) {
            double a = cmnd[best_tau - 1], b = cmnd[best_tau], c = cmnd[best_tau + 1];
            double denom = 2.0 * (a - 2.0 * b + c);
            if (std::abs(denom) > 1e-6)
                refined = best_tau + (a - c) / denom;
        }
        if (refined < 1.0) return 0.0f;

        float f0 = static_cast<float>(sr_ / refined);
        return (f0 >= min_f0_ && f0 <= max_f0_) ? f0 : 0.0f;
    }

    // Cumulative mean normalized difference d'(tau) for tau in [0, max_lag].
    // d'(0) = 1 by definition; the squared difference is integrated over
    // N - max_lag samples so every lag sees the same number of terms.
    static std::vector<double> cmnd_function(const float* frame, int N, int max_lag) {
        std::vector<double> cmnd(max_lag + 1, 1.0);
        const int span = N - max_lag;
        double running_sum = 0.0;
        for (int tau = 1; tau <= max_lag; ++tau) {
            double df = 0.0;
            for (int j = 0; j < span; ++j) {
                double diff = static_cast<double>(frame[j]) - frame[j + tau];
                df += diff * diff;
            }
            running_sum += df;
            cmnd[tau] = (running_sum > 0.0) ? df * tau / running_sum : 1.0;
        }
        return cmnd;
    }

    int min_period() const { return min_period_; }
    int max_period() const { return max_period_; }

private:
    int   sr_, min_period_, max_period_;
    float min_f0_, max_f0_, threshold_;
};

} // namespace dsp
} // namespace pl

#endif // PL_PITCH_ANALYZER_H

#pragma once
#ifndef PL_LOUDNESS_H
#define PL_LOUDNESS_H

// Frame energy measurements on normalized [-1,1] samples.

#include <vector>
#include <cmath>

namespace pl {
namespace dsp {

// Energy floor returned for digital silence
static constexpr float ENERGY_FLOOR_DB = -100.0f;

// ----------------------------------------------------------------
// RMS energy
// ----------------------------------------------------------------
inline double compute_rms(const float* pcm, int n) {
    if (n <= 0) return 0.0;
    double s = 0.0;
    for (int i = 0; i < n; ++i) s += static_cast<double>(pcm[i]) * pcm[i];
    return std::sqrt(s / n);
}

inline float compute_rms(const std::vector<float>& pcm) {
    return static_cast<float>(compute_rms(pcm.data(), static_cast<int>(pcm.size())));
}

// ----------------------------------------------------------------
// RMS level in dB relative to full scale
// ----------------------------------------------------------------
inline float rms_to_db(double rms) {
    if (rms < 1e-10) return ENERGY_FLOOR_DB;
    return static_cast<float>(20.0 * std::log10(rms));
}

inline float compute_energy_db(const float* pcm, int n) {
    return rms_to_db(compute_rms(pcm, n));
}

} // namespace dsp
} // namespace pl

#endif // PL_LOUDNESS_H

// Unit tests for the per-window DSP primitives (YIN pitch, RMS energy).

#include <gtest/gtest.h>
#include "core/loudness.h"
#include "core/pitch_analyzer.h"

#include <cmath>
#include <vector>

namespace {

// ----------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------
static std::vector<float> make_sine(float freq_hz, int n_samples, float amp = 0.5f,
                                    int sample_rate = 16000) {
    std::vector<float> pcm(n_samples);
    for (int i = 0; i < n_samples; ++i)
        pcm[i] = amp * static_cast<float>(std::sin(2.0 * M_PI * freq_hz * i / sample_rate));
    return pcm;
}

// ----------------------------------------------------------------
// Energy tests
// ----------------------------------------------------------------
TEST(Energy, SilenceHitsFloor) {
    std::vector<float> silence(800, 0.0f);
    EXPECT_FLOAT_EQ(pl::dsp::compute_energy_db(silence.data(), 800), pl::dsp::ENERGY_FLOOR_DB);
}

TEST(Energy, FullScaleSquareIsZeroDb) {
    std::vector<float> square(800);
    for (size_t i = 0; i < square.size(); ++i) square[i] = (i % 2) ? 1.0f : -1.0f;
    EXPECT_NEAR(pl::dsp::compute_energy_db(square.data(), 800), 0.0f, 1e-4f);
}

TEST(Energy, HalfAmplitudeSineIsAboutMinus9Db) {
    // RMS of 0.5*sin = 0.3536 -> -9.03 dB
    auto sine = make_sine(200.0f, 800);
    EXPECT_NEAR(pl::dsp::compute_energy_db(sine.data(), 800), -9.03f, 0.1f);
}

TEST(Energy, EmptyInputIsFloor) {
    EXPECT_FLOAT_EQ(pl::dsp::compute_energy_db(nullptr, 0), pl::dsp::ENERGY_FLOOR_DB);
}

TEST(Energy, TinyRmsIsFloor) {
    EXPECT_FLOAT_EQ(pl::dsp::rms_to_db(1e-12), pl::dsp::ENERGY_FLOOR_DB);
}

// ----------------------------------------------------------------
// Pitch analyzer tests
// ----------------------------------------------------------------
TEST(PitchAnalyzer, 200HzSineWithinTwoPercent) {
    auto sine = make_sine(200.0f, 800);
    pl::dsp::PitchAnalyzer pa;
    float f0 = pa.estimate(sine.data(), 800);
    EXPECT_GE(f0, 196.0f);
    EXPECT_LE(f0, 204.0f);
}

TEST(PitchAnalyzer, NonIntegerPeriodIsRefined) {
    // 16000 / 230 = 69.57 samples: needs sub-sample interpolation
    auto sine = make_sine(230.0f, 800);
    pl::dsp::PitchAnalyzer pa;
    float f0 = pa.estimate(sine.data(), 800);
    EXPECT_NEAR(f0, 230.0f, 2.0f);
}

TEST(PitchAnalyzer, LowVoiceDetected) {
    auto sine = make_sine(100.0f, 800);
    pl::dsp::PitchAnalyzer pa;
    EXPECT_NEAR(pa.estimate(sine.data(), 800), 100.0f, 2.0f);
}

TEST(PitchAnalyzer, SilenceIsUnvoiced) {
    std::vector<float> silence(800, 0.0f);
    pl::dsp::PitchAnalyzer pa;
    EXPECT_FLOAT_EQ(pa.estimate(silence.data(), 800), 0.0f);
}

TEST(PitchAnalyzer, AboveRangeIsUnvoiced) {
    // 1 kHz is outside the 60-500 Hz speech range
    auto sine = make_sine(1000.0f, 800);
    pl::dsp::PitchAnalyzer pa;
    float f0 = pa.estimate(sine.data(), 800);
    EXPECT_TRUE(f0 == 0.0f || (f0 >= 60.0f && f0 <= 500.0f));
}

TEST(PitchAnalyzer, TooShortWindowIsUnvoiced) {
    auto sine = make_sine(200.0f, 40);
    pl::dsp::PitchAnalyzer pa;
    EXPECT_FLOAT_EQ(pa.estimate(sine.data(), 40), 0.0f);
}

TEST(PitchAnalyzer, CmndStartsAtOne) {
    auto sine = make_sine(200.0f, 800);
    auto cmnd = pl::dsp::PitchAnalyzer::cmnd_function(sine.data(), 800, 300);
    ASSERT_EQ(cmnd.size(), 301u);
    EXPECT_DOUBLE_EQ(cmnd[0], 1.0);
    // Deepest dip sits at the period (80 samples)
    EXPECT_LT(cmnd[80], 0.05);
}

TEST(PitchAnalyzer, RespectsConfiguredRange) {
    pl::dsp::PitchAnalyzer pa(16000, 150.0f, 400.0f);
    auto sine = make_sine(100.0f, 800);
    float f0 = pa.estimate(sine.data(), 800);
    EXPECT_TRUE(f0 == 0.0f || (f0 >= 150.0f && f0 <= 400.0f));
}

} // namespace

#ifndef PL_EMOTION_TYPES_H
#define PL_EMOTION_TYPES_H

#include <array>
#include <string>
#include <vector>

namespace pl {

// Numeric values match PL_EMOTION_* in paraling_types.h
enum class EmotionTag {
    Neutral   = 0,
    Angry     = 1,
    Confident = 2,
    Uncertain = 3,
    Excited   = 4,
    Calm      = 5,
    Sad       = 6,
    Stressed  = 7,
};

constexpr int kEmotionCount = 8;

const char* emotion_name(EmotionTag tag);    // "angry"
const char* emotion_label(EmotionTag tag);   // "Angry"

struct EmotionSegment {
    double      start_time = 0.0;
    double      end_time   = 0.0;
    EmotionTag  tag        = EmotionTag::Neutral;
    float       confidence = 0.0f;
    std::string text;
};

struct EmotionResult {
    std::vector<EmotionSegment> segments;
    EmotionTag  dominant            = EmotionTag::Neutral;
    float       dominant_confidence = 0.5f;
    float       valence             = 0.0f;   // [-1, 1]
    float       arousal             = 0.0f;   // [0, 1]
    bool        should_warn         = false;
    std::string warning_message;

    // "\n[Emotion] Mood: Angry (72%) | Valence: negative (-0.58) | ..."
    std::string build_summary_footer() const;
};

struct ConfidenceRange {
    float lo;
    float hi;
};

struct EmotionConfig {
    float high_energy_delta        = 4.0f;    // dB above baseline
    float low_energy_delta         = -4.0f;
    float very_low_energy_delta    = -8.0f;
    float confident_min_energy     = -2.0f;
    float high_pitch_delta         = 0.20f;
    float high_pitch_variability   = 0.25f;   // stddev of pitch delta
    float uncertain_variability    = 0.16f;
    float steady_pitch_variability = 0.08f;
    float calm_variability         = 0.12f;
    float rising_trend             = 0.10f;
    float falling_trend            = -0.05f;

    ConfidenceRange angry     {0.40f, 0.95f};
    ConfidenceRange stressed  {0.40f, 0.90f};
    ConfidenceRange excited   {0.40f, 0.90f};
    ConfidenceRange sad       {0.35f, 0.85f};
    ConfidenceRange uncertain {0.35f, 0.85f};
    ConfidenceRange confident {0.40f, 0.85f};
    float calm_confidence       = 0.5f;
    float neutral_confidence    = 0.4f;
    float no_window_confidence  = 0.3f;   // segment without voiced windows
    float no_input_confidence   = 0.5f;   // no segments / no prosody

    float angry_warn_confidence    = 0.6f;
    float stressed_warn_confidence = 0.7f;

    // Indexed by EmotionTag
    std::array<float, kEmotionCount> valence {{0.0f, -0.8f, 0.5f, -0.3f, 0.7f, 0.3f, -0.6f, -0.5f}};
    std::array<float, kEmotionCount> arousal {{0.3f,  0.9f, 0.5f,  0.4f, 0.85f, 0.15f, 0.2f, 0.8f}};
};

} // namespace pl

#endif // PL_EMOTION_TYPES_H

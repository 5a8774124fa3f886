#ifndef PL_EMOTION_ANALYZER_H
#define PL_EMOTION_ANALYZER_H

#include "core/emotion_types.h"
#include "core/prosody_types.h"
#include "core/transcript.h"
#include <functional>
#include <vector>

namespace pl {

// Prosodic features of one transcript segment
struct EmotionFeatures {
    float energy_delta = 0.0f;   // mean, dB
    float pitch_delta  = 0.0f;   // mean
    float pitch_stddev = 0.0f;   // population stddev of pitch delta
    float pitch_trend  = 0.0f;   // second half mean - first half mean
};

/**
 * EmotionAnalyzer labels each transcript segment with a discrete emotion from
 * the prosody of the windows it overlaps, then aggregates the session into a
 * dominant emotion and valence/arousal.
 *
 * Classification walks an ordered rule table; the first matching rule wins
 * and Neutral is the fallback. Never fails.
 */
class EmotionAnalyzer {
public:
    struct Rule {
        EmotionTag tag;
        std::function<bool(const EmotionFeatures&, const EmotionConfig&)>  matches;
        std::function<float(const EmotionFeatures&, const EmotionConfig&)> confidence;
    };

    explicit EmotionAnalyzer(const EmotionConfig& config = EmotionConfig{});

    EmotionResult analyze(const std::vector<TranscriptSegment>* segments,
                          const ProsodyResult* prosody) const;

    static EmotionFeatures compute_features(const std::vector<const ProsodyWindow*>& windows);

    void classify(const EmotionFeatures& f, EmotionTag& tag, float& confidence) const;

    const std::vector<Rule>& rules() const { return rules_; }
    const EmotionConfig& config() const    { return config_; }

private:
    void aggregate(EmotionResult& result) const;

    EmotionConfig     config_;
    std::vector<Rule> rules_;
};

} // namespace pl

#endif // PL_EMOTION_ANALYZER_H

#include "core/emotion_analyzer.h"
#include "utils/logger.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <cmath>

namespace pl {

namespace {

float clamp_to(float value, const ConfidenceRange& range) {
    return std::clamp(value, range.lo, range.hi);
}

} // anonymous namespace

const char* emotion_name(EmotionTag tag) {
    static const char* kNames[kEmotionCount] = {
        "neutral", "angry", "confident", "uncertain", "excited", "calm", "sad", "stressed"
    };
    int id = static_cast<int>(tag);
    if (id >= 0 && id < kEmotionCount) return kNames[id];
    return "unknown";
}

const char* emotion_label(EmotionTag tag) {
    static const char* kLabels[kEmotionCount] = {
        "Neutral", "Angry", "Confident", "Uncertain", "Excited", "Calm", "Sad", "Stressed"
    };
    int id = static_cast<int>(tag);
    if (id >= 0 && id < kEmotionCount) return kLabels[id];
    return "Unknown";
}

// ============================================================
std::string EmotionResult::build_summary_footer() const {
    std::vector<std::string> parts;
    parts.push_back(fmt::format("Mood: {} ({:.0f}%)", emotion_label(dominant),
                                dominant_confidence * 100.0f));

    if (valence < -0.3f)
        parts.push_back(fmt::format("Valence: negative ({:.2f})", valence));
    else if (valence > 0.3f)
        parts.push_back(fmt::format("Valence: positive ({:.2f})", valence));

    if (arousal > 0.7f)
        parts.push_back("Energy: high");

    // Non-neutral tags by frequency, ties in order of first appearance
    std::vector<std::pair<EmotionTag, int>> counts;
    for (const auto& seg : segments) {
        if (seg.tag == EmotionTag::Neutral) continue;
        auto it = std::find_if(counts.begin(), counts.end(),
            [&](const std::pair<EmotionTag, int>& c) { return c.first == seg.tag; });
        if (it == counts.end()) counts.emplace_back(seg.tag, 1);
        else it->second++;
    }
    std::stable_sort(counts.begin(), counts.end(),
        [](const std::pair<EmotionTag, int>& a, const std::pair<EmotionTag, int>& b) {
            return a.second > b.second;
        });
    if (counts.size() > 3) counts.resize(3);

    if (!counts.empty()) {
        std::vector<std::string> arc;
        for (const auto& c : counts)
            arc.push_back(fmt::format("{}({})", emotion_label(c.first), c.second));
        parts.push_back(fmt::format("Arc: {}", fmt::join(arc, " \xE2\x86\x92 ")));
    }

    return fmt::format("\n[Emotion] {}", fmt::join(parts, " | "));
}

// ============================================================
EmotionAnalyzer::EmotionAnalyzer(const EmotionConfig& config)
    : config_(config) {
    using F = const EmotionFeatures&;
    using C = const EmotionConfig&;

    rules_ = {
        {EmotionTag::Angry,
         [](F f, C c) { return f.energy_delta > c.high_energy_delta && f.pitch_delta > c.high_pitch_delta; },
         [](F f, C c) { return clamp_to((f.energy_delta / 10.0f + f.pitch_delta) * 0.8f, c.angry); }},
        {EmotionTag::Stressed,
         [](F f, C c) { return f.pitch_stddev > c.high_pitch_variability && f.energy_delta > 0.0f; },
         [](F f, C c) { return clamp_to(f.pitch_stddev * 2.0f, c.stressed); }},
        {EmotionTag::Excited,
         [](F f, C c) { return f.energy_delta > c.high_energy_delta && f.pitch_trend > c.rising_trend; },
         [](F f, C c) { return clamp_to((f.energy_delta / 8.0f + f.pitch_trend) * 0.7f, c.excited); }},
        {EmotionTag::Sad,
         [](F f, C c) { return f.energy_delta < c.very_low_energy_delta && f.pitch_trend < c.falling_trend; },
         [](F f, C c) { return clamp_to((std::fabs(f.energy_delta) / 12.0f) * 0.8f, c.sad); }},
        {EmotionTag::Uncertain,
         [](F f, C c) { return f.energy_delta < c.low_energy_delta && f.pitch_stddev > c.uncertain_variability; },
         [](F f, C c) { return clamp_to((std::fabs(f.energy_delta) / 8.0f + f.pitch_stddev) * 0.6f, c.uncertain); }},
        {EmotionTag::Confident,
         [](F f, C c) {
             return f.energy_delta > c.confident_min_energy && f.energy_delta < c.high_energy_delta &&
                    f.pitch_stddev < c.steady_pitch_variability;
         },
         [](F f, C c) {
             return clamp_to((1.0f - f.pitch_stddev / c.steady_pitch_variability) * 0.7f, c.confident);
         }},
        {EmotionTag::Calm,
         [](F f, C c) { return f.energy_delta < 0.0f && f.pitch_stddev < c.calm_variability; },
         [](F, C c) { return c.calm_confidence; }},
    };
}

EmotionFeatures EmotionAnalyzer::compute_features(const std::vector<const ProsodyWindow*>& windows) {
    EmotionFeatures f;
    if (windows.empty()) return f;

    f.energy_delta = mean_energy_delta(windows);
    f.pitch_delta  = mean_pitch_delta(windows);

    if (windows.size() > 1) {
        double var = 0.0;
        for (const auto* w : windows) {
            double d = w->pitch_delta - f.pitch_delta;
            var += d * d;
        }
        f.pitch_stddev = static_cast<float>(std::sqrt(var / windows.size()));
    }

    if (windows.size() >= 3) {
        size_t half = windows.size() / 2;
        std::vector<const ProsodyWindow*> first(windows.begin(), windows.begin() + half);
        std::vector<const ProsodyWindow*> second(windows.begin() + half, windows.end());
        f.pitch_trend = mean_pitch_delta(second) - mean_pitch_delta(first);
    }
    return f;
}

void EmotionAnalyzer::classify(const EmotionFeatures& f, EmotionTag& tag, float& confidence) const {
    for (const auto& rule : rules_) {
        if (rule.matches(f, config_)) {
            tag        = rule.tag;
            confidence = rule.confidence(f, config_);
            return;
        }
    }
    tag        = EmotionTag::Neutral;
    confidence = config_.neutral_confidence;
}

EmotionResult EmotionAnalyzer::analyze(const std::vector<TranscriptSegment>* segments,
                                       const ProsodyResult* prosody) const {
    EmotionResult result;
    if (!segments || segments->empty() || !prosody || !prosody->ok()) {
        result.dominant            = EmotionTag::Neutral;
        result.dominant_confidence = config_.no_input_confidence;
        return result;
    }

    for (const auto& seg : *segments) {
        EmotionSegment es;
        es.start_time = seg.start;
        es.end_time   = seg.end;
        es.text       = seg.text;

        auto windows = overlapping_windows(*prosody, seg);
        if (windows.empty()) {
            es.tag        = EmotionTag::Neutral;
            es.confidence = config_.no_window_confidence;
        } else {
            classify(compute_features(windows), es.tag, es.confidence);
        }
        result.segments.push_back(std::move(es));
    }

    aggregate(result);

    PL_LOG_DEBUG("Emotion: {} segments, dominant={} ({:.2f}), valence={:.2f}, arousal={:.2f}",
                 result.segments.size(), emotion_name(result.dominant),
                 result.dominant_confidence, result.valence, result.arousal);
    return result;
}

void EmotionAnalyzer::aggregate(EmotionResult& result) const {
    const float n = static_cast<float>(result.segments.size());

    std::array<float, kEmotionCount> scores{};
    std::vector<int> order;   // tags in order of first appearance
    float valence = 0.0f, arousal = 0.0f;
    for (const auto& seg : result.segments) {
        int id = static_cast<int>(seg.tag);
        if (std::find(order.begin(), order.end(), id) == order.end()) order.push_back(id);
        scores[id] += seg.confidence;
        valence    += config_.valence[id] * seg.confidence;
        arousal    += config_.arousal[id] * seg.confidence;
    }

    // Equal sums keep the tag seen first
    int best = order.front();
    for (int id : order)
        if (scores[id] > scores[best]) best = id;

    result.dominant            = static_cast<EmotionTag>(best);
    result.dominant_confidence = scores[best] / n;
    result.valence             = std::clamp(valence / n, -1.0f, 1.0f);
    result.arousal             = std::clamp(arousal / n, 0.0f, 1.0f);

    if (result.dominant == EmotionTag::Angry &&
        result.dominant_confidence > config_.angry_warn_confidence) {
        result.should_warn     = true;
        result.warning_message = "You may have dictated this while frustrated \xE2\x80\x94 review before sending?";
    } else if (result.dominant == EmotionTag::Stressed &&
               result.dominant_confidence > config_.stressed_warn_confidence) {
        result.should_warn     = true;
        result.warning_message = "Elevated stress detected in your speech \xE2\x80\x94 consider reviewing the tone.";
    }
}

} // namespace pl

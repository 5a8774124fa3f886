#ifndef PL_TRANSCRIPT_H
#define PL_TRANSCRIPT_H

// Alignment between variable-length transcript segments and the fixed-stride
// prosody windows. Shared by the hesitation, emotion and formatting stages.

#include "core/prosody_types.h"
#include <string>
#include <vector>

namespace pl {

struct TranscriptSegment {
    double      start = 0.0;   // seconds, same timeline as ProsodyResult
    double      end   = 0.0;
    std::string text;
};

// Non-silent windows whose span overlaps [start, end) (strict overlap).
inline std::vector<const ProsodyWindow*> overlapping_windows(const ProsodyResult& prosody,
                                                             double start, double end) {
    std::vector<const ProsodyWindow*> out;
    for (const auto& w : prosody.windows) {
        if (w.start_time >= end) break;   // windows are time-ascending
        if (w.end_time > start && !w.is_silence) out.push_back(&w);
    }
    return out;
}

inline std::vector<const ProsodyWindow*> overlapping_windows(const ProsodyResult& prosody,
                                                             const TranscriptSegment& seg) {
    return overlapping_windows(prosody, seg.start, seg.end);
}

// Mean of a window member over a window set; 0 for an empty set.
template<typename Getter>
inline float mean_of(const std::vector<const ProsodyWindow*>& windows, Getter get) {
    if (windows.empty()) return 0.0f;
    double sum = 0.0;
    for (const auto* w : windows) sum += get(*w);
    return static_cast<float>(sum / windows.size());
}

inline float mean_energy_delta(const std::vector<const ProsodyWindow*>& windows) {
    return mean_of(windows, [](const ProsodyWindow& w) { return w.energy_delta; });
}

inline float mean_pitch_delta(const std::vector<const ProsodyWindow*>& windows) {
    return mean_of(windows, [](const ProsodyWindow& w) { return w.pitch_delta; });
}

inline float mean_energy_db(const std::vector<const ProsodyWindow*>& windows) {
    return mean_of(windows, [](const ProsodyWindow& w) { return w.energy_db; });
}

// Whitespace tokenization used by every text heuristic.
inline std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!cur.empty()) { words.push_back(cur); cur.clear(); }
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

} // namespace pl

#endif // PL_TRANSCRIPT_H

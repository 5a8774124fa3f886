#ifndef PL_HESITATION_TYPES_H
#define PL_HESITATION_TYPES_H

#include <string>
#include <vector>

namespace pl {

// Numeric values match PL_HESITATION_* in paraling_types.h
enum class HesitationType {
    FillerWord     = 0,
    Uncertainty    = 1,
    SelfCorrection = 2,
    TopicChange    = 3,
    FatigueWarning = 4,
};

const char* hesitation_type_name(HesitationType type);

struct HesitationAnnotation {
    HesitationType type       = HesitationType::FillerWord;
    double         start_time = 0.0;
    double         end_time   = 0.0;
    std::string    text;
    std::string    suggestion;    // empty = none
    float          confidence = 0.0f;
};

struct HesitationResult {
    std::vector<HesitationAnnotation> annotations;
    float fluency_score         = 1.0f;
    float fatigue_level         = 0.0f;
    int   filler_count          = 0;
    int   self_correction_count = 0;

    int count(HesitationType type) const;

    // "\n---\n[Hesitation Analysis] Fluency: 85% | Fillers: 3 | ..."
    std::string build_summary_footer() const;
};

struct HesitationConfig {
    // Search every supported lexicon, detected language first
    bool  union_all_languages      = true;
    float uncertainty_density      = 0.25f;   // filler tokens / words
    float low_confidence_energy_db = -3.0f;   // mean energy delta that boosts uncertainty
    float fatigue_rate_ratio       = 0.70f;   // last/first quarter words-per-second
    int   min_segments_fatigue     = 8;
    float topic_pitch_shift        = 0.30f;
    float topic_energy_shift_db    = 8.0f;
    double topic_pause_tolerance   = 0.2;     // seconds
    size_t suggestion_max_chars    = 60;
};

} // namespace pl

#endif // PL_HESITATION_TYPES_H

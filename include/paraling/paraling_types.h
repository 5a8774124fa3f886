#ifndef PARALING_TYPES_H
#define PARALING_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================
// Feature flags for pl_session_analyze()
// ============================================================
#define PL_FEATURE_FORMATTING    0x001u
#define PL_FEATURE_HESITATION    0x002u
#define PL_FEATURE_EMOTION       0x004u
#define PL_FEATURE_ALL           0x007u

// ============================================================
// Emotion constants
// ============================================================
#define PL_EMOTION_NEUTRAL    0
#define PL_EMOTION_ANGRY      1
#define PL_EMOTION_CONFIDENT  2
#define PL_EMOTION_UNCERTAIN  3
#define PL_EMOTION_EXCITED    4
#define PL_EMOTION_CALM       5
#define PL_EMOTION_SAD        6
#define PL_EMOTION_STRESSED   7
#define PL_EMOTION_COUNT      8

// ============================================================
// Hesitation annotation types
// ============================================================
#define PL_HESITATION_FILLER_WORD      0
#define PL_HESITATION_UNCERTAINTY      1
#define PL_HESITATION_SELF_CORRECTION  2
#define PL_HESITATION_TOPIC_CHANGE     3
#define PL_HESITATION_FATIGUE_WARNING  4

// ============================================================
// Result structures (all POD / C-compatible)
// ============================================================

/** Session-level prosody summary */
typedef struct PlProsodySummary {
    int   window_count;        /**< number of 50ms analysis windows */
    int   voiced_count;        /**< windows with pitch > 0 and not silent */
    int   silent_count;        /**< windows below the silence threshold */
    int   pause_count;         /**< detected pauses (>= 200ms) */
    float baseline_pitch_hz;   /**< median pitch of voiced windows, 0 if none */
    float baseline_energy_db;  /**< median energy of voiced windows, 0 if none */
    float duration_sec;        /**< end time of the last window */
    int   reserved[2];
} PlProsodySummary;

/** One prosody analysis window */
typedef struct PlProsodyWindow {
    double start_sec;
    double end_sec;
    float  pitch_hz;       /**< 0 = unvoiced/silent */
    float  pitch_delta;    /**< [-1,1] vs. baseline pitch */
    float  energy_db;      /**< dBFS, floor -100 */
    float  energy_delta;   /**< dB vs. baseline energy */
    int    is_silence;
    int    is_whisper;
} PlProsodyWindow;

/** Detected pause (silence gap) */
typedef struct PlPauseEvent {
    double start_sec;
    double end_sec;
    double duration_ms;
} PlPauseEvent;

/** Hesitation annotation */
typedef struct PlHesitationAnnotation {
    int    type;             /**< PL_HESITATION_* */
    double start_sec;
    double end_sec;
    float  confidence;       /**< [0,1] */
    char   text[128];        /**< affected text span (truncated) */
    char   suggestion[256];  /**< empty when no suggestion */
    int    reserved[2];
} PlHesitationAnnotation;

/** Hesitation aggregate scores */
typedef struct PlHesitationSummary {
    float fluency_score;          /**< [0,1], 1 = perfectly fluent */
    float fatigue_level;          /**< [0,1] */
    int   filler_count;
    int   self_correction_count;
    int   uncertainty_count;
    int   topic_change_count;
    int   annotation_count;
    int   reserved[2];
} PlHesitationSummary;

/** Emotion classification for one transcript segment */
typedef struct PlEmotionSegment {
    double start_sec;
    double end_sec;
    int    emotion_id;       /**< PL_EMOTION_* */
    float  confidence;       /**< [0,1] */
    int    reserved[2];
} PlEmotionSegment;

/** Session-level emotion aggregates */
typedef struct PlEmotionSummary {
    int   dominant_emotion;     /**< PL_EMOTION_* */
    float dominant_confidence;  /**< [0,1] */
    float valence;              /**< [-1,1] negative→positive */
    float arousal;              /**< [0,1] calm→intense */
    int   should_warn;          /**< 1 = surface warning_message to the user */
    char  warning_message[256];
    int   segment_count;
    int   reserved[2];
} PlEmotionSummary;

/** Aggregated result from pl_session_analyze() */
typedef struct PlSessionResult {
    unsigned int        features_computed; /**< Bitmask of PL_FEATURE_* actually computed */
    PlProsodySummary    prosody;
    PlHesitationSummary hesitation;
    PlEmotionSummary    emotion;
    int                 formatted_text_length; /**< bytes, excluding terminator */
    int                 reserved[4];
} PlSessionResult;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // PARALING_TYPES_H

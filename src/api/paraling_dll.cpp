#include <paraling/paraling_api.h>
#include "manager/session_analyzer.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>

struct PlSession {
    pl::SessionAnalyzer analyzer;
};

static bool       g_initialized = false;
static std::mutex g_init_mutex;

// ============================================================
// Helpers
// ============================================================

// Run `fn` converting escaping exceptions into PL_ERROR_UNKNOWN
template<typename Fn>
static int guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        PL_LOG_ERROR("Unhandled exception: {}", e.what());
        pl::set_last_error(pl::ErrorCode::UNKNOWN, e.what());
        return PL_ERROR_UNKNOWN;
    } catch (...) {
        pl::set_last_error(pl::ErrorCode::UNKNOWN);
        return PL_ERROR_UNKNOWN;
    }
}

static int check_session(PlSessionHandle session) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_initialized) {
        pl::set_last_error(pl::ErrorCode::NOT_INIT, "pl_init() must be called first");
        return PL_ERROR_NOT_INIT;
    }
    if (!session) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "session is null");
        return PL_ERROR_INVALID_PARAM;
    }
    return PL_OK;
}

// Truncating copy into a fixed char array, never splitting a UTF-8 sequence
template<size_t N>
static void copy_fixed(char (&dst)[N], const std::string& src) {
    size_t len = std::min(src.size(), N - 1);
    if (len < src.size()) {
        while (len > 0 && (static_cast<unsigned char>(src[len]) & 0xC0) == 0x80) --len;
    }
    std::memcpy(dst, src.data(), len);
    dst[len] = '\0';
}

static int copy_string(const std::string& src, char* buf, int buf_size) {
    if (!buf || buf_size <= 0) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM);
        return PL_ERROR_INVALID_PARAM;
    }
    if (static_cast<size_t>(buf_size) <= src.size()) {
        pl::set_last_error(pl::ErrorCode::BUFFER_TOO_SMALL,
                           "need " + std::to_string(src.size() + 1) + " bytes");
        return PL_ERROR_BUFFER_TOO_SMALL;
    }
    std::memcpy(buf, src.c_str(), src.size() + 1);
    return PL_OK;
}

// Copy up to max_items elements; out_count always receives the total
template<typename Src, typename Dst, typename Convert>
static int copy_items(const std::vector<Src>& items, Dst* out, int max_items, int* out_count,
                      Convert convert) {
    if (!out_count || max_items < 0 || (max_items > 0 && !out)) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM);
        return PL_ERROR_INVALID_PARAM;
    }
    size_t n = std::min(items.size(), static_cast<size_t>(max_items));
    for (size_t i = 0; i < n; ++i) {
        std::memset(&out[i], 0, sizeof(Dst));
        convert(items[i], out[i]);
    }
    *out_count = static_cast<int>(items.size());
    return PL_OK;
}

static void fill_prosody_summary(const pl::ProsodyResult& p, PlProsodySummary* out) {
    std::memset(out, 0, sizeof(*out));
    out->window_count = static_cast<int>(p.windows.size());
    for (const auto& w : p.windows) {
        if (w.is_silence) out->silent_count++;
        if (w.voiced())   out->voiced_count++;
    }
    out->pause_count        = static_cast<int>(p.pauses.size());
    out->baseline_pitch_hz  = p.baseline_pitch_hz;
    out->baseline_energy_db = p.baseline_energy_db;
    out->duration_sec = p.windows.empty() ? 0.0f : static_cast<float>(p.windows.back().end_time);
}

static void fill_hesitation_summary(const pl::HesitationResult& h, PlHesitationSummary* out) {
    std::memset(out, 0, sizeof(*out));
    out->fluency_score         = h.fluency_score;
    out->fatigue_level         = h.fatigue_level;
    out->filler_count          = h.filler_count;
    out->self_correction_count = h.self_correction_count;
    out->uncertainty_count     = h.count(pl::HesitationType::Uncertainty);
    out->topic_change_count    = h.count(pl::HesitationType::TopicChange);
    out->annotation_count      = static_cast<int>(h.annotations.size());
}

static void fill_emotion_summary(const pl::EmotionResult& e, PlEmotionSummary* out) {
    std::memset(out, 0, sizeof(*out));
    out->dominant_emotion    = static_cast<int>(e.dominant);
    out->dominant_confidence = e.dominant_confidence;
    out->valence             = e.valence;
    out->arousal             = e.arousal;
    out->should_warn         = e.should_warn ? 1 : 0;
    copy_fixed(out->warning_message, e.warning_message);
    out->segment_count       = static_cast<int>(e.segments.size());
}

static int require_prosody(PlSessionHandle session, pl::ProsodyResultPtr& out) {
    out = session->analyzer.prosody();
    if (!out) {
        pl::set_last_error(pl::ErrorCode::NO_AUDIO);
        return PL_ERROR_NO_AUDIO;
    }
    return PL_OK;
}

static int require_result(PlSessionHandle session, std::shared_ptr<const pl::SessionResult>& out) {
    out = session->analyzer.last_result();
    if (!out) {
        pl::set_last_error(pl::ErrorCode::NOT_INIT, "pl_session_analyze() not called");
        return PL_ERROR_NOT_INIT;
    }
    return PL_OK;
}

// ============================================================
// Library lifecycle
// ============================================================
PL_API int pl_init(const char* log_file) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized) {
        pl::set_last_error(pl::ErrorCode::ALREADY_INIT);
        return PL_ERROR_ALREADY_INIT;
    }

    return guarded([&]() {
        // Replace the console-only logger created by any earlier log call
        pl::Logger::instance().shutdown();
        pl::Logger::instance().init(log_file ? log_file : "");
        PL_LOG_INFO("Initializing paraling v1.0.0");
        g_initialized = true;
        return PL_OK;
    });
}

PL_API void pl_release() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_initialized) return;

    PL_LOG_INFO("paraling released");
    g_initialized = false;
    pl::Logger::instance().shutdown();
}

// ============================================================
// Sessions
// ============================================================
PL_API int pl_session_create(PlSessionHandle* out_session) {
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (!g_initialized) {
            pl::set_last_error(pl::ErrorCode::NOT_INIT, "pl_init() must be called first");
            return PL_ERROR_NOT_INIT;
        }
    }
    if (!out_session) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM);
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        *out_session = new PlSession();
        return PL_OK;
    });
}

PL_API void pl_session_destroy(PlSessionHandle session) {
    delete session;
}

PL_API int pl_session_set_audio(PlSessionHandle session, const int16_t* pcm_data,
                                int sample_count, int sample_rate) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!pcm_data && sample_count > 0) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "pcm_data is null");
        return PL_ERROR_INVALID_PARAM;
    }
    if (sample_count < 0) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "negative sample_count");
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        int result = session->analyzer.set_audio(pcm_data, static_cast<size_t>(sample_count),
                                                 sample_rate);
        if (result != PL_OK) {
            pl::set_last_error(static_cast<pl::ErrorCode>(result), session->analyzer.last_error());
        }
        return result;
    });
}

PL_API int pl_session_set_audio_file(PlSessionHandle session, const char* wav_path) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!wav_path) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "wav_path is null");
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        int result = session->analyzer.set_audio_file(wav_path);
        if (result != PL_OK) {
            pl::set_last_error(static_cast<pl::ErrorCode>(result), session->analyzer.last_error());
        }
        return result;
    });
}

PL_API int pl_session_cancel(PlSessionHandle session) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    session->analyzer.cancel();
    return PL_OK;
}

PL_API int pl_session_set_transcript(PlSessionHandle session, const char* text,
                                     const char* language) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!text) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "text is null");
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        session->analyzer.set_transcript(text, language ? language : "");
        return PL_OK;
    });
}

PL_API int pl_session_add_segment(PlSessionHandle session, double start_sec,
                                  double end_sec, const char* text) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!text) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "text is null");
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        int result = session->analyzer.add_segment(start_sec, end_sec, text);
        if (result != PL_OK) {
            pl::set_last_error(static_cast<pl::ErrorCode>(result), session->analyzer.last_error());
        }
        return result;
    });
}

PL_API int pl_session_clear_segments(PlSessionHandle session) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    session->analyzer.clear_segments();
    return PL_OK;
}

PL_API int pl_session_analyze(PlSessionHandle session, unsigned int feature_flags,
                              PlSessionResult* out) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!out) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM, "out is null");
        return PL_ERROR_INVALID_PARAM;
    }

    return guarded([&]() {
        pl::SessionResult result;
        int status = session->analyzer.analyze(feature_flags, result);
        if (status != PL_OK) {
            pl::set_last_error(static_cast<pl::ErrorCode>(status), session->analyzer.last_error());
            return status;
        }

        std::memset(out, 0, sizeof(*out));
        out->features_computed = result.features;
        if (result.prosody) fill_prosody_summary(*result.prosody, &out->prosody);
        fill_hesitation_summary(result.hesitation, &out->hesitation);
        fill_emotion_summary(result.emotion, &out->emotion);
        out->formatted_text_length = static_cast<int>(result.formatted_text.size());
        return PL_OK;
    });
}

// ============================================================
// Result accessors
// ============================================================
PL_API int pl_session_get_prosody_summary(PlSessionHandle session, PlProsodySummary* out) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;
    if (!out) {
        pl::set_last_error(pl::ErrorCode::INVALID_PARAM);
        return PL_ERROR_INVALID_PARAM;
    }

    pl::ProsodyResultPtr prosody;
    rc = require_prosody(session, prosody);
    if (rc != PL_OK) return rc;
    fill_prosody_summary(*prosody, out);
    return PL_OK;
}

PL_API int pl_session_get_windows(PlSessionHandle session, PlProsodyWindow* out_windows,
                                  int max_windows, int* out_count) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    pl::ProsodyResultPtr prosody;
    rc = require_prosody(session, prosody);
    if (rc != PL_OK) return rc;

    return copy_items(prosody->windows, out_windows, max_windows, out_count,
        [](const pl::ProsodyWindow& w, PlProsodyWindow& o) {
            o.start_sec    = w.start_time;
            o.end_sec      = w.end_time;
            o.pitch_hz     = w.pitch_hz;
            o.pitch_delta  = w.pitch_delta;
            o.energy_db    = w.energy_db;
            o.energy_delta = w.energy_delta;
            o.is_silence   = w.is_silence ? 1 : 0;
            o.is_whisper   = w.is_whisper ? 1 : 0;
        });
}

PL_API int pl_session_get_pauses(PlSessionHandle session, PlPauseEvent* out_pauses,
                                 int max_pauses, int* out_count) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    pl::ProsodyResultPtr prosody;
    rc = require_prosody(session, prosody);
    if (rc != PL_OK) return rc;

    return copy_items(prosody->pauses, out_pauses, max_pauses, out_count,
        [](const pl::PauseEvent& p, PlPauseEvent& o) {
            o.start_sec   = p.start_time;
            o.end_sec     = p.end_time;
            o.duration_ms = p.duration_ms();
        });
}

PL_API int pl_session_get_formatted_text(PlSessionHandle session, char* buf, int buf_size) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    std::shared_ptr<const pl::SessionResult> result;
    rc = require_result(session, result);
    if (rc != PL_OK) return rc;
    return copy_string(result->formatted_text, buf, buf_size);
}

PL_API int pl_session_get_hesitations(PlSessionHandle session,
                                      PlHesitationAnnotation* out_annotations,
                                      int max_annotations, int* out_count) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    std::shared_ptr<const pl::SessionResult> result;
    rc = require_result(session, result);
    if (rc != PL_OK) return rc;

    return copy_items(result->hesitation.annotations, out_annotations, max_annotations, out_count,
        [](const pl::HesitationAnnotation& a, PlHesitationAnnotation& o) {
            o.type       = static_cast<int>(a.type);
            o.start_sec  = a.start_time;
            o.end_sec    = a.end_time;
            o.confidence = a.confidence;
            copy_fixed(o.text, a.text);
            copy_fixed(o.suggestion, a.suggestion);
        });
}

PL_API int pl_session_get_emotion_segments(PlSessionHandle session,
                                           PlEmotionSegment* out_segments,
                                           int max_segments, int* out_count) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    std::shared_ptr<const pl::SessionResult> result;
    rc = require_result(session, result);
    if (rc != PL_OK) return rc;

    return copy_items(result->emotion.segments, out_segments, max_segments, out_count,
        [](const pl::EmotionSegment& s, PlEmotionSegment& o) {
            o.start_sec  = s.start_time;
            o.end_sec    = s.end_time;
            o.emotion_id = static_cast<int>(s.tag);
            o.confidence = s.confidence;
        });
}

PL_API int pl_session_get_footer(PlSessionHandle session, char* buf, int buf_size) {
    int rc = check_session(session);
    if (rc != PL_OK) return rc;

    std::shared_ptr<const pl::SessionResult> result;
    rc = require_result(session, result);
    if (rc != PL_OK) return rc;
    return copy_string(result->footer, buf, buf_size);
}

// ============================================================
// Names / errors
// ============================================================
PL_API const char* pl_emotion_name(int emotion_id) {
    return pl::emotion_name(static_cast<pl::EmotionTag>(emotion_id));
}

PL_API const char* pl_hesitation_type_name(int type) {
    if (type < PL_HESITATION_FILLER_WORD || type > PL_HESITATION_FATIGUE_WARNING) return "unknown";
    return pl::hesitation_type_name(static_cast<pl::HesitationType>(type));
}

PL_API const char* pl_get_last_error() {
    return pl::get_last_error();
}

#ifndef PARALING_API_H
#define PARALING_API_H

#include <paraling/paraling_types.h>

#ifdef _WIN32
    #ifdef PARALING_EXPORTS
        #define PL_API extern "C" __declspec(dllexport)
    #else
        #define PL_API extern "C" __declspec(dllimport)
    #endif
#else
    #define PL_API extern "C" __attribute__((visibility("default")))
#endif

// Error codes
#define PL_OK                        0
#define PL_ERROR_UNKNOWN            -1
#define PL_ERROR_INVALID_PARAM      -2
#define PL_ERROR_NOT_INIT           -3
#define PL_ERROR_ALREADY_INIT       -4
#define PL_ERROR_AUDIO_EMPTY        -5
#define PL_ERROR_AUDIO_TOO_SHORT    -6
#define PL_ERROR_AUDIO_INVALID      -7
#define PL_ERROR_FILE_NOT_FOUND     -8
#define PL_ERROR_WAV_FORMAT         -9
#define PL_ERROR_CANCELLED          -10
#define PL_ERROR_NO_AUDIO           -11
#define PL_ERROR_BUFFER_TOO_SMALL   -12

/** Opaque analysis session: one recorded utterance plus its transcript. */
typedef struct PlSession* PlSessionHandle;

/**
 * Initialize the library (logging).
 * @param log_file Rotating log file path, or NULL/"" for console-only logging
 * @return PL_OK on success, PL_ERROR_ALREADY_INIT if called twice
 */
PL_API int pl_init(const char* log_file);

/**
 * Release global resources. Sessions must be destroyed first.
 */
PL_API void pl_release();

/**
 * Create an analysis session.
 * @param out_session Receives the new handle
 */
PL_API int pl_session_create(PlSessionHandle* out_session);

/**
 * Destroy a session. Passing NULL is a no-op.
 */
PL_API void pl_session_destroy(PlSessionHandle session);

/**
 * Run prosody analysis on 16-bit mono PCM. Blocks for the duration of the
 * analysis; pl_session_cancel() may be called from another thread.
 * When calls overlap, only the most recently started one publishes; an
 * older call that finishes later returns PL_ERROR_CANCELLED.
 * @param pcm_data     Signed 16-bit samples
 * @param sample_count Number of samples
 * @param sample_rate  Sample rate in Hz
 * @return PL_OK, PL_ERROR_AUDIO_EMPTY, PL_ERROR_AUDIO_TOO_SHORT,
 *         PL_ERROR_AUDIO_INVALID or PL_ERROR_CANCELLED
 */
PL_API int pl_session_set_audio(PlSessionHandle session, const int16_t* pcm_data,
                                int sample_count, int sample_rate);

/**
 * Run prosody analysis on a 16-bit mono WAV file.
 */
PL_API int pl_session_set_audio_file(PlSessionHandle session, const char* wav_path);

/**
 * Request cancellation of every running pl_session_set_audio*() call.
 */
PL_API int pl_session_cancel(PlSessionHandle session);

/**
 * Set the full transcript text and the detected language code (may be NULL).
 */
PL_API int pl_session_set_transcript(PlSessionHandle session, const char* text,
                                     const char* language);

/**
 * Append one timestamped transcript segment. Segments must be added in order.
 */
PL_API int pl_session_add_segment(PlSessionHandle session, double start_sec,
                                  double end_sec, const char* text);

/**
 * Remove all transcript segments.
 */
PL_API int pl_session_clear_segments(PlSessionHandle session);

/**
 * Run the downstream analyzers selected by feature_flags against the session's
 * prosody result. Without audio the analyzers still run and degrade to their
 * neutral outputs.
 * @param feature_flags Bitmask of PL_FEATURE_*
 * @param out           Caller-allocated result
 */
PL_API int pl_session_analyze(PlSessionHandle session, unsigned int feature_flags,
                              PlSessionResult* out);

/**
 * Prosody summary of the last successful pl_session_set_audio*() call.
 * @return PL_ERROR_NO_AUDIO when no audio has been analyzed
 */
PL_API int pl_session_get_prosody_summary(PlSessionHandle session, PlProsodySummary* out);

/**
 * Copy prosody windows. out_count receives the total window count even when
 * max_windows is smaller.
 */
PL_API int pl_session_get_windows(PlSessionHandle session, PlProsodyWindow* out_windows,
                                  int max_windows, int* out_count);

PL_API int pl_session_get_pauses(PlSessionHandle session, PlPauseEvent* out_pauses,
                                 int max_pauses, int* out_count);

/**
 * Copy the formatted text of the last pl_session_analyze() call.
 * @return PL_ERROR_BUFFER_TOO_SMALL if buf_size <= text length
 */
PL_API int pl_session_get_formatted_text(PlSessionHandle session, char* buf, int buf_size);

PL_API int pl_session_get_hesitations(PlSessionHandle session,
                                      PlHesitationAnnotation* out_annotations,
                                      int max_annotations, int* out_count);

PL_API int pl_session_get_emotion_segments(PlSessionHandle session,
                                           PlEmotionSegment* out_segments,
                                           int max_segments, int* out_count);

/**
 * Summary footer text (hesitation + emotion) for appending to the transcript.
 */
PL_API int pl_session_get_footer(PlSessionHandle session, char* buf, int buf_size);

/**
 * @return Static name of an emotion ID (e.g. "angry"). Never NULL.
 */
PL_API const char* pl_emotion_name(int emotion_id);

/**
 * @return Static name of a hesitation type (e.g. "filler_word"). Never NULL.
 */
PL_API const char* pl_hesitation_type_name(int type);

/**
 * Get the last error message.
 * @return Error message string (thread-local, valid until next API call)
 */
PL_API const char* pl_get_last_error();

#endif // PARALING_API_H

#ifndef PL_SESSION_ANALYZER_H
#define PL_SESSION_ANALYZER_H

#include "core/emotion_analyzer.h"
#include "core/hesitation_analyzer.h"
#include "core/prosody_analyzer.h"
#include "core/prosody_formatter.h"
#include "core/transcript.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pl {

struct SessionResult {
    unsigned int     features = 0;   // PL_FEATURE_* actually computed
    ProsodyResultPtr prosody;        // null when no audio was analyzed
    std::string      formatted_text;
    HesitationResult hesitation;
    EmotionResult    emotion;
    std::string      footer;         // hesitation + emotion summary lines
};

/**
 * SessionAnalyzer owns one recorded utterance and its transcript.
 *
 * Prosody is computed once per utterance by set_audio*() and published as an
 * immutable shared result; analyze() fans the enabled downstream analyzers out
 * over that result concurrently. Readers never block on a running prosody
 * analysis, and cancel() may be called from any thread.
 *
 * Concurrent set_audio*() calls are ordered by start: only the most recently
 * started call publishes. An older call finishing later returns
 * PL_ERROR_CANCELLED and leaves the session as it is.
 */
class SessionAnalyzer {
public:
    SessionAnalyzer();
    ~SessionAnalyzer();

    // Blocking prosody analysis; replaces any previous audio on success
    int set_audio(const AudioBuffer& audio);
    int set_audio(const int16_t* pcm, size_t sample_count, int sample_rate);
    int set_audio_file(const std::string& wav_path);

    // Cancels every set_audio*() call in flight
    void cancel();

    // Number of set_audio*() calls currently running
    size_t audio_in_flight() const;

    void set_transcript(const std::string& text, const std::string& language);
    int  add_segment(double start, double end, const std::string& text);
    void clear_segments();

    /**
     * Run the analyzers selected by `features` (PL_FEATURE_*).
     * @return PL_OK or PL_ERROR_INVALID_PARAM for unknown feature bits.
     */
    int analyze(unsigned int features, SessionResult& out);

    ProsodyResultPtr prosody() const;
    std::shared_ptr<const SessionResult> last_result() const;

    // Config changes apply to subsequent set_audio*() / analyze() calls
    void set_prosody_config(const ProsodyConfig& config);
    void set_hesitation_config(const HesitationConfig& config);
    void set_emotion_config(const EmotionConfig& config);
    void set_formatter_config(const FormatterConfig& config);

    std::string last_error() const;

private:
    struct AudioRequest {
        uint64_t                           generation = 0;
        std::shared_ptr<std::atomic<bool>> cancel;
    };

    AudioRequest begin_audio(ProsodyConfig& config);
    int publish_prosody(const AudioRequest& request, ProsodyResult&& result, int status);

    mutable std::shared_mutex mutex_;

    uint64_t                                        audio_generation_ = 0;
    std::vector<std::shared_ptr<std::atomic<bool>>> pending_cancels_;

    ProsodyConfig    prosody_config_;
    HesitationConfig hesitation_config_;
    EmotionConfig    emotion_config_;
    FormatterConfig  formatter_config_;

    ProsodyResultPtr               prosody_;
    std::string                    text_;
    std::string                    language_;
    std::vector<TranscriptSegment> segments_;

    std::shared_ptr<const SessionResult> last_result_;
    std::string last_error_;
};

} // namespace pl

#endif // PL_SESSION_ANALYZER_H

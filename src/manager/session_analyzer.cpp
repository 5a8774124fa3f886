#include "manager/session_analyzer.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <paraling/paraling_types.h>

#include <algorithm>
#include <future>
#include <mutex>

namespace pl {

SessionAnalyzer::SessionAnalyzer() = default;
SessionAnalyzer::~SessionAnalyzer() = default;

// ============================================================
// Audio -> prosody (once per utterance)
// ============================================================
SessionAnalyzer::AudioRequest SessionAnalyzer::begin_audio(ProsodyConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config = prosody_config_;

    AudioRequest request;
    request.generation = ++audio_generation_;
    request.cancel     = std::make_shared<std::atomic<bool>>(false);
    pending_cancels_.push_back(request.cancel);
    return request;
}

int SessionAnalyzer::set_audio(const AudioBuffer& audio) {
    ProsodyConfig config;
    AudioRequest request = begin_audio(config);

    ProsodyResult result;
    int rc = ProsodyAnalyzer(config).analyze(audio, result, request.cancel.get());
    return publish_prosody(request, std::move(result), rc);
}

int SessionAnalyzer::set_audio(const int16_t* pcm, size_t sample_count, int sample_rate) {
    ProsodyConfig config;
    AudioRequest request = begin_audio(config);

    ProsodyResult result;
    int rc = ProsodyAnalyzer(config).analyze(pcm, sample_count, sample_rate, result,
                                             request.cancel.get());
    return publish_prosody(request, std::move(result), rc);
}

int SessionAnalyzer::set_audio_file(const std::string& wav_path) {
    ProsodyConfig config;
    AudioRequest request = begin_audio(config);

    ProsodyResult result;
    int rc = ProsodyAnalyzer(config).analyze_file(wav_path, result, request.cancel.get());
    return publish_prosody(request, std::move(result), rc);
}

int SessionAnalyzer::publish_prosody(const AudioRequest& request, ProsodyResult&& result,
                                     int status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pending_cancels_.erase(std::remove(pending_cancels_.begin(), pending_cancels_.end(),
                                       request.cancel),
                           pending_cancels_.end());

    if (request.generation != audio_generation_) {
        PL_LOG_DEBUG("Prosody result of set_audio #{} dropped, #{} started later",
                     request.generation, audio_generation_);
        last_error_ = "Superseded by a newer set_audio call";
        return static_cast<int>(ErrorCode::CANCELLED);
    }
    if (status != static_cast<int>(ErrorCode::OK)) {
        // A rejected or cancelled utterance leaves the session without audio
        prosody_.reset();
        last_error_ = result.error;
        return status;
    }
    prosody_ = std::make_shared<const ProsodyResult>(std::move(result));
    last_error_.clear();
    return status;
}

void SessionAnalyzer::cancel() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& flag : pending_cancels_)
        flag->store(true);
}

size_t SessionAnalyzer::audio_in_flight() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pending_cancels_.size();
}

// ============================================================
// Transcript
// ============================================================
void SessionAnalyzer::set_transcript(const std::string& text, const std::string& language) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    text_     = text;
    language_ = language;
}

int SessionAnalyzer::add_segment(double start, double end, const std::string& text) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (start < 0.0 || end < start) {
        last_error_ = "Segment end precedes start";
        return static_cast<int>(ErrorCode::INVALID_PARAM);
    }
    if (!segments_.empty() && start < segments_.back().start) {
        last_error_ = "Segments must be added in time order";
        return static_cast<int>(ErrorCode::INVALID_PARAM);
    }
    segments_.push_back(TranscriptSegment{start, end, text});
    return static_cast<int>(ErrorCode::OK);
}

void SessionAnalyzer::clear_segments() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    segments_.clear();
}

// ============================================================
// Fan-out over the shared prosody result
// ============================================================
int SessionAnalyzer::analyze(unsigned int features, SessionResult& out) {
    if (features & ~PL_FEATURE_ALL) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        last_error_ = "Unknown feature flags";
        return static_cast<int>(ErrorCode::INVALID_PARAM);
    }

    // Snapshot inputs so the analyzers run without holding the lock
    ProsodyResultPtr prosody;
    std::string text, language;
    std::vector<TranscriptSegment> segments;
    HesitationConfig hesitation_config;
    EmotionConfig    emotion_config;
    FormatterConfig  formatter_config;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        prosody           = prosody_;
        text              = text_;
        language          = language_;
        segments          = segments_;
        hesitation_config = hesitation_config_;
        emotion_config    = emotion_config_;
        formatter_config  = formatter_config_;
    }

    const ProsodyResult* p = prosody.get();
    const std::vector<TranscriptSegment>* segs = segments.empty() ? nullptr : &segments;

    std::future<std::string>      formatted;
    std::future<HesitationResult> hesitation;
    std::future<EmotionResult>    emotion;

    if (features & PL_FEATURE_FORMATTING) {
        formatted = std::async(std::launch::async, [&, p, segs]() {
            return ProsodyFormatter(formatter_config).apply(text, segs, p);
        });
    }
    if (features & PL_FEATURE_HESITATION) {
        hesitation = std::async(std::launch::async, [&, p, segs]() {
            return HesitationAnalyzer(hesitation_config).analyze(text, segs, p, language);
        });
    }
    if (features & PL_FEATURE_EMOTION) {
        emotion = std::async(std::launch::async, [&, p, segs]() {
            return EmotionAnalyzer(emotion_config).analyze(segs, p);
        });
    }

    auto result = std::make_shared<SessionResult>();
    result->features = features;
    result->prosody  = prosody;
    result->formatted_text = formatted.valid() ? formatted.get() : text;
    if (hesitation.valid()) {
        result->hesitation = hesitation.get();
        result->footer += result->hesitation.build_summary_footer();
    }
    if (emotion.valid()) {
        result->emotion = emotion.get();
        result->footer += result->emotion.build_summary_footer();
    }

    PL_LOG_INFO("Session analyzed: features=0x{:x}, prosody={}, segments={}",
                features, prosody ? "yes" : "no", segments.size());

    out = *result;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    last_result_ = std::move(result);
    return static_cast<int>(ErrorCode::OK);
}

ProsodyResultPtr SessionAnalyzer::prosody() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return prosody_;
}

std::shared_ptr<const SessionResult> SessionAnalyzer::last_result() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_result_;
}

void SessionAnalyzer::set_prosody_config(const ProsodyConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    prosody_config_ = config;
}

void SessionAnalyzer::set_hesitation_config(const HesitationConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    hesitation_config_ = config;
}

void SessionAnalyzer::set_emotion_config(const EmotionConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    emotion_config_ = config;
}

void SessionAnalyzer::set_formatter_config(const FormatterConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    formatter_config_ = config;
}

std::string SessionAnalyzer::last_error() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_error_;
}

} // namespace pl

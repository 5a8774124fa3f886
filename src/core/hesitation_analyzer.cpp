#include "core/hesitation_analyzer.h"
#include "core/lexicon.h"
#include "utils/logger.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <cmath>

namespace pl {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string percent(float fraction) {
    return fmt::format("{:.0f}%", fraction * 100.0f);
}

// Linear position of word `index` over the transcript time span
void time_for_word(size_t index, size_t total, const std::vector<TranscriptSegment>* segments,
                   double& start, double& end) {
    start = end = 0.0;
    if (!segments || segments->empty()) return;
    double t0 = segments->front().start;
    double t1 = segments->back().end;
    if (total == 0) { start = t0; end = t1; return; }
    double dur = t1 - t0;
    start = t0 + (static_cast<double>(index) / total) * dur;
    end   = std::min(start + dur / total, t1);
}

// Same mapping by byte offset into the full text
void time_for_offset(size_t offset, size_t length, size_t text_length,
                     const std::vector<TranscriptSegment>* segments,
                     double& start, double& end) {
    start = end = 0.0;
    if (!segments || segments->empty() || text_length == 0) return;
    double t0 = segments->front().start;
    double t1 = segments->back().end;
    double dur = t1 - t0;
    start = t0 + (static_cast<double>(offset) / text_length) * dur;
    end   = std::min(start + (static_cast<double>(length) / text_length) * dur, t1);
}

bool is_filler(const std::unordered_set<std::string>& fillers, const std::string& token) {
    return fillers.count(to_lower(token)) > 0;
}

} // anonymous namespace

// ============================================================
const char* hesitation_type_name(HesitationType type) {
    switch (type) {
    case HesitationType::FillerWord:     return "filler_word";
    case HesitationType::Uncertainty:    return "uncertainty";
    case HesitationType::SelfCorrection: return "self_correction";
    case HesitationType::TopicChange:    return "topic_change";
    case HesitationType::FatigueWarning: return "fatigue_warning";
    }
    return "unknown";
}

int HesitationResult::count(HesitationType type) const {
    return static_cast<int>(std::count_if(annotations.begin(), annotations.end(),
        [type](const HesitationAnnotation& a) { return a.type == type; }));
}

std::string HesitationResult::build_summary_footer() const {
    std::vector<std::string> parts;
    parts.push_back("Fluency: " + percent(fluency_score));
    if (filler_count > 0)
        parts.push_back(fmt::format("Fillers: {}", filler_count));
    if (self_correction_count > 0)
        parts.push_back(fmt::format("Self-corrections: {}", self_correction_count));
    if (fatigue_level > 0.3f)
        parts.push_back("Fatigue: " + percent(fatigue_level));
    int uncertain = count(HesitationType::Uncertainty);
    if (uncertain > 0)
        parts.push_back(fmt::format("Uncertain phrases: {}", uncertain));
    int topics = count(HesitationType::TopicChange);
    if (topics > 0)
        parts.push_back(fmt::format("Topic shifts: {}", topics));

    return fmt::format("\n---\n[Hesitation Analysis] {}", fmt::join(parts, " | "));
}

// ============================================================
HesitationAnalyzer::HesitationAnalyzer(const HesitationConfig& config)
    : config_(config) {}

std::vector<std::string> HesitationAnalyzer::resolve_languages(const std::string& language) const {
    const Lexicon& lexicon = Lexicon::instance();
    std::vector<std::string> langs;

    if (!language.empty()) {
        std::string primary = to_lower(language.substr(0, language.find_first_of("-_")));
        if (lexicon.supports(primary)) {
            langs.push_back(primary);
            if (!config_.union_all_languages) return langs;
        }
    }

    for (const auto& code : lexicon.languages()) {
        if (std::find(langs.begin(), langs.end(), code) == langs.end())
            langs.push_back(code);
    }
    return langs;
}

HesitationResult HesitationAnalyzer::analyze(const std::string& text,
                                             const std::vector<TranscriptSegment>* segments,
                                             const ProsodyResult* prosody,
                                             const std::string& language) const {
    HesitationResult result;
    if (trim(text).empty()) {
        result.fluency_score = 1.0f;
        return result;
    }
    if (prosody && !prosody->ok()) prosody = nullptr;

    auto languages = resolve_languages(language);
    auto fillers   = Lexicon::instance().fillers_for(languages);

    detect_fillers(text, segments, fillers, result);
    detect_self_corrections(text, segments, languages, result);
    detect_uncertainty(segments, prosody, fillers, result);
    detect_fatigue(segments, result);
    detect_topic_changes(segments, prosody, result);

    result.fluency_score = fluency_score(result);

    PL_LOG_DEBUG("Hesitation: {} annotations, fillers={}, corrections={}, fluency={:.2f}",
                 result.annotations.size(), result.filler_count,
                 result.self_correction_count, result.fluency_score);
    return result;
}

// ============================================================
// Fillers: unigram first, then the bigram starting at the token
// ============================================================
void HesitationAnalyzer::detect_fillers(const std::string& text,
                                        const std::vector<TranscriptSegment>* segments,
                                        const FillerSet& fillers,
                                        HesitationResult& result) const {
    auto words = split_words(text);
    for (size_t i = 0; i < words.size(); ++i) {
        std::string word = clean_word(words[i]);

        bool hit = is_filler(fillers, word);
        if (!hit && i + 1 < words.size())
            hit = is_filler(fillers, word + " " + clean_word(words[i + 1]));
        if (!hit) continue;

        HesitationAnnotation a;
        a.type       = HesitationType::FillerWord;
        a.text       = word;
        a.confidence = 0.9f;
        time_for_word(i, words.size(), segments, a.start_time, a.end_time);
        result.annotations.push_back(std::move(a));
        result.filler_count++;
    }
}

// ============================================================
// Self-corrections: marker phrases at word boundaries
// ============================================================
void HesitationAnalyzer::detect_self_corrections(const std::string& text,
                                                 const std::vector<TranscriptSegment>* segments,
                                                 const std::vector<std::string>& languages,
                                                 HesitationResult& result) const {
    const std::string lower = to_lower(text);   // same byte length as text

    for (const auto& lang : languages) {
        for (const auto& marker : Lexicon::instance().correction_markers(lang)) {
            size_t pos = 0;
            while ((pos = lower.find(marker, pos)) != std::string::npos) {
                size_t after = pos + marker.size();
                bool boundary = !is_letter_before(lower, pos) && !is_letter_at(lower, after);

                if (boundary) {
                    HesitationAnnotation a;
                    a.type       = HesitationType::SelfCorrection;
                    a.text       = text.substr(pos, marker.size());
                    a.confidence = 0.8f;
                    time_for_offset(pos, marker.size(), text.size(), segments,
                                    a.start_time, a.end_time);
                    if (after < text.size()) {
                        std::string context = trim(utf8_prefix(text, after, config_.suggestion_max_chars));
                        if (!context.empty())
                            a.suggestion = "Self-correction \xE2\x86\x92 \"" + context + "\"";
                    }
                    result.annotations.push_back(std::move(a));
                    result.self_correction_count++;
                }
                pos = after;
            }
        }
    }
}

// ============================================================
// Uncertainty: filler-dense sliding windows of segments
// ============================================================
void HesitationAnalyzer::detect_uncertainty(const std::vector<TranscriptSegment>* segments,
                                            const ProsodyResult* prosody,
                                            const FillerSet& fillers,
                                            HesitationResult& result) const {
    if (!segments || segments->size() < 2) return;

    const size_t n    = segments->size();
    const size_t span = std::min<size_t>(3, n);

    for (size_t i = 0; i + span <= n; ++i) {
        const TranscriptSegment& first = (*segments)[i];
        const TranscriptSegment& last  = (*segments)[i + span - 1];

        std::string window_text;
        for (size_t k = i; k < i + span; ++k) {
            if (k > i) window_text += ' ';
            window_text += (*segments)[k].text;
        }
        auto words = split_words(window_text);
        if (words.empty()) continue;

        int filler_tokens = 0;
        for (const auto& w : words)
            if (is_filler(fillers, clean_word(w))) filler_tokens++;

        float density = static_cast<float>(filler_tokens) / words.size();
        if (density < config_.uncertainty_density) continue;

        float confidence = std::min(1.0f, density * 2.0f);
        if (prosody) {
            auto overlap = overlapping_windows(*prosody, first.start, last.end);
            if (!overlap.empty() && mean_energy_delta(overlap) < config_.low_confidence_energy_db)
                confidence = std::min(1.0f, confidence + 0.2f);
        }

        bool flagged = std::any_of(result.annotations.begin(), result.annotations.end(),
            [&](const HesitationAnnotation& a) {
                return a.type == HesitationType::Uncertainty &&
                       a.start_time < last.end && a.end_time > first.start;
            });
        if (flagged) continue;

        HesitationAnnotation a;
        a.type       = HesitationType::Uncertainty;
        a.start_time = first.start;
        a.end_time   = last.end;
        a.text       = trim(window_text);
        a.suggestion = "[uncertain]";
        a.confidence = confidence;
        result.annotations.push_back(std::move(a));
    }
}

// ============================================================
// Fatigue: words per second, first quarter vs last quarter
// ============================================================
float HesitationAnalyzer::speech_rate(const std::vector<TranscriptSegment>& segments,
                                      size_t first, size_t count) {
    if (count == 0) return 0.0f;
    size_t words = 0;
    for (size_t i = first; i < first + count; ++i)
        words += split_words(segments[i].text).size();
    double elapsed = segments[first + count - 1].end - segments[first].start;
    return elapsed > 0.0 ? static_cast<float>(words / elapsed) : 0.0f;
}

void HesitationAnalyzer::detect_fatigue(const std::vector<TranscriptSegment>* segments,
                                        HesitationResult& result) const {
    if (!segments || segments->size() < static_cast<size_t>(config_.min_segments_fatigue)) return;

    const size_t n       = segments->size();
    const size_t quarter = n / 4;
    if (quarter < 2) return;

    float first_rate = speech_rate(*segments, 0, quarter);
    float last_rate  = speech_rate(*segments, n - quarter, quarter);
    if (first_rate <= 0.0f) return;

    float ratio = last_rate / first_rate;
    if (ratio >= config_.fatigue_rate_ratio) return;

    result.fatigue_level = std::clamp(1.0f - ratio, 0.0f, 1.0f);
    double minutes = (segments->back().end - segments->front().start) / 60.0;

    HesitationAnnotation a;
    a.type       = HesitationType::FatigueWarning;
    a.start_time = (*segments)[n - quarter].start;
    a.end_time   = segments->back().end;
    a.suggestion = fmt::format("Fatigue detected \xE2\x80\x94 {:.0f} min in, speech rate down {}",
                               minutes, percent(1.0f - ratio));
    a.confidence = std::clamp((config_.fatigue_rate_ratio - ratio) * 5.0f, 0.3f, 1.0f);
    result.annotations.push_back(std::move(a));

    PL_LOG_DEBUG("Fatigue: first={:.2f} w/s last={:.2f} w/s ratio={:.2f}",
                 first_rate, last_rate, ratio);
}

// ============================================================
// Topic changes: prosodic shift between adjacent segments
// ============================================================
void HesitationAnalyzer::detect_topic_changes(const std::vector<TranscriptSegment>* segments,
                                              const ProsodyResult* prosody,
                                              HesitationResult& result) const {
    if (!segments || segments->size() < 4 || !prosody) return;

    for (size_t i = 1; i + 1 < segments->size(); ++i) {
        const TranscriptSegment& prev = (*segments)[i - 1];
        const TranscriptSegment& curr = (*segments)[i];

        auto prev_windows = overlapping_windows(*prosody, prev);
        auto curr_windows = overlapping_windows(*prosody, curr);
        if (prev_windows.size() < 2 || curr_windows.size() < 2) continue;

        float pitch_shift  = std::fabs(mean_pitch_delta(curr_windows) - mean_pitch_delta(prev_windows));
        float energy_shift = std::fabs(mean_energy_db(curr_windows) - mean_energy_db(prev_windows));
        if (pitch_shift <= config_.topic_pitch_shift && energy_shift <= config_.topic_energy_shift_db)
            continue;

        const double tol = config_.topic_pause_tolerance;
        bool pause = std::any_of(prosody->pauses.begin(), prosody->pauses.end(),
            [&](const PauseEvent& p) {
                return p.start_time >= prev.end - tol && p.end_time <= curr.start + tol;
            });

        HesitationAnnotation a;
        a.type       = HesitationType::TopicChange;
        a.start_time = prev.end;
        a.end_time   = curr.start;
        a.suggestion = "Possible topic change \xE2\x80\x94 consider section break";
        a.confidence = pause ? 0.85f : 0.6f;
        result.annotations.push_back(std::move(a));
    }
}

float HesitationAnalyzer::fluency_score(const HesitationResult& result) {
    float filler_penalty      = std::min(0.5f, result.filler_count * 0.05f);
    float correction_penalty  = std::min(0.3f, result.self_correction_count * 0.08f);
    float uncertainty_penalty = std::min(0.2f, result.count(HesitationType::Uncertainty) * 0.1f);
    return std::clamp(1.0f - filler_penalty - correction_penalty - uncertainty_penalty, 0.0f, 1.0f);
}

} // namespace pl

#include "core/prosody_formatter.h"
#include "utils/logger.h"

#include <algorithm>

namespace pl {

namespace {

const char* const kWhitespace = " \t\r\n";

std::string trim_left(const std::string& s) {
    size_t b = s.find_first_not_of(kWhitespace);
    return b == std::string::npos ? std::string() : s.substr(b);
}

std::string trim_right(const std::string& s) {
    size_t e = s.find_last_not_of(kWhitespace);
    return e == std::string::npos ? std::string() : s.substr(0, e + 1);
}

std::string trim(const std::string& s) {
    return trim_left(trim_right(s));
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

ProsodyFormatter::ProsodyFormatter(const FormatterConfig& config)
    : config_(config) {}

std::string ProsodyFormatter::wrap(const std::string& text, const char* marker) {
    size_t b = text.find_first_not_of(kWhitespace);
    if (b == std::string::npos) return text;
    size_t e = text.find_last_not_of(kWhitespace);
    return text.substr(0, b) + marker + text.substr(b, e - b + 1) + marker + text.substr(e + 1);
}

bool ProsodyFormatter::ends_with_punctuation(const std::string& text) {
    std::string t = trim_right(text);
    // Look through closing emphasis markers
    size_t end = t.find_last_not_of('*');
    if (end == std::string::npos) return false;
    t.resize(end + 1);

    if (ends_with(t, "\xE2\x80\xA6")) return true;   // U+2026
    char last = t.back();
    return last == '.' || last == '!' || last == '?' || last == ',' || last == ';' || last == ':';
}

std::string ProsodyFormatter::apply(const std::string& raw_text,
                                    const std::vector<TranscriptSegment>* segments,
                                    const ProsodyResult* prosody) const {
    if (!segments || segments->empty() || !prosody || !prosody->ok())
        return raw_text;

    std::string out;
    const size_t n = segments->size();

    for (size_t i = 0; i < n; ++i) {
        const TranscriptSegment& seg  = (*segments)[i];
        const TranscriptSegment* next = (i + 1 < n) ? &(*segments)[i + 1] : nullptr;

        std::string text = trim_left(seg.text);
        if (text.empty()) continue;

        auto windows = overlapping_windows(*prosody, seg);
        if (windows.empty()) {
            out += text;
            append_separator(out, seg, next, prosody->pauses);
            continue;
        }

        float energy  = mean_energy_delta(windows);
        bool  whisper = std::all_of(windows.begin(), windows.end(),
                                    [](const ProsodyWindow* w) { return w->is_whisper; });

        std::vector<const ProsodyWindow*> tail;
        for (const auto* w : windows)
            if (w->end_time >= seg.end - config_.end_window_sec) tail.push_back(w);
        float end_pitch = mean_pitch_delta(tail);

        if (energy > config_.bold_energy_db)
            text = wrap(text, "**");
        else if (whisper || energy < config_.italic_energy_db)
            text = wrap(text, "*");

        if (!ends_with_punctuation(text)) {
            if (end_pitch > config_.rising_pitch)
                text = trim_right(text) + "?";
            else if (end_pitch < config_.falling_pitch && energy > config_.exclaim_energy_db)
                text = trim_right(text) + "!";
        }

        out += text;
        append_separator(out, seg, next, prosody->pauses);
    }

    out = trim(out);
    PL_LOG_DEBUG("Formatter: {} segments -> {} chars", n, out.size());
    return out;
}

void ProsodyFormatter::append_separator(std::string& out, const TranscriptSegment& current,
                                        const TranscriptSegment* next,
                                        const std::vector<PauseEvent>& pauses) const {
    if (!next) return;

    const double tol = config_.pause_tolerance_sec;
    auto gap = std::find_if(pauses.begin(), pauses.end(), [&](const PauseEvent& p) {
        return p.start_time >= current.end - tol && p.end_time <= next->start + tol;
    });

    if (gap != pauses.end()) {
        double ms = gap->duration_ms();
        if (ms >= config_.paragraph_pause_ms) { out += "\n\n"; return; }
        if (ms >= config_.line_pause_ms)      { out += "\n";   return; }
    }

    if (!out.empty() && out.back() != ' ' && out.back() != '\n')
        out += ' ';
}

} // namespace pl

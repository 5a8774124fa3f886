#ifndef PL_PROSODY_FORMATTER_H
#define PL_PROSODY_FORMATTER_H

#include "core/prosody_types.h"
#include "core/transcript.h"
#include <string>
#include <vector>

namespace pl {

struct FormatterConfig {
    float  bold_energy_db      = 6.0f;     // mean energy delta above baseline
    float  italic_energy_db    = -8.0f;
    float  rising_pitch        = 0.15f;    // end pitch delta -> '?'
    float  falling_pitch       = -0.10f;   // end pitch delta -> '!' (when loud)
    float  exclaim_energy_db   = 3.0f;
    double end_window_sec      = 0.3;
    double pause_tolerance_sec = 0.1;
    double paragraph_pause_ms  = 1500.0;
    double line_pause_ms       = 500.0;
};

/**
 * ProsodyFormatter rewrites a transcript with typographic cues taken from the
 * voice: **bold** for loud segments, *italic* for whispered or quiet ones,
 * inferred '?' / '!' and line or paragraph breaks at long pauses.
 *
 * Returns the raw text untouched when segments are missing or the prosody
 * result is absent or unsuccessful.
 */
class ProsodyFormatter {
public:
    explicit ProsodyFormatter(const FormatterConfig& config = FormatterConfig{});

    std::string apply(const std::string& raw_text,
                      const std::vector<TranscriptSegment>* segments,
                      const ProsodyResult* prosody) const;

    const FormatterConfig& config() const { return config_; }

    static std::string wrap(const std::string& text, const char* marker);
    static bool ends_with_punctuation(const std::string& text);

private:
    void append_separator(std::string& out, const TranscriptSegment& current,
                          const TranscriptSegment* next,
                          const std::vector<PauseEvent>& pauses) const;

    FormatterConfig config_;
};

} // namespace pl

#endif // PL_PROSODY_FORMATTER_H

#ifndef PL_HESITATION_ANALYZER_H
#define PL_HESITATION_ANALYZER_H

#include "core/hesitation_types.h"
#include "core/prosody_types.h"
#include "core/transcript.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace pl {

/**
 * HesitationAnalyzer scores fluency from the transcript, optionally refined by
 * the prosody of the same utterance:
 *   - filler words and phrases (multilingual lexicon)
 *   - self-correction markers
 *   - uncertain passages (filler-dense, optionally quiet)
 *   - fatigue (speech rate drop between first and last quarter)
 *   - topic changes (pitch/energy shift between adjacent segments)
 *
 * Never fails. `segments` and `prosody` may be null; an unsuccessful prosody
 * result is treated as absent.
 */
class HesitationAnalyzer {
public:
    explicit HesitationAnalyzer(const HesitationConfig& config = HesitationConfig{});

    HesitationResult analyze(const std::string& text,
                             const std::vector<TranscriptSegment>* segments,
                             const ProsodyResult* prosody,
                             const std::string& language = "") const;

    // Lexicons to search for `language` ("fr-FR", "en", "" ...), in priority order
    std::vector<std::string> resolve_languages(const std::string& language) const;

    const HesitationConfig& config() const { return config_; }

private:
    using FillerSet = std::unordered_set<std::string>;

    void detect_fillers(const std::string& text, const std::vector<TranscriptSegment>* segments,
                        const FillerSet& fillers, HesitationResult& result) const;
    void detect_self_corrections(const std::string& text,
                                 const std::vector<TranscriptSegment>* segments,
                                 const std::vector<std::string>& languages,
                                 HesitationResult& result) const;
    void detect_uncertainty(const std::vector<TranscriptSegment>* segments,
                            const ProsodyResult* prosody, const FillerSet& fillers,
                            HesitationResult& result) const;
    void detect_fatigue(const std::vector<TranscriptSegment>* segments,
                        HesitationResult& result) const;
    void detect_topic_changes(const std::vector<TranscriptSegment>* segments,
                              const ProsodyResult* prosody, HesitationResult& result) const;

    static float fluency_score(const HesitationResult& result);
    static float speech_rate(const std::vector<TranscriptSegment>& segments,
                             size_t first, size_t count);

    HesitationConfig config_;
};

} // namespace pl

#endif // PL_HESITATION_ANALYZER_H

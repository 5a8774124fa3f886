#ifndef PL_PROSODY_ANALYZER_H
#define PL_PROSODY_ANALYZER_H

#include "core/prosody_types.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pl {

/**
 * ProsodyAnalyzer converts a recorded utterance into fixed-stride prosody
 * windows (pitch, energy, silence, whisper), pause events and the speaker's
 * pitch/energy baselines.
 *
 * Analysis is a pure function of the input and the configuration. It is the
 * expensive stage of the pipeline (YIN is quadratic per window), so callers run
 * it off latency-sensitive threads and may cancel it through `cancel`, which is
 * polled at every window boundary.
 *
 * Every analyze* overload fills `out` (a failure result carries the status and
 * a message but no windows) and returns the same status code.
 */
class ProsodyAnalyzer {
public:
    explicit ProsodyAnalyzer(const ProsodyConfig& config = ProsodyConfig{});

    /**
     * @return PL_OK, PL_ERROR_AUDIO_INVALID (not 16-bit mono / bad rate),
     *         PL_ERROR_AUDIO_EMPTY, PL_ERROR_AUDIO_TOO_SHORT or PL_ERROR_CANCELLED.
     */
    int analyze(const AudioBuffer& audio, ProsodyResult& out,
                const std::atomic<bool>* cancel = nullptr) const;

    // Mono 16-bit samples
    int analyze(const int16_t* pcm, size_t sample_count, int sample_rate,
                ProsodyResult& out, const std::atomic<bool>* cancel = nullptr) const;

    // Little-endian 16-bit byte stream (odd byte counts are rejected)
    int analyze_bytes(const uint8_t* data, size_t byte_count, int sample_rate,
                      ProsodyResult& out, const std::atomic<bool>* cancel = nullptr) const;

    // 16-bit mono WAV file
    int analyze_file(const std::string& wav_path, ProsodyResult& out,
                     const std::atomic<bool>* cancel = nullptr) const;

    const ProsodyConfig& config() const { return config_; }

    // Runs of silent windows lasting at least min_pause_ms
    static std::vector<PauseEvent> detect_pauses(const std::vector<ProsodyWindow>& windows,
                                                 double min_pause_ms);

    static float median(std::vector<float> values);

private:
    // Phase 1 output: features measured directly from one window
    struct RawWindow {
        double start_time;
        double end_time;
        float  pitch_hz;
        float  energy_db;
        bool   is_silence;
        bool   is_whisper;
    };

    int analyze_samples(const int16_t* pcm, size_t sample_count, int sample_rate,
                        ProsodyResult& out, const std::atomic<bool>* cancel) const;

    // Phase 2: attach baseline-relative deltas
    static std::vector<ProsodyWindow> attach_deltas(const std::vector<RawWindow>& raw,
                                                    float baseline_pitch,
                                                    float baseline_energy,
                                                    bool have_baseline);

    static bool validate(const ProsodyConfig& config, std::string& reason);

    ProsodyConfig config_;
};

} // namespace pl

#endif // PL_PROSODY_ANALYZER_H

#ifndef PL_PROSODY_TYPES_H
#define PL_PROSODY_TYPES_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pl {

// Mono 16-bit PCM as delivered by the capture layer.
struct AudioBuffer {
    std::vector<int16_t> samples;
    int sample_rate     = 16000;
    int channels        = 1;
    int bits_per_sample = 16;
};

struct ProsodyWindow {
    double start_time   = 0.0;    // seconds
    double end_time     = 0.0;    // seconds
    float  pitch_hz     = 0.0f;   // 0 = unvoiced / silent
    float  pitch_delta  = 0.0f;   // (pitch - baseline) / baseline, clamped to [-1,1]
    float  energy_db    = 0.0f;   // RMS in dBFS, floor -100
    float  energy_delta = 0.0f;   // energy_db - baseline energy
    bool   is_silence   = false;
    bool   is_whisper   = false;

    bool voiced() const { return !is_silence && pitch_hz > 0.0f; }
};

struct PauseEvent {
    double start_time = 0.0;
    double end_time   = 0.0;

    double duration_ms() const { return (end_time - start_time) * 1000.0; }
};

// Output of ProsodyAnalyzer. Created once per utterance and shared read-only
// (std::shared_ptr<const ProsodyResult>) with every downstream analyzer.
struct ProsodyResult {
    int         status = 0;   // PL_OK or PL_ERROR_*
    std::string error;

    std::vector<ProsodyWindow> windows;   // time-ascending, evenly spaced by the hop
    std::vector<PauseEvent>    pauses;    // time-ascending

    float baseline_pitch_hz  = 0.0f;
    float baseline_energy_db = 0.0f;

    bool ok() const { return status == 0; }

    static ProsodyResult failure(int status, std::string message) {
        ProsodyResult r;
        r.status = status;
        r.error  = std::move(message);
        return r;
    }
};

using ProsodyResultPtr = std::shared_ptr<const ProsodyResult>;

struct ProsodyConfig {
    int   window_ms          = 50;
    int   hop_ms             = 25;
    float silence_db         = -40.0f;   // energy below -> silent window
    float whisper_db         = -28.0f;   // voiced and below -> whisper
    float min_pitch_hz       = 60.0f;
    float max_pitch_hz       = 500.0f;
    float yin_threshold      = 0.15f;
    double min_pause_ms      = 200.0;
};

} // namespace pl

#endif // PL_PROSODY_TYPES_H

#include "core/prosody_analyzer.h"
#include "core/audio_processor.h"
#include "core/loudness.h"
#include "core/pitch_analyzer.h"
#include "utils/error_codes.h"
#include "utils/logger.h"

#include <algorithm>

namespace pl {

namespace {

template<typename T>
inline T clamp(T v, T lo, T hi) { return v < lo ? lo : (v > hi ? hi : v); }

inline int fail(ProsodyResult& out, ErrorCode code, const std::string& detail) {
    out = ProsodyResult::failure(static_cast<int>(code),
                                 detail.empty() ? error_code_to_string(code) : detail);
    return out.status;
}

inline bool cancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

} // anonymous namespace

// ============================================================
ProsodyAnalyzer::ProsodyAnalyzer(const ProsodyConfig& config) : config_(config) {
    std::string reason;
    if (!validate(config_, reason)) {
        PL_LOG_WARN("Invalid prosody config ({}), using defaults", reason);
        config_ = ProsodyConfig{};
    }
}

bool ProsodyAnalyzer::validate(const ProsodyConfig& c, std::string& reason) {
    if (c.window_ms <= 0 || c.hop_ms <= 0) {
        reason = "window and hop must be positive";
        return false;
    }
    if (c.min_pitch_hz <= 0.0f || c.min_pitch_hz >= c.max_pitch_hz) {
        reason = "pitch range must satisfy 0 < min < max";
        return false;
    }
    if (c.yin_threshold <= 0.0f || c.yin_threshold >= 1.0f) {
        reason = "YIN threshold must be in (0,1)";
        return false;
    }
    if (c.min_pause_ms < 0.0) {
        reason = "minimum pause must be non-negative";
        return false;
    }
    return true;
}

// ============================================================
int ProsodyAnalyzer::analyze(const AudioBuffer& audio, ProsodyResult& out,
                             const std::atomic<bool>* cancel) const {
    if (audio.bits_per_sample != 16 || audio.channels != 1) {
        return fail(out, ErrorCode::AUDIO_INVALID,
                    "Expected 16-bit mono PCM, got " + std::to_string(audio.bits_per_sample) +
                    "-bit " + std::to_string(audio.channels) + "-channel");
    }
    return analyze_samples(audio.samples.data(), audio.samples.size(),
                           audio.sample_rate, out, cancel);
}

int ProsodyAnalyzer::analyze(const int16_t* pcm, size_t sample_count, int sample_rate,
                             ProsodyResult& out, const std::atomic<bool>* cancel) const {
    if (!pcm && sample_count > 0) {
        return fail(out, ErrorCode::INVALID_PARAM, "null PCM pointer");
    }
    return analyze_samples(pcm, sample_count, sample_rate, out, cancel);
}

int ProsodyAnalyzer::analyze_bytes(const uint8_t* data, size_t byte_count, int sample_rate,
                                   ProsodyResult& out, const std::atomic<bool>* cancel) const {
    if (!data && byte_count > 0) {
        return fail(out, ErrorCode::INVALID_PARAM, "null PCM pointer");
    }
    if (byte_count % 2 != 0) {
        return fail(out, ErrorCode::AUDIO_INVALID,
                    "Odd byte count " + std::to_string(byte_count) + " for 16-bit PCM");
    }
    auto samples = AudioProcessor::decode_pcm16_le(data, byte_count);
    return analyze_samples(samples.data(), samples.size(), sample_rate, out, cancel);
}

int ProsodyAnalyzer::analyze_file(const std::string& wav_path, ProsodyResult& out,
                                  const std::atomic<bool>* cancel) const {
    PL_LOG_INFO("Analyzing prosody from WAV file: {}", wav_path);
    AudioProcessor processor;
    AudioBuffer audio;
    int rc = processor.read_wav(wav_path, audio);
    if (rc != static_cast<int>(ErrorCode::OK)) {
        return fail(out, static_cast<ErrorCode>(rc), processor.last_error());
    }
    return analyze(audio, out, cancel);
}

// ============================================================
int ProsodyAnalyzer::analyze_samples(const int16_t* pcm, size_t sample_count, int sample_rate,
                                     ProsodyResult& out, const std::atomic<bool>* cancel) const {
    if (sample_rate <= 0) {
        return fail(out, ErrorCode::AUDIO_INVALID,
                    "Invalid sample rate: " + std::to_string(sample_rate));
    }
    if (sample_count == 0) {
        return fail(out, ErrorCode::AUDIO_EMPTY, "");
    }

    const size_t window_samples = static_cast<size_t>(sample_rate) * config_.window_ms / 1000;
    const size_t hop_samples    = static_cast<size_t>(sample_rate) * config_.hop_ms / 1000;
    if (window_samples == 0 || hop_samples == 0) {
        return fail(out, ErrorCode::AUDIO_INVALID,
                    "Sample rate " + std::to_string(sample_rate) + " too low for analysis windows");
    }
    if (sample_count < window_samples) {
        return fail(out, ErrorCode::AUDIO_TOO_SHORT,
                    "Audio too short for analysis: " + std::to_string(sample_count) +
                    " samples, need " + std::to_string(window_samples));
    }

    const std::vector<float> samples = AudioProcessor::int16_to_float(pcm, sample_count);
    const dsp::PitchAnalyzer yin(sample_rate, config_.min_pitch_hz,
                                 config_.max_pitch_hz, config_.yin_threshold);
    const int N = static_cast<int>(window_samples);

    // Phase 1: raw per-window features; the trailing partial window is dropped
    std::vector<RawWindow> raw;
    raw.reserve((sample_count - window_samples) / hop_samples + 1);
    for (size_t offset = 0; offset + window_samples <= sample_count; offset += hop_samples) {
        if (cancelled(cancel)) {
            PL_LOG_INFO("Prosody analysis cancelled after {} windows", raw.size());
            return fail(out, ErrorCode::CANCELLED, "");
        }

        const float* window = samples.data() + offset;
        RawWindow w{};
        w.start_time = static_cast<double>(offset) / sample_rate;
        w.end_time   = static_cast<double>(offset + window_samples) / sample_rate;
        w.energy_db  = dsp::compute_energy_db(window, N);
        w.is_silence = w.energy_db < config_.silence_db;
        w.pitch_hz   = 0.0f;
        w.is_whisper = false;
        if (!w.is_silence) {
            w.pitch_hz   = yin.estimate(window, N);
            w.is_whisper = w.pitch_hz > 0.0f && w.energy_db < config_.whisper_db;
        }
        raw.push_back(w);
    }

    // Baselines from voiced, non-silent windows
    std::vector<float> voiced_pitch, voiced_energy;
    for (const auto& w : raw) {
        if (!w.is_silence && w.pitch_hz > 0.0f) {
            voiced_pitch.push_back(w.pitch_hz);
            voiced_energy.push_back(w.energy_db);
        }
    }
    const bool have_baseline = !voiced_pitch.empty();
    const size_t voiced_count = voiced_pitch.size();
    const float baseline_pitch  = have_baseline ? median(std::move(voiced_pitch)) : 0.0f;
    const float baseline_energy = have_baseline ? median(std::move(voiced_energy)) : 0.0f;

    // Phase 2: derived windows with deltas
    ProsodyResult result;
    result.status             = static_cast<int>(ErrorCode::OK);
    result.windows            = attach_deltas(raw, baseline_pitch, baseline_energy, have_baseline);
    result.pauses             = detect_pauses(result.windows, config_.min_pause_ms);
    result.baseline_pitch_hz  = baseline_pitch;
    result.baseline_energy_db = baseline_energy;

    PL_LOG_INFO("Prosody analysis complete: {} windows, {} voiced, {} pauses, "
                "baseline pitch={:.1f}Hz, baseline energy={:.1f}dB",
                result.windows.size(), voiced_count, result.pauses.size(),
                baseline_pitch, baseline_energy);

    out = std::move(result);
    return out.status;
}

std::vector<ProsodyWindow> ProsodyAnalyzer::attach_deltas(const std::vector<RawWindow>& raw,
                                                          float baseline_pitch,
                                                          float baseline_energy,
                                                          bool have_baseline) {
    std::vector<ProsodyWindow> windows;
    windows.reserve(raw.size());
    for (const auto& r : raw) {
        ProsodyWindow w;
        w.start_time = r.start_time;
        w.end_time   = r.end_time;
        w.pitch_hz   = r.pitch_hz;
        w.energy_db  = r.energy_db;
        w.is_silence = r.is_silence;
        w.is_whisper = r.is_whisper;
        if (have_baseline) {
            // +1 = doubled pitch, -1 = halved (or lower)
            if (!r.is_silence && r.pitch_hz > 0.0f && baseline_pitch > 0.0f)
                w.pitch_delta = clamp((r.pitch_hz - baseline_pitch) / baseline_pitch, -1.0f, 1.0f);
            w.energy_delta = r.energy_db - baseline_energy;
        }
        windows.push_back(w);
    }
    return windows;
}

// ============================================================
std::vector<PauseEvent> ProsodyAnalyzer::detect_pauses(const std::vector<ProsodyWindow>& windows,
                                                       double min_pause_ms) {
    std::vector<PauseEvent> pauses;
    bool in_pause = false;
    double pause_start = 0.0;

    for (const auto& w : windows) {
        if (w.is_silence) {
            if (!in_pause) {
                in_pause = true;
                pause_start = w.start_time;
            }
        } else if (in_pause) {
            PauseEvent p{pause_start, w.start_time};
            if (p.duration_ms() >= min_pause_ms) pauses.push_back(p);
            in_pause = false;
        }
    }

    // Trailing silence runs to the end of the last window
    if (in_pause && !windows.empty()) {
        PauseEvent p{pause_start, windows.back().end_time};
        if (p.duration_ms() >= min_pause_ms) pauses.push_back(p);
    }
    return pauses;
}

float ProsodyAnalyzer::median(std::vector<float> values) {
    if (values.empty()) return 0.0f;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    return (values.size() % 2 == 0) ? (values[mid - 1] + values[mid]) / 2.0f : values[mid];
}

} // namespace pl

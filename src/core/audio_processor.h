#ifndef PL_AUDIO_PROCESSOR_H
#define PL_AUDIO_PROCESSOR_H

#include "core/prosody_types.h"
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace pl {

class AudioProcessor {
public:
    AudioProcessor() = default;

    // Read a WAV file without conversion. The declared channel count and bit
    // depth are reported in `out`; samples are only decoded for 16-bit PCM.
    // Returns PL_OK, PL_ERROR_FILE_NOT_FOUND or PL_ERROR_WAV_FORMAT.
    int read_wav(const std::string& wav_path, AudioBuffer& out);

    // Decode little-endian signed 16-bit samples
    static std::vector<int16_t> decode_pcm16_le(const uint8_t* data, size_t byte_count);

    // Convert int16 PCM to float32 [-1.0, 1.0)
    static std::vector<float> int16_to_float(const int16_t* data, size_t count);

    // Get last error message
    const std::string& last_error() const { return last_error_; }

private:
    int fail(int code, const std::string& message);

    std::string last_error_;
};

} // namespace pl

#endif // PL_AUDIO_PROCESSOR_H

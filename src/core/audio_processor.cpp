#include "core/audio_processor.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <cstring>
#include <fstream>

namespace pl {

namespace {

constexpr uint16_t kFormatPcm   = 1;
constexpr uint16_t kFormatFloat = 3;

struct FmtChunk {
    uint16_t audio_format    = 0;
    uint16_t num_channels    = 0;
    uint32_t sample_rate     = 0;
    uint32_t byte_rate       = 0;
    uint16_t block_align     = 0;
    uint16_t bits_per_sample = 0;
};

template<typename T>
bool read_le(std::ifstream& file, T& value) {
    uint8_t bytes[sizeof(T)];
    file.read(reinterpret_cast<char*>(bytes), sizeof(T));
    if (file.gcount() != static_cast<std::streamsize>(sizeof(T))) return false;
    value = 0;
    for (size_t i = 0; i < sizeof(T); ++i)
        value = static_cast<T>(value | (static_cast<T>(bytes[i]) << (8 * i)));
    return true;
}

bool read_tag(std::ifstream& file, const char* expected) {
    char tag[4];
    file.read(tag, 4);
    return file.gcount() == 4 && std::strncmp(tag, expected, 4) == 0;
}

} // anonymous namespace

int AudioProcessor::fail(int code, const std::string& message) {
    last_error_ = message;
    PL_LOG_ERROR(last_error_);
    return code;
}

int AudioProcessor::read_wav(const std::string& wav_path, AudioBuffer& out) {
    const int wav_format = static_cast<int>(ErrorCode::WAV_FORMAT);

    std::ifstream file(wav_path, std::ios::binary);
    if (!file.is_open())
        return fail(static_cast<int>(ErrorCode::FILE_NOT_FOUND), "Cannot open file: " + wav_path);

    uint32_t riff_size = 0;
    if (!read_tag(file, "RIFF") || !read_le(file, riff_size))
        return fail(wav_format, "Not a valid RIFF file");
    if (!read_tag(file, "WAVE"))
        return fail(wav_format, "Not a valid WAVE file");

    FmtChunk fmt;
    bool have_fmt = false;
    std::vector<uint8_t> data;

    // Walk chunks until "data"; anything else is skipped (RIFF chunks are word aligned)
    for (;;) {
        char chunk_id[4];
        uint32_t chunk_size = 0;
        file.read(chunk_id, 4);
        if (file.gcount() < 4 || !read_le(file, chunk_size)) break;

        if (std::strncmp(chunk_id, "fmt ", 4) == 0) {
            if (chunk_size < 16)
                return fail(wav_format, "fmt chunk too small: " + std::to_string(chunk_size));
            bool ok = read_le(file, fmt.audio_format) && read_le(file, fmt.num_channels) &&
                      read_le(file, fmt.sample_rate)  && read_le(file, fmt.byte_rate) &&
                      read_le(file, fmt.block_align)  && read_le(file, fmt.bits_per_sample);
            if (!ok) return fail(wav_format, "Truncated fmt chunk");
            file.seekg(chunk_size - 16 + (chunk_size & 1u), std::ios::cur);
            have_fmt = true;
        } else if (std::strncmp(chunk_id, "data", 4) == 0) {
            if (!have_fmt) break;
            data.resize(chunk_size);
            file.read(reinterpret_cast<char*>(data.data()), chunk_size);
            data.resize(static_cast<size_t>(file.gcount()));   // tolerate truncated files
            PL_LOG_INFO("WAV: format={}, channels={}, rate={}, bits={}, bytes={}",
                        fmt.audio_format, fmt.num_channels, fmt.sample_rate,
                        fmt.bits_per_sample, data.size());

            if (fmt.audio_format != kFormatPcm && fmt.audio_format != kFormatFloat) {
                return fail(wav_format, "Unsupported audio format: " +
                            std::to_string(fmt.audio_format) + " (expected PCM or IEEE float)");
            }
            // Format checks belong to the analyzer; only 16-bit PCM is decoded here
            out.sample_rate     = static_cast<int>(fmt.sample_rate);
            out.channels        = fmt.num_channels;
            out.bits_per_sample = fmt.audio_format == kFormatPcm ? fmt.bits_per_sample : 0;
            out.samples.clear();
            if (fmt.audio_format == kFormatPcm && fmt.bits_per_sample == 16)
                out.samples = decode_pcm16_le(data.data(), data.size());
            return static_cast<int>(ErrorCode::OK);
        } else {
            file.seekg(chunk_size + (chunk_size & 1u), std::ios::cur);
        }
        if (!file.good()) break;
    }

    return fail(wav_format, "Missing fmt or data chunk in WAV file");
}

std::vector<int16_t> AudioProcessor::decode_pcm16_le(const uint8_t* data, size_t byte_count) {
    std::vector<int16_t> result(byte_count / 2);
    for (size_t i = 0; i < result.size(); ++i) {
        uint16_t lo = data[i * 2];
        uint16_t hi = data[i * 2 + 1];
        result[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return result;
}

std::vector<float> AudioProcessor::int16_to_float(const int16_t* data, size_t count) {
    std::vector<float> result(count);
    for (size_t i = 0; i < count; ++i) {
        result[i] = static_cast<float>(data[i]) / 32768.0f;
    }
    return result;
}

} // namespace pl

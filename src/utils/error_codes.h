#ifndef PL_ERROR_CODES_H
#define PL_ERROR_CODES_H

#include <string>

namespace pl {

// Values match the PL_ERROR_* codes of paraling_api.h
enum class ErrorCode {
    OK = 0,
    UNKNOWN = -1,
    INVALID_PARAM = -2,
    NOT_INIT = -3,
    ALREADY_INIT = -4,
    AUDIO_EMPTY = -5,
    AUDIO_TOO_SHORT = -6,
    AUDIO_INVALID = -7,
    FILE_NOT_FOUND = -8,
    WAV_FORMAT = -9,
    CANCELLED = -10,
    NO_AUDIO = -11,
    BUFFER_TOO_SMALL = -12
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Success";
        case ErrorCode::UNKNOWN: return "Unknown error";
        case ErrorCode::INVALID_PARAM: return "Invalid parameter";
        case ErrorCode::NOT_INIT: return "Library not initialized";
        case ErrorCode::ALREADY_INIT: return "Library already initialized";
        case ErrorCode::AUDIO_EMPTY: return "Audio buffer is empty";
        case ErrorCode::AUDIO_TOO_SHORT: return "Audio too short for analysis";
        case ErrorCode::AUDIO_INVALID: return "Invalid audio format (expected 16-bit mono PCM)";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::WAV_FORMAT: return "Invalid WAV format";
        case ErrorCode::CANCELLED: return "Analysis cancelled";
        case ErrorCode::NO_AUDIO: return "No audio analyzed in this session";
        case ErrorCode::BUFFER_TOO_SMALL: return "Output buffer too small";
        default: return "Unknown error code";
    }
}

inline const char* error_code_to_string(int code) {
    return error_code_to_string(static_cast<ErrorCode>(code));
}

// Thread-local error message storage
inline thread_local std::string g_last_error;

inline void set_last_error(const std::string& msg) {
    g_last_error = msg;
}

inline void set_last_error(ErrorCode code) {
    g_last_error = error_code_to_string(code);
}

inline void set_last_error(ErrorCode code, const std::string& detail) {
    g_last_error = std::string(error_code_to_string(code)) + ": " + detail;
}

inline const char* get_last_error() {
    return g_last_error.c_str();
}

} // namespace pl

#endif // PL_ERROR_CODES_H

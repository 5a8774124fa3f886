#include "utils/logger.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <string>
#include <vector>

namespace pl {

namespace {

constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles     = 3;

spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback) {
    const char* env = std::getenv("PARALING_LOG_LEVEL");
    if (!env || !*env) return fallback;
    // from_str maps unknown names to off; keep the fallback instead
    auto level = spdlog::level::from_str(env);
    if (level == spdlog::level::off && std::string(env) != "off") return fallback;
    return level;
}

} // anonymous namespace

void Logger::init(const std::string& log_file, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) return;
    configure(log_file, level);
}

void Logger::configure(const std::string& log_file, spdlog::level::level_enum level) {
    level = level_from_env(level);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kMaxLogFileBytes, kMaxLogFiles);
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("paraling", sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger_->flush_on(spdlog::level::warn);

    spdlog::drop("paraling");
    spdlog::register_logger(logger_);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) return;

    logger_->flush();
    spdlog::drop("paraling");
    logger_.reset();
}

} // namespace pl

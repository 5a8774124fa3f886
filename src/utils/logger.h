#ifndef PL_LOGGER_H
#define PL_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace pl {

/**
 * Process-wide spdlog logger named "paraling".
 *
 * pl_init() configures it with a rotating file sink; any log call before that
 * lazily creates a console-only logger. PARALING_LOG_LEVEL (trace, debug,
 * info, warn, error, off) overrides the requested level.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Empty log_file = console only; no-op once configured
    void init(const std::string& log_file,
              spdlog::level::level_enum level = spdlog::level::info);

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!logger_) configure("", spdlog::level::info);
        return logger_;
    }

    void set_level(spdlog::level::level_enum level) {
        get()->set_level(level);
    }

    void shutdown();

private:
    Logger() = default;
    ~Logger() { shutdown(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller holds mutex_
    void configure(const std::string& log_file, spdlog::level::level_enum level);

    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
};

} // namespace pl

#define PL_LOG_DEBUG(...) pl::Logger::instance().get()->debug(__VA_ARGS__)
#define PL_LOG_INFO(...)  pl::Logger::instance().get()->info(__VA_ARGS__)
#define PL_LOG_WARN(...)  pl::Logger::instance().get()->warn(__VA_ARGS__)
#define PL_LOG_ERROR(...) pl::Logger::instance().get()->error(__VA_ARGS__)

#endif // PL_LOGGER_H

#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include "core/errors/contract_errors.hpp"

namespace evo::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline constexpr const char* kEnvLogDir = "EVO_LOG_DIR";
    inline constexpr const char* kDefaultLogDir = "./logs";
    inline constexpr const char* kEnvLogLevel = "EVO_LOG_LEVEL";
    inline constexpr LogLevel kDefaultLogLevel = LogLevel::INFO;

    std::string_view level_name(LogLevel level);

    // Case-insensitive: "trace", "debug", "info", "warn"/"warning", "error".
    std::optional<LogLevel> parse_log_level(std::string_view text);

    // $EVO_LOG_DIR, or ./logs
    std::filesystem::path log_dir();

    // $EVO_LOG_LEVEL, or info when unset or unrecognized
    LogLevel log_level_from_env();

    // 2. Global Logger Setup
    // Every record goes to stdout as text. Once a file sink is attached the
    // record is also appended to <dir>/<component>.log.<YYYY-MM-DD> as one
    // JSON object per line; the file rolls over when the UTC date changes.
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get();

        void set_component(const std::string& component);
        void set_min_level(LogLevel level);
        LogLevel min_level() const;
        bool enabled(LogLevel level) const;

        void log(LogLevel level, const std::string& message);

        errors::Result<std::filesystem::path> attach_file(
            const std::filesystem::path& directory);
        void detach_file();
        void flush();

    private:
        Logger() = default;

        bool open_file_for_today();

        mutable std::mutex mutex_;
        std::string component_;
        LogLevel min_level_ = kDefaultLogLevel;
        std::filesystem::path file_dir_;
        std::filesystem::path file_path_;
        std::string file_date_;
        std::ofstream file_;
    };

    // Keeps the file sink attached. Hold it for the lifetime of the process;
    // destruction flushes and detaches the sink.
    class LogGuard {
    public:
        LogGuard() = default;
        explicit LogGuard(std::filesystem::path file_path);
        ~LogGuard();

        LogGuard(LogGuard&& other) noexcept;
        LogGuard& operator=(LogGuard&& other) noexcept;
        LogGuard(const LogGuard&) = delete;
        LogGuard& operator=(const LogGuard&) = delete;

        bool active() const { return active_; }
        const std::filesystem::path& file_path() const { return file_path_; }

    private:
        void release();

        bool active_ = false;
        std::filesystem::path file_path_;
    };

    // One-time process setup: names the component, applies $EVO_LOG_LEVEL and
    // attaches the daily file sink under log_dir(). Telemetry export is not
    // built into this library; an endpoint is acknowledged with a warning and
    // no second guard is produced.
    errors::Result<LogGuard> init_logging(
        const std::string& component,
        const std::optional<std::string>& otlp_endpoint = std::nullopt);

    // 3. Helper macros for clean syntax everywhere else in the code.
    // The message expression is only evaluated when the level is enabled.
    #define EVO_LOG_AT(level, msg)                                        \
        do {                                                              \
            auto& evo_logger_ = evo::core::logging::Logger::get();        \
            if (evo_logger_.enabled(level)) {                             \
                evo_logger_.log(level, msg);                              \
            }                                                             \
        } while (0)

    #define EVO_LOG_TRACE(msg) EVO_LOG_AT(evo::core::logging::LogLevel::TRACE, msg)
    #define EVO_LOG_DEBUG(msg) EVO_LOG_AT(evo::core::logging::LogLevel::DEBUG, msg)
    #define EVO_LOG_INFO(msg)  EVO_LOG_AT(evo::core::logging::LogLevel::INFO, msg)
    #define EVO_LOG_WARN(msg)  EVO_LOG_AT(evo::core::logging::LogLevel::WARN, msg)
    #define EVO_LOG_ERROR(msg) EVO_LOG_AT(evo::core::logging::LogLevel::ERROR, msg)

} // namespace evo::core::logging

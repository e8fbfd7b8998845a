#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>

namespace evo::core::logging {

using core::errors::ContractError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::string utc_date() {
    const std::time_t now = std::time(nullptr);
    std::tm parts{};
    gmtime_r(&now, &parts);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &parts);
    return buffer;
}

std::string thread_label() {
    std::ostringstream out;
    out << std::this_thread::get_id();
    return out.str();
}

}  // namespace

std::string_view level_name(const LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(const std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::filesystem::path log_dir() {
    const char* configured = std::getenv(kEnvLogDir);
    if (configured == nullptr || *configured == '\0') {
        return std::filesystem::path(kDefaultLogDir);
    }
    return std::filesystem::path(configured);
}

LogLevel log_level_from_env() {
    const char* configured = std::getenv(kEnvLogLevel);
    if (configured == nullptr) {
        return kDefaultLogLevel;
    }
    return parse_log_level(configured).value_or(kDefaultLogLevel);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_component(const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_ = component;
}

void Logger::set_min_level(const LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(const LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level());
}

void Logger::log(const LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }

    std::cout << "[" << level_name(level) << "] "
              << (component_.empty() ? "" : "[" + component_ + "] ")
              << message << std::endl;

    if (!file_.is_open() || !open_file_for_today()) {
        return;
    }
    json record;
    record["ts_unix_ms"] = now_unix_ms();
    record["level"] = std::string(level_name(level));
    record["component"] = component_;
    record["thread"] = thread_label();
    record["message"] = message;
    file_ << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

// Caller holds mutex_.
bool Logger::open_file_for_today() {
    const std::string today = utc_date();
    if (file_.is_open() && today == file_date_) {
        return true;
    }
    if (file_.is_open()) {
        file_.close();
    }
    const std::string prefix = component_.empty() ? "evo" : component_;
    file_path_ = file_dir_ / (prefix + ".log." + today);
    file_.open(file_path_, std::ios::app);
    file_date_ = today;
    return file_.is_open();
}

errors::Result<std::filesystem::path> Logger::attach_file(
    const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return ContractError{ErrorCategory::Internal,
                             "Unable to create log directory: " + directory.string(),
                             "log_dir_create_failed"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_dir_ = directory;
    file_date_.clear();
    if (!open_file_for_today()) {
        return ContractError{ErrorCategory::Internal,
                             "Unable to open log file: " + file_path_.string(),
                             "log_open_failed"};
    }
    return file_path_;
}

void Logger::detach_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_date_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

LogGuard::LogGuard(std::filesystem::path file_path)
    : active_(true), file_path_(std::move(file_path)) {}

LogGuard::~LogGuard() {
    release();
}

LogGuard::LogGuard(LogGuard&& other) noexcept
    : active_(other.active_), file_path_(std::move(other.file_path_)) {
    other.active_ = false;
}

LogGuard& LogGuard::operator=(LogGuard&& other) noexcept {
    if (this != &other) {
        release();
        active_ = other.active_;
        file_path_ = std::move(other.file_path_);
        other.active_ = false;
    }
    return *this;
}

void LogGuard::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    Logger::get().flush();
    Logger::get().detach_file();
}

errors::Result<LogGuard> init_logging(const std::string& component,
                                      const std::optional<std::string>& otlp_endpoint) {
    Logger& logger = Logger::get();
    logger.set_component(component);
    logger.set_min_level(log_level_from_env());

    auto attached = logger.attach_file(log_dir());
    if (errors::is_error(attached)) {
        return errors::get_error(attached);
    }
    const auto file_path = errors::get_value(attached);

    EVO_LOG_INFO("Logging initialized: " + file_path.string());
    if (otlp_endpoint.has_value()) {
        EVO_LOG_WARN("Telemetry export is not available in this build; endpoint " +
                     *otlp_endpoint + " ignored");
    }
    return LogGuard(file_path);
}

}  // namespace evo::core::logging

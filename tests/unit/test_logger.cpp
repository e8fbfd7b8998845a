#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/contract_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

using evo::core::errors::get_error;
using evo::core::errors::is_error;
using evo::core::errors::take_value;
using evo::core::logging::init_logging;
using evo::core::logging::LogGuard;
using evo::core::logging::Logger;
using evo::core::logging::LogLevel;
using evo::core::logging::parse_log_level;
using nlohmann::json;

class TempLogDir {
public:
    TempLogDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                ("evo_logger_test_" + std::to_string(stamp));
        setenv("EVO_LOG_DIR", root_.c_str(), 1);
    }

    ~TempLogDir() {
        unsetenv("EVO_LOG_DIR");
        unsetenv("EVO_LOG_LEVEL");
        Logger::get().set_min_level(LogLevel::INFO);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_records(const std::filesystem::path& file_path) {
    std::vector<json> records;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        records.push_back(json::parse(line));
    }
    return records;
}

}  // namespace

TEST(LoggerTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(LoggerTest, LogDirDefaultsWhenUnset) {
    unsetenv("EVO_LOG_DIR");

    EXPECT_EQ(evo::core::logging::log_dir(), std::filesystem::path("./logs"));
}

TEST(LoggerTest, InitWritesJsonLinesIntoConfiguredDirectory) {
    TempLogDir dir;
    setenv("EVO_LOG_LEVEL", "debug", 1);

    auto result = init_logging("gateway");
    ASSERT_FALSE(is_error(result)) << get_error(result).describe();
    std::filesystem::path file_path;
    {
        LogGuard guard = take_value(std::move(result));
        ASSERT_TRUE(guard.active());
        file_path = guard.file_path();
        EXPECT_EQ(file_path.parent_path(), dir.root());
        EXPECT_EQ(file_path.filename().string().rfind("gateway.log.", 0), 0u);

        EVO_LOG_DEBUG("provider pool loaded");
    }

    const auto records = read_records(file_path);
    ASSERT_GE(records.size(), 2u);
    const json& last = records.back();
    EXPECT_EQ(last["level"], "DEBUG");
    EXPECT_EQ(last["component"], "gateway");
    EXPECT_EQ(last["message"], "provider pool loaded");
    EXPECT_TRUE(last["ts_unix_ms"].is_number_integer());
}

TEST(LoggerTest, EnvLevelFiltersLowerSeverities) {
    TempLogDir dir;
    setenv("EVO_LOG_LEVEL", "warn", 1);

    auto result = init_logging("agent");
    ASSERT_FALSE(is_error(result));
    std::filesystem::path file_path;
    {
        LogGuard guard = take_value(std::move(result));
        file_path = guard.file_path();
        EXPECT_EQ(Logger::get().min_level(), LogLevel::WARN);

        EVO_LOG_INFO("hidden");
        EVO_LOG_WARN("shown");
    }

    const auto records = read_records(file_path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["message"], "shown");
    EXPECT_EQ(records[0]["level"], "WARN");
}

TEST(LoggerTest, MessagesBelowMinLevelAreNotBuilt) {
    TempLogDir dir;
    Logger::get().set_min_level(LogLevel::WARN);
    EXPECT_FALSE(Logger::get().enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::get().enabled(LogLevel::ERROR));

    int built = 0;
    const auto message = [&built] {
        ++built;
        return std::string("counted");
    };
    EVO_LOG_DEBUG(message());
    EVO_LOG_INFO(message());
    EXPECT_EQ(built, 0);

    EVO_LOG_WARN(message());
    EXPECT_EQ(built, 1);
}

TEST(LoggerTest, InvalidUtf8IsReplacedInFileRecords) {
    TempLogDir dir;

    auto result = init_logging("gateway");
    ASSERT_FALSE(is_error(result));
    std::filesystem::path file_path;
    {
        LogGuard guard = take_value(std::move(result));
        file_path = guard.file_path();
        EXPECT_NO_THROW(EVO_LOG_WARN(std::string("bad byte h\xff")));
    }

    const auto records = read_records(file_path);
    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records.back()["message"], "bad byte h\xEF\xBF\xBD");
}

TEST(LoggerTest, TelemetryEndpointIsAcknowledgedWithAWarning) {
    TempLogDir dir;

    auto result = init_logging("king", std::string("http://collector:4317"));
    ASSERT_FALSE(is_error(result));
    std::filesystem::path file_path;
    {
        LogGuard guard = take_value(std::move(result));
        file_path = guard.file_path();
    }

    const auto records = read_records(file_path);
    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records.back()["level"], "WARN");
    EXPECT_NE(records.back()["message"].get<std::string>().find("http://collector:4317"),
              std::string::npos);
}

TEST(LoggerTest, GuardDetachesFileSinkOnDestruction) {
    TempLogDir dir;

    auto result = init_logging("skill");
    ASSERT_FALSE(is_error(result));
    std::filesystem::path file_path;
    {
        LogGuard guard = take_value(std::move(result));
        file_path = guard.file_path();
        LogGuard moved = std::move(guard);
        EXPECT_FALSE(guard.active());
        EXPECT_TRUE(moved.active());
    }
    const auto before = read_records(file_path).size();

    EVO_LOG_ERROR("after guard");

    EXPECT_EQ(read_records(file_path).size(), before);
}

TEST(LoggerTest, UncreatableDirectoryIsAnInternalError) {
    TempLogDir dir;
    std::filesystem::create_directories(dir.root());
    const auto blocker = dir.root() / "not_a_dir";
    std::ofstream(blocker) << "x";
    setenv("EVO_LOG_DIR", (blocker / "logs").c_str(), 1);

    auto result = init_logging("gateway");

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, evo::core::errors::ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "log_dir_create_failed");
}

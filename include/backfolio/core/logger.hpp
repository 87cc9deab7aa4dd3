// include/backfolio/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "backfolio/core/config_base.hpp"

namespace backfolio {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // Per-session progress
    INFO,     // Run lifecycle
    WARNING,  // Recovered per-session problems
    ERR,      // Errors that abort an operation
    FATAL     // Errors that abort the process
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& s, LogLevel fallback = LogLevel::INFO);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& s,
                                           LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"backfolio"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Messages carry the component name registered on the calling thread, so
 * concurrent backtest runs stay distinguishable in a shared log file.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error when the log file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Name the component for messages logged from this thread
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All helpers below assume mutex_ is held
    void open_log_file();
    void enforce_retention(const std::filesystem::path& log_dir);
    void write_to_file(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::backfolio::Logger::instance().get_min_level()) {        \
            std::ostringstream os;                                             \
            os << message;                                                     \
            ::backfolio::Logger::instance().log(level, os.str());              \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::backfolio::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::backfolio::LogLevel::DEBUG, message)
#define INFO(message) LOG(::backfolio::LogLevel::INFO, message)
#define WARN(message) LOG(::backfolio::LogLevel::WARNING, message)
#define ERROR(message) LOG(::backfolio::LogLevel::ERR, message)
#define FATAL(message) LOG(::backfolio::LogLevel::FATAL, message)

}  // namespace backfolio

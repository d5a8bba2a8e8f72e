// include/tcrimer/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "tcrimer/core/config_base.hpp"

namespace tcrimer {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Degraded operation: retries, failover, cache faults
    ERR,      // Errors that fail an operation but don't stop the process
    FATAL     // Unrecoverable
};

/**
 * @brief Log destination type
 */
enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& text);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"tcrimer"};
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
 * Before initialize() is called, WARNING and above still reach stderr so that
 * library code used without setup does not lose failures.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close the log file and return to the uninitialized state
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread
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

    void open_log_file();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void write_to_file_unsafe(const std::string& message);
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
#define LOG(level, message)                                         \
    do {                                                            \
        if (level >= ::tcrimer::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                  \
            os << message;                                          \
            ::tcrimer::Logger::instance().log(level, os.str());     \
        }                                                           \
    } while (0)

#define TRACE(message) LOG(::tcrimer::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::tcrimer::LogLevel::DEBUG, message)
#define INFO(message) LOG(::tcrimer::LogLevel::INFO, message)
#define WARN(message) LOG(::tcrimer::LogLevel::WARNING, message)
#define ERROR(message) LOG(::tcrimer::LogLevel::ERR, message)
#define FATAL(message) LOG(::tcrimer::LogLevel::FATAL, message)

}  // namespace tcrimer

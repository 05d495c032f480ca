// include/ledger_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "ledger_ngin/core/config_base.hpp"

namespace ledger_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Data-quality anomalies that don't stop a computation
    ERR,      // Failed computations or collaborator errors
    FATAL     // Critical errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

inline LogLevel level_from_string(const std::string& level, LogLevel fallback) {
    if (level == "TRACE")
        return LogLevel::TRACE;
    if (level == "DEBUG")
        return LogLevel::DEBUG;
    if (level == "INFO")
        return LogLevel::INFO;
    if (level == "WARNING")
        return LogLevel::WARNING;
    if (level == "ERROR")
        return LogLevel::ERR;
    if (level == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

inline LogDestination destination_from_string(const std::string& dest, LogDestination fallback) {
    if (dest == "CONSOLE")
        return LogDestination::CONSOLE;
    if (dest == "FILE")
        return LogDestination::FILE;
    if (dest == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};  // Minimum level to log
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};           // Directory for log files
    std::string filename_prefix{"ledger_ngin"};  // Prefix for log files
    bool include_timestamp{true};                // Include timestamp in logs
    bool include_level{true};                    // Include log level in logs
    size_t max_file_size{50 * 1024 * 1024};      // Max log file size (50MB)
    size_t max_files{10};                        // Maximum number of log files to keep

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level"))
            min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
        if (j.contains("destination"))
            destination =
                destination_from_string(j.at("destination").get<std::string>(), destination);
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Process-wide logger
 *
 * Lines look like `2025-01-17T21:00:00Z [WARNING] [CostBasisLedger] message`.
 * The component tag is per thread, so concurrent reconciliations and cache
 * loads tag their own lines. File output is split into
 * `<prefix>_<session>_partN.log` files of at most max_file_size bytes, and
 * only the newest max_files are kept.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Return to the uninitialized state, closing any open file
     */
    static void reset_for_tests() {
        Logger& logger = instance();
        std::lock_guard<std::mutex> lock(logger.mutex_);
        logger.initialized_.store(false, std::memory_order_release);
        if (logger.log_file_.is_open()) {
            logger.log_file_.close();
        }
        logger.config_ = LoggerConfig();
        logger.min_level_.store(logger.config_.min_level, std::memory_order_relaxed);
        logger.part_number_ = 0;
    }

    /**
     * @brief Write one line; before initialize() it goes to stderr
     */
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
     * @brief Tag subsequent messages from the calling thread with a component name
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

    // Callers hold mutex_
    bool writes_to_file() const;
    bool open_next_part();
    void prune_old_files();
    std::string format_line(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::filesystem::path log_directory_;
    std::ofstream log_file_;
    std::string session_stamp_;  // YYYYMMDD_HHMMSS, UTC
    int part_number_{0};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                      \
    do {                                                                         \
        if (level >= ::ledger_ngin::Logger::instance().get_min_level()) {        \
            std::ostringstream os;                                               \
            os << message;                                                       \
            ::ledger_ngin::Logger::instance().log(level, os.str());              \
        }                                                                        \
    } while (0)

#define TRACE(message) LOG(::ledger_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::ledger_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::ledger_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::ledger_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::ledger_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::ledger_ngin::LogLevel::FATAL, message)
}  // namespace ledger_ngin

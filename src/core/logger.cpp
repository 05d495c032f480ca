// src/core/logger.cpp

#include "ledger_ngin/core/logger.hpp"
#include <algorithm>
#include <vector>
#include "ledger_ngin/core/time_utils.hpp"

namespace ledger_ngin {

thread_local std::string Logger::current_component_;

namespace {

bool is_session_file(const std::filesystem::path& path, const std::string& prefix) {
    return path.extension() == ".log" && path.filename().string().rfind(prefix + "_", 0) == 0;
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }

    config_ = config;
    min_level_.store(config_.min_level, std::memory_order_relaxed);
    session_stamp_ = core::get_formatted_time("%Y%m%d_%H%M%S", false);
    part_number_ = 0;

    if (writes_to_file()) {
        log_directory_ = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_directory_, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory " + log_directory_.string() +
                                     ": " + ec.message());
        }
        if (!open_next_part()) {
            throw std::runtime_error("Failed to open log file in " + log_directory_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "[" << level_to_string(level) << "] (logger not initialized) " << message
                  << std::endl;
        return;
    }
    if (level < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string line = format_line(level, message);
    if (config_.destination != LogDestination::FILE) {
        std::cout << line << '\n' << std::flush;
    }
    if (writes_to_file() && log_file_.is_open()) {
        log_file_ << line << '\n' << std::flush;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            log_file_.close();
            if (!open_next_part()) {
                std::cerr << "Failed to rotate log file in " << log_directory_.string()
                          << ", file logging stopped" << std::endl;
            }
        }
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    if (config_.include_timestamp) {
        // Same UTC convention as the ledger's day boundaries
        line << core::get_formatted_time("%Y-%m-%dT%H:%M:%SZ", false) << " ";
    }
    if (config_.include_level) {
        line << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        line << "[" << current_component_ << "] ";
    }
    line << message;
    return line.str();
}

bool Logger::writes_to_file() const {
    return config_.destination == LogDestination::FILE ||
           config_.destination == LogDestination::BOTH;
}

bool Logger::open_next_part() {
    prune_old_files();

    part_number_++;
    const std::filesystem::path path =
        log_directory_ / (config_.filename_prefix + "_" + session_stamp_ + "_part" +
                          std::to_string(part_number_) + ".log");
    log_file_.open(path, std::ios::app);
    return log_file_.is_open();
}

void Logger::prune_old_files() {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(log_directory_, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec) && is_session_file(it->path(), config_.filename_prefix)) {
            files.push_back(it->path());
        }
    }
    if (files.size() < config_.max_files) {
        return;
    }

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        std::error_code ignored;
        return std::filesystem::last_write_time(a, ignored) <
               std::filesystem::last_write_time(b, ignored);
    });

    // Leave room for the file about to be opened
    const size_t excess = files.size() - (config_.max_files > 0 ? config_.max_files - 1 : 0);
    for (size_t i = 0; i < excess; ++i) {
        std::filesystem::remove(files[i], ec);
    }
}

}  // namespace ledger_ngin

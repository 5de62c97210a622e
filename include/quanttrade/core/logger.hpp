// include/quanttrade/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "quanttrade/core/config_base.hpp"

namespace quanttrade {

/**
 * @brief Severity of a log line
 */
enum class LogLevel {
    TRACE,    // Per-bar simulator detail
    DEBUG,    // Per-candidate and per-window detail
    INFO,     // Run start, data summary, progress
    WARNING,  // Skipped or failed iterations, missing benchmark
    ERR,      // A run failed
    FATAL
};

enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name, case-insensitive ("WARN" and "WARNING" both accepted)
 * @return std::nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(const std::string& name);
std::optional<LogDestination> parse_log_destination(const std::string& name);

/**
 * @brief Logging section of the application config
 *
 * from_json throws std::invalid_argument on an unknown level or destination,
 * which ConfigLoader reports as INVALID_DATA.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"quanttrade"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // Bytes before rolling to the next part
    size_t max_files{10};                    // Files with our prefix kept in log_directory

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide thread-safe logger
 *
 * Files are named <prefix>_<YYYYMMDD_HHMMSS>_part<N>.log. A file that grows
 * past max_file_size rolls over to the next part, and the oldest files with
 * the same prefix are removed so at most max_files remain.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening the log file if needed
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
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

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void enforce_retention(const std::filesystem::path& log_dir);
    void open_log_file(const std::filesystem::path& log_dir);
    void roll_over();
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;
    int part_number_{1};
};

/**
 * @brief Sets the calling thread's component tag and restores the previous one on exit
 *
 * Worker threads start with an empty tag, so Monte Carlo workers use this to
 * keep their lines attributed.
 */
class ScopedLogComponent {
public:
    explicit ScopedLogComponent(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }

    ~ScopedLogComponent() {
        Logger::register_component(previous_);
    }

    ScopedLogComponent(const ScopedLogComponent&) = delete;
    ScopedLogComponent& operator=(const ScopedLogComponent&) = delete;

private:
    std::string previous_;
};

/**
 * Usage: LOG(LogLevel::INFO, "Loaded " << rows << " rows")
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)
}  // namespace quanttrade

// src/core/logger.cpp

#include "quanttrade/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

thread_local std::string Logger::current_component_;

namespace {

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool has_prefix(const std::filesystem::path& path, const std::string& prefix) {
    return path.filename().string().rfind(prefix + "_", 0) == 0;
}

}  // anonymous namespace

std::string level_to_string(LogLevel level) {
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
    }
    return "UNKNOWN";
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARNING;
    if (upper == "ERR" || upper == "ERROR")
        return LogLevel::ERR;
    if (upper == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

std::optional<LogDestination> parse_log_destination(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "CONSOLE")
        return LogDestination::CONSOLE;
    if (upper == "FILE")
        return LogDestination::FILE;
    if (upper == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

nlohmann::json LoggerConfig::to_json() const {
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

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        const std::string name = j.at("min_level").get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            throw std::invalid_argument("Unknown log level: " + name);
        }
        min_level = *level;
    }
    if (j.contains("destination")) {
        const std::string name = j.at("destination").get<std::string>();
        auto dest = parse_log_destination(name);
        if (!dest) {
            throw std::invalid_argument("Unknown log destination: " + name);
        }
        destination = *dest;
    }
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

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_ = false;
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (config_.max_files == 0) {
        config_.max_files = 1;
    }

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Make room before the new file exists
        enforce_retention(log_dir);

        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_log_file(log_dir);

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in: " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string line = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }

    if (config_.destination != LogDestination::CONSOLE && log_file_.is_open()) {
        log_file_ << line << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            roll_over();
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> ours;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            has_prefix(entry.path(), config_.filename_prefix)) {
            ours.push_back(entry.path());
        }
    }

    // Names embed the session timestamp and part number, so name order is age order
    // within a session; write time orders across sessions.
    std::sort(ours.begin(), ours.end(), [](const auto& a, const auto& b) {
        auto ta = std::filesystem::last_write_time(a);
        auto tb = std::filesystem::last_write_time(b);
        return ta != tb ? ta < tb : a.filename().string() < b.filename().string();
    });

    size_t excess = ours.size() + 1 > config_.max_files ? ours.size() + 1 - config_.max_files : 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        std::filesystem::remove(ours[i], ec);
        if (ec) {
            std::cerr << "WARNING: Failed to remove old log file " << ours[i].string() << ": "
                      << ec.message() << std::endl;
        }
    }
}

void Logger::open_log_file(const std::filesystem::path& log_dir) {
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                   std::to_string(part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::roll_over() {
    log_file_.close();

    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    enforce_retention(log_dir);

    ++part_number_;
    open_log_file(log_dir);
    if (!log_file_.is_open()) {
        std::cerr << "WARNING: Failed to open log part " << part_number_ << " in "
                  << log_dir.string() << std::endl;
    }
}

}  // namespace quanttrade

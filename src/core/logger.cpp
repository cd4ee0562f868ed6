// src/core/logger.cpp

#include "gold_rotation/core/logger.hpp"
#include <algorithm>
#include <vector>
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {

thread_local std::string Logger::current_component_;

namespace {

LogLevel level_from_string(const std::string& level_str, LogLevel fallback) {
    if (level_str == "TRACE")
        return LogLevel::TRACE;
    if (level_str == "DEBUG")
        return LogLevel::DEBUG;
    if (level_str == "INFO")
        return LogLevel::INFO;
    if (level_str == "WARNING")
        return LogLevel::WARNING;
    if (level_str == "ERROR")
        return LogLevel::ERR;
    if (level_str == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

}  // namespace

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
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    if (j.contains("destination")) {
        std::string dest_str = j.at("destination").get<std::string>();
        if (dest_str == "CONSOLE")
            destination = LogDestination::CONSOLE;
        else if (dest_str == "FILE")
            destination = LogDestination::FILE;
        else if (dest_str == "BOTH")
            destination = LogDestination::BOTH;
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
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        enforce_retention(log_dir);

        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_log_file();

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
        // Messages below WARNING are dropped until someone configures the logger
        if (level >= LogLevel::WARNING) {
            std::cerr << "[" << level_to_string(level) << "] " << message << std::endl;
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(level, formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
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

void Logger::write_to_console_unsafe(LogLevel level, const std::string& message) {
    // Assumes mutex is already held
    std::ostream& out = level >= LogLevel::ERR ? std::cerr : std::cout;
    out << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::open_log_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                   std::to_string(part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    enforce_retention(std::filesystem::absolute(config_.log_directory));
    ++part_number_;
    open_log_file();
}

}  // namespace gold_rotation

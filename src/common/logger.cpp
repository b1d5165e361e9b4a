#include "common/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cctype>
#include <iostream>
#include <mutex>

namespace bridgelink {

// ============================================================================
// Log Level Utilities
// ============================================================================

LogLevel log_level_from_string(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace" || lower == "verbose") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err") return LogLevel::ERROR;
    if (lower == "fatal" || lower == "critical") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;

    return LogLevel::INFO;  // Default
}

std::string_view log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::OFF:   return "off";
    }
    return "info";
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(const std::string& module, std::shared_ptr<spdlog::logger> logger)
    : module_(module), logger_(std::move(logger)) {}

Logger& Logger::get(const std::string& module) {
    return LogManager::instance().get_logger(module);
}

void Logger::set_level(LogLevel level) {
    if (logger_) logger_->set_level(to_spdlog_level(level));
}

LogLevel Logger::get_level() const {
    if (!logger_) return LogLevel::OFF;
    switch (logger_->level()) {
        case spdlog::level::trace: return LogLevel::TRACE;
        case spdlog::level::debug: return LogLevel::DEBUG;
        case spdlog::level::info: return LogLevel::INFO;
        case spdlog::level::warn: return LogLevel::WARN;
        case spdlog::level::err: return LogLevel::ERROR;
        case spdlog::level::critical: return LogLevel::FATAL;
        default: return LogLevel::OFF;
    }
}

// ============================================================================
// LogManager
// ============================================================================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::~LogManager() {
    shutdown();
}

void LogManager::init(const LogConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        config_.global_level = config.global_level;
        config_.module_levels = config.module_levels;
        for (auto& [name, logger] : loggers_) {
            logger->set_level(resolve_module_level(name));
        }
        return;
    }

    config_ = config;
    build_sinks();
    initialized_ = true;

    // Loggers created before init() keep working but pick up the new sinks
    for (auto& [name, logger] : loggers_) {
        logger->logger_ = create_logger(name);
        logger->set_level(resolve_module_level(name));
    }
}

void LogManager::build_sinks() {
    sinks_.clear();

    if (config_.console_enabled) {
        spdlog::sink_ptr console;
        if (config_.console_color) {
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        }
        sinks_.push_back(std::move(console));
    }

    if (!config_.file_path.empty()) {
        try {
            sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.file_path, config_.file_max_size, config_.file_max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Failed to open log file " << config_.file_path << ": " << ex.what() << std::endl;
        }
    }
}

std::shared_ptr<spdlog::logger> LogManager::create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_pattern(config_.pattern);
    logger->set_level(to_spdlog_level(resolve_module_level(name)));
    return logger;
}

void LogManager::set_global_level(LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.global_level = level;

    // Update all loggers without module-specific overrides
    for (auto& [name, logger] : loggers_) {
        logger->set_level(resolve_module_level(name));
    }
}

LogLevel LogManager::get_global_level() const {
    std::shared_lock lock(mutex_);
    return config_.global_level;
}

void LogManager::set_module_level(const std::string& module, LogLevel level) {
    std::unique_lock lock(mutex_);
    config_.module_levels[module] = level;

    for (auto& [name, logger] : loggers_) {
        logger->set_level(resolve_module_level(name));
    }
}

std::optional<LogLevel> LogManager::get_module_level(const std::string& module) const {
    std::shared_lock lock(mutex_);
    auto it = config_.module_levels.find(module);
    if (it != config_.module_levels.end()) {
        return it->second;
    }
    return std::nullopt;
}

void LogManager::flush() {
    std::shared_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        if (logger->logger_) logger->logger_->flush();
    }
}

void LogManager::shutdown() {
    std::unique_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        if (logger->logger_) logger->logger_->flush();
    }
    sinks_.clear();
    initialized_ = false;
}

Logger& LogManager::get_logger(const std::string& module) {
    // Fast path: check if logger exists
    {
        std::shared_lock lock(mutex_);
        auto it = loggers_.find(module);
        if (it != loggers_.end()) {
            return *it->second;
        }
    }

    // Slow path: create new logger
    std::unique_lock lock(mutex_);

    // Double-check after acquiring write lock
    auto it = loggers_.find(module);
    if (it != loggers_.end()) {
        return *it->second;
    }

    // Lazily fall back to default sinks when nobody called init()
    if (!initialized_ && sinks_.empty()) {
        build_sinks();
    }

    auto logger = std::unique_ptr<Logger>(new Logger(module, create_logger(module)));
    auto& ref = *logger;
    loggers_[module] = std::move(logger);

    return ref;
}

LogLevel LogManager::resolve_module_level(const std::string& module) const {
    auto it = config_.module_levels.find(module);
    if (it != config_.module_levels.end()) {
        return it->second;
    }

    // Check for parent module level (e.g., "client.watchdog" inherits from "client")
    size_t dot_pos = module.rfind('.');
    while (dot_pos != std::string::npos) {
        std::string parent = module.substr(0, dot_pos);
        auto parent_it = config_.module_levels.find(parent);
        if (parent_it != config_.module_levels.end()) {
            return parent_it->second;
        }
        if (dot_pos == 0) break;
        dot_pos = parent.rfind('.');
    }

    return config_.global_level;
}

} // namespace bridgelink

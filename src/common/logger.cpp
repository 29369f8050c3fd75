#include "liveline/common/logger.hpp"
#include "liveline/common/constants.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace liveline {
namespace common {

namespace {

spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(std::cerr, true);
    sink->set_level(level);
    return sink;
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }
    
    auto spdlog_level = toSpdlogLevel(logging_config.level);
    std::vector<spdlog::sink_ptr> sinks;
    
    try {
        if (mode == LogMode::FILE_ONLY) {
            if (logging_config.file.empty()) {
                throw std::runtime_error("Log file path required for FILE_ONLY mode");
            }
            
            std::filesystem::path log_dir = std::filesystem::path(logging_config.file).parent_path();
            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }
            
            try {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    getLogFileWithSuffix(logging_config.format, logging_config.file),
                    logging_config.rotation_size_mb * 1024 * 1024,
                    logging_config.max_files);
                file_sink->set_level(spdlog_level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "[Logger] Failed to open log file: " << logging_config.file
                         << " - " << ex.what() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                sinks.push_back(makeConsoleSink(spdlog_level));
            }
        } else {
            sinks.push_back(makeConsoleSink(spdlog_level));
        }
        
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME,
                                                   sinks.begin(), sinks.end());
        
        if (logging_config.format == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }
        
        logger_->set_level(spdlog_level);
        
        if (mode == LogMode::FILE_ONLY) {
            logger_->flush_on(spdlog::level::info);
        }
        
        spdlog::register_logger(logger_);
        initialized_ = true;
        
    } catch (const std::exception& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME,
                                                   makeConsoleSink(spdlog_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(spdlog_level);
        initialized_ = true;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::warn;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    
    std::filesystem::path p(base_path);
    std::string name = p.stem().string() + ".json" + p.extension().string();
    if (p.parent_path().empty()) {
        return name;
    }
    return (p.parent_path() / name).string();
}

}}

#include "liveline/common/config.hpp"
#include "liveline/common/constants.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace liveline {
namespace common {

namespace {

int parseInt(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            LIVELINE_THROW(InvalidArgument, "{}: '{}' is not an integer", key, value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        LIVELINE_THROW(InvalidArgument, "{}: '{}' is not an integer", key, value);
    }
}

size_t parseSize(const std::string& key, const std::string& value) {
    int parsed = parseInt(key, value);
    if (parsed < 0) {
        LIVELINE_THROW(InvalidArgument, "{}: '{}' must not be negative", key, value);
    }
    return static_cast<size_t>(parsed);
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    LIVELINE_THROW(InvalidArgument, "{}: '{}' is not a boolean", key, value);
}

}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "WARN";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.display.title = TITLE;
    config.display.text_color = TEXT_COLOR;
    config.display.unicode_supported = UNICODE_SUPPORTED;
    config.display.bar_width = BAR_WIDTH;
    config.display.style = constants::styles::DEFAULT;
    
    config.timing.awaiting_interval_ms = AWAITING_INTERVAL_MS;
    config.timing.awaiting_timeout_ms = AWAITING_TIMEOUT_MS;
    config.timing.relay_interval_ms = RELAY_INTERVAL_MS;
    
    config.logging.level = LogLevel::WARN;
    config.logging.file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::string Config::getDefaultConfigPath() const {
    std::filesystem::path base;
    
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return constants::system::CONFIG_FILE_NAME;
    }
    
    return (base / constants::system::APPLICATION_NAME / constants::system::CONFIG_FILE_NAME).string();
}

std::optional<std::string> Config::findBestConfig(const std::string& explicit_path) const {
    std::vector<std::string> paths;
    
    if (!explicit_path.empty()) {
        paths.push_back(explicit_path);
    }
    if (const char* env = std::getenv(constants::system::CONFIG_ENV); env && *env) {
        paths.push_back(env);
    }
    paths.push_back(getDefaultConfigPath());
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

std::string Config::getConfigPath() const {
    return current_config_path_.empty() ? getDefaultConfigPath() : current_config_path_;
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    
    auto best = findBestConfig(config_file);
    if (!best) {
        current_config_path_ = config_file;
        Logger::instance().debug("[Config] No configuration file | using defaults");
        return true;
    }
    
    current_config_path_ = *best;
    return tryLoadTomlFile(*best);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    try {
        auto data = toml::parse(path);
        
        if (data.contains("display")) {
            auto display = data.at("display");
            
            if (display.contains("title")) {
                global_.display.title = toml::find<std::string>(display, "title");
            }
            if (display.contains("text_color")) {
                global_.display.text_color = toml::find<std::string>(display, "text_color");
            }
            if (display.contains("unicode_supported")) {
                global_.display.unicode_supported = toml::find<bool>(display, "unicode_supported");
            }
            if (display.contains("bar_width")) {
                global_.display.bar_width = toml::find<size_t>(display, "bar_width");
            }
            if (display.contains("style")) {
                global_.display.style = toml::find<std::string>(display, "style");
            }
        }
        
        if (data.contains("timing")) {
            auto timing = data.at("timing");
            
            if (timing.contains("awaiting_interval_ms")) {
                global_.timing.awaiting_interval_ms = toml::find<int>(timing, "awaiting_interval_ms");
            }
            if (timing.contains("awaiting_timeout_ms")) {
                global_.timing.awaiting_timeout_ms = toml::find<int>(timing, "awaiting_timeout_ms");
            }
            if (timing.contains("relay_interval_ms")) {
                global_.timing.relay_interval_ms = toml::find<int>(timing, "relay_interval_ms");
            }
        }
        
        if (data.contains("logging")) {
            auto logging = data.at("logging");
            
            if (logging.contains("level")) {
                auto level = parseLogLevel(toml::find<std::string>(logging, "level"));
                if (level) {
                    global_.logging.level = *level;
                }
            }
            if (logging.contains("file")) {
                global_.logging.file = toml::find<std::string>(logging, "file");
            }
            if (logging.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging, "rotation_size_mb");
            }
            if (logging.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging, "max_files");
            }
            if (logging.contains("format")) {
                global_.logging.format = toml::find<std::string>(logging, "format") == "json"
                    ? LogFormat::JSON
                    : LogFormat::TEXT;
            }
        }
        
        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    std::string effective_config_file = config_file.empty() ? getConfigPath() : config_file;
    
    try {
        toml::value data = toml::table{
            {"display", toml::table{
                {"title", global_.display.title},
                {"text_color", global_.display.text_color},
                {"unicode_supported", global_.display.unicode_supported},
                {"bar_width", global_.display.bar_width},
                {"style", global_.display.style}
            }},
            {"timing", toml::table{
                {"awaiting_interval_ms", global_.timing.awaiting_interval_ms},
                {"awaiting_timeout_ms", global_.timing.awaiting_timeout_ms},
                {"relay_interval_ms", global_.timing.relay_interval_ms}
            }},
            {"logging", toml::table{
                {"level", logLevelToString(global_.logging.level)},
                {"file", global_.logging.file},
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }}
        };
        
        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
        }
        
        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }
        
        file << toml::format(data);
        file.close();
        
        current_config_path_ = effective_config_file;
        
        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | path={} | error={}", effective_config_file, e.what());
        return false;
    }
}

const std::vector<std::string>& Config::keys() {
    static const std::vector<std::string> keys = {
        "display.title",
        "display.text_color",
        "display.unicode_supported",
        "display.bar_width",
        "display.style",
        "timing.awaiting_interval_ms",
        "timing.awaiting_timeout_ms",
        "timing.relay_interval_ms",
        "logging.level",
        "logging.file",
        "logging.rotation_size_mb",
        "logging.max_files",
        "logging.format"
    };
    return keys;
}

void Config::setValue(const std::string& key, const std::string& value) {
    if (key == "display.title") {
        global_.display.title = value;
    } else if (key == "display.text_color") {
        global_.display.text_color = value;
    } else if (key == "display.unicode_supported") {
        global_.display.unicode_supported = parseBool(key, value);
    } else if (key == "display.bar_width") {
        global_.display.bar_width = parseSize(key, value);
    } else if (key == "display.style") {
        global_.display.style = value;
    } else if (key == "timing.awaiting_interval_ms") {
        global_.timing.awaiting_interval_ms = parseInt(key, value);
    } else if (key == "timing.awaiting_timeout_ms") {
        global_.timing.awaiting_timeout_ms = parseInt(key, value);
    } else if (key == "timing.relay_interval_ms") {
        global_.timing.relay_interval_ms = parseInt(key, value);
    } else if (key == "logging.level") {
        auto level = parseLogLevel(value);
        if (!level) {
            LIVELINE_THROW(InvalidArgument, "{}: unknown log level '{}'", key, value);
        }
        global_.logging.level = *level;
    } else if (key == "logging.file") {
        global_.logging.file = value;
    } else if (key == "logging.rotation_size_mb") {
        global_.logging.rotation_size_mb = parseSize(key, value);
    } else if (key == "logging.max_files") {
        global_.logging.max_files = parseSize(key, value);
    } else if (key == "logging.format") {
        if (value != "text" && value != "json") {
            LIVELINE_THROW(InvalidArgument, "{}: expected 'text' or 'json', got '{}'", key, value);
        }
        global_.logging.format = value == "json" ? LogFormat::JSON : LogFormat::TEXT;
    } else {
        LIVELINE_THROW(InvalidArgument, "Unknown configuration key: {}", key);
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "display.title") return global_.display.title;
    if (key == "display.text_color") return global_.display.text_color;
    if (key == "display.unicode_supported") return std::string(global_.display.unicode_supported ? "true" : "false");
    if (key == "display.bar_width") return std::to_string(global_.display.bar_width);
    if (key == "display.style") return global_.display.style;
    if (key == "timing.awaiting_interval_ms") return std::to_string(global_.timing.awaiting_interval_ms);
    if (key == "timing.awaiting_timeout_ms") return std::to_string(global_.timing.awaiting_timeout_ms);
    if (key == "timing.relay_interval_ms") return std::to_string(global_.timing.relay_interval_ms);
    if (key == "logging.level") return logLevelToString(global_.logging.level);
    if (key == "logging.file") return global_.logging.file;
    if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    if (key == "logging.format") return std::string(global_.logging.format == LogFormat::JSON ? "json" : "text");
    return std::nullopt;
}

}}

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace liveline {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct DisplayConfig {
    std::string title;
    std::string text_color;
    bool unicode_supported;
    size_t bar_width;
    std::string style;
};

struct TimingConfig {
    int awaiting_interval_ms;
    int awaiting_timeout_ms;
    int relay_interval_ms;
};

struct LoggingConfig {
    LogLevel level;
    std::string file;
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    DisplayConfig display;
    TimingConfig timing;
    LoggingConfig logging;
};

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

class Config {
public:
    static Config& instance();
    static GlobalConfig createDefaultConfig();
    
    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    static const std::vector<std::string>& keys();
    
    std::optional<std::string> findBestConfig(const std::string& explicit_path = "") const;
    std::string getConfigPath() const;
    std::string getDefaultConfigPath() const;

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}

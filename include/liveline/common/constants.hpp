#pragma once

#include <array>
#include <algorithm>
#include <cstddef>
#include <string>

namespace liveline {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("liveline v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "liveline";
    constexpr const char* CONFIG_ENV = "LIVELINE_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "liveline.toml";
    constexpr const char* LOGGER_NAME = "liveline";
}

namespace styles {
    constexpr std::array<const char*, 2> SUPPORTED = {"bar", "loading"};
    constexpr const char* DEFAULT = "bar";
    
    inline bool isSupported(const std::string& style) {
        return std::find(SUPPORTED.begin(), SUPPORTED.end(), style) != SUPPORTED.end();
    }
}

namespace limits {
    constexpr size_t MIN_BAR_WIDTH = 2;
    constexpr size_t MAX_BAR_WIDTH = 200;
}

namespace config_defaults {
    constexpr const char* TITLE = "Progress Tool";
    constexpr const char* TEXT_COLOR = "default";
    constexpr bool UNICODE_SUPPORTED = true;
    constexpr size_t BAR_WIDTH = 30;
    constexpr double MAX_VALUE = 100;
    
    constexpr int AWAITING_INTERVAL_MS = 10;
    constexpr int AWAITING_TIMEOUT_MS = 0;
    constexpr int RELAY_INTERVAL_MS = 1000;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
}

}
}

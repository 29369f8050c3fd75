#include "liveline/config/validator.hpp"
#include "liveline/common/constants.hpp"
#include "liveline/common/logger.hpp"
#include "liveline/console/color.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace liveline {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (!validateBarWidth(config.display.bar_width)) {
        result.errors.push_back(fmt::format("display.bar_width: Must be between {}-{}",
                                            constants::limits::MIN_BAR_WIDTH,
                                            constants::limits::MAX_BAR_WIDTH));
        result.is_valid = false;
    }
    
    if (!validateColor(config.display.text_color)) {
        result.errors.push_back("display.text_color: Unknown color '" + config.display.text_color + "'");
        result.is_valid = false;
    }
    
    if (!validateStyle(config.display.style)) {
        result.errors.push_back("display.style: Must be 'bar' or 'loading'");
        result.is_valid = false;
    }
    
    if (config.display.title.empty()) {
        result.warnings.push_back("display.title: Empty, log entries will carry no title");
    }
    
    if (!validateInterval(config.timing.awaiting_interval_ms)) {
        result.errors.push_back("timing.awaiting_interval_ms: Must be > 0");
        result.is_valid = false;
    }
    
    if (config.timing.awaiting_timeout_ms < 0) {
        result.errors.push_back("timing.awaiting_timeout_ms: Must be >= 0 (0=none)");
        result.is_valid = false;
    }
    
    if (!validateInterval(config.timing.relay_interval_ms)) {
        result.errors.push_back("timing.relay_interval_ms: Must be > 0");
        result.is_valid = false;
    }
    
    if (config.timing.relay_interval_ms > 10000) {
        result.warnings.push_back(
            "timing.relay_interval_ms: Above 10s, captured output will appear late"
        );
    }
    
    if (!config.logging.file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.logging.file).parent_path().string())) {
        result.errors.push_back("logging.file: Cannot create parent directory");
        result.is_valid = false;
    }
    
    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }
    
    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }
    
    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }
    
    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;
    
    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }
    
    try {
        auto& config = common::Config::instance();
        if (!config.load(path)) {
            result.errors.push_back("Failed to parse configuration file");
            result.is_valid = false;
            common::Logger::instance().error("[Validator] Parse failed | path={}", path);
            return result;
        }
        
        return validate(config.global());
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Exception: ") + e.what());
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Exception | path={} | error={}", path, e.what());
        return result;
    }
}

bool ConfigValidator::validateBarWidth(size_t width) {
    return width >= constants::limits::MIN_BAR_WIDTH && width <= constants::limits::MAX_BAR_WIDTH;
}

bool ConfigValidator::validateInterval(int interval_ms) {
    return interval_ms > 0;
}

bool ConfigValidator::validateColor(const std::string& color) {
    return console::isColorName(color);
}

bool ConfigValidator::validateStyle(const std::string& style) {
    return constants::styles::isSupported(style);
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    if (path.empty()) return true;
    
    std::error_code ec;
    std::filesystem::path p(path);
    
    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }
    
    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;
    
    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }
    
    return canCreateDirectory(parent.string());
}

}}

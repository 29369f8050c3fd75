#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace liveline {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);
    
    static bool validateBarWidth(size_t width);
    static bool validateInterval(int interval_ms);
    static bool validateColor(const std::string& color);
    static bool validateStyle(const std::string& style);
    static bool canCreateDirectory(const std::string& path);
};

}}

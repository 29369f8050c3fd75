#include "config_command.hpp"
#include "liveline/common/config.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"
#include "liveline/config/validator.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace liveline {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing configuration file");
    init_cmd_->callback([this]() { was_called_ = true; });
    
    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key (e.g. display.bar_width)")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (std::filesystem::exists(config_path) && !init_force_) {
        std::cerr << "Configuration file already exists: " << config_path << "\n";
        std::cerr << "Run: liveline config init --force\n";
        return 1;
    }
    
    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        return 1;
    }
    
    config.reset();
    if (!config.save(config_path)) {
        std::cerr << "Failed to write configuration.\n";
        return 1;
    }
    
    std::cout << "✓ Configuration created: " << config_path << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    
    if (!config.exists()) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Run: liveline config init\n";
        return 1;
    }
    
    std::string config_path = config.getConfigPath();
    
    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        std::cerr << "Check file permissions: ls -l " << config_path << "\n";
        return 1;
    }
    
    try {
        config.setValue(set_key_, set_value_);
    } catch (const common::InvalidArgument& e) {
        std::cerr << "\033[31mError: " << e.what() << "\033[0m\n";
        return 1;
    }
    
    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cerr << "Configuration not saved.\n";
        return 1;
    }
    
    if (config.save(config_path)) {
        std::cout << "✓ Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
        return 0;
    }
    
    std::cerr << "Failed to save configuration.\n";
    return 1;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();
    
    if (get_key_.empty()) {
        std::cout << "Configuration:\n";
        for (const auto& key : common::Config::keys()) {
            std::cout << "  " << key << " = " << config.getValue(key).value_or("") << "\n";
        }
        return 0;
    }
    
    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Expected: " << config_path << "\n";
        std::cerr << "Run: liveline config init\n";
        return 1;
    }
    
    std::cout << "Configuration file: " << config_path << "\n\n";
    
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Failed to read configuration file.\n";
        return 1;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        std::cout << line << "\n";
    }
    
    return 0;
}

int ConfigCommand::executeValidate() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    std::cout << "Validating: " << config_path << "\n\n";
    
    config::ConfigValidator validator;
    auto result = validator.validateFile(config_path);
    
    if (result.errors.empty()) {
        std::cout << "Syntax: Valid\n";
    } else {
        std::cout << "Syntax: Invalid\n";
    }
    
    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }
    
    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }
    
    std::cout << "\nErrors: " << result.errors.size() 
              << "  Warnings: " << result.warnings.size() << "\n";
    
    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }
    
    std::cout << "\nConfiguration has errors.\n";
    return 1;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) {
    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }
    
    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    while (!parent.empty() && !std::filesystem::exists(parent)) {
        parent = parent.parent_path();
    }
    if (parent.empty()) {
        parent = ".";
    }
    return access(parent.c_str(), W_OK) == 0;
}

}}

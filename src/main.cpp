#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "liveline/common/config.hpp"
#include "liveline/common/constants.hpp"
#include "liveline/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/demo_command.hpp"
#include "cli/states_command.hpp"
#include "cli/config_command.hpp"

std::string explicit_config_path(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Live single-line progress display", liveline::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", liveline::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        app.add_option("-c,--config", config_file, "Configuration file path");
        
        auto& config = liveline::common::Config::instance();
        if (!config.load(explicit_config_path(argc, argv))) {
            std::cerr << "Warning: configuration could not be parsed, using defaults\n";
        }
        
        const auto& logging = config.global().logging;
        liveline::common::Logger::instance().initialize(
            logging.file.empty() ? liveline::common::LogMode::CONSOLE_ONLY
                                 : liveline::common::LogMode::FILE_ONLY,
            logging
        );
        
        auto demo_cmd = std::make_unique<liveline::cli::DemoCommand>();
        auto states_cmd = std::make_unique<liveline::cli::StatesCommand>();
        auto config_cmd = std::make_unique<liveline::cli::ConfigCommand>();
        
        demo_cmd->setup(app.add_subcommand("demo", "Run a simulated task under a progress line"));
        states_cmd->setup(app.add_subcommand("states", "Show the available progress fields"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        int result = 0;
        if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else if (states_cmd->wasCalled()) {
            result = states_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        liveline::common::Logger::instance().shutdown();
        return result;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

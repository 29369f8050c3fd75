#include "main_command.hpp"
#include "liveline/common/constants.hpp"
#include <iostream>

namespace liveline {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::printHelp() const {
    std::cout << constants::system::APPLICATION_NAME << " - Live single-line progress display\n\n";
    std::cout << "Usage: liveline [OPTIONS] COMMAND [ARGS]...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH    Configuration file path\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  demo                Run a simulated task under a progress line\n";
    std::cout << "  states              Show the available progress fields\n";
    std::cout << "  config              Manage configuration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  liveline demo --items 50 --threads 4\n";
    std::cout << "  liveline states --value 42 --max 100\n";
    std::cout << "  liveline config set display.bar_width 40\n";
}

void MainCommand::printVersion() const {
    std::cout << constants::version::getFullVersion() << "\n";
}

}}

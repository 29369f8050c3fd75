#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace liveline {
namespace cli {

class StatesCommand : public MainCommand {
public:
    StatesCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    
    bool validateArguments() const override;

private:
    bool was_called_;
    double value_ = 50;
    double max_value_ = 100;
};

}}

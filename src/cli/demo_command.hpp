#pragma once

#include "main_command.hpp"
#include "liveline/progress/progress_session.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace liveline {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    
    bool validateArguments() const override;

private:
    bool was_called_;
    
    int items_ = 20;
    int delay_ms_ = 50;
    int threads_ = 1;
    bool chatty_ = false;
    int fail_at_ = -1;
    std::string style_;
    double max_value_ = 0;
    
    void runSequential(progress::ProgressSession& session);
    void runParallel(progress::ProgressSession& session);
    void processItem(int index);
};

}}

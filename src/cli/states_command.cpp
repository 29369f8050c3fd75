#include "states_command.hpp"
#include "liveline/common/config.hpp"
#include "liveline/console/console_sink.hpp"
#include "liveline/console/stream_interceptor.hpp"
#include "liveline/progress/progress_session.hpp"
#include "liveline/progress/render_state.hpp"
#include <fmt/format.h>
#include <iostream>

namespace liveline {
namespace cli {

StatesCommand::StatesCommand() : was_called_(false) {}

void StatesCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("--value", value_, "Value to render")->default_val(50);
    subcommand->add_option("--max", max_value_, "Max value")->default_val(100);
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool StatesCommand::wasCalled() const {
    return was_called_;
}

bool StatesCommand::validateArguments() const {
    if (max_value_ <= 0) {
        std::cerr << "Error: --max must be positive\n";
        return false;
    }
    if (value_ < 0) {
        std::cerr << "Error: --value must not be negative\n";
        return false;
    }
    return true;
}

int StatesCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    
    const auto& display = common::Config::instance().global().display;
    
    progress::Metrics metrics;
    metrics.current = value_;
    metrics.max = max_value_;
    metrics.percent = value_ / max_value_ * 100;
    
    std::cout << "Available states:\n";
    for (const auto& key : progress::RenderState::keys()) {
        auto state = key == "bar"
            ? progress::RenderState::bar(display.bar_width)
            : progress::RenderState::fromKey(key);
        std::cout << fmt::format("  {:<8} {:<14} {}  |  {}\n",
                                 key, state.name(), state.display(metrics), state.done(metrics));
    }
    
    console::ConsoleOptions console_options;
    console_options.text_color = display.text_color;
    console_options.unicode_supported = display.unicode_supported;
    console::ConsoleSink sink(display.title, std::cout, console_options);
    console::StreamInterceptor interceptor(sink, std::cout, std::cerr);
    
    progress::SessionOptions session_options;
    session_options.style = display.style;
    
    std::vector<progress::RenderState> states = {
        progress::RenderState::bar(display.bar_width),
        progress::RenderState::percent(),
        progress::RenderState::time()
    };
    progress::ProgressSession session(sink, interceptor, max_value_, states, session_options);
    
    std::cout << "\nPreview:\n";
    sink.printLine(session.preview(value_));
    return 0;
}

}}

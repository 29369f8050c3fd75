#include "liveline/progress/progress.hpp"
#include "liveline/common/logger.hpp"
#include <iostream>

namespace liveline {
namespace progress {

ProgressOptions ProgressOptions::fromConfig(const common::GlobalConfig& config) {
    ProgressOptions options;
    options.style = config.display.style;
    options.text_color = config.display.text_color;
    options.unicode_supported = config.display.unicode_supported;
    options.bar_width = config.display.bar_width;
    
    if (config.timing.awaiting_interval_ms > 0) {
        options.awaiting_interval = std::chrono::milliseconds(config.timing.awaiting_interval_ms);
    } else {
        common::Logger::instance().warn("[Progress] Ignoring awaiting interval | value_ms={} | using_ms={}",
                                        config.timing.awaiting_interval_ms, options.awaiting_interval.count());
    }
    if (config.timing.awaiting_timeout_ms > 0) {
        options.awaiting_timeout = std::chrono::milliseconds(config.timing.awaiting_timeout_ms);
    }
    if (config.timing.relay_interval_ms > 0) {
        options.relay_interval = std::chrono::milliseconds(config.timing.relay_interval_ms);
    } else {
        common::Logger::instance().warn("[Progress] Ignoring relay interval | value_ms={} | using_ms={}",
                                        config.timing.relay_interval_ms, options.relay_interval.count());
    }
    return options;
}

Progress::Progress(const std::string& name,
                   double max_value,
                   std::optional<std::vector<RenderState>> states,
                   ProgressOptions options) {
    console::ConsoleOptions console_options;
    console_options.text_color = options.text_color;
    console_options.unicode_supported = options.unicode_supported;
    
    console_ = std::make_unique<console::ConsoleSink>(name, std::cout, console_options);
    interceptor_ = std::make_unique<console::StreamInterceptor>(
        *console_, std::cout, std::cerr, options.relay_interval);
    
    if (!states) {
        states = std::vector<RenderState>{
            RenderState::bar(options.bar_width),
            RenderState::percent(),
            RenderState::time()
        };
    }
    
    SessionOptions session_options;
    session_options.awaiting_interval = options.awaiting_interval;
    session_options.awaiting_timeout = options.awaiting_timeout;
    session_options.style = options.style;
    
    session_ = std::make_unique<ProgressSession>(
        *console_, *interceptor_, max_value, std::move(states), session_options);
    
    common::Logger::instance().debug("[Progress] Created | name={}, max={}, style={}",
                                     name, max_value, options.style);
}

Progress::~Progress() {
    // Session first: stopping it deactivates the interceptor.
    session_.reset();
    interceptor_.reset();
}

}}

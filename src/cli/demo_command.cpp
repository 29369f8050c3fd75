#include "demo_command.hpp"
#include "liveline/common/config.hpp"
#include "liveline/common/constants.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"
#include "liveline/progress/progress.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace liveline {
namespace cli {

DemoCommand::DemoCommand() : was_called_(false) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--items", items_, "Number of simulated work items")
        ->default_val(20);
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Time spent on each item (ms)")
        ->default_val(50);
    subcommand->add_option("-t,--threads", threads_, "Worker threads (1 runs sequentially)")
        ->default_val(1);
    subcommand->add_flag("--chatty", chatty_, "Write to stdout and stderr while running");
    subcommand->add_option("--fail-at", fail_at_, "Throw while processing this item");
    subcommand->add_option("--style", style_, "Progress style")
        ->check(CLI::IsMember({"bar", "loading"}));
    subcommand->add_option("--max", max_value_, "Max value (defaults to the item count)");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::wasCalled() const {
    return was_called_;
}

bool DemoCommand::validateArguments() const {
    if (items_ < 1) {
        std::cerr << "Error: --items must be at least 1\n";
        return false;
    }
    if (delay_ms_ < 0) {
        std::cerr << "Error: --delay-ms must not be negative\n";
        return false;
    }
    if (threads_ < 1 || threads_ > 64) {
        std::cerr << "Error: --threads must be between 1-64\n";
        return false;
    }
    if (max_value_ < 0) {
        std::cerr << "Error: --max must be positive\n";
        return false;
    }
    return true;
}

int DemoCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    
    auto& config = common::Config::instance();
    auto options = progress::ProgressOptions::fromConfig(config.global());
    if (!style_.empty()) {
        options.style = style_;
    }
    
    double max_value = max_value_ > 0 ? max_value_ : static_cast<double>(items_);
    
    common::Logger::instance().info("[Demo] Starting | items={} | threads={} | max={}",
                                    items_, threads_, max_value);
    
    auto started = std::chrono::steady_clock::now();
    
    try {
        progress::Progress tracker(config.global().display.title, max_value, std::nullopt, options);
        
        tracker.runScoped([this](progress::ProgressSession& session) {
            if (threads_ > 1) {
                runParallel(session);
            } else {
                runSequential(session);
            }
        }, LIVELINE_HERE);
    } catch (const common::DeprecationNotice& e) {
        common::Logger::instance().warn("[Demo] Deprecated | error={}", e.what());
        return 1;
    } catch (const common::Error& e) {
        common::Logger::instance().error("[Demo] Failed | code={} | error={}",
                                         common::ErrorCodeHelper::toString(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Demo] Failed | error={}", e.what());
        return 1;
    }
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    
    std::cout << "Processed " << items_ << " items in " << elapsed.count() << " ms\n";
    common::Logger::instance().info("[Demo] Finished | duration_ms={}", elapsed.count());
    return 0;
}

void DemoCommand::runSequential(progress::ProgressSession& session) {
    for (int i = 0; i < items_; ++i) {
        processItem(i);
        session.advance(i);
    }
}

void DemoCommand::runParallel(progress::ProgressSession& session) {
    std::atomic<int> completed{0};
    
    tbb::task_arena arena(threads_);
    arena.execute([&]() {
        tbb::parallel_for(tbb::blocked_range<int>(0, items_), [&](const tbb::blocked_range<int>& range) {
            for (int i = range.begin(); i != range.end(); ++i) {
                processItem(i);
                session.advance(completed.fetch_add(1));
            }
        });
    });
}

void DemoCommand::processItem(int index) {
    if (delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    
    if (index == fail_at_) {
        throw std::runtime_error(fmt::format("simulated failure at item {}", index));
    }
    
    if (chatty_ && index % 5 == 0) {
        std::cout << "processed item " << index << std::endl;
        if (index % 10 == 0) {
            std::cerr << "checkpoint at item " << index << std::endl;
        }
    }
}

}}

#include "liveline/progress/awaiting_animator.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/logger.hpp"

namespace liveline {
namespace progress {

AwaitingAnimator::AwaitingAnimator(console::ConsoleSink& console, std::chrono::milliseconds interval)
    : console_(console),
      interval_(interval) {
    if (interval_.count() <= 0) {
        LIVELINE_THROW(common::InvalidArgument, "Awaiting interval must be positive, got {} ms", interval_.count());
    }
}

AwaitingAnimator::~AwaitingAnimator() {
    stop();
}

void AwaitingAnimator::start(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    
    if (worker_.joinable()) {
        worker_.join();
    }
    
    stop_requested_ = false;
    running_ = true;
    frames_ = 0;
    worker_ = std::thread(&AwaitingAnimator::run, this, timeout);
}

void AwaitingAnimator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool AwaitingAnimator::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

uint64_t AwaitingAnimator::framesDrawn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
}

void AwaitingAnimator::run(std::optional<std::chrono::milliseconds> timeout) {
    auto began = std::chrono::steady_clock::now();
    uint64_t phase = 0;
    
    try {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            lock.unlock();
            
            Metrics metrics;
            metrics.call_count = phase++;
            console_.replaceLastLine(state_.display(metrics));
            
            lock.lock();
            ++frames_;
            
            if (timeout && std::chrono::steady_clock::now() - began > *timeout) {
                common::Logger::instance().debug("[Awaiting] Timed out | timeout_ms={}", timeout->count());
                break;
            }
            
            cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
        }
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Awaiting] Animation failed | error={}", e.what());
    }
    
    try {
        console_.replaceLastLine(state_.done(Metrics{}));
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Awaiting] Final frame failed | error={}", e.what());
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

}}

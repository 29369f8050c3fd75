#pragma once

#include "render_state.hpp"
#include "../console/console_sink.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace liveline {
namespace progress {

class AwaitingAnimator {
public:
    explicit AwaitingAnimator(console::ConsoleSink& console,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(10));
    ~AwaitingAnimator();
    
    AwaitingAnimator(const AwaitingAnimator&) = delete;
    AwaitingAnimator& operator=(const AwaitingAnimator&) = delete;
    
    void start(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void stop();
    
    bool isRunning() const;
    uint64_t framesDrawn() const;

private:
    console::ConsoleSink& console_;
    std::chrono::milliseconds interval_;
    RenderState state_ = RenderState::awaiting();
    
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    uint64_t frames_ = 0;
    
    void run(std::optional<std::chrono::milliseconds> timeout);
};

}}

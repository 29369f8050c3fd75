#pragma once

#include "awaiting_animator.hpp"
#include "render_state.hpp"
#include "../common/constants.hpp"
#include "../common/errors.hpp"
#include "../console/console_sink.hpp"
#include "../console/stream_interceptor.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace liveline {
namespace progress {

struct SessionOptions {
    std::chrono::milliseconds awaiting_interval{constants::config_defaults::AWAITING_INTERVAL_MS};
    std::optional<std::chrono::milliseconds> awaiting_timeout;
    std::string style = constants::styles::DEFAULT;
};

class ProgressSession {
public:
    ProgressSession(console::ConsoleSink& console,
                    console::StreamInterceptor& interceptor,
                    double max_value = constants::config_defaults::MAX_VALUE,
                    std::optional<std::vector<RenderState>> states = std::nullopt,
                    SessionOptions options = {});
    ~ProgressSession();
    
    ProgressSession(const ProgressSession&) = delete;
    ProgressSession& operator=(const ProgressSession&) = delete;
    
    void addState(const RenderState& state);
    void addStates(const std::vector<RenderState>& states);
    
    void setMaxValue(double max_value);
    void advance(double current, std::optional<double> max_value = std::nullopt);
    
    void start();
    void stop();
    void restart();
    
    size_t stateCount() const;
    std::vector<std::string> stateNames() const;
    RenderState state(size_t index) const;
    RenderState state(const std::string& key) const;
    void setState(size_t index, const RenderState& state);
    void setState(const std::string& key, const RenderState& state);
    
    std::string preview(double value) const;
    double percent(double value) const;
    
    bool isRunning() const;
    bool isAwaiting() const { return awaiting_.load(); }
    uint64_t callCount() const;
    double currentValue() const;
    double maxValue() const;
    
    console::ConsoleSink& console() { return console_; }
    
    void reportFault(const std::exception& error, const common::SourceContext& where);
    
    template<typename Body>
    void runScoped(Body&& body, common::SourceContext where = {}) {
        start();
        try {
            body(*this);
        } catch (const common::DeprecationNotice&) {
            stop();
            throw;
        } catch (const std::exception& e) {
            reportFault(e, where);
            stop();
            throw;
        } catch (...) {
            stop();
            throw;
        }
        stop();
    }

private:
    mutable std::mutex mutex_;
    console::ConsoleSink& console_;
    console::StreamInterceptor& interceptor_;
    AwaitingAnimator animator_;
    SessionOptions options_;
    
    std::vector<RenderState> states_;
    double max_value_;
    double current_value_ = 0;
    uint64_t call_count_ = 0;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
    bool running_ = false;
    std::atomic<bool> awaiting_{false};
    std::optional<std::string> final_line_;
    
    void startLocked();
    void stopLocked();
    void restartLocked();
    void setMaxValueLocked(double max_value);
    void resetCountersLocked();
    
    size_t indexOfLocked(StateKind kind) const;
    Metrics metricsLocked(double value) const;
    std::string composeLocked(const Metrics& metrics, bool done) const;
    
    static void validateMaxValue(double max_value);
    static void validateSessionState(const RenderState& state);
};

}}

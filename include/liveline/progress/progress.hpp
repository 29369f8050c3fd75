#pragma once

#include "progress_iterable.hpp"
#include "progress_session.hpp"
#include "render_state.hpp"
#include "../common/config.hpp"
#include "../common/constants.hpp"
#include "../console/console_sink.hpp"
#include "../console/stream_interceptor.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace liveline {
namespace progress {

struct ProgressOptions {
    std::string style = constants::styles::DEFAULT;
    std::string text_color = constants::config_defaults::TEXT_COLOR;
    bool unicode_supported = constants::config_defaults::UNICODE_SUPPORTED;
    size_t bar_width = constants::config_defaults::BAR_WIDTH;
    std::chrono::milliseconds awaiting_interval{constants::config_defaults::AWAITING_INTERVAL_MS};
    std::optional<std::chrono::milliseconds> awaiting_timeout;
    std::chrono::milliseconds relay_interval{constants::config_defaults::RELAY_INTERVAL_MS};
    
    static ProgressOptions fromConfig(const common::GlobalConfig& config);
};

class Progress {
public:
    explicit Progress(const std::string& name,
                      double max_value = constants::config_defaults::MAX_VALUE,
                      std::optional<std::vector<RenderState>> states = std::nullopt,
                      ProgressOptions options = {});
    ~Progress();
    
    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;
    
    void start() { session_->start(); }
    void stop() { session_->stop(); }
    void restart() { session_->restart(); }
    
    void advance(double current, std::optional<double> max_value = std::nullopt) {
        session_->advance(current, max_value);
    }
    void setMaxValue(double max_value) { session_->setMaxValue(max_value); }
    
    void addState(const RenderState& state) { session_->addState(state); }
    void addStates(const std::vector<RenderState>& states) { session_->addStates(states); }
    void setState(const std::string& key, const RenderState& state) { session_->setState(key, state); }
    RenderState state(const std::string& key) const { return session_->state(key); }
    
    std::string preview(double value) const { return session_->preview(value); }
    
    bool isRunning() const { return session_->isRunning(); }
    uint64_t callCount() const { return session_->callCount(); }
    double maxValue() const { return session_->maxValue(); }
    
    ProgressSession& session() { return *session_; }
    console::ConsoleSink& console() { return *console_; }
    
    template<typename Sequence>
    ProgressIterable<Sequence> operator()(Sequence&& sequence) {
        return ProgressIterable<Sequence>(*session_, std::forward<Sequence>(sequence));
    }
    
    template<typename Body>
    void runScoped(Body&& body, common::SourceContext where = {}) {
        session_->runScoped(std::forward<Body>(body), where);
    }

private:
    std::unique_ptr<console::ConsoleSink> console_;
    std::unique_ptr<console::StreamInterceptor> interceptor_;
    std::unique_ptr<ProgressSession> session_;
};

}}

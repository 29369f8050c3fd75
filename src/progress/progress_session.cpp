#include "liveline/progress/progress_session.hpp"
#include "liveline/common/constants.hpp"
#include "liveline/common/logger.hpp"
#include <fmt/format.h>
#include <cmath>
#include <limits>

namespace liveline {
namespace progress {

namespace {

constexpr const char* DONE_MARKER = "Done! ✅";
constexpr const char* FIELD_SEPARATOR = " - ";
constexpr size_t NOT_FOUND = std::numeric_limits<size_t>::max();

}

ProgressSession::ProgressSession(console::ConsoleSink& console,
                                 console::StreamInterceptor& interceptor,
                                 double max_value,
                                 std::optional<std::vector<RenderState>> states,
                                 SessionOptions options)
    : console_(console),
      interceptor_(interceptor),
      animator_(console, options.awaiting_interval),
      options_(std::move(options)),
      max_value_(max_value) {
    validateMaxValue(max_value);
    
    if (!constants::styles::isSupported(options_.style)) {
        LIVELINE_THROW(common::InvalidArgument, "Unknown progress style '{}'", options_.style);
    }
    
    for (const auto& state : states.value_or(defaultStates())) {
        validateSessionState(state);
        if (indexOfLocked(state.kind()) == NOT_FOUND) {
            states_.push_back(state);
        }
    }
    
    if (options_.style == "loading" && !states_.empty() && states_[0].kind() != StateKind::LOADING) {
        size_t existing = indexOfLocked(StateKind::LOADING);
        if (existing != NOT_FOUND) {
            states_.erase(states_.begin() + static_cast<std::ptrdiff_t>(existing));
        }
        states_[0] = RenderState::loading();
    }
}

ProgressSession::~ProgressSession() {
    try {
        stop();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Progress] Stop on destruction failed | error={}", e.what());
    }
}

void ProgressSession::validateMaxValue(double max_value) {
    if (!std::isfinite(max_value) || max_value <= 0) {
        LIVELINE_THROW(common::InvalidArgument,
                       "Max value {} isn't valid, expected a positive number", max_value);
    }
}

void ProgressSession::validateSessionState(const RenderState& state) {
    if (state.kind() == StateKind::AWAITING) {
        LIVELINE_THROW(common::InvalidArgument,
                       "The Awaiting field is reserved for the idle animation");
    }
}

void ProgressSession::addState(const RenderState& state) {
    addStates({state});
}

void ProgressSession::addStates(const std::vector<RenderState>& states) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    for (const auto& state : states) {
        validateSessionState(state);
        if (indexOfLocked(state.kind()) != NOT_FOUND) {
            continue;
        }
        states_.push_back(state);
        console_.printLine(fmt::format("Added new states! {}", state.name()));
    }
}

void ProgressSession::setMaxValue(double max_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    setMaxValueLocked(max_value);
}

void ProgressSession::setMaxValueLocked(double max_value) {
    validateMaxValue(max_value);
    if (max_value == max_value_) {
        return;
    }
    
    if (running_) {
        restartLocked();
    } else {
        resetCountersLocked();
    }
    max_value_ = max_value;
    
    common::Logger::instance().debug("[Progress] Max value changed | max={}", max_value);
}

void ProgressSession::advance(double current, std::optional<double> max_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (max_value) {
        setMaxValueLocked(*max_value);
    }
    
    // Joining the animator here guarantees it draws nothing after this line.
    if (awaiting_.exchange(false)) {
        animator_.stop();
    }
    
    ++call_count_;
    current_value_ = current;
    
    if (!final_line_) {
        Metrics metrics = metricsLocked(current);
        if (current >= max_value_ - 1) {
            final_line_ = composeLocked(metrics, true);
            console_.replaceLastLine(*final_line_);
            common::Logger::instance().debug("[Progress] Completed | value={} | max={}", current, max_value_);
            return;
        }
        console_.replaceLastLine(composeLocked(metrics, false));
        return;
    }
    
    console_.replaceLastLine(*final_line_);
}

void ProgressSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    startLocked();
}

void ProgressSession::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
}

void ProgressSession::restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    restartLocked();
}

void ProgressSession::startLocked() {
    if (running_) {
        restartLocked();
        return;
    }
    
    resetCountersLocked();
    running_ = true;
    awaiting_ = true;
    started_at_ = std::chrono::steady_clock::now();
    
    interceptor_.activate();
    animator_.start(options_.awaiting_timeout);
    
    common::Logger::instance().debug("[Progress] Started | title={} | max={} | states={}",
                                     console_.title(), max_value_, states_.size());
}

void ProgressSession::stopLocked() {
    if (!running_) {
        return;
    }
    
    awaiting_ = false;
    animator_.stop();
    running_ = false;
    interceptor_.deactivate();
    
    common::Logger::instance().debug("[Progress] Stopped | title={} | calls={}",
                                     console_.title(), call_count_);
}

void ProgressSession::restartLocked() {
    stopLocked();
    startLocked();
}

void ProgressSession::resetCountersLocked() {
    call_count_ = 0;
    current_value_ = 0;
    final_line_.reset();
}

size_t ProgressSession::stateCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

std::vector<std::string> ProgressSession::stateNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(states_.size());
    for (const auto& state : states_) {
        names.push_back(state.name());
    }
    return names;
}

RenderState ProgressSession::state(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= states_.size()) {
        LIVELINE_THROW(common::InvalidArgument, "{} isn't in progress ({} states)", index, states_.size());
    }
    return states_[index];
}

RenderState ProgressSession::state(const std::string& key) const {
    StateKind kind = RenderState::kindFromKey(key);
    
    std::lock_guard<std::mutex> lock(mutex_);
    size_t index = indexOfLocked(kind);
    if (index == NOT_FOUND) {
        LIVELINE_THROW(common::InvalidArgument, "Not exists {} in progress", key);
    }
    return states_[index];
}

void ProgressSession::setState(size_t index, const RenderState& state) {
    validateSessionState(state);
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= states_.size()) {
        LIVELINE_THROW(common::InvalidArgument, "{} isn't in progress ({} states)", index, states_.size());
    }
    
    size_t existing = indexOfLocked(state.kind());
    if (existing != NOT_FOUND && existing != index) {
        LIVELINE_THROW(common::InvalidArgument, "{} is already at position {}", state.name(), existing);
    }
    states_[index] = state;
}

void ProgressSession::setState(const std::string& key, const RenderState& state) {
    StateKind kind = RenderState::kindFromKey(key);
    
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        index = indexOfLocked(kind);
    }
    if (index == NOT_FOUND) {
        LIVELINE_THROW(common::InvalidArgument, "Not exists {} in progress", key);
    }
    setState(index, state);
}

std::string ProgressSession::preview(double value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Metrics metrics = metricsLocked(value);
    metrics.elapsed_seconds = 0;
    return composeLocked(metrics, value >= max_value_ - 1);
}

double ProgressSession::percent(double value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value / max_value_ * 100;
}

bool ProgressSession::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

uint64_t ProgressSession::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_count_;
}

double ProgressSession::currentValue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_value_;
}

double ProgressSession::maxValue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_value_;
}

void ProgressSession::reportFault(const std::exception& error, const common::SourceContext& where) {
    common::SourceContext context = where;
    if (const auto* tagged = dynamic_cast<const common::Error*>(&error)) {
        if (!tagged->where().empty()) {
            context = tagged->where();
        }
    }
    
    std::string location = common::formatContext(context);
    std::string message = location.empty()
        ? std::string(error.what())
        : fmt::format("{}: {}", location, error.what());
    
    common::Logger::instance().debug("[Progress] Fault in scoped session | {}", message);
    console_.logError(message);
}

size_t ProgressSession::indexOfLocked(StateKind kind) const {
    for (size_t i = 0; i < states_.size(); ++i) {
        if (states_[i].kind() == kind) {
            return i;
        }
    }
    return NOT_FOUND;
}

Metrics ProgressSession::metricsLocked(double value) const {
    Metrics metrics;
    metrics.current = value;
    metrics.max = max_value_;
    metrics.percent = value / max_value_ * 100;
    metrics.call_count = call_count_;
    if (started_at_) {
        metrics.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - *started_at_).count();
    }
    return metrics;
}

std::string ProgressSession::composeLocked(const Metrics& metrics, bool done) const {
    std::string line;
    for (const auto& state : states_) {
        if (!line.empty()) {
            line += FIELD_SEPARATOR;
        }
        line += done ? state.done(metrics) : state.display(metrics);
    }
    if (done) {
        if (!line.empty()) {
            line += FIELD_SEPARATOR;
        }
        line += DONE_MARKER;
    }
    return line;
}

}}

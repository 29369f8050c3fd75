#include "liveline/progress/render_state.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/text.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace liveline {
namespace progress {

std::string LoadingState::animation(uint64_t phase) const {
    if (size == 0) {
        return "";
    }
    size_t dots = static_cast<size_t>(phase % size) + 1;
    return std::string(dots, fill) + std::string(size - dots, ' ');
}

std::string LoadingState::display(const Metrics& metrics) const {
    return left_delimiter + animation(metrics.call_count) + right_delimiter;
}

std::string LoadingState::done(const Metrics&) const {
    return left_delimiter + std::string(size, fill) + right_delimiter;
}

std::string AwaitingState::display(const Metrics& metrics) const {
    return "Awaiting" + loading.animation(metrics.call_count);
}

std::string AwaitingState::done(const Metrics&) const {
    return "Awaiting" + std::string(loading.size, loading.fill) + " Done!";
}

std::string BarState::display(const Metrics& metrics) const {
    auto filled = static_cast<long long>(std::floor(metrics.percent / 100.0 * static_cast<double>(width)));
    filled = std::max(filled, 0LL);
    long long blanks = std::max(static_cast<long long>(width) - filled - 1, 0LL);
    
    return left_delimiter
        + std::string(static_cast<size_t>(filled), fill)
        + arrow
        + std::string(static_cast<size_t>(blanks), ' ')
        + right_delimiter;
}

std::string BarState::done(const Metrics&) const {
    return left_delimiter + std::string(width, fill) + right_delimiter;
}

std::string PercentState::display(const Metrics& metrics) const {
    return fmt::format("{:06.2f}%", metrics.percent);
}

std::string PercentState::done(const Metrics&) const {
    return fmt::format("{:.2f}%", 100.0);
}

double TimeState::estimate(const Metrics& metrics) {
    if (metrics.current == 0) {
        return 0;
    }
    return metrics.elapsed_seconds * metrics.max / metrics.current;
}

std::string TimeState::clock(size_t phase) {
    phase = std::min(phase, PHASES - 1);
    return common::encodeUtf8(static_cast<char32_t>(FIRST_CLOCK + phase));
}

std::string TimeState::display(const Metrics& metrics) const {
    double position = std::floor(metrics.percent / 100.0 * static_cast<double>(PHASES));
    size_t phase = position > 0 ? static_cast<size_t>(position) : 0;
    return fmt::format("{} {} estimated", clock(phase), common::formatClock(estimate(metrics)));
}

std::string TimeState::done(const Metrics& metrics) const {
    return fmt::format("{} {} total", clock(0), common::formatClock(metrics.elapsed_seconds));
}

RenderState RenderState::bar(size_t width) {
    if (width == 0) {
        LIVELINE_THROW(common::InvalidArgument, "Bar width must be positive");
    }
    BarState state;
    state.width = width;
    return state;
}

const std::vector<std::string>& RenderState::keys() {
    static const std::vector<std::string> keys = {"loading", "time", "percent", "bar"};
    return keys;
}

StateKind RenderState::kindFromKey(const std::string& key) {
    if (key == "loading") return StateKind::LOADING;
    if (key == "time") return StateKind::TIME;
    if (key == "percent") return StateKind::PERCENT;
    if (key == "bar") return StateKind::BAR;
    LIVELINE_THROW(common::InvalidArgument,
                   "Unknown state key '{}'. Expected one of loading, time, percent, bar", key);
}

RenderState RenderState::fromKey(const std::string& key) {
    switch (kindFromKey(key)) {
        case StateKind::LOADING: return loading();
        case StateKind::TIME: return time();
        case StateKind::PERCENT: return percent();
        case StateKind::BAR: return bar();
        case StateKind::AWAITING: break;
    }
    LIVELINE_THROW(common::InvalidArgument, "Unknown state key '{}'", key);
}

std::string RenderState::display(const Metrics& metrics) const {
    return std::visit([&metrics](const auto& state) { return state.display(metrics); }, state_);
}

std::string RenderState::done(const Metrics& metrics) const {
    return std::visit([&metrics](const auto& state) { return state.done(metrics); }, state_);
}

StateKind RenderState::kind() const {
    return static_cast<StateKind>(state_.index());
}

std::string RenderState::name() const {
    switch (kind()) {
        case StateKind::LOADING: return "Loading field";
        case StateKind::AWAITING: return "Awaiting field";
        case StateKind::BAR: return "Bar field";
        case StateKind::PERCENT: return "Percent field";
        case StateKind::TIME: return "Time field";
    }
    return "Unknown field";
}

std::vector<RenderState> defaultStates() {
    return {RenderState::bar(), RenderState::percent(), RenderState::time()};
}

}}

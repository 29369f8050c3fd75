#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace liveline {
namespace progress {

struct Metrics {
    double current = 0;
    double max = 0;
    double percent = 0;
    double elapsed_seconds = 0;
    uint64_t call_count = 0;
};

enum class StateKind {
    LOADING,
    AWAITING,
    BAR,
    PERCENT,
    TIME
};

struct LoadingState {
    std::string left_delimiter = "[";
    std::string right_delimiter = "]";
    char fill = '.';
    size_t size = 3;
    
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
    
    std::string animation(uint64_t phase) const;
};

struct AwaitingState {
    LoadingState loading;
    
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
};

struct BarState {
    std::string left_delimiter = "[";
    std::string right_delimiter = "]";
    char fill = '=';
    char arrow = '>';
    size_t width = 30;
    
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
};

struct PercentState {
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
};

struct TimeState {
    static constexpr char32_t FIRST_CLOCK = U'\U0001F55C';
    static constexpr size_t PHASES = 12;
    
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
    
    static double estimate(const Metrics& metrics);
    static std::string clock(size_t phase);
};

class RenderState {
public:
    using Variant = std::variant<LoadingState, AwaitingState, BarState, PercentState, TimeState>;
    
    RenderState(LoadingState state) : state_(std::move(state)) {}
    RenderState(AwaitingState state) : state_(std::move(state)) {}
    RenderState(BarState state) : state_(std::move(state)) {}
    RenderState(PercentState state) : state_(state) {}
    RenderState(TimeState state) : state_(state) {}
    
    static RenderState loading() { return LoadingState{}; }
    static RenderState awaiting() { return AwaitingState{}; }
    static RenderState bar(size_t width = 30);
    static RenderState percent() { return PercentState{}; }
    static RenderState time() { return TimeState{}; }
    
    static RenderState fromKey(const std::string& key);
    static StateKind kindFromKey(const std::string& key);
    static const std::vector<std::string>& keys();
    
    std::string display(const Metrics& metrics) const;
    std::string done(const Metrics& metrics) const;
    
    StateKind kind() const;
    std::string name() const;
    bool sameKind(const RenderState& other) const { return kind() == other.kind(); }
    
    const Variant& variant() const { return state_; }

private:
    Variant state_;
};

std::vector<RenderState> defaultStates();

}}

#include <gtest/gtest.h>
#include "liveline/progress/render_state.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/common/text.hpp"

using namespace liveline::progress;
using liveline::common::InvalidArgument;
using liveline::common::encodeUtf8;

namespace {

Metrics at(double current, double max, double elapsed = 0, uint64_t calls = 0) {
    Metrics metrics;
    metrics.current = current;
    metrics.max = max;
    metrics.percent = current / max * 100;
    metrics.elapsed_seconds = elapsed;
    metrics.call_count = calls;
    return metrics;
}

}

TEST(RenderStateTest, BarStartsWithArrowOnly) {
    auto bar = RenderState::bar();
    EXPECT_EQ(bar.display(at(0, 100)), "[>" + std::string(29, ' ') + "]");
}

TEST(RenderStateTest, BarFillsProportionally) {
    auto bar = RenderState::bar(10);
    EXPECT_EQ(bar.display(at(50, 100)), "[=====>    ]");
    EXPECT_EQ(bar.display(at(33, 100)), "[===>      ]");
    EXPECT_EQ(bar.display(at(0, 100)).size(), bar.display(at(80, 100)).size());
}

TEST(RenderStateTest, BarDoneIsFullyFilled) {
    EXPECT_EQ(RenderState::bar(10).done(at(9, 10)), "[==========]");
    EXPECT_EQ(RenderState::bar().done(at(0, 1)), "[" + std::string(30, '=') + "]");
}

TEST(RenderStateTest, BarRejectsZeroWidth) {
    EXPECT_THROW(RenderState::bar(0), InvalidArgument);
}

TEST(RenderStateTest, PercentIsZeroPaddedToConstantWidth) {
    auto percent = RenderState::percent();
    EXPECT_EQ(percent.display(at(0, 100)), "000.00%");
    EXPECT_EQ(percent.display(at(50, 100)), "050.00%");
    EXPECT_EQ(percent.display(at(1, 3)), "033.33%");
    EXPECT_EQ(percent.display(at(5, 100)), "005.00%");
    EXPECT_EQ(percent.done(at(0, 100)), "100.00%");
}

TEST(RenderStateTest, TimeEstimatesTotalDuration) {
    auto time = RenderState::time();
    EXPECT_EQ(time.display(at(5, 10, 10)), TimeState::clock(6) + " 00:00:20 estimated");
}

TEST(RenderStateTest, TimeWithoutProgressEstimatesZero) {
    auto time = RenderState::time();
    EXPECT_EQ(time.display(at(0, 10, 3)), TimeState::clock(0) + " 00:00:00 estimated");
    EXPECT_EQ(TimeState::estimate(at(0, 10, 3)), 0);
}

TEST(RenderStateTest, TimeWithTinyProgressCapsTheEstimate) {
    auto time = RenderState::time();
    EXPECT_EQ(time.display(at(1e-20, 100, 1)), TimeState::clock(0) + " 277777777:46:40 estimated");
    EXPECT_EQ(time.display(at(5e-324, 100, 1)), TimeState::clock(0) + " 277777777:46:40 estimated");
}

TEST(RenderStateTest, TimeDoneReportsElapsed) {
    EXPECT_EQ(RenderState::time().done(at(9, 10, 75)), TimeState::clock(0) + " 00:01:15 total");
}

TEST(RenderStateTest, ClockCyclesThroughTwelveFaces) {
    EXPECT_EQ(TimeState::clock(0), encodeUtf8(U'\U0001F55C'));
    EXPECT_EQ(TimeState::clock(11), encodeUtf8(U'\U0001F567'));
    EXPECT_EQ(TimeState::clock(40), TimeState::clock(11));
}

TEST(RenderStateTest, LoadingAnimatesThreePhases) {
    auto loading = RenderState::loading();
    EXPECT_EQ(loading.display(at(0, 1, 0, 0)), "[.  ]");
    EXPECT_EQ(loading.display(at(0, 1, 0, 1)), "[.. ]");
    EXPECT_EQ(loading.display(at(0, 1, 0, 2)), "[...]");
    EXPECT_EQ(loading.display(at(0, 1, 0, 3)), "[.  ]");
    EXPECT_EQ(loading.done(at(0, 1)), "[...]");
}

TEST(RenderStateTest, AwaitingReusesLoadingAnimation) {
    auto awaiting = RenderState::awaiting();
    EXPECT_EQ(awaiting.display(at(0, 1, 0, 1)), "Awaiting.. ");
    EXPECT_EQ(awaiting.done(at(0, 1)), "Awaiting... Done!");
}

TEST(RenderStateTest, KeysResolveToVariants) {
    EXPECT_EQ(RenderState::fromKey("loading").kind(), StateKind::LOADING);
    EXPECT_EQ(RenderState::fromKey("time").kind(), StateKind::TIME);
    EXPECT_EQ(RenderState::fromKey("percent").kind(), StateKind::PERCENT);
    EXPECT_EQ(RenderState::fromKey("bar").kind(), StateKind::BAR);
    EXPECT_THROW(RenderState::fromKey("awaiting"), InvalidArgument);
    EXPECT_THROW(RenderState::kindFromKey("spinner"), InvalidArgument);
}

TEST(RenderStateTest, IdentityIsTheVariant) {
    EXPECT_TRUE(RenderState::bar(10).sameKind(RenderState::bar(40)));
    EXPECT_FALSE(RenderState::bar().sameKind(RenderState::percent()));
    EXPECT_EQ(RenderState::bar().name(), "Bar field");
    EXPECT_EQ(RenderState::awaiting().name(), "Awaiting field");
}

TEST(RenderStateTest, DefaultsAreBarPercentTime) {
    auto states = defaultStates();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0].kind(), StateKind::BAR);
    EXPECT_EQ(states[1].kind(), StateKind::PERCENT);
    EXPECT_EQ(states[2].kind(), StateKind::TIME);
}

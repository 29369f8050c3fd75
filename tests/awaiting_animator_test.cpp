#include <gtest/gtest.h>
#include "liveline/progress/awaiting_animator.hpp"
#include "liveline/common/errors.hpp"
#include <chrono>
#include <sstream>
#include <thread>

using namespace liveline;
using namespace std::chrono_literals;

class AwaitingAnimatorTest : public ::testing::Test {
protected:
    std::ostringstream terminal;
    console::ConsoleSink console{"Test", terminal};
    
    bool waitUntilIdle(const progress::AwaitingAnimator& animator) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (animator.isRunning()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
};

TEST_F(AwaitingAnimatorTest, RejectsNonPositiveInterval) {
    EXPECT_THROW(progress::AwaitingAnimator(console, 0ms), common::InvalidArgument);
    EXPECT_THROW(progress::AwaitingAnimator(console, -5ms), common::InvalidArgument);
    EXPECT_TRUE(terminal.str().empty());
}

TEST_F(AwaitingAnimatorTest, DrawsFramesUntilStopped) {
    progress::AwaitingAnimator animator(console, 5ms);
    animator.start();
    EXPECT_TRUE(animator.isRunning());
    
    std::this_thread::sleep_for(50ms);
    animator.stop();
    
    EXPECT_FALSE(animator.isRunning());
    EXPECT_GE(animator.framesDrawn(), 2u);
    EXPECT_NE(terminal.str().find("Awaiting."), std::string::npos);
    EXPECT_NE(console.lastLine().find("Awaiting... Done!"), std::string::npos);
}

TEST_F(AwaitingAnimatorTest, NothingIsDrawnAfterStopReturns) {
    progress::AwaitingAnimator animator(console, 1ms);
    animator.start();
    std::this_thread::sleep_for(20ms);
    animator.stop();
    
    std::string snapshot = terminal.str();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(terminal.str(), snapshot);
}

TEST_F(AwaitingAnimatorTest, StopsOnTimeout) {
    progress::AwaitingAnimator animator(console, 5ms);
    animator.start(20ms);
    
    ASSERT_TRUE(waitUntilIdle(animator));
    EXPECT_NE(console.lastLine().find("Awaiting... Done!"), std::string::npos);
    
    animator.stop();
}

TEST_F(AwaitingAnimatorTest, StartWhileRunningIsIgnored) {
    progress::AwaitingAnimator animator(console, 5ms);
    animator.start();
    animator.start();
    animator.stop();
    
    std::string out = terminal.str();
    size_t finals = 0;
    for (size_t pos = out.find("Done!"); pos != std::string::npos; pos = out.find("Done!", pos + 1)) {
        ++finals;
    }
    EXPECT_EQ(finals, 1u);
}

TEST_F(AwaitingAnimatorTest, StopIsIdempotentAndRestartable) {
    progress::AwaitingAnimator animator(console, 5ms);
    animator.stop();
    
    animator.start();
    animator.stop();
    animator.stop();
    
    animator.start(10ms);
    ASSERT_TRUE(waitUntilIdle(animator));
    animator.start();
    EXPECT_TRUE(animator.isRunning());
    animator.stop();
    EXPECT_FALSE(animator.isRunning());
}

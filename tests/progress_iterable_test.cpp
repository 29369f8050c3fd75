#include <gtest/gtest.h>
#include "liveline/progress/progress_iterable.hpp"
#include <chrono>
#include <list>
#include <sstream>
#include <string>
#include <vector>

using namespace liveline;
using namespace liveline::progress;
using namespace std::chrono_literals;

namespace {

size_t occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

const std::string STOP_MARKER = "console \033[31mout!";
const std::string START_MARKER = "Awaiting... Done!";

}

class ProgressIterableTest : public ::testing::Test {
protected:
    std::ostringstream terminal;
    std::ostringstream out;
    std::ostringstream err;
    console::ConsoleSink console{"Test", terminal};
    console::StreamInterceptor interceptor{console, out, err, 10ms};
    
    SessionOptions fastOptions() {
        SessionOptions options;
        options.awaiting_interval = 2ms;
        return options;
    }
};

TEST_F(ProgressIterableTest, DrivesOneAdvancePerElement) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    std::vector<std::string> items = {"a", "b", "c"};
    
    std::vector<std::string> seen;
    std::vector<std::string> lines;
    for (const auto& item : iterate(session, items)) {
        EXPECT_TRUE(session.isRunning());
        seen.push_back(item);
        lines.push_back(console.lastLine());
    }
    
    EXPECT_EQ(seen, items);
    EXPECT_EQ(session.maxValue(), 3);
    EXPECT_EQ(session.callCount(), 3u);
    EXPECT_EQ(session.currentValue(), 2);
    EXPECT_FALSE(session.isRunning());
    
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("000.00%"), std::string::npos);
    EXPECT_NE(lines[1].find("033.33%"), std::string::npos);
    EXPECT_NE(lines[2].find("Done!"), std::string::npos);
    
    EXPECT_EQ(occurrences(terminal.str(), START_MARKER), 1u);
    EXPECT_EQ(occurrences(terminal.str(), STOP_MARKER), 1u);
}

TEST_F(ProgressIterableTest, EarlyExitStillStops) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    std::list<int> items = {10, 20, 30};
    
    int consumed = 0;
    for (int item : iterate(session, items)) {
        (void)item;
        if (++consumed == 2) {
            break;
        }
    }
    
    EXPECT_EQ(consumed, 2);
    EXPECT_EQ(session.callCount(), 2u);
    EXPECT_EQ(session.currentValue(), 1);
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(occurrences(terminal.str(), START_MARKER), 1u);
    EXPECT_EQ(occurrences(terminal.str(), STOP_MARKER), 1u);
}

TEST_F(ProgressIterableTest, IsSinglePass) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    std::vector<int> items = {1, 2};
    
    auto view = iterate(session, items);
    int first = 0;
    for (int item : view) {
        first += item;
    }
    int second = 0;
    for (int item : view) {
        second += item;
    }
    
    EXPECT_EQ(first, 3);
    EXPECT_EQ(second, 0);
    EXPECT_EQ(session.callCount(), 2u);
    EXPECT_EQ(occurrences(terminal.str(), STOP_MARKER), 1u);
}

TEST_F(ProgressIterableTest, OwnsTemporarySequences) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    
    int total = 0;
    for (int item : iterate(session, std::vector<int>{4, 5, 6, 7})) {
        total += item;
    }
    
    EXPECT_EQ(total, 22);
    EXPECT_EQ(session.maxValue(), 4);
    EXPECT_EQ(session.callCount(), 4u);
}

TEST_F(ProgressIterableTest, EmptySequenceStartsAndStops) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    std::vector<int> items;
    
    for (int item : iterate(session, items)) {
        (void)item;
        ADD_FAILURE() << "empty sequence yielded an element";
    }
    
    EXPECT_EQ(session.maxValue(), 100);
    EXPECT_EQ(session.callCount(), 0u);
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(occurrences(terminal.str(), STOP_MARKER), 1u);
}

TEST_F(ProgressIterableTest, UnconsumedViewNeverStarts) {
    ProgressSession session(console, interceptor, 100, std::nullopt, fastOptions());
    std::vector<int> items = {1, 2, 3};
    {
        auto view = iterate(session, items);
    }
    
    EXPECT_FALSE(session.isRunning());
    EXPECT_TRUE(terminal.str().empty());
}

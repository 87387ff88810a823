#include "agent.h"
#include "log.h"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

using namespace xiangqi;

namespace {

std::vector<std::pair<LogLevel, std::string>> captured;

void capture_sink(LogLevel level, const std::string &message) {
    captured.emplace_back(level, message);
}

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        set_log_sink(capture_sink);
    }

    void TearDown() override {
        set_log_sink(nullptr);
        captured.clear();
    }

    bool has_line(LogLevel level, const std::string &prefix) const {
        for (const auto &entry : captured) {
            if (entry.first == level && entry.second.compare(0, prefix.size(), prefix) == 0) return true;
        }
        return false;
    }
};

} // namespace

TEST_F(LogTest, ConcatenatesArguments) {
    log_message(LOG_INFO, "depth=", 3, " nodes=", 120u);
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].first, LOG_INFO);
    EXPECT_EQ(captured[0].second, "depth=3 nodes=120");
}

TEST_F(LogTest, DroppedWithoutSink) {
    set_log_sink(nullptr);
    log_message(LOG_ERROR, "nobody listens");
    EXPECT_TRUE(captured.empty());
    EXPECT_EQ(get_log_sink(), nullptr);
}

TEST_F(LogTest, MalformedFenWarns) {
    Board board;
    EXPECT_FALSE(board.parse_fen("rnbakabnx/9/9/9/9/9/9/9/9/9 w"));
    EXPECT_FALSE(captured.empty());
    EXPECT_EQ(captured[0].first, LOG_WARNING);
}

TEST_F(LogTest, SearchReportsSummary) {
    Board board;
    ASSERT_TRUE(board.parse_fen(XQ_INITIAL_FEN));
    Agent agent(&board);

    SearchLimits limits;
    limits.max_depth = 2;
    agent.search(limits);

    EXPECT_TRUE(has_line(LOG_VERBOSE, "Iteration: depth=1"));
    EXPECT_TRUE(has_line(LOG_VERBOSE, "Iteration: depth=2"));
    EXPECT_TRUE(has_line(LOG_INFO, "Search: depth=2"));
}

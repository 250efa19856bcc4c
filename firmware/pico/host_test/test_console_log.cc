#include <string>
#include <vector>

#include "console_log.hh"
#include "gtest/gtest.h"

namespace {

struct CapturedLine {
    ConsoleLog::LogLevel level;
    std::string text;
};

std::vector<CapturedLine> captured;

void Capture(ConsoleLog::LogLevel level, const char* line) { captured.push_back({level, line}); }

class ConsoleLogTest : public ::testing::Test {
   protected:
    void SetUp() override {
        captured.clear();
        ConsoleLog::SetSink(Capture);
        ConsoleLog::SetLevel(ConsoleLog::kInfo);
    }

    void TearDown() override {
        ConsoleLog::SetSink(nullptr);
        ConsoleLog::SetLevel(ConsoleLog::kInfo);
    }
};

}  // namespace

TEST_F(ConsoleLogTest, FormatsTagAndMessage) {
    int len = CONSOLE_INFO("GPSClockReceiver::Update", "Read %d bytes from uart%u.", 42, 1u);
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].level, ConsoleLog::kInfo);
    EXPECT_EQ(captured[0].text, "[GPSClockReceiver::Update] Read 42 bytes from uart1.");
    EXPECT_EQ(len, static_cast<int>(captured[0].text.size()));
}

TEST_F(ConsoleLogTest, StripsTrailingLineEndings) {
    CONSOLE_WARNING("tag", "line one\r\n");
    CONSOLE_ERROR("tag", "line two\n\n");
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].text, "[tag] line one");
    EXPECT_EQ(captured[1].text, "[tag] line two");
}

TEST_F(ConsoleLogTest, LevelFiltering) {
    ConsoleLog::SetLevel(ConsoleLog::kWarnings);
    EXPECT_EQ(CONSOLE_INFO("tag", "hidden"), 0);
    EXPECT_GT(CONSOLE_WARNING("tag", "shown"), 0);
    EXPECT_GT(CONSOLE_ERROR("tag", "shown"), 0);
    EXPECT_EQ(captured.size(), 2u);

    ConsoleLog::SetLevel(ConsoleLog::kErrors);
    EXPECT_EQ(CONSOLE_WARNING("tag", "hidden"), 0);
    EXPECT_GT(CONSOLE_ERROR("tag", "shown"), 0);
    EXPECT_EQ(captured.size(), 3u);

    ConsoleLog::SetLevel(ConsoleLog::kSilent);
    EXPECT_EQ(CONSOLE_ERROR("tag", "hidden"), 0);
    EXPECT_EQ(captured.size(), 3u);
    EXPECT_EQ(ConsoleLog::GetLevel(), ConsoleLog::kSilent);
}

TEST_F(ConsoleLogTest, LongMessagesTruncated) {
    std::string long_message(ConsoleLog::kMaxLineLen * 2, 'x');
    CONSOLE_INFO("tag", "%s", long_message.c_str());
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].text.size(), ConsoleLog::kMaxLineLen - 1u);
}

TEST(ConsoleLog, LevelStrings) {
    EXPECT_STREQ(ConsoleLog::GetLevelString(ConsoleLog::kSilent), "SILENT");
    EXPECT_STREQ(ConsoleLog::GetLevelString(ConsoleLog::kErrors), "ERROR");
    EXPECT_STREQ(ConsoleLog::GetLevelString(ConsoleLog::kWarnings), "WARNING");
    EXPECT_STREQ(ConsoleLog::GetLevelString(ConsoleLog::kInfo), "INFO");
}

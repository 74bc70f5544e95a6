#include <gtest/gtest.h>
#include "utils.hpp"

TEST(UtilsTest, ValidSessionIdAccepted)
{
    // Letters, digits, dot, dash and underscore make a valid key.
    EXPECT_TRUE(isValidSessionId("user_123"));
    EXPECT_TRUE(isValidSessionId("team-a.prod"));
    EXPECT_TRUE(isValidSessionId(std::string(64, 'k')));
}

TEST(UtilsTest, InvalidSessionIdRejected)
{
    // Empty, oversized and punctuated keys are refused.
    EXPECT_FALSE(isValidSessionId(""));
    EXPECT_FALSE(isValidSessionId(std::string(65, 'k')));
    EXPECT_FALSE(isValidSessionId("bad key"));
    EXPECT_FALSE(isValidSessionId("bad/key"));
}

TEST(UtilsTest, PromptValidationBounds)
{
    // Prompts respect size and control character rules but may contain newlines.
    EXPECT_TRUE(isValidPrompt("hello there"));
    EXPECT_TRUE(isValidPrompt("line one\nline two\tindented"));
    EXPECT_FALSE(isValidPrompt(""));
    EXPECT_FALSE(isValidPrompt(std::string(9000, 'x')));
    EXPECT_FALSE(isValidPrompt(std::string("bad\rprompt")));
    EXPECT_FALSE(isValidPrompt(std::string("nul\0byte", 8)));
}

TEST(UtilsTest, TimestampFormat)
{
    // Log timestamps look like "YYYY-MM-DD HH:MM:SS".
    auto ts = current_timestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
}

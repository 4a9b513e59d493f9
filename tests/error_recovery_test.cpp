#include <gtest/gtest.h>
#include "core/error_recovery.hpp"
#include "core/error_types.hpp"
#include <stdexcept>
#include <string>

TEST(ErrorRecoveryTest, TransientComposeErrorIsRetriedUntilItClears)
{
    int calls = 0;
    std::string result = ErrorRecovery::retryTransientCompose(
        [&calls]()
        {
            if (++calls < 3)
                throw ComposeError("Input/output error", true);
            return std::string("segment.mp4");
        },
        5, "extract interval 1", 1);

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result, "segment.mp4");
}

TEST(ErrorRecoveryTest, PersistentComposeErrorIsNotRetried)
{
    int calls = 0;
    EXPECT_THROW(ErrorRecovery::retryTransientCompose(
                     [&calls]()
                     {
                         ++calls;
                         throw ComposeError("Invalid data found when processing input", false);
                     },
                     5, "concatenate extracts", 1),
                 ComposeError);
    EXPECT_EQ(calls, 1);
}

TEST(ErrorRecoveryTest, TransientErrorThatNeverClearsGivesUpAfterMaxRetries)
{
    int calls = 0;
    try
    {
        ErrorRecovery::retryTransientCompose(
            [&calls]()
            {
                ++calls;
                throw ComposeError("Resource temporarily unavailable", true);
            },
            3, "extract interval 2", 1);
        FAIL() << "expected ComposeError";
    }
    catch (const ComposeError &e)
    {
        EXPECT_TRUE(e.isTransient());
        EXPECT_EQ(e.kind(), ErrorKind::COMPOSE);
    }
    EXPECT_EQ(calls, 3);
}

TEST(ErrorRecoveryTest, OtherErrorsAreNotRetried)
{
    int calls = 0;
    EXPECT_THROW(ErrorRecovery::retryTransientCompose(
                     [&calls]()
                     {
                         ++calls;
                         throw ResourceError("Source video not found");
                     },
                     3, "extract interval 1", 1),
                 ResourceError);
    EXPECT_EQ(calls, 1);
}

TEST(ErrorRecoveryTest, RetryWithBackoffTreatsEveryErrorAsRetryable)
{
    int calls = 0;
    int value = ErrorRecovery::retryWithBackoff(
        [&calls]()
        {
            if (++calls == 1)
                throw std::runtime_error("busy");
            return 7;
        },
        2, "open database", 1);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 2);
}

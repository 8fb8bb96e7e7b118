// ============================================================================
// MultiError Tests
// ============================================================================

#include "fanin/core/multi_error.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace fanin;

TEST(MultiErrorTest, MessageJoinsWithNewline) {
    MultiError err({make_error_code(Errc::UnitFailed), make_error_code(Errc::Cancelled)});
    EXPECT_EQ(err.Message(), "Unit of work failed\nOperation cancelled");
}

TEST(MultiErrorTest, SingleComponentHasNoSeparator) {
    MultiError err({make_error_code(Errc::DeadlineExceeded)});
    EXPECT_EQ(err.Message(), "Deadline exceeded");
}

TEST(MultiErrorTest, ErrorsKeepRecordedOrder) {
    std::vector<Error> errors = {
        std::make_error_code(std::errc::io_error),
        make_error_code(Errc::UnitFailed),
        std::make_error_code(std::errc::io_error),
    };
    MultiError err(errors);

    EXPECT_EQ(err.Size(), 3u);
    EXPECT_EQ(err.Errors(), errors);
}

TEST(MultiErrorTest, IsFindsComponent) {
    Error io = std::make_error_code(std::errc::io_error);
    Error refused = std::make_error_code(std::errc::connection_refused);
    MultiError err({io, make_error_code(Errc::UnitFailed)});

    EXPECT_TRUE(err.Is(io));
    EXPECT_TRUE(err.Is(Errc::UnitFailed));
    EXPECT_FALSE(err.Is(refused));
    EXPECT_FALSE(err.Is(Errc::Cancelled));
}

TEST(MultiErrorTest, IsMatchesCondition) {
    MultiError err({std::make_error_code(std::errc::io_error), make_error_code(Errc::Cancelled)});

    EXPECT_TRUE(err.Is(std::errc::operation_canceled));
    EXPECT_TRUE(err.Is(std::errc::io_error));
    EXPECT_FALSE(err.Is(std::errc::timed_out));
}

TEST(MultiErrorTest, SameCodeFromOtherCategoryIsDistinct) {
    // Errc::Cancelled has the value 1, like EPERM in the generic category
    MultiError err({make_error_code(Errc::Cancelled)});
    EXPECT_FALSE(err.Is(Error(1, std::generic_category())));
}

TEST(MultiErrorTest, StreamsMessage) {
    MultiError err({make_error_code(Errc::UnitFailed), make_error_code(Errc::InvalidArgument)});
    std::ostringstream os;
    os << err;
    EXPECT_EQ(os.str(), "Unit of work failed\nInvalid argument");
}

#include "range_spec.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace mediacache;

class RangeResolverTest : public ::testing::Test {
protected:
    RangeResolver resolver;

    RangeWindow resolve(const std::string& header, std::uint64_t size) {
        return resolver.resolve(header, size);
    }
};

TEST_F(RangeResolverTest, NoHeaderIsWholeObject) {
    EXPECT_EQ(resolver.resolve(std::nullopt, 1000), (RangeWindow{0, 999}));
}

TEST_F(RangeResolverTest, EndClampedToObjectSize) {
    RangeWindow window = resolve("bytes=0-1023", 1000);
    EXPECT_EQ(window, (RangeWindow{0, 999}));
    EXPECT_EQ(window.length(), 1000u);
}

TEST_F(RangeResolverTest, OpenEndedRangeRunsToObjectEnd) {
    EXPECT_EQ(resolve("bytes=500-", 2000), (RangeWindow{500, 1999}));
}

TEST_F(RangeResolverTest, OpenEndedRangeLimitedToUnboundedMaximum) {
    RangeResolver small(RangeLimits{100, 1000});

    RangeWindow window = small.resolve(std::string("bytes=50-"), 10000);
    EXPECT_EQ(window, (RangeWindow{50, 149}));
    EXPECT_EQ(window.length(), 100u);
}

TEST_F(RangeResolverTest, LongWindowTruncatedAtTail) {
    RangeResolver small(RangeLimits{1000, 256});

    EXPECT_EQ(small.resolve(std::string("bytes=100-5000"), 10000), (RangeWindow{100, 355}));
}

TEST_F(RangeResolverTest, DefaultLimitsTruncateToTenMiB) {
    const std::uint64_t size = 100ULL * 1024 * 1024;
    RangeWindow window = resolve("bytes=0-" + std::to_string(size - 1), size);
    EXPECT_EQ(window.start, 0u);
    EXPECT_EQ(window.length(), 10ULL * 1024 * 1024);
}

TEST_F(RangeResolverTest, StartPastEndOfObjectClampsToLastByte) {
    EXPECT_EQ(resolve("bytes=5000-6000", 1000), (RangeWindow{999, 999}));
}

TEST_F(RangeResolverTest, EndBeforeStartBecomesSingleByte) {
    EXPECT_EQ(resolve("bytes=500-100", 1000), (RangeWindow{500, 500}));
}

TEST_F(RangeResolverTest, SingleByteObject) {
    EXPECT_EQ(resolve("bytes=0-", 1), (RangeWindow{0, 0}));
    EXPECT_EQ(resolve("bytes=0-0", 1), (RangeWindow{0, 0}));
}

TEST_F(RangeResolverTest, OnlyFirstOfSeveralRangesIsHonoured) {
    EXPECT_EQ(resolve("bytes=0-99,200-299", 1000), (RangeWindow{0, 99}));
    EXPECT_EQ(resolve("bytes=10-,200-299", 1000), (RangeWindow{10, 999}));
}

TEST_F(RangeResolverTest, HugeStartDoesNotOverflow) {
    const std::uint64_t size = std::numeric_limits<std::uint64_t>::max();
    RangeWindow window = resolve("bytes=" + std::to_string(size - 10) + "-", size);
    EXPECT_EQ(window.start, size - 10);
    EXPECT_EQ(window.end, size - 1);
}

TEST_F(RangeResolverTest, MalformedHeaders) {
    for (const char* header : {"", "bytes", "bytes=", "bytes=-500", "bytes=abc-100", "bytes=10-abc",
                               "items=0-100", "BYTES=0-100", "bytes=0_100", "bytes= 0-100",
                               "bytes=99999999999999999999999-"}) {
        EXPECT_THROW(resolve(header, 1000), MalformedRangeError) << "header: '" << header << "'";
    }
}

TEST_F(RangeResolverTest, MalformedErrorKeepsHeader) {
    try {
        resolve("bytes=x", 1000);
        FAIL() << "expected MalformedRangeError";
    } catch (const MalformedRangeError& e) {
        EXPECT_EQ(e.header(), "bytes=x");
    }
}

TEST_F(RangeResolverTest, EmptyObjectRejected) {
    EXPECT_THROW(resolver.resolve(std::string("bytes=0-10"), 0), std::invalid_argument);
    EXPECT_THROW(resolver.resolve(std::nullopt, 0), std::invalid_argument);
}

// 0 <= start <= end < size and length <= max chunk for a spread of inputs
TEST_F(RangeResolverTest, WindowAlwaysWithinBounds) {
    RangeResolver small(RangeLimits{64, 32});
    const std::uint64_t sizes[] = {1, 2, 31, 32, 33, 100, 1000};
    const char* headers[] = {"bytes=0-", "bytes=0-0", "bytes=5-", "bytes=0-31", "bytes=0-32",
                             "bytes=30-40", "bytes=99-", "bytes=999-", "bytes=50-10", "bytes=0-100000"};

    for (std::uint64_t size : sizes) {
        for (const char* header : headers) {
            RangeWindow window = small.resolve(std::string(header), size);
            EXPECT_LE(window.start, window.end) << header << " size " << size;
            EXPECT_LT(window.end, size) << header << " size " << size;
            EXPECT_LE(window.length(), 32u) << header << " size " << size;
        }
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

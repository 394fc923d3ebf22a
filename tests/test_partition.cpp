#include "partition.h"

#include "errors.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <numeric>

namespace {

ErrorKind kind_of(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const SplitterError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a SplitterError";
    return ErrorKind::IOFailure;
}

} // namespace

TEST(PlanSplitTest, EvenCountSplit) {
    const auto plan = plan_split(1024, SplitByCount{4});
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{256, 256, 256, 256}));
}

TEST(PlanSplitTest, DistributeFrontLoadsRemainder) {
    // 26 = 3 * 8 + 2: the first two parts carry one extra byte each.
    const auto plan = plan_split(26, SplitByCount{3}, ExtraBytesPolicy::Distribute);
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{9, 9, 8}));
}

TEST(PlanSplitTest, NewFileAppendsRemainderPart) {
    const auto plan = plan_split(26, SplitByCount{3}, ExtraBytesPolicy::NewFile);
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{8, 8, 8, 2}));
}

TEST(PlanSplitTest, NewFileWithoutRemainderAddsNothing) {
    const auto plan = plan_split(24, SplitByCount{3}, ExtraBytesPolicy::NewFile);
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{8, 8, 8}));
}

TEST(PlanSplitTest, TwentyFiveMegabytesByThree) {
    constexpr uint64_t size = 25ull * 1024 * 1024;
    const auto distributed = plan_split(size, SplitByCount{3});
    ASSERT_EQ(distributed.part_count(), 3u);
    EXPECT_EQ(distributed.part_sizes[0], size / 3 + 1);
    EXPECT_EQ(distributed.part_sizes[1], size / 3);
    EXPECT_EQ(distributed.part_sizes[2], size / 3);
    EXPECT_EQ(distributed.total_size(), size);

    const auto new_file = plan_split(size, SplitByCount{3}, ExtraBytesPolicy::NewFile);
    ASSERT_EQ(new_file.part_count(), 4u);
    EXPECT_EQ(new_file.part_sizes[3], size % 3);
    EXPECT_EQ(new_file.total_size(), size);
}

TEST(PlanSplitTest, BySizeDistributesRemainder) {
    // 10 parts of 100 with 7 leftover bytes.
    const auto plan = plan_split(1007, SplitBySize{100});
    ASSERT_EQ(plan.part_count(), 10u);
    EXPECT_EQ(std::count(plan.part_sizes.begin(), plan.part_sizes.end(), 101u), 7);
    EXPECT_EQ(std::count(plan.part_sizes.begin(), plan.part_sizes.end(), 100u), 3);
    EXPECT_EQ(plan.part_sizes.front(), 101u);
    EXPECT_EQ(plan.part_sizes.back(), 100u);
}

TEST(PlanSplitTest, BySizeNewFile) {
    const auto plan = plan_split(1007, SplitBySize{100}, ExtraBytesPolicy::NewFile);
    ASSERT_EQ(plan.part_count(), 11u);
    EXPECT_EQ(plan.part_sizes.back(), 7u);
}

TEST(PlanSplitTest, RemainderLargerThanPartCount) {
    // 2 parts of 400 with 399 leftover bytes: 200 + 199 redistributed.
    const auto plan = plan_split(1199, SplitBySize{400});
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{600, 599}));
}

TEST(PlanSplitTest, SizeEqualToFileIsOnePart) {
    const auto plan = plan_split(4096, SplitBySize{4096});
    EXPECT_EQ(plan.part_sizes, (std::vector<uint64_t>{4096}));
}

TEST(PlanSplitTest, ConservesSizeAndFairness) {
    for (uint64_t size: {1ull, 2ull, 7ull, 97ull, 1000ull, 65537ull, 1048583ull}) {
        for (int64_t count: {1, 2, 3, 5, 7, 64, 97}) {
            if (static_cast<uint64_t>(count) > size) {
                continue;
            }
            for (const auto policy: {ExtraBytesPolicy::Distribute, ExtraBytesPolicy::NewFile}) {
                const auto plan = plan_split(size, SplitByCount{count}, policy);
                EXPECT_EQ(plan.total_size(), size) << size << "/" << count;
                EXPECT_TRUE(std::none_of(plan.part_sizes.begin(), plan.part_sizes.end(),
                                         [](uint64_t s) { return s == 0; }));
                if (policy == ExtraBytesPolicy::Distribute) {
                    ASSERT_EQ(plan.part_count(), static_cast<std::size_t>(count));
                    const auto [lo, hi] = std::minmax_element(plan.part_sizes.begin(), plan.part_sizes.end());
                    EXPECT_LE(*hi - *lo, 1u);
                    EXPECT_TRUE(std::is_sorted(plan.part_sizes.rbegin(), plan.part_sizes.rend()));
                }
            }
        }
    }
}

TEST(PlanSplitTest, SlicesAreContiguous) {
    const auto plan = plan_split(26, SplitByCount{3});
    const auto slices = plan.slices();
    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[0].offset, 0u);
    EXPECT_EQ(slices[1].offset, 9u);
    EXPECT_EQ(slices[2].offset, 18u);
    EXPECT_EQ(slices[2].offset + slices[2].length, 26u);
}

TEST(PlanSplitTest, RejectsBadRequests) {
    EXPECT_EQ(kind_of([] { (void) plan_split(100, SplitByCount{0}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kind_of([] { (void) plan_split(100, SplitByCount{-3}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kind_of([] { (void) plan_split(10, SplitByCount{11}); }), ErrorKind::PartTooSmall);
    EXPECT_EQ(kind_of([] { (void) plan_split(100, SplitBySize{0}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kind_of([] { (void) plan_split(100, SplitBySize{-1024}); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kind_of([] { (void) plan_split(100, SplitBySize{101}); }), ErrorKind::SizeExceedsFile);
    EXPECT_EQ(kind_of([] { (void) plan_split(0, SplitByCount{1}); }), ErrorKind::EmptyInput);
}

TEST(PlanSplitTest, TooManyPartsMessage) {
    try {
        (void) plan_split(10, SplitByCount{11});
        FAIL() << "expected PartTooSmall";
    } catch (const SplitterError &e) {
        EXPECT_NE(std::string(e.what()).find("Number of parts is too large"), std::string::npos);
    }
}

TEST(ParseRequestTest, ParsesIntegers) {
    EXPECT_EQ(parse_part_count("3"), 3);
    EXPECT_EQ(parse_part_count("0"), 0);
    EXPECT_EQ(parse_part_count("-2"), -2);
    EXPECT_EQ(parse_part_size("1024"), 1024);
    EXPECT_EQ(parse_part_size("4K"), 4096);
    EXPECT_EQ(parse_part_size("2m"), 2 * 1024 * 1024);
    EXPECT_EQ(parse_part_size("1G"), 1024ll * 1024 * 1024);
}

TEST(ParseRequestTest, RejectsFractionalAndGarbage) {
    for (const char *text: {"2.5", "1024.5", "", "abc", "3 ", "1e3", "K"}) {
        try {
            (void) parse_part_size(text);
            ADD_FAILURE() << "accepted '" << text << "'";
        } catch (const SplitterError &e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument) << text;
        }
    }
    try {
        (void) parse_part_count("2.5");
        FAIL() << "accepted 2.5";
    } catch (const SplitterError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
        EXPECT_NE(std::string(e.what()).find("should be an integer"), std::string::npos);
    }
}

TEST(ParseRequestTest, RejectsOverflow) {
    EXPECT_EQ(kind_of([] { (void) parse_part_count("99999999999999999999"); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(kind_of([] { (void) parse_part_size("9223372036854775807G"); }), ErrorKind::InvalidArgument);
}

TEST(ParseRequestTest, ParsesExtraBytesPolicy) {
    EXPECT_EQ(parse_extra_bytes_policy("distribute"), ExtraBytesPolicy::Distribute);
    EXPECT_EQ(parse_extra_bytes_policy("new-file"), ExtraBytesPolicy::NewFile);
    EXPECT_EQ(kind_of([] { (void) parse_extra_bytes_policy("spread"); }), ErrorKind::InvalidArgument);
    EXPECT_EQ(extra_bytes_policy_name(ExtraBytesPolicy::NewFile), "new-file");
}

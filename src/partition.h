#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

enum class ExtraBytesPolicy {
    Distribute,
    NewFile,
};

struct SplitByCount {
    int64_t count = 0;
};

struct SplitBySize {
    int64_t size = 0;
};

using SplitRequest = std::variant<SplitByCount, SplitBySize>;

struct PartSlice {
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct SplitPlan {
    std::vector<uint64_t> part_sizes;

    [[nodiscard]] std::size_t part_count() const { return part_sizes.size(); }

    [[nodiscard]] uint64_t total_size() const;

    [[nodiscard]] std::vector<PartSlice> slices() const;
};

// Throws SplitterError (InvalidArgument, SizeExceedsFile, PartTooSmall).
SplitPlan plan_split(uint64_t file_size, const SplitRequest &request,
                     ExtraBytesPolicy policy = ExtraBytesPolicy::Distribute);

int64_t parse_part_count(std::string_view text);

// Accepts an optional K, M or G suffix (powers of 1024).
int64_t parse_part_size(std::string_view text);

ExtraBytesPolicy parse_extra_bytes_policy(std::string_view text);

std::string_view extra_bytes_policy_name(ExtraBytesPolicy policy);

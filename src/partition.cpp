#include "partition.h"

#include "errors.h"

#include <charconv>
#include <limits>
#include <numeric>
#include <string>

static constexpr std::string_view NON_INTEGER_MESSAGE =
        "Part size and number of parts should be an integer";

static int64_t parse_integer(const std::string_view text) {
    int64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        throw SplitterError(ErrorKind::InvalidArgument,
                            "Value out of range: '" + std::string(text) + "'");
    }
    if (text.empty() || ec != std::errc{} || ptr != last) {
        throw SplitterError(ErrorKind::InvalidArgument,
                            std::string(NON_INTEGER_MESSAGE) + " (got '" + std::string(text) + "')");
    }
    return value;
}

static int64_t suffix_multiplier(const char suffix) {
    switch (suffix) {
        case 'k':
        case 'K':
            return 1024;
        case 'm':
        case 'M':
            return 1024 * 1024;
        case 'g':
        case 'G':
            return 1024 * 1024 * 1024;
        default:
            return 0;
    }
}

uint64_t SplitPlan::total_size() const {
    return std::accumulate(part_sizes.begin(), part_sizes.end(), uint64_t{0});
}

std::vector<PartSlice> SplitPlan::slices() const {
    std::vector<PartSlice> result;
    result.reserve(part_sizes.size());
    uint64_t offset = 0;
    for (const uint64_t length: part_sizes) {
        result.push_back(PartSlice{offset, length});
        offset += length;
    }
    return result;
}

static void distribute_extra_bytes(std::vector<uint64_t> &sizes, const uint64_t extra) {
    const uint64_t count = sizes.size();
    const uint64_t per_part = extra / count;
    const uint64_t leftover = extra % count;
    for (uint64_t i = 0; i < count; ++i) {
        sizes[i] += per_part + (i < leftover ? 1u : 0u);
    }
}

SplitPlan plan_split(const uint64_t file_size, const SplitRequest &request, const ExtraBytesPolicy policy) {
    if (file_size == 0) {
        throw SplitterError(ErrorKind::EmptyInput, "File is empty!");
    }

    uint64_t part_count = 0;
    uint64_t base_size = 0;
    uint64_t extra = 0;

    if (const auto *by_count = std::get_if<SplitByCount>(&request)) {
        if (by_count->count < 1) {
            throw SplitterError(ErrorKind::InvalidArgument,
                                "Number of parts must be at least 1 (got " +
                                std::to_string(by_count->count) + ")");
        }
        part_count = static_cast<uint64_t>(by_count->count);
        base_size = file_size / part_count;
        if (base_size < 1) {
            throw SplitterError(ErrorKind::PartTooSmall,
                                "Number of parts is too large: " + std::to_string(part_count) +
                                " parts for " + std::to_string(file_size) + " bytes");
        }
        extra = file_size % part_count;
    } else {
        const auto &by_size = std::get<SplitBySize>(request);
        if (by_size.size <= 0) {
            throw SplitterError(ErrorKind::InvalidArgument, "Part size cannot be negative or zero");
        }
        base_size = static_cast<uint64_t>(by_size.size);
        if (base_size > file_size) {
            throw SplitterError(ErrorKind::SizeExceedsFile,
                                "Part size cannot bigger than file size (" + std::to_string(base_size) +
                                " > " + std::to_string(file_size) + ")");
        }
        part_count = file_size / base_size;
        extra = file_size % base_size;
    }

    SplitPlan plan;
    plan.part_sizes.assign(part_count, base_size);

    if (extra > 0) {
        if (policy == ExtraBytesPolicy::NewFile) {
            plan.part_sizes.push_back(extra);
        } else {
            distribute_extra_bytes(plan.part_sizes, extra);
        }
    }

    return plan;
}

int64_t parse_part_count(const std::string_view text) {
    return parse_integer(text);
}

int64_t parse_part_size(std::string_view text) {
    int64_t multiplier = 1;
    if (!text.empty()) {
        if (const int64_t m = suffix_multiplier(text.back()); m != 0) {
            multiplier = m;
            text.remove_suffix(1);
        }
    }

    const int64_t value = parse_integer(text);
    if (value > std::numeric_limits<int64_t>::max() / multiplier ||
        value < std::numeric_limits<int64_t>::min() / multiplier) {
        throw SplitterError(ErrorKind::InvalidArgument,
                            "Value out of range: '" + std::string(text) + "'");
    }
    return value * multiplier;
}

ExtraBytesPolicy parse_extra_bytes_policy(const std::string_view text) {
    if (text == "distribute") {
        return ExtraBytesPolicy::Distribute;
    }
    if (text == "new-file") {
        return ExtraBytesPolicy::NewFile;
    }
    throw SplitterError(ErrorKind::InvalidArgument,
                        "Unknown extra bytes policy '" + std::string(text) +
                        "' (expected distribute or new-file)");
}

std::string_view extra_bytes_policy_name(const ExtraBytesPolicy policy) {
    return policy == ExtraBytesPolicy::NewFile ? "new-file" : "distribute";
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byte_stream.h"
#include "integrity.h"
#include "partition.h"

struct PartFile {
    uint64_t index = 0; // 1-based
    std::filesystem::path path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

using PartNamer = std::function<std::filesystem::path(uint64_t index)>;

[[nodiscard]] std::size_t part_index_width(std::size_t part_count);

// "<base_name>.<index>" with the index zero-padded to part_index_width().
[[nodiscard]] std::string part_file_name(std::string_view base_name, uint64_t index, std::size_t part_count);

[[nodiscard]] std::filesystem::path checksum_file_path(const std::filesystem::path &output_dir,
                                                       std::string_view base_name,
                                                       ChecksumAlgorithm algorithm);

// Redirects a byte stream into the successive part files of a plan. Part files
// written by a writer that is destroyed before finish() are removed.
class SplitWriter {
public:
    SplitWriter(const SplitPlan &plan, PartNamer namer, Hasher *hasher = nullptr);

    ~SplitWriter();

    SplitWriter(const SplitWriter &) = delete;

    SplitWriter &operator=(const SplitWriter &) = delete;

    void write(std::span<const std::byte> chunk);

    // Throws if fewer bytes than planned were written.
    std::vector<PartFile> finish();

    [[nodiscard]] uint64_t bytes_written() const { return offset_; }

private:
    void open_part();

    void close_part();

    void discard() noexcept;

    const SplitPlan &plan_;
    PartNamer namer_;
    Hasher *hasher_;
    std::size_t current_ = 0;
    uint64_t written_in_part_ = 0;
    uint64_t offset_ = 0;
    std::ofstream out_;
    std::vector<PartFile> parts_;
    bool finished_ = false;
};

std::vector<PartFile> write_parts(ByteSource &source, const SplitPlan &plan, const PartNamer &namer,
                                  Hasher *hasher = nullptr);

struct SplitOptions {
    SplitRequest request = SplitByCount{1};
    ExtraBytesPolicy extra_bytes = ExtraBytesPolicy::Distribute;
    std::optional<ChecksumAlgorithm> checksum;
    bool delete_source = false;
};

struct SplitResult {
    std::vector<PartFile> parts;
    std::optional<std::filesystem::path> checksum_path;
    std::optional<std::string> digest;
};

// Errors are SplitterError with a "split failed: " prefix and the cause nested.
SplitResult split_file(const std::filesystem::path &source, const std::filesystem::path &output_dir,
                       const SplitOptions &options);

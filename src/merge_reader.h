#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "integrity.h"

// Numeric index carried by a part's file name: an all-digit final extension,
// else the digits just before the final extension, else digits ending the name.
[[nodiscard]] std::optional<uint64_t> merge_order_index(const std::filesystem::path &part);

// Stable ascending sort on merge_order_index(); names without digits go last.
[[nodiscard]] std::vector<std::filesystem::path> order_parts(std::vector<std::filesystem::path> parts);

// Existence is checked before size. Throws NotFound or EmptyInput.
void validate_parts(const std::vector<std::filesystem::path> &parts);

// The checksum file's extension names the algorithm.
[[nodiscard]] ChecksumAlgorithm checksum_algorithm_for(const std::filesystem::path &checksum_file,
                                                       ChecksumAlgorithmTable table = SUPPORTED_CHECKSUM_ALGORITHMS);

[[nodiscard]] std::string read_reference_digest(const std::filesystem::path &checksum_file);

// Destination under construction. Bytes go to "<destination>.partial", which
// is renamed onto the destination by commit() and removed otherwise.
class AssemblyFile {
public:
    explicit AssemblyFile(std::filesystem::path destination);

    ~AssemblyFile();

    AssemblyFile(const AssemblyFile &) = delete;

    AssemblyFile &operator=(const AssemblyFile &) = delete;

    void append(std::span<const std::byte> chunk);

    void commit();

    [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }

    [[nodiscard]] const std::filesystem::path &partial_path() const { return partial_; }

private:
    std::filesystem::path destination_;
    std::filesystem::path partial_;
    std::ofstream out_;
    uint64_t bytes_written_ = 0;
    bool committed_ = false;
};

struct MergeOptions {
    std::optional<std::filesystem::path> checksum_path;
    bool delete_parts = false;
    ChecksumAlgorithmTable supported_algorithms = SUPPORTED_CHECKSUM_ALGORITHMS;
};

struct MergeResult {
    std::vector<std::filesystem::path> ordered_parts;
    uint64_t bytes_written = 0;
    std::optional<std::string> digest;
};

// Errors are SplitterError with a "merge failed: " prefix and the cause nested.
MergeResult merge_files(const std::vector<std::filesystem::path> &parts,
                        const std::filesystem::path &destination,
                        const MergeOptions &options = {});

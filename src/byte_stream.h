#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

#include "configuration.h"

// Forward-only sequence of byte chunks. next() returns an empty span once the
// stream is exhausted; the returned span stays valid until the following call.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::span<const std::byte> next() = 0;
};

class FileByteSource final : public ByteSource {
public:
    explicit FileByteSource(const std::filesystem::path &path, std::size_t chunk_size = CHUNK_SIZE_BYTES);

    std::span<const std::byte> next() override;

    [[nodiscard]] uint64_t bytes_read() const { return bytes_read_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::vector<std::byte> buffer_;
    uint64_t bytes_read_ = 0;
};

class MemoryByteSource final : public ByteSource {
public:
    MemoryByteSource(std::span<const std::byte> data, std::size_t chunk_size);

    std::span<const std::byte> next() override;

private:
    std::span<const std::byte> data_;
    std::size_t chunk_size_;
    std::size_t offset_ = 0;
};

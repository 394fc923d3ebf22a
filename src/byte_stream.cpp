#include "byte_stream.h"

#include "errors.h"

#include <algorithm>
#include <string>

FileByteSource::FileByteSource(const std::filesystem::path &path, const std::size_t chunk_size)
    : path_(path)
      , file_(path, std::ios::binary)
      , buffer_(chunk_size) {
    if (chunk_size == 0) {
        throw SplitterError(ErrorKind::InvalidArgument, "chunk size must be > 0");
    }
    if (!file_) {
        throw SplitterError(ErrorKind::IOFailure, "open failed: " + path_.string());
    }
}

std::span<const std::byte> FileByteSource::next() {
    if (file_.eof()) {
        return {};
    }

    file_.read(reinterpret_cast<char *>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    const auto count = static_cast<std::size_t>(file_.gcount());
    if (file_.bad() || (file_.fail() && !file_.eof())) {
        throw SplitterError(ErrorKind::IOFailure, "read failed: " + path_.string());
    }

    bytes_read_ += count;
    return {buffer_.data(), count};
}

MemoryByteSource::MemoryByteSource(const std::span<const std::byte> data, const std::size_t chunk_size)
    : data_(data)
      , chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw SplitterError(ErrorKind::InvalidArgument, "chunk size must be > 0");
    }
}

std::span<const std::byte> MemoryByteSource::next() {
    const std::size_t len = (std::min)(chunk_size_, data_.size() - offset_);
    const auto chunk = data_.subspan(offset_, len);
    offset_ += len;
    return chunk;
}

// This file is part of file-splitter, a tool for splitting and merging files.
// Copyright (C) Brandon Li <https://brandonli.me/>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "errors.h"

#include <exception>
#include <filesystem>

std::string_view error_kind_name(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::EmptyInput:
            return "empty input";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
        case ErrorKind::SizeExceedsFile:
            return "size exceeds file";
        case ErrorKind::PartTooSmall:
            return "part too small";
        case ErrorKind::ChecksumMismatch:
            return "checksum mismatch";
        case ErrorKind::UnsupportedAlgorithm:
            return "unsupported algorithm";
        case ErrorKind::IOFailure:
            return "i/o failure";
    }
    return "unknown";
}

SplitterError::SplitterError(const ErrorKind kind, const std::string &message)
    : std::runtime_error(message)
      , kind_(kind) {
}

void throw_operation_failure(const std::string_view operation) {
    const std::string prefix = std::string(operation) + " failed: ";
    try {
        throw;
    } catch (const SplitterError &e) {
        std::throw_with_nested(SplitterError(e.kind(), prefix + e.what()));
    } catch (const std::filesystem::filesystem_error &e) {
        const auto kind = e.code() == std::errc::no_such_file_or_directory
                              ? ErrorKind::NotFound
                              : ErrorKind::IOFailure;
        std::throw_with_nested(SplitterError(kind, prefix + e.what()));
    } catch (const std::exception &e) {
        std::throw_with_nested(SplitterError(ErrorKind::IOFailure, prefix + e.what()));
    }
}

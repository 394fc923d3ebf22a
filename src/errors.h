/*
 * This file is part of file-splitter, a tool for splitting and merging files.
 * Copyright (C) Brandon Li <https://brandonli.me/>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorKind {
    NotFound,
    EmptyInput,
    InvalidArgument,
    SizeExceedsFile,
    PartTooSmall,
    ChecksumMismatch,
    UnsupportedAlgorithm,
    IOFailure,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

class SplitterError : public std::runtime_error {
public:
    SplitterError(ErrorKind kind, const std::string &message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Rethrows the exception currently being handled as a SplitterError whose
// message is "<operation> failed: <cause>", nesting the cause. Must be
// called from inside a catch block.
[[noreturn]] void throw_operation_failure(std::string_view operation);

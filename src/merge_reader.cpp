#include "merge_reader.h"

#include "byte_stream.h"
#include "configuration.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

static bool is_digit(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool same_file_path(const std::filesystem::path &a, const std::filesystem::path &b) {
    return std::filesystem::weakly_canonical(a) == std::filesystem::weakly_canonical(b);
}

// Value of a run of decimal digits, saturating at the uint64_t maximum.
static uint64_t parse_digit_run(const std::string_view digits) {
    uint64_t value = 0;
    if (const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        ec == std::errc::result_out_of_range) {
        return std::numeric_limits<uint64_t>::max();
    }
    return value;
}

// Digit run at the end of text, or nullopt if text does not end in a digit.
static std::optional<uint64_t> trailing_digits(const std::string_view text) {
    const auto first_non_digit = std::find_if_not(text.rbegin(), text.rend(), is_digit);
    const auto count = static_cast<std::size_t>(std::distance(text.rbegin(), first_non_digit));
    if (count == 0) {
        return std::nullopt;
    }
    return parse_digit_run(text.substr(text.size() - count));
}

std::optional<uint64_t> merge_order_index(const std::filesystem::path &part) {
    const std::string name = part.filename().string();
    const std::string_view view(name);

    const auto dot = view.rfind('.');
    if (dot == std::string_view::npos) {
        return trailing_digits(view);
    }

    // "data.bin.007": the extension itself is the index.
    const std::string_view extension = view.substr(dot + 1);
    if (!extension.empty() && std::all_of(extension.begin(), extension.end(), is_digit)) {
        return parse_digit_run(extension);
    }

    // "part3.mp4": the digits just before the final extension.
    if (const auto index = trailing_digits(view.substr(0, dot))) {
        return index;
    }
    return trailing_digits(view);
}

std::vector<std::filesystem::path> order_parts(std::vector<std::filesystem::path> parts) {
    std::vector<std::pair<std::optional<uint64_t>, std::filesystem::path> > keyed;
    keyed.reserve(parts.size());
    for (auto &part: parts) {
        auto index = merge_order_index(part);
        keyed.emplace_back(index, std::move(part));
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b) {
        if (a.first.has_value() != b.first.has_value()) {
            return a.first.has_value();
        }
        return a.first.has_value() && *a.first < *b.first;
    });

    std::vector<std::filesystem::path> ordered;
    ordered.reserve(keyed.size());
    for (auto &[index, path]: keyed) {
        ordered.push_back(std::move(path));
    }
    return ordered;
}

void validate_parts(const std::vector<std::filesystem::path> &parts) {
    for (const auto &part: parts) {
        if (!std::filesystem::exists(part)) {
            throw SplitterError(ErrorKind::NotFound, "Part file " + part.string() + " does not exist");
        }
        if (!std::filesystem::is_regular_file(part)) {
            throw SplitterError(ErrorKind::InvalidArgument, "Part file " + part.string() + " is not a regular file");
        }
        if (std::filesystem::file_size(part) == 0) {
            throw SplitterError(ErrorKind::EmptyInput, "Part file " + part.string() + " is empty");
        }
    }
}

ChecksumAlgorithm checksum_algorithm_for(const std::filesystem::path &checksum_file,
                                         const ChecksumAlgorithmTable table) {
    const std::string extension = checksum_file.extension().string();
    if (extension.size() <= 1) {
        throw SplitterError(ErrorKind::UnsupportedAlgorithm,
                            "Checksum file " + checksum_file.string() + " has no algorithm extension");
    }

    const std::string name = extension.substr(1);
    const auto algorithm = find_checksum_algorithm(name, table);
    if (!algorithm) {
        throw SplitterError(ErrorKind::UnsupportedAlgorithm, "Unsupported checksum algorithm '" + name + "'");
    }
    return *algorithm;
}

std::string read_reference_digest(const std::filesystem::path &checksum_file) {
    std::ifstream in(checksum_file, std::ios::binary);
    if (!in) {
        throw SplitterError(ErrorKind::IOFailure, "could not open checksum file " + checksum_file.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw SplitterError(ErrorKind::IOFailure, "read failed: " + checksum_file.string());
    }

    const auto first = std::find_if_not(text.begin(), text.end(), is_space);
    const auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

AssemblyFile::AssemblyFile(std::filesystem::path destination)
    : destination_(std::move(destination)) {
    partial_ = destination_;
    partial_ += PARTIAL_FILE_SUFFIX;

    out_.open(partial_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw SplitterError(ErrorKind::IOFailure, "could not open " + partial_.string() + " for writing");
    }
}

AssemblyFile::~AssemblyFile() {
    if (!committed_) {
        if (out_.is_open()) {
            out_.close();
        }
        std::error_code ec;
        std::filesystem::remove(partial_, ec);
    }
}

void AssemblyFile::append(const std::span<const std::byte> chunk) {
    out_.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!out_) {
        throw SplitterError(ErrorKind::IOFailure, "write failed: " + partial_.string());
    }
    bytes_written_ += chunk.size();
}

void AssemblyFile::commit() {
    out_.close();
    if (!out_) {
        throw SplitterError(ErrorKind::IOFailure, "failed to flush " + partial_.string());
    }
    std::filesystem::rename(partial_, destination_);
    committed_ = true;
}

MergeResult merge_files(const std::vector<std::filesystem::path> &parts,
                        const std::filesystem::path &destination,
                        const MergeOptions &options) {
    MergeResult result;
    try {
        if (parts.empty()) {
            throw SplitterError(ErrorKind::InvalidArgument, "No part files to merge");
        }

        validate_parts(parts);

        std::optional<ChecksumAlgorithm> algorithm;
        if (options.checksum_path) {
            if (!std::filesystem::exists(*options.checksum_path)) {
                throw SplitterError(ErrorKind::NotFound,
                                    "Checksum file " + options.checksum_path->string() + " does not exist");
            }
            algorithm = checksum_algorithm_for(*options.checksum_path, options.supported_algorithms);
        }

        for (const auto &part: parts) {
            if (std::filesystem::exists(destination) && same_file_path(part, destination)) {
                throw SplitterError(ErrorKind::InvalidArgument,
                                    "Destination " + destination.string() + " is one of the parts");
            }
        }

        result.ordered_parts = order_parts(parts);

        if (destination.has_parent_path()) {
            std::filesystem::create_directories(destination.parent_path());
        }

        std::unique_ptr<Hasher> hasher;
        if (algorithm) {
            hasher = make_hasher(*algorithm);
        }

        AssemblyFile output(destination);
        for (const auto &part: result.ordered_parts) {
            FileByteSource source(part);
            for (auto chunk = source.next(); !chunk.empty(); chunk = source.next()) {
                output.append(chunk);
                if (hasher) {
                    hasher->update(chunk);
                }
            }
        }

        if (hasher) {
            result.digest = hasher->finalize_hex();
            const std::string reference = read_reference_digest(*options.checksum_path);
            if (*result.digest != reference) {
                throw SplitterError(ErrorKind::ChecksumMismatch,
                                    "Checksum mismatch: expected " + reference + ", got " + *result.digest);
            }
        }

        output.commit();
        result.bytes_written = output.bytes_written();

        if (options.delete_parts) {
            for (const auto &part: result.ordered_parts) {
                std::filesystem::remove(part);
            }
        }
    } catch (...) {
        throw_operation_failure("merge");
    }
    return result;
}

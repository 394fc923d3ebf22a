#include "split_writer.h"

#include "configuration.h"
#include "errors.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

static void remove_quietly(const std::filesystem::path &path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

static void write_text_file(const std::filesystem::path &path, const std::string &text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SplitterError(ErrorKind::IOFailure, "could not open " + path.string() + " for writing");
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (!out) {
        remove_quietly(path);
        throw SplitterError(ErrorKind::IOFailure, "write failed: " + path.string());
    }
}

std::size_t part_index_width(const std::size_t part_count) {
    std::size_t digits = 1;
    for (std::size_t n = part_count; n >= 10; n /= 10) {
        ++digits;
    }
    return (std::max)(digits, PART_INDEX_MIN_DIGITS);
}

std::string part_file_name(const std::string_view base_name, const uint64_t index, const std::size_t part_count) {
    std::ostringstream oss;
    oss << base_name << '.' << std::setfill('0') << std::setw(static_cast<int>(part_index_width(part_count)))
            << index;
    return oss.str();
}

std::filesystem::path checksum_file_path(const std::filesystem::path &output_dir,
                                         const std::string_view base_name,
                                         const ChecksumAlgorithm algorithm) {
    std::string name(base_name);
    name += '.';
    name += CHECKSUM_FILE_INFIX;
    name += '.';
    name += checksum_algorithm_name(algorithm);
    return output_dir / name;
}

SplitWriter::SplitWriter(const SplitPlan &plan, PartNamer namer, Hasher *hasher)
    : plan_(plan)
      , namer_(std::move(namer))
      , hasher_(hasher) {
    if (plan_.part_count() == 0) {
        throw SplitterError(ErrorKind::InvalidArgument, "split plan has no parts");
    }
    parts_.reserve(plan_.part_count());
}

SplitWriter::~SplitWriter() {
    if (!finished_) {
        discard();
    }
}

void SplitWriter::open_part() {
    const uint64_t index = FIRST_PART_INDEX + current_;
    PartFile part;
    part.index = index;
    part.path = namer_(index);
    part.offset = offset_;
    part.length = plan_.part_sizes[current_];

    std::error_code ec;
    const bool existed = std::filesystem::exists(part.path, ec);
    out_.open(part.path, std::ios::binary | std::ios::trunc);
    if (!out_) {
        out_.close();
        if (!existed) {
            remove_quietly(part.path);
        }
        throw SplitterError(ErrorKind::IOFailure, "could not create part file " + part.path.string());
    }
    parts_.push_back(part);
    written_in_part_ = 0;
}

void SplitWriter::close_part() {
    out_.close();
    if (!out_) {
        throw SplitterError(ErrorKind::IOFailure, "failed to flush part file " + parts_.back().path.string());
    }
}

void SplitWriter::write(std::span<const std::byte> chunk) {
    if (finished_) {
        throw SplitterError(ErrorKind::IOFailure, "write after finish");
    }

    if (hasher_ != nullptr) {
        hasher_->update(chunk);
    }

    while (!chunk.empty()) {
        if (current_ >= plan_.part_count()) {
            throw SplitterError(ErrorKind::IOFailure,
                                "source is larger than the planned " + std::to_string(plan_.total_size()) +
                                " bytes");
        }
        if (!out_.is_open()) {
            open_part();
        }

        const uint64_t remaining = plan_.part_sizes[current_] - written_in_part_;
        const auto len = static_cast<std::size_t>((std::min<uint64_t>)(remaining, chunk.size()));

        out_.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(len));
        if (!out_) {
            throw SplitterError(ErrorKind::IOFailure, "write failed: " + parts_.back().path.string());
        }

        written_in_part_ += len;
        offset_ += len;
        chunk = chunk.subspan(len);

        if (written_in_part_ == plan_.part_sizes[current_]) {
            close_part();
            ++current_;
        }
    }
}

std::vector<PartFile> SplitWriter::finish() {
    if (current_ != plan_.part_count()) {
        throw SplitterError(ErrorKind::IOFailure,
                            "source ended after " + std::to_string(offset_) + " of " +
                            std::to_string(plan_.total_size()) + " planned bytes");
    }
    finished_ = true;
    return parts_;
}

void SplitWriter::discard() noexcept {
    if (out_.is_open()) {
        out_.close();
    }
    for (const auto &part: parts_) {
        remove_quietly(part.path);
    }
    parts_.clear();
}

std::vector<PartFile> write_parts(ByteSource &source, const SplitPlan &plan, const PartNamer &namer,
                                  Hasher *hasher) {
    SplitWriter writer(plan, namer, hasher);
    for (auto chunk = source.next(); !chunk.empty(); chunk = source.next()) {
        writer.write(chunk);
    }
    return writer.finish();
}

SplitResult split_file(const std::filesystem::path &source, const std::filesystem::path &output_dir,
                       const SplitOptions &options) {
    SplitResult result;
    try {
        if (!std::filesystem::exists(source)) {
            throw SplitterError(ErrorKind::NotFound, "File doesn't exist: " + source.string());
        }
        if (!std::filesystem::is_regular_file(source)) {
            throw SplitterError(ErrorKind::InvalidArgument, "path must be a regular file: " + source.string());
        }

        const uint64_t file_size = std::filesystem::file_size(source);
        if (file_size == 0) {
            throw SplitterError(ErrorKind::EmptyInput, "File is empty! " + source.string());
        }

        const SplitPlan plan = plan_split(file_size, options.request, options.extra_bytes);

        std::filesystem::create_directories(output_dir);

        const std::string base_name = source.filename().string();
        const std::size_t part_count = plan.part_count();
        const PartNamer namer = [&output_dir, &base_name, part_count](const uint64_t index) {
            return output_dir / part_file_name(base_name, index, part_count);
        };

        std::unique_ptr<Hasher> hasher;
        if (options.checksum) {
            hasher = make_hasher(*options.checksum);
        }

        FileByteSource stream(source);
        result.parts = write_parts(stream, plan, namer, hasher.get());

        if (hasher) {
            try {
                result.digest = hasher->finalize_hex();
                result.checksum_path = checksum_file_path(output_dir, base_name, *options.checksum);
                write_text_file(*result.checksum_path, *result.digest);
            } catch (...) {
                for (const auto &part: result.parts) {
                    remove_quietly(part.path);
                }
                throw;
            }
        }

        if (options.delete_source) {
            std::filesystem::remove(source);
        }
    } catch (...) {
        throw_operation_failure("split");
    }
    return result;
}

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

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "errors.h"
#include "integrity.h"
#include "merge_reader.h"
#include "partition.h"
#include "split_writer.h"

static std::string format_size(const std::uintmax_t bytes) {
    const char *units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    auto size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 3) {
        size /= 1024;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

static void print_usage(const char *program) {
    std::cerr << "Usage:\n"
            << "  " << program << " split --input <file> --output <dir> (--parts <n> | --size <bytes[K|M|G]>)\n"
            << "      [--checksum <algorithm>] [--extra distribute|new-file] [--delete-source]\n"
            << "  " << program << " merge --output <file> [--checksum <file>] [--delete-parts] <part>...\n"
            << "  " << program << " plan --input <file> (--parts <n> | --size <bytes[K|M|G]>)"
            << " [--extra distribute|new-file]\n"
            << "  " << program << " algorithms\n";
}

struct CommandLine {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> parts;
    std::optional<std::string> size;
    std::optional<std::string> checksum;
    std::string extra = "distribute";
    bool delete_source = false;
    bool delete_parts = false;
    std::vector<std::string> positional;
};

static bool parse_command_line(const int argc, char *argv[], CommandLine &cmd) {
    for (int i = 2; i < argc; ++i) {
        if (const std::string arg = argv[i]; (arg == "--input" || arg == "-i") && i + 1 < argc) {
            cmd.input_path = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            cmd.output_path = argv[++i];
        } else if ((arg == "--parts" || arg == "-n") && i + 1 < argc) {
            cmd.parts = argv[++i];
        } else if ((arg == "--size" || arg == "-s") && i + 1 < argc) {
            cmd.size = argv[++i];
        } else if ((arg == "--checksum" || arg == "-c") && i + 1 < argc) {
            cmd.checksum = argv[++i];
        } else if (arg == "--extra" && i + 1 < argc) {
            cmd.extra = argv[++i];
        } else if (arg == "--delete-source") {
            cmd.delete_source = true;
        } else if (arg == "--delete-parts") {
            cmd.delete_parts = true;
        } else if (!arg.empty() && arg[0] != '-') {
            cmd.positional.push_back(arg);
        } else {
            std::cerr << "Error: unknown or incomplete argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

static SplitRequest make_request(const CommandLine &cmd) {
    if (cmd.parts.has_value() == cmd.size.has_value()) {
        throw SplitterError(ErrorKind::InvalidArgument, "exactly one of --parts and --size must be given");
    }
    if (cmd.parts) {
        return SplitByCount{parse_part_count(*cmd.parts)};
    }
    return SplitBySize{parse_part_size(*cmd.size)};
}

static int do_split(const CommandLine &cmd) {
    if (cmd.input_path.empty() || cmd.output_path.empty()) {
        std::cerr << "Error: both --input and --output must be specified\n";
        return 1;
    }

    SplitOptions options;
    options.request = make_request(cmd);
    options.extra_bytes = parse_extra_bytes_policy(cmd.extra);
    options.delete_source = cmd.delete_source;
    if (cmd.checksum) {
        options.checksum = find_checksum_algorithm(*cmd.checksum);
        if (!options.checksum) {
            throw SplitterError(ErrorKind::UnsupportedAlgorithm,
                                "Unsupported checksum algorithm '" + *cmd.checksum + "'");
        }
    }

    if (std::filesystem::exists(cmd.input_path)) {
        std::cout << "Input: " << cmd.input_path << " ("
                << format_size(std::filesystem::file_size(cmd.input_path)) << ")\n";
    }

    const SplitResult result = split_file(cmd.input_path, cmd.output_path, options);

    std::cout << "Parts: " << result.parts.size() << "\n";
    for (const auto &part: result.parts) {
        std::cout << "  " << part.path.filename().string() << " (" << format_size(part.length) << ")\n";
    }
    if (result.checksum_path) {
        std::cout << "Checksum: " << *result.digest << "\n";
        std::cout << "Checksum written to: " << result.checksum_path->string() << "\n";
    }
    if (cmd.delete_source) {
        std::cout << "Removed: " << cmd.input_path << "\n";
    }
    std::cout << "\nSplit complete. Written to: " << cmd.output_path << "\n";
    return 0;
}

static int do_merge(const CommandLine &cmd) {
    if (cmd.output_path.empty() || cmd.positional.empty()) {
        std::cerr << "Error: --output and at least one part file must be specified\n";
        return 1;
    }

    std::vector<std::filesystem::path> parts(cmd.positional.begin(), cmd.positional.end());
    MergeOptions options;
    options.delete_parts = cmd.delete_parts;
    if (cmd.checksum) {
        options.checksum_path = *cmd.checksum;
    }

    std::cout << "Parts: " << parts.size() << "\n";

    const MergeResult result = merge_files(parts, cmd.output_path, options);

    if (result.digest) {
        std::cout << "Checksum verified: " << *result.digest << "\n";
    }
    std::cout << "\nMerge complete: " << format_size(result.bytes_written) << "\n";
    std::cout << "Written to: " << cmd.output_path << "\n";
    return 0;
}

static int do_plan(const CommandLine &cmd) {
    if (cmd.input_path.empty()) {
        std::cerr << "Error: --input must be specified\n";
        return 1;
    }
    if (!std::filesystem::exists(cmd.input_path)) {
        throw SplitterError(ErrorKind::NotFound, "File doesn't exist: " + cmd.input_path);
    }

    const auto file_size = std::filesystem::file_size(cmd.input_path);
    const ExtraBytesPolicy policy = parse_extra_bytes_policy(cmd.extra);
    const SplitPlan plan = plan_split(file_size, make_request(cmd), policy);

    const std::string base_name = std::filesystem::path(cmd.input_path).filename().string();
    std::cout << "Input: " << cmd.input_path << " (" << format_size(file_size) << ")\n";
    std::cout << "Extra bytes: " << extra_bytes_policy_name(policy) << "\n";
    std::cout << "Parts: " << plan.part_count() << "\n";
    const auto slices = plan.slices();
    for (std::size_t i = 0; i < slices.size(); ++i) {
        std::cout << "  " << part_file_name(base_name, i + 1, slices.size())
                << " offset=" << slices[i].offset << " length=" << slices[i].length << "\n";
    }
    return 0;
}

static int do_algorithms() {
    for (const auto &entry: SUPPORTED_CHECKSUM_ALGORITHMS) {
        std::cout << entry.name << "\n";
    }
    return 0;
}

int main(const int argc, char *argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];

    if (command != "split" && command != "merge" && command != "plan" && command != "algorithms") {
        std::cerr << "Error: unknown command '" << command << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (command == "split") {
            return do_split(cmd);
        }
        if (command == "merge") {
            return do_merge(cmd);
        }
        if (command == "plan") {
            return do_plan(cmd);
        }
        return do_algorithms();
    } catch (const SplitterError &e) {
        std::cerr << "Error (" << error_kind_name(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

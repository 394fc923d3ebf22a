#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

// Streaming Parameters
constexpr size_t CHUNK_SIZE_BYTES = 1024ull * 1024ull; // 1 MiB

// Part Naming Scheme
constexpr size_t PART_INDEX_MIN_DIGITS = 3;
constexpr uint64_t FIRST_PART_INDEX = 1;

const std::string CHECKSUM_FILE_INFIX = "checksum";
const std::string PARTIAL_FILE_SUFFIX = ".partial";

// Digest Encoding
constexpr char HEX_CHARACTERS[] = "0123456789abcdef";

#include "integrity.h"
#include "configuration.h"

#include "byte_stream.h"
#include "crypto.h"

std::optional<ChecksumAlgorithm> find_checksum_algorithm(const std::string_view name,
                                                         const ChecksumAlgorithmTable table) {
    for (const auto &entry: table) {
        if (entry.name == name) {
            return entry.algorithm;
        }
    }
    return std::nullopt;
}

std::string_view checksum_algorithm_name(const ChecksumAlgorithm algorithm) {
    for (const auto &entry: SUPPORTED_CHECKSUM_ALGORITHMS) {
        if (entry.algorithm == algorithm) {
            return entry.name;
        }
    }
    return "unknown";
}

std::string bytes_to_hex(const std::span<const std::byte> bytes) {
    std::string hexString(bytes.size() * 2, 0);
    auto outputPosition = hexString.data();
    for (const auto &currentByte: bytes) {
        const auto byteValue = std::to_integer<unsigned char>(currentByte);
        *outputPosition++ = HEX_CHARACTERS[byteValue >> 4];
        *outputPosition++ = HEX_CHARACTERS[byteValue & 0x0F];
    }
    return hexString;
}

std::unique_ptr<Hasher> make_hasher(const ChecksumAlgorithm algorithm) {
    if (SodiumHasher::supports(algorithm)) {
        return std::make_unique<SodiumHasher>(algorithm);
    }
    return std::make_unique<EvpHasher>(algorithm);
}

std::string hash_file(const std::filesystem::path &path, const ChecksumAlgorithm algorithm) {
    const auto hasher = make_hasher(algorithm);
    FileByteSource source(path);
    for (auto chunk = source.next(); !chunk.empty(); chunk = source.next()) {
        hasher->update(chunk);
    }
    return hasher->finalize_hex();
}

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

enum class ChecksumAlgorithm {
    Blake2b256,
    Blake2b512,
    Md4,
    Md5,
    Ripemd160,
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512,
    Sha512_224,
    Sha512_256,
    Sha3_224,
    Sha3_256,
    Sha3_384,
    Sha3_512,
    Shake128,
    Shake256,
};

struct ChecksumAlgorithmInfo {
    ChecksumAlgorithm algorithm;
    std::string_view name;
};

inline constexpr std::array<ChecksumAlgorithmInfo, 18> SUPPORTED_CHECKSUM_ALGORITHMS{{
    {ChecksumAlgorithm::Blake2b256, "blake2b256"},
    {ChecksumAlgorithm::Blake2b512, "blake2b512"},
    {ChecksumAlgorithm::Md4, "md4"},
    {ChecksumAlgorithm::Md5, "md5"},
    {ChecksumAlgorithm::Ripemd160, "ripemd160"},
    {ChecksumAlgorithm::Sha1, "sha1"},
    {ChecksumAlgorithm::Sha224, "sha224"},
    {ChecksumAlgorithm::Sha256, "sha256"},
    {ChecksumAlgorithm::Sha384, "sha384"},
    {ChecksumAlgorithm::Sha512, "sha512"},
    {ChecksumAlgorithm::Sha512_224, "sha512-224"},
    {ChecksumAlgorithm::Sha512_256, "sha512-256"},
    {ChecksumAlgorithm::Sha3_224, "sha3-224"},
    {ChecksumAlgorithm::Sha3_256, "sha3-256"},
    {ChecksumAlgorithm::Sha3_384, "sha3-384"},
    {ChecksumAlgorithm::Sha3_512, "sha3-512"},
    {ChecksumAlgorithm::Shake128, "shake128"},
    {ChecksumAlgorithm::Shake256, "shake256"},
}};

using ChecksumAlgorithmTable = std::span<const ChecksumAlgorithmInfo>;

[[nodiscard]] std::optional<ChecksumAlgorithm> find_checksum_algorithm(
    std::string_view name,
    ChecksumAlgorithmTable table = SUPPORTED_CHECKSUM_ALGORITHMS);

[[nodiscard]] std::string_view checksum_algorithm_name(ChecksumAlgorithm algorithm);

// Incremental digest over a byte stream.
class Hasher {
public:
    virtual ~Hasher() = default;

    virtual void update(std::span<const std::byte> data) = 0;

    // Lowercase hex. The hasher must not be used afterwards.
    [[nodiscard]] virtual std::string finalize_hex() = 0;
};

// libsodium for the SHA-2 and BLAKE2b variants it implements, OpenSSL otherwise.
std::unique_ptr<Hasher> make_hasher(ChecksumAlgorithm algorithm);

std::string bytes_to_hex(std::span<const std::byte> bytes);

std::string hash_file(const std::filesystem::path &path, ChecksumAlgorithm algorithm);

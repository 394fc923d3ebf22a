#include "integrity.h"

#include "byte_stream.h"
#include "crypto.h"
#include "errors.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace {

std::span<const std::byte> as_bytes(const std::string_view text) {
    return {reinterpret_cast<const std::byte *>(text.data()), text.size()};
}

std::string digest_of(const ChecksumAlgorithm algorithm, const std::string_view text) {
    const auto hasher = make_hasher(algorithm);
    hasher->update(as_bytes(text));
    return hasher->finalize_hex();
}

} // namespace

TEST(ChecksumAlgorithmTest, LooksUpNamesInTable) {
    EXPECT_EQ(find_checksum_algorithm("sha256"), ChecksumAlgorithm::Sha256);
    EXPECT_EQ(find_checksum_algorithm("sha3-512"), ChecksumAlgorithm::Sha3_512);
    EXPECT_EQ(find_checksum_algorithm("blake2b256"), ChecksumAlgorithm::Blake2b256);
    EXPECT_FALSE(find_checksum_algorithm("SHA256").has_value());
    EXPECT_FALSE(find_checksum_algorithm("crc32").has_value());
    EXPECT_EQ(checksum_algorithm_name(ChecksumAlgorithm::Sha512_224), "sha512-224");

    for (const auto &entry: SUPPORTED_CHECKSUM_ALGORITHMS) {
        EXPECT_EQ(find_checksum_algorithm(entry.name), entry.algorithm);
        EXPECT_EQ(checksum_algorithm_name(entry.algorithm), entry.name);
    }
}

TEST(ChecksumAlgorithmTest, RestrictedTableIsHonoured) {
    constexpr std::array<ChecksumAlgorithmInfo, 1> only_md5{{{ChecksumAlgorithm::Md5, "md5"}}};
    EXPECT_EQ(find_checksum_algorithm("md5", only_md5), ChecksumAlgorithm::Md5);
    EXPECT_FALSE(find_checksum_algorithm("sha256", only_md5).has_value());
}

TEST(HasherTest, KnownVectors) {
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha256, "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha512, "abc"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Blake2b512, "abc"),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Md5, "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha1, "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha3_256, "abc"),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Ripemd160, "abc"), "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(HasherTest, DigestLengths) {
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Blake2b256, "abc").size(), 64u);
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha224, "abc").size(), 56u);
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha384, "abc").size(), 96u);
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Sha512_256, "abc").size(), 64u);
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Shake128, "abc").size(), 32u);
    EXPECT_EQ(digest_of(ChecksumAlgorithm::Shake256, "abc").size(), 64u);
}

TEST(HasherTest, IncrementalMatchesOneShot) {
    const auto data = make_pattern(10007);
    for (const auto algorithm: {ChecksumAlgorithm::Sha256, ChecksumAlgorithm::Blake2b512,
                                ChecksumAlgorithm::Sha3_384, ChecksumAlgorithm::Shake256}) {
        const auto whole = make_hasher(algorithm);
        whole->update(data);

        const auto pieces = make_hasher(algorithm);
        MemoryByteSource source(data, 333);
        for (auto chunk = source.next(); !chunk.empty(); chunk = source.next()) {
            pieces->update(chunk);
        }
        EXPECT_EQ(whole->finalize_hex(), pieces->finalize_hex()) << checksum_algorithm_name(algorithm);
    }
}

TEST(HasherTest, BackendsAgree) {
    const auto data = make_pattern(4096);
    for (const auto algorithm: {ChecksumAlgorithm::Sha256, ChecksumAlgorithm::Sha512,
                                ChecksumAlgorithm::Blake2b512}) {
        SodiumHasher sodium(algorithm);
        EvpHasher evp(algorithm);
        sodium.update(data);
        evp.update(data);
        EXPECT_EQ(sodium.finalize_hex(), evp.finalize_hex()) << checksum_algorithm_name(algorithm);
    }
}

TEST(HasherTest, RipemdResolvesThroughOpenSsl) {
    EvpHasher hasher(ChecksumAlgorithm::Ripemd160);
    hasher.update(as_bytes("abc"));
    EXPECT_EQ(hasher.finalize_hex(), "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(HasherTest, SodiumRejectsForeignAlgorithm) {
    EXPECT_FALSE(SodiumHasher::supports(ChecksumAlgorithm::Md5));
    try {
        SodiumHasher hasher(ChecksumAlgorithm::Md5);
        FAIL() << "expected UnsupportedAlgorithm";
    } catch (const SplitterError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedAlgorithm);
    }
}

TEST(HasherTest, HexIsLowercase) {
    const std::array<std::byte, 3> bytes{std::byte{0x00}, std::byte{0xAB}, std::byte{0xF9}};
    EXPECT_EQ(bytes_to_hex(bytes), "00abf9");
}

class HashFileTest : public TempDirTest {
};

TEST_F(HashFileTest, MatchesInMemoryDigest) {
    const auto data = make_pattern(3 * 1024 * 1024 + 17);
    const auto path = input_dir() / "blob.bin";
    write_file(path, data);

    const auto hasher = make_hasher(ChecksumAlgorithm::Sha256);
    hasher->update(data);
    EXPECT_EQ(hash_file(path, ChecksumAlgorithm::Sha256), hasher->finalize_hex());
}

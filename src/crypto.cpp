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

#include "crypto.h"
#include "errors.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/provider.h>

#include <array>
#include <mutex>
#include <stdexcept>

static std::once_flag sodium_init_flag;
static std::once_flag legacy_provider_flag;

static void ensure_sodium_init() {
    std::call_once(sodium_init_flag, [] {
        if (sodium_init() < 0) {
            throw std::runtime_error("sodium_init failed");
        }
    });
}

// Loading any provider explicitly disables the implicit default provider, so
// the default and legacy providers are loaded together.
static void ensure_legacy_provider() {
    std::call_once(legacy_provider_flag, [] {
        if (OSSL_PROVIDER_load(nullptr, "default") == nullptr) {
            throw std::runtime_error("Failed to load the OpenSSL default provider");
        }
        // Without it legacy digests are reported as unsupported.
        if (OSSL_PROVIDER_load(nullptr, "legacy") == nullptr) {
            ERR_clear_error();
        }
    });
}

static const char *evp_name(const ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::Blake2b512:
            return "BLAKE2B-512";
        case ChecksumAlgorithm::Md4:
            return "MD4";
        case ChecksumAlgorithm::Md5:
            return "MD5";
        case ChecksumAlgorithm::Ripemd160:
            return "RIPEMD-160";
        case ChecksumAlgorithm::Sha1:
            return "SHA1";
        case ChecksumAlgorithm::Sha224:
            return "SHA2-224";
        case ChecksumAlgorithm::Sha256:
            return "SHA2-256";
        case ChecksumAlgorithm::Sha384:
            return "SHA2-384";
        case ChecksumAlgorithm::Sha512:
            return "SHA2-512";
        case ChecksumAlgorithm::Sha512_224:
            return "SHA2-512/224";
        case ChecksumAlgorithm::Sha512_256:
            return "SHA2-512/256";
        case ChecksumAlgorithm::Sha3_224:
            return "SHA3-224";
        case ChecksumAlgorithm::Sha3_256:
            return "SHA3-256";
        case ChecksumAlgorithm::Sha3_384:
            return "SHA3-384";
        case ChecksumAlgorithm::Sha3_512:
            return "SHA3-512";
        case ChecksumAlgorithm::Shake128:
            return "SHAKE-128";
        case ChecksumAlgorithm::Shake256:
            return "SHAKE-256";
        case ChecksumAlgorithm::Blake2b256:
            break;
    }
    return nullptr;
}

// Output length used for the extendable-output functions.
static std::size_t xof_length(const ChecksumAlgorithm algorithm) {
    return algorithm == ChecksumAlgorithm::Shake128 ? 16u : 32u;
}

static std::size_t generichash_length(const ChecksumAlgorithm algorithm) {
    return algorithm == ChecksumAlgorithm::Blake2b256 ? 32u : 64u;
}

bool SodiumHasher::supports(const ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::Sha256:
        case ChecksumAlgorithm::Sha512:
        case ChecksumAlgorithm::Blake2b256:
        case ChecksumAlgorithm::Blake2b512:
            return true;
        default:
            return false;
    }
}

SodiumHasher::SodiumHasher(const ChecksumAlgorithm algorithm)
    : algorithm_(algorithm) {
    ensure_sodium_init();

    switch (algorithm_) {
        case ChecksumAlgorithm::Sha256:
            crypto_hash_sha256_init(&state_.emplace<crypto_hash_sha256_state>());
            break;
        case ChecksumAlgorithm::Sha512:
            crypto_hash_sha512_init(&state_.emplace<crypto_hash_sha512_state>());
            break;
        case ChecksumAlgorithm::Blake2b256:
        case ChecksumAlgorithm::Blake2b512:
            if (crypto_generichash_init(&state_.emplace<crypto_generichash_state>(),
                                        nullptr, 0, generichash_length(algorithm_)) != 0) {
                throw std::runtime_error("crypto_generichash_init failed");
            }
            break;
        default:
            throw SplitterError(ErrorKind::UnsupportedAlgorithm,
                                "libsodium does not provide " +
                                std::string(checksum_algorithm_name(algorithm_)));
    }
}

void SodiumHasher::update(const std::span<const std::byte> data) {
    const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
    const auto size = static_cast<unsigned long long>(data.size());

    if (auto *sha256 = std::get_if<crypto_hash_sha256_state>(&state_)) {
        crypto_hash_sha256_update(sha256, bytes, size);
    } else if (auto *sha512 = std::get_if<crypto_hash_sha512_state>(&state_)) {
        crypto_hash_sha512_update(sha512, bytes, size);
    } else if (crypto_generichash_update(&std::get<crypto_generichash_state>(state_), bytes, size) != 0) {
        throw std::runtime_error("crypto_generichash_update failed");
    }
}

std::string SodiumHasher::finalize_hex() {
    std::array<std::byte, crypto_hash_sha512_BYTES> digest{};
    auto *out = reinterpret_cast<unsigned char *>(digest.data());
    std::size_t length = 0;

    if (auto *sha256 = std::get_if<crypto_hash_sha256_state>(&state_)) {
        crypto_hash_sha256_final(sha256, out);
        length = crypto_hash_sha256_BYTES;
    } else if (auto *sha512 = std::get_if<crypto_hash_sha512_state>(&state_)) {
        crypto_hash_sha512_final(sha512, out);
        length = crypto_hash_sha512_BYTES;
    } else {
        length = generichash_length(algorithm_);
        if (crypto_generichash_final(&std::get<crypto_generichash_state>(state_), out, length) != 0) {
            throw std::runtime_error("crypto_generichash_final failed");
        }
    }

    const std::string hex = bytes_to_hex(std::span(digest.data(), length));
    sodium_memzero(digest.data(), digest.size());
    return hex;
}

void EvpHasher::MdDeleter::operator()(evp_md_st *md) const {
    EVP_MD_free(md);
}

void EvpHasher::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
    EVP_MD_CTX_free(ctx);
}

EvpHasher::EvpHasher(const ChecksumAlgorithm algorithm)
    : algorithm_(algorithm) {
    const char *name = evp_name(algorithm_);
    const std::string display_name(checksum_algorithm_name(algorithm_));
    if (name == nullptr) {
        throw SplitterError(ErrorKind::UnsupportedAlgorithm,
                            "OpenSSL does not provide " + display_name);
    }

    md_.reset(EVP_MD_fetch(nullptr, name, nullptr));
    if (!md_) {
        // MD4 always, and RIPEMD-160 before OpenSSL 3.0.7, live in the legacy provider.
        ERR_clear_error();
        ensure_legacy_provider();
        md_.reset(EVP_MD_fetch(nullptr, name, nullptr));
    }
    if (!md_) {
        ERR_clear_error();
        throw SplitterError(ErrorKind::UnsupportedAlgorithm,
                            display_name + " is not available in this OpenSSL build");
    }

    ctx_.reset(EVP_MD_CTX_new());
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx_.get(), md_.get(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize " + display_name + " digest");
    }
}

void EvpHasher::update(const std::span<const std::byte> data) {
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string EvpHasher::finalize_hex() {
    std::array<std::byte, EVP_MAX_MD_SIZE> digest{};
    auto *out = reinterpret_cast<unsigned char *>(digest.data());
    std::size_t length = 0;

    if ((EVP_MD_get_flags(md_.get()) & EVP_MD_FLAG_XOF) != 0) {
        length = xof_length(algorithm_);
        if (EVP_DigestFinalXOF(ctx_.get(), out, length) != 1) {
            throw std::runtime_error("Failed to finalize digest");
        }
    } else {
        unsigned int written = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out, &written) != 1) {
            throw std::runtime_error("Failed to finalize digest");
        }
        length = written;
    }

    return bytes_to_hex(std::span(digest.data(), length));
}

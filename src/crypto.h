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

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <variant>

#include <sodium.h>

#include "integrity.h"

struct evp_md_ctx_st;
struct evp_md_st;

class SodiumHasher final : public Hasher {
public:
    explicit SodiumHasher(ChecksumAlgorithm algorithm);

    [[nodiscard]] static bool supports(ChecksumAlgorithm algorithm);

    void update(std::span<const std::byte> data) override;

    [[nodiscard]] std::string finalize_hex() override;

private:
    ChecksumAlgorithm algorithm_;
    std::variant<crypto_hash_sha256_state, crypto_hash_sha512_state, crypto_generichash_state> state_;
};

class EvpHasher final : public Hasher {
public:
    // Throws SplitterError(UnsupportedAlgorithm) if OpenSSL cannot provide it.
    explicit EvpHasher(ChecksumAlgorithm algorithm);

    void update(std::span<const std::byte> data) override;

    [[nodiscard]] std::string finalize_hex() override;

private:
    struct MdDeleter {
        void operator()(evp_md_st *md) const;
    };

    struct CtxDeleter {
        void operator()(evp_md_ctx_st *ctx) const;
    };

    ChecksumAlgorithm algorithm_;
    std::unique_ptr<evp_md_st, MdDeleter> md_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

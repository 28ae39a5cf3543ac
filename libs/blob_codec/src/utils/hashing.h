/*
 * Blob Codec
 * Copyright (C) 2025 Joshua Olson
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
#include "blake3.h"
#include "blst.h"
#include <array>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>

using Hash = std::array<byte, 32>;
using Bytes48 = std::array<byte, 48>;

using ByteSlice = std::span<const byte>;

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void update(const std::string &tag) {
        blake3_hasher_update(&h_, tag.data(), tag.size());
    }
    Hash finalize() {
        Hash out;
        blake3_hasher_finalize(&h_, static_cast<uint8_t*>(out.data()), out.size());
        return out;
    }
};

void seeded_hash(Hash* out, int i);
void hash_to_scalar(blst_scalar* s, const Hash &hash);

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
#include "blst.h"
#include <cstddef>
#include <cstdint>
#include <vector>

/*  =======================================================
 *  |                  LAYOUT OF ONE BLOB                 |
 *  |=====================================================|
 *  |    field element  = 32 bytes                        |
 *  |    row            = 4 field elements = 128 bytes    |
 *  |    blob           = 1024 rows = 4096 elements       |
 *  |                   = 131,072 bytes                   |
 *  =======================================================
 *
 *  every field element = [6-bit header] ++ [31 carrier bytes]
 *  one row carries 4 * 31 + 3 = 127 payload bytes, the 3 extra
 *  bytes being split across the 4 header bytes of the row.
 *
 *  row 0 gives up 4 carrier bytes to the blob header:
 *      [version][len >> 16][len >> 8][len]
*/

constexpr size_t BYTES_PER_FIELD_ELEMENT = 32;
constexpr size_t FIELD_ELEMENTS_PER_BLOB = 4096;
constexpr size_t BYTES_PER_BLOB = BYTES_PER_FIELD_ELEMENT * FIELD_ELEMENTS_PER_BLOB;

constexpr size_t CARRIER_SIZE = BYTES_PER_FIELD_ELEMENT - 1;
constexpr size_t ELEMENTS_PER_ROUND = 4;
constexpr size_t ROUNDS = FIELD_ELEMENTS_PER_BLOB / ELEMENTS_PER_ROUND;

constexpr byte ENCODING_VERSION = 0;
constexpr size_t BLOB_HEADER_SIZE = 1 + 3;

constexpr byte SIX_BIT_MASK = 0b0011'1111;
constexpr byte HIGH_BITS_MASK = 0b1100'0000;

// (127 * 1024) - 4 = 130,044
constexpr size_t MAX_BLOB_DATA_SIZE =
    (ELEMENTS_PER_ROUND * CARRIER_SIZE + 3) * ROUNDS - BLOB_HEADER_SIZE;

static_assert(BYTES_PER_BLOB == 131072);
static_assert(MAX_BLOB_DATA_SIZE == 130044);
static_assert(MAX_BLOB_DATA_SIZE < (1u << 24));

using Blob = std::vector<byte>;

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
#include "codes.h"
#include "constants.h"
#include "hashing.h"
#include "result.h"

// Packs data (0 <= len <= MAX_BLOB_DATA_SIZE) into one blob.
//
// The blob is filled in rounds of 4 field elements. Each element is a
// 6-bit header followed by 31 carrier bytes, and each round consumes
// 4 * 31 + 3 input bytes: the 3 bytes x, y, z read after the first three
// carriers are spread over the 4 headers so that no header ever sets its
// top two bits.
//
//      h1 = x & 0x3f
//      h2 = (y & 0x0f) | ((x & 0xc0) >> 2)
//      h3 = z & 0x3f
//      h4 = ((z & 0xc0) >> 2) | ((y & 0xf0) >> 4)
//
// Round 0 reserves the first 4 carrier bytes for version and length.
// Bit compatible with the OP stack blob encoding.
Result<Blob, BlobError> create_blob_from_data(ByteSlice data);

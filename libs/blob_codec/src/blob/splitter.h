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
#include <vector>

// ceil(len / MAX_BLOB_DATA_SIZE), zero for an empty payload
size_t blob_count(size_t len);

// Slices data end to end into chunks of at most MAX_BLOB_DATA_SIZE.
std::vector<ByteSlice> split_chunks(ByteSlice data);

// Packs every chunk of data into its own blob, in order.
Result<std::vector<Blob>, BlobError> create_blobs_from_data(ByteSlice data);

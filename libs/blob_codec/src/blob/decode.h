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
#include "result.h"
#include <vector>

// Inverse of create_blob_from_data. Validates the blob size, every
// field element header, the version byte and the declared length, then
// undoes the header bit interleaving round by round. Bytes past the
// declared length must be zero.
Result<std::vector<byte>, BlobError> decode_blob(const Blob &blob);

// Concatenates the payloads of consecutive blobs.
Result<std::vector<byte>, BlobError> decode_blobs(const std::vector<Blob> &blobs);

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

#include "splitter.h"
#include "encode.h"
#include <algorithm>

size_t blob_count(size_t len) {
    return (len + MAX_BLOB_DATA_SIZE - 1) / MAX_BLOB_DATA_SIZE;
}

std::vector<ByteSlice> split_chunks(ByteSlice data) {
    std::vector<ByteSlice> chunks;
    chunks.reserve(blob_count(data.size()));

    for (size_t start{}; start < data.size(); start += MAX_BLOB_DATA_SIZE) {
        size_t n = std::min(MAX_BLOB_DATA_SIZE, data.size() - start);
        chunks.push_back(data.subspan(start, n));
    }
    return chunks;
}

Result<std::vector<Blob>, BlobError> create_blobs_from_data(ByteSlice data) {
    std::vector<ByteSlice> chunks = split_chunks(data);

    std::vector<Blob> blobs;
    blobs.reserve(chunks.size());

    for (const ByteSlice &chunk : chunks) {
        auto r = create_blob_from_data(chunk);
        if (r.is_err()) return r.unwrap_err();
        blobs.push_back(r.take());
    }
    return blobs;
}

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

#include "decode.h"
#include "cursor.h"
#include <algorithm>

static void append(std::vector<byte> &out, const byte* src, size_t n) {
    out.insert(out.end(), src, src + n);
}

Result<std::vector<byte>, BlobError> decode_blob(const Blob &blob) {
    if (blob.size() != BYTES_PER_BLOB)
        return BlobError{INVALID_BLOB_SIZE, blob.size()};

    for (size_t i{}; i < BYTES_PER_BLOB; i += BYTES_PER_FIELD_ELEMENT) {
        if ((blob[i] & HIGH_BITS_MASK) != 0)
            return BlobError{INVALID_FIELD_ELEMENT, i};
    }

    // header sits in the first carrier, right after element 0's 6-bit header
    byte version = blob[1];
    if (version != ENCODING_VERSION)
        return BlobError{UNSUPPORTED_VERSION, version};

    size_t len = (size_t(blob[2]) << 16) | (size_t(blob[3]) << 8) | size_t(blob[4]);
    if (len > MAX_BLOB_DATA_SIZE)
        return BlobError{INVALID_LENGTH, len};

    std::vector<byte> out;
    out.reserve(MAX_BLOB_DATA_SIZE);

    BlobReader reader(blob);
    for (size_t round{}; round < ROUNDS; round++) {
        byte h1 = reader.read_header_byte();
        const byte* c1 = reader.read_carrier();
        byte h2 = reader.read_header_byte();
        const byte* c2 = reader.read_carrier();
        byte h3 = reader.read_header_byte();
        const byte* c3 = reader.read_carrier();
        byte h4 = reader.read_header_byte();
        const byte* c4 = reader.read_carrier();

        byte x = h1 | ((h2 & 0b0011'0000) << 2);
        byte y = (h2 & 0b0000'1111) | ((h4 & 0b0000'1111) << 4);
        byte z = h3 | ((h4 & 0b0011'0000) << 2);

        if (round == 0) {
            append(out, c1 + BLOB_HEADER_SIZE, CARRIER_SIZE - BLOB_HEADER_SIZE);
        } else {
            append(out, c1, CARRIER_SIZE);
        }
        out.push_back(x);
        append(out, c2, CARRIER_SIZE);
        out.push_back(y);
        append(out, c3, CARRIER_SIZE);
        out.push_back(z);
        append(out, c4, CARRIER_SIZE);
    }

    // anything past len must be the packer's zero fill, so that a blob
    // decodes only if it is exactly the encoding of its payload
    auto stray = std::find_if(out.begin() + len, out.end(), [](byte b) { return b != 0; });
    if (stray != out.end())
        return BlobError{NON_ZERO_PADDING, size_t(stray - out.begin())};

    out.resize(len);
    return out;
}

Result<std::vector<byte>, BlobError> decode_blobs(const std::vector<Blob> &blobs) {
    std::vector<byte> payload;
    payload.reserve(blobs.size() * MAX_BLOB_DATA_SIZE);

    for (const Blob &blob : blobs) {
        auto r = decode_blob(blob);
        if (r.is_err()) return r.unwrap_err();

        const std::vector<byte> &chunk = r.unwrap();
        payload.insert(payload.end(), chunk.begin(), chunk.end());
    }
    return payload;
}

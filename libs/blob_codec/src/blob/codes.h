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
#include <cstddef>
#include <string>

enum BlobCodes {
    OK = 0,

    INPUT_TOO_LARGE = 1,
    DATA_DID_NOT_FIT = 2,
    KZG_ERR = 3,
    THREAD_PANICKED = 4,

    INVALID_BLOB_SIZE = 5,
    INVALID_FIELD_ELEMENT = 6,
    UNSUPPORTED_VERSION = 7,
    INVALID_LENGTH = 8,

    NULL_PARAMETER = 9,
    BUFFER_TOO_SMALL = 10,

    NON_ZERO_PADDING = 11,
};

struct BlobError {
    BlobCodes code;

    // INPUT_TOO_LARGE, INVALID_LENGTH, UNSUPPORTED_VERSION,
    // INVALID_FIELD_ELEMENT (offset of the element)
    // and NON_ZERO_PADDING (payload offset of the first stray byte)
    size_t len = 0;

    // DATA_DID_NOT_FIT
    size_t read_offset = 0;
    size_t data_len = 0;

    // KZG_ERR, THREAD_PANICKED
    std::string msg;

    std::string to_string() const;
};

BlobError input_too_large(size_t len);
BlobError data_did_not_fit(size_t read_offset, size_t data_len);
BlobError kzg_error(std::string msg);
BlobError thread_panicked(std::string msg);

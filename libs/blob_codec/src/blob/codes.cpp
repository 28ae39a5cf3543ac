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

#include "codes.h"
#include <utility>

BlobError input_too_large(size_t len) {
    return BlobError{INPUT_TOO_LARGE, len};
}

BlobError data_did_not_fit(size_t read_offset, size_t data_len) {
    return BlobError{DATA_DID_NOT_FIT, 0, read_offset, data_len};
}

BlobError kzg_error(std::string msg) {
    return BlobError{KZG_ERR, 0, 0, 0, std::move(msg)};
}

BlobError thread_panicked(std::string msg) {
    return BlobError{THREAD_PANICKED, 0, 0, 0, std::move(msg)};
}

std::string BlobError::to_string() const {
    switch (code) {
    case OK:
        return "ok";
    case INPUT_TOO_LARGE:
        return "too much data to encode in one blob: len=" + std::to_string(len);
    case DATA_DID_NOT_FIT:
        return "data did not fit in blob: read_offset=" + std::to_string(read_offset)
            + ", data_len=" + std::to_string(data_len);
    case KZG_ERR:
        return "KZG error: " + msg;
    case THREAD_PANICKED:
        return "thread panicked: " + msg;
    case INVALID_BLOB_SIZE:
        return "invalid blob size: len=" + std::to_string(len);
    case INVALID_FIELD_ELEMENT:
        return "invalid field element at offset " + std::to_string(len);
    case UNSUPPORTED_VERSION:
        return "unsupported blob encoding version: " + std::to_string(len);
    case INVALID_LENGTH:
        return "invalid blob data length: len=" + std::to_string(len);
    case NULL_PARAMETER:
        return "null parameter";
    case BUFFER_TOO_SMALL:
        return "output buffer too small: need=" + std::to_string(len);
    case NON_ZERO_PADDING:
        return "non-zero padding past declared length at offset " + std::to_string(len);
    }
    return "unknown blob error";
}

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

// extern.h
#pragma once
#include <cstddef>
#include <cstdint>

extern "C" {
    size_t blob_max_data_size();
    size_t blob_size();
    size_t blobs_needed(size_t data_size);

    int blob_encode(
        const unsigned char* data,
        size_t data_size,
        unsigned char* out,
        size_t out_size
    );

    int blob_encode_all(
        const unsigned char* data,
        size_t data_size,
        unsigned char* out,
        size_t out_size,
        size_t* n_blobs
    );

    int blob_decode(
        const unsigned char* blob,
        size_t blob_size,
        unsigned char* out,
        size_t out_cap,
        size_t* out_len
    );

    void* kzg_engine_open(
        const unsigned char* secret,
        size_t secret_size,
        const char* tag
    );

    void kzg_engine_close(void* engine);

    int kzg_blob_commitment(
        void* engine,
        const unsigned char* blob,
        size_t blob_size,
        unsigned char* out
    );

    int kzg_blob_proof(
        void* engine,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char* commitment,
        unsigned char* out
    );

    // 1 valid, 0 invalid, -NULL_PARAMETER, -INVALID_BLOB_SIZE or -KZG_ERR
    int kzg_verify_blob_proof(
        void* engine,
        const unsigned char* blob,
        size_t blob_size,
        const unsigned char* commitment,
        const unsigned char* proof
    );
}

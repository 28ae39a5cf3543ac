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

#include "extern.h"
#include "decode.h"
#include "encode.h"
#include "engine.h"
#include "splitter.h"
#include <algorithm>
#include <cstdio>
#include <cstring>

size_t blob_max_data_size() { return MAX_BLOB_DATA_SIZE; }
size_t blob_size() { return BYTES_PER_BLOB; }
size_t blobs_needed(size_t data_size) { return blob_count(data_size); }

int blob_encode(
    const unsigned char* data,
    size_t data_size,
    unsigned char* out,
    size_t out_size
) {
    if (!out || (!data && data_size != 0)) return NULL_PARAMETER;
    if (out_size < BYTES_PER_BLOB) return BUFFER_TOO_SMALL;

    auto r = create_blob_from_data(ByteSlice(data, data_size));
    if (r.is_err()) return r.unwrap_err().code;

    std::memcpy(out, r.unwrap().data(), BYTES_PER_BLOB);
    return OK;
}

int blob_encode_all(
    const unsigned char* data,
    size_t data_size,
    unsigned char* out,
    size_t out_size,
    size_t* n_blobs
) {
    if (!n_blobs || (!data && data_size != 0)) return NULL_PARAMETER;

    size_t n = blob_count(data_size);
    *n_blobs = n;
    if (n == 0) return OK;

    if (!out) return NULL_PARAMETER;
    if (out_size < n * BYTES_PER_BLOB) return BUFFER_TOO_SMALL;

    auto r = create_blobs_from_data(ByteSlice(data, data_size));
    if (r.is_err()) return r.unwrap_err().code;

    for (const Blob &blob : r.unwrap()) {
        std::memcpy(out, blob.data(), BYTES_PER_BLOB);
        out += BYTES_PER_BLOB;
    }
    return OK;
}

int blob_decode(
    const unsigned char* blob,
    size_t blob_size,
    unsigned char* out,
    size_t out_cap,
    size_t* out_len
) {
    if (!blob || !out_len) return NULL_PARAMETER;

    Blob b(blob, blob + blob_size);
    auto r = decode_blob(b);
    if (r.is_err()) return r.unwrap_err().code;

    const std::vector<byte> &payload = r.unwrap();
    *out_len = payload.size();
    if (payload.empty()) return OK;

    if (!out) return NULL_PARAMETER;
    if (out_cap < payload.size()) return BUFFER_TOO_SMALL;

    std::memcpy(out, payload.data(), payload.size());
    return OK;
}

void* kzg_engine_open(
    const unsigned char* secret,
    size_t secret_size,
    const char* tag
) {
    if (!secret || secret_size == 0) return nullptr;

    blst_scalar s;
    if (!blst_scalar_from_be_bytes(&s, secret, secret_size)) {
        fprintf(stderr, "[kzg] secret reduces to zero\n");
        return nullptr;
    }

    try {
        return new KzgEngine(s, tag ? std::string(tag) : DEFAULT_ENGINE_TAG);
    } catch (const std::exception &e) {
        fprintf(stderr, "[kzg] engine setup failed: %s\n", e.what());
        return nullptr;
    }
}

void kzg_engine_close(void* engine) {
    delete static_cast<KzgEngine*>(engine);
}

int kzg_blob_commitment(
    void* engine,
    const unsigned char* blob,
    size_t blob_size,
    unsigned char* out
) {
    if (!engine || !blob || !out) return NULL_PARAMETER;

    auto e = static_cast<KzgEngine*>(engine);
    Blob b(blob, blob + blob_size);

    auto r = e->blob_to_commitment(b);
    if (r.is_err()) return r.unwrap_err().code;

    std::memcpy(out, r.unwrap().data(), 48);
    return OK;
}

int kzg_blob_proof(
    void* engine,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char* commitment,
    unsigned char* out
) {
    if (!engine || !blob || !commitment || !out) return NULL_PARAMETER;

    auto e = static_cast<KzgEngine*>(engine);
    Blob b(blob, blob + blob_size);

    Bytes48 C;
    std::copy_n(commitment, C.size(), C.begin());

    auto r = e->compute_blob_proof(b, C);
    if (r.is_err()) return r.unwrap_err().code;

    std::memcpy(out, r.unwrap().data(), 48);
    return OK;
}

// 1 valid, 0 invalid, or a negated BlobCodes value for bad input
int kzg_verify_blob_proof(
    void* engine,
    const unsigned char* blob,
    size_t blob_size,
    const unsigned char* commitment,
    const unsigned char* proof
) {
    if (!engine || !blob || !commitment || !proof) return -NULL_PARAMETER;
    if (blob_size != BYTES_PER_BLOB) return -INVALID_BLOB_SIZE;

    auto e = static_cast<KzgEngine*>(engine);
    Blob b(blob, blob + blob_size);

    Bytes48 C, Pi;
    std::copy_n(commitment, C.size(), C.begin());
    std::copy_n(proof, Pi.size(), Pi.begin());

    auto r = e->verify_blob_proof(b, C, Pi);
    if (r.is_err()) return -int(r.unwrap_err().code);

    return r.unwrap() ? 1 : 0;
}

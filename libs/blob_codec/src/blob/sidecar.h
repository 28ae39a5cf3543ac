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
#include <array>
#include <vector>


// blobs plus one commitment and one opening proof per blob
struct Sidecar {
    std::vector<Blob> blobs;
    std::vector<Bytes48> commitments;
    std::vector<Bytes48> proofs;
};

// Turns packed blobs into a sidecar. Implementations report their own
// failures as KZG_ERR and must be safe to call from several threads.
class CommitmentEngine {
public:
    virtual ~CommitmentEngine() = default;

    virtual Result<Sidecar, BlobError> build_sidecar(std::vector<Blob> blobs) const = 0;
};

// Splits and packs data, then hands the blobs to the engine.
// Blocks the calling thread until the sidecar is built.
Result<Sidecar, BlobError> create_blob_sidecar_from_data_blocking(
    ByteSlice data,
    const CommitmentEngine &engine
);

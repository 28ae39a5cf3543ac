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
#include "kzg.h"
#include "sidecar.h"
#include <string>

const std::string DEFAULT_ENGINE_TAG = "BLOB_CODEC";

// KZG commitments over BLS12-381 for blobs of FIELD_ELEMENTS_PER_BLOB
// elements. Each blob is committed in coefficient form and opened at a
// Fiat-Shamir point z = H(tag || blob || C).
//
// The setup is derived from a caller supplied secret, so commitments are
// only meaningful between parties sharing that secret.
class KzgEngine : public CommitmentEngine {
public:
    explicit KzgEngine(
        const blst_scalar &secret,
        std::string tag = DEFAULT_ENGINE_TAG
    );

    Result<Sidecar, BlobError> build_sidecar(std::vector<Blob> blobs) const override;

    Result<Bytes48, BlobError> blob_to_commitment(const Blob &blob) const;

    Result<Bytes48, BlobError> compute_blob_proof(
        const Blob &blob,
        const Bytes48 &commitment
    ) const;

    // false for a proof that does not open the commitment, or for bytes
    // that are not a G1 point; an error for a blob that is not well formed
    Result<bool, BlobError> verify_blob_proof(
        const Blob &blob,
        const Bytes48 &commitment,
        const Bytes48 &proof
    ) const;

    bool verify_sidecar(const Sidecar &sidecar) const;

    const KZGSettings& settings() const { return settings_; }

private:
    KZGSettings settings_;

    blst_scalar challenge(const Blob &blob, const Bytes48 &commitment) const;
};

// big-endian field elements -> scalars, fails on any element >= r
Result<Scalar_vec, BlobError> blob_to_evals(const Blob &blob);

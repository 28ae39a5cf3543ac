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

#include "engine.h"
#include "fft.h"
#include <utility>

Result<Scalar_vec, BlobError> blob_to_evals(const Blob &blob) {
    if (blob.size() != BYTES_PER_BLOB)
        return kzg_error("blob is " + std::to_string(blob.size()) + " bytes");

    Scalar_vec evals(FIELD_ELEMENTS_PER_BLOB);
    for (size_t i{}; i < FIELD_ELEMENTS_PER_BLOB; i++) {
        const byte* fe = blob.data() + i * BYTES_PER_FIELD_ELEMENT;
        blst_scalar_from_bendian(&evals[i], fe);

        if (!blst_scalar_fr_check(&evals[i]))
            return kzg_error("non-canonical field element at index " + std::to_string(i));
    }
    return evals;
}

KzgEngine::KzgEngine(const blst_scalar &secret, std::string tag)
    : settings_(init_settings(FIELD_ELEMENTS_PER_BLOB, secret, std::move(tag)))
{}

blst_scalar KzgEngine::challenge(const Blob &blob, const Bytes48 &commitment) const {
    BlakeHasher hasher;
    hasher.update(settings_.tag);
    hasher.update(blob.data(), blob.size());
    hasher.update(commitment.data(), commitment.size());

    blst_scalar z;
    hash_to_scalar(&z, hasher.finalize());
    return z;
}

Result<Bytes48, BlobError> KzgEngine::blob_to_commitment(const Blob &blob) const {
    auto evals = blob_to_evals(blob);
    if (evals.is_err()) return evals.unwrap_err();

    // eval -> coeff form
    Polynomial fx = evals.take();
    inverse_fft_in_place(fx, settings_.roots.inv_roots);

    Commitment C;
    commit_g1(&C, fx, settings_.setup);
    return compress_p1(C);
}

Result<Bytes48, BlobError> KzgEngine::compute_blob_proof(
    const Blob &blob,
    const Bytes48 &commitment
) const {
    auto evals = blob_to_evals(blob);
    if (evals.is_err()) return evals.unwrap_err();

    const Scalar_vec &fx_evals = evals.unwrap();

    Polynomial fx(fx_evals);
    inverse_fft_in_place(fx, settings_.roots.inv_roots);

    blst_scalar z = challenge(blob, commitment);
    blst_scalar y = eval_poly(fx, z);

    auto Pi = prove_kzg(fx_evals, z, y, settings_);
    if (!Pi.has_value())
        return kzg_error("could not derive quotient polynomial");

    return compress_p1(Pi.value());
}

Result<bool, BlobError> KzgEngine::verify_blob_proof(
    const Blob &blob,
    const Bytes48 &commitment,
    const Bytes48 &proof
) const {
    auto evals = blob_to_evals(blob);
    if (evals.is_err()) return evals.unwrap_err();

    Commitment C;
    Proof Pi;
    if (!p1_from_bytes(&C, commitment)) return false;
    if (!p1_from_bytes(&Pi, proof)) return false;

    Polynomial fx = evals.take();
    inverse_fft_in_place(fx, settings_.roots.inv_roots);

    blst_scalar z = challenge(blob, commitment);
    blst_scalar y = eval_poly(fx, z);

    return verify_kzg(C, z, y, Pi, settings_.setup);
}

bool KzgEngine::verify_sidecar(const Sidecar &sidecar) const {
    size_t n = sidecar.blobs.size();
    if (sidecar.commitments.size() != n || sidecar.proofs.size() != n) return false;

    for (size_t i{}; i < n; i++) {
        auto ok = verify_blob_proof(sidecar.blobs[i], sidecar.commitments[i], sidecar.proofs[i]);
        if (ok.is_err() || !ok.unwrap())
            return false;
    }
    return true;
}

Result<Sidecar, BlobError> KzgEngine::build_sidecar(std::vector<Blob> blobs) const {
    Sidecar sidecar;
    sidecar.commitments.reserve(blobs.size());
    sidecar.proofs.reserve(blobs.size());

    for (const Blob &blob : blobs) {
        auto C = blob_to_commitment(blob);
        if (C.is_err()) return C.unwrap_err();

        auto Pi = compute_blob_proof(blob, C.unwrap());
        if (Pi.is_err()) return Pi.unwrap_err();

        sidecar.commitments.push_back(C.unwrap());
        sidecar.proofs.push_back(Pi.unwrap());
    }

    sidecar.blobs = std::move(blobs);
    return sidecar;
}

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

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include "engine.h"
#include "fft.h"
#include "offload.h"
#include "splitter.h"
#include "tests.h"

void test_fft() {
    printf("TESTING f -> FFT -> IFFT == f \n");
    const size_t DEGREE = 256;

    // root * inv_root == 1
    NTTRoots roots = build_roots(DEGREE);
    for (size_t i = 0; i < DEGREE; i++) {
        blst_scalar tmp;
        blst_sk_mul_n_check(&tmp, &roots.roots[i], &roots.inv_roots[i]);
        assert(equal_scalars(tmp, num_scalar(1)));
    }

    Scalar_vec evals(DEGREE, blst_scalar());

    Hash hash;
    for (size_t i = 0; i < DEGREE; i++) {
        seeded_hash(&hash, i);
        hash_to_scalar(&evals[i], hash);
    }

    Scalar_vec coeffs = evals;
    inverse_fft_in_place(coeffs, roots.inv_roots);

    // f(w_i) == evals[i]
    for (size_t i = 0; i < DEGREE; i += 37)
        assert(equal_scalars(eval_poly(coeffs, roots.roots[i]), evals[i]));

    Scalar_vec fx = coeffs;
    fft_in_place(fx, roots.roots);
    for (size_t i = 0; i < DEGREE; i++)
        assert(equal_scalars(evals[i], fx[i]));

    bool threw = false;
    try {
        build_roots(100);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

class FailingEngine : public CommitmentEngine {
public:
    Result<Sidecar, BlobError> build_sidecar(std::vector<Blob>) const override {
        return kzg_error("engine offline");
    }
};

void test_sidecar(const KzgEngine &engine) {
    printf("TESTING SIDECAR COMMIT & PROVE \n");

    std::vector<byte> data = test_payload(MAX_BLOB_DATA_SIZE + 5000, 31);

    auto r = create_blob_sidecar_from_data_blocking(data, engine);
    assert(r.is_ok());

    Sidecar &sc = r.unwrap();
    assert(sc.blobs.size() == 2);
    assert(sc.commitments.size() == 2);
    assert(sc.proofs.size() == 2);
    assert(sc.commitments[0] != sc.commitments[1]);
    assert(engine.verify_sidecar(sc));

    // commitments are deterministic
    auto C0 = engine.blob_to_commitment(sc.blobs[0]);
    assert(C0.is_ok() && C0.unwrap() == sc.commitments[0]);

    // swapped commitment
    assert(!engine.verify_blob_proof(sc.blobs[0], sc.commitments[1], sc.proofs[0]).unwrap());

    // swapped proof
    assert(!engine.verify_blob_proof(sc.blobs[0], sc.commitments[0], sc.proofs[1]).unwrap());

    // tampered blob
    Blob tampered = sc.blobs[1];
    tampered[1000] ^= 0x01;
    assert(!engine.verify_blob_proof(tampered, sc.commitments[1], sc.proofs[1]).unwrap());

    // proofs do not line up with blobs
    Sidecar short_sc = sc;
    short_sc.proofs.pop_back();
    assert(!engine.verify_sidecar(short_sc));

    // an empty payload gives an empty sidecar
    auto empty = create_blob_sidecar_from_data_blocking(ByteSlice(), engine);
    assert(empty.is_ok());
    assert(empty.unwrap().blobs.empty());
    assert(engine.verify_sidecar(empty.unwrap()));
}

void test_small_blob(const KzgEngine &engine) {
    printf("TESTING SHORT & EMPTY BLOB PROOFS \n");

    std::vector<byte> one = {0xAB};
    auto blobs = create_blobs_from_data(one);
    assert(blobs.is_ok());

    // the all zero blob commits to the identity
    Blob zero(BYTES_PER_BLOB, 0);
    blobs.unwrap().push_back(zero);

    auto sc = engine.build_sidecar(blobs.take());
    assert(sc.is_ok());
    assert(engine.verify_sidecar(sc.unwrap()));
}

void test_non_canonical(const KzgEngine &engine) {
    printf("TESTING NON CANONICAL FIELD ELEMENT \n");

    // 0xff.. is above the modulus
    Blob bad(BYTES_PER_BLOB, 0);
    for (size_t i{}; i < 32; i++) bad[32 * 5 + i] = 0xFF;

    auto r = engine.build_sidecar({bad});
    assert(r.is_err());
    assert(r.unwrap_err().code == KZG_ERR);

    Blob wrong_size(100, 0);
    assert(engine.blob_to_commitment(wrong_size).is_err());

    // a malformed blob is an error, not a failed proof
    Blob zero(BYTES_PER_BLOB, 0);
    Bytes48 C = engine.blob_to_commitment(zero).take();
    Bytes48 Pi = engine.compute_blob_proof(zero, C).take();
    assert(engine.verify_blob_proof(zero, C, Pi).unwrap());

    auto v = engine.verify_blob_proof(bad, C, Pi);
    assert(v.is_err() && v.unwrap_err().code == KZG_ERR);

    v = engine.verify_blob_proof(wrong_size, C, Pi);
    assert(v.is_err() && v.unwrap_err().code == KZG_ERR);
}

void test_async_sidecar(const KzgEngine &engine) {
    printf("TESTING ASYNC SIDECAR \n");

    BlobPool pool;
    std::vector<byte> data = test_payload(70000, 32);

    auto blocking = create_blob_sidecar_from_data_blocking(data, engine);
    auto async = create_blob_sidecar_from_data_async(pool, data, engine).get();

    assert(blocking.is_ok() && async.is_ok());
    assert(async.unwrap().blobs == blocking.unwrap().blobs);
    assert(async.unwrap().commitments == blocking.unwrap().commitments);
    assert(async.unwrap().proofs == blocking.unwrap().proofs);

    // engine errors come back unchanged
    FailingEngine failing;
    auto failed = create_blob_sidecar_from_data_async(pool, data, failing).get();
    assert(failed.is_err());
    assert(failed.unwrap_err().code == KZG_ERR);
    assert(failed.unwrap_err().to_string() == "KZG error: engine offline");

    // default pool
    auto global = create_blob_sidecar_from_data_async(data, engine).get();
    assert(global.is_ok());
    assert(global.unwrap().commitments == blocking.unwrap().commitments);
}

void main_kzg() {
    test_fft();

    printf("BUILDING %zu POINT SETUP \n", FIELD_ELEMENTS_PER_BLOB);
    KzgEngine engine(num_scalar(69), "TAG");
    assert(engine.settings().setup.max_degree() == FIELD_ELEMENTS_PER_BLOB - 1);

    test_sidecar(engine);
    test_small_blob(engine);
    test_non_canonical(engine);
    test_async_sidecar(engine);

    printf("SUCCESSFUL KZG \n\n");
}

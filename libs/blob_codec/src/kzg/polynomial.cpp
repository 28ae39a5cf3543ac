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

#include "polynomial.h"
#include <stdexcept>

// ================== COMMIT POLYNOMIAL ==================
void commit_g1(
    blst_p1* C,
    const Polynomial& coeffs,
    const SRS& srs
) {
    size_t n = coeffs.size();
    if (n > srs.g1_powers_aff.size())
        throw std::invalid_argument("commit_g1: polynomial degree exceeds setup");

    if (n == 0) {
        *C = new_inf_p1();
        return;
    }

    std::vector<const blst_p1_affine*> point_ptrs(n);
    std::vector<const byte*> scalar_ptrs(n);
    for (size_t i{}; i < n; i++) {
        point_ptrs[i] = &srs.g1_powers_aff[i];
        scalar_ptrs[i] = coeffs[i].b;
    }

    size_t scratch_size = blst_p1s_mult_pippenger_scratch_sizeof(n);
    std::vector<limb_t> scratch_space(scratch_size / sizeof(limb_t) + 1);

    blst_p1s_mult_pippenger(C,
        point_ptrs.data(), n,
        scalar_ptrs.data(), 256,
        scratch_space.data());
}

blst_scalar eval_poly(const Polynomial &coeffs, const blst_scalar &z) {
    blst_scalar acc = ZERO_SK;
    for (size_t i = coeffs.size(); i-- > 0;) {
        blst_sk_mul_n_check(&acc, &acc, &z);
        blst_sk_add_n_check(&acc, &acc, &coeffs[i]);
    }
    return acc;
}

bool batch_inv(Scalar_vec &out, const Scalar_vec &in) {
    out.resize(in.size());

    blst_scalar accumulator = ONE_SK;
    for (size_t i{}; i < in.size(); i++) {
        out[i] = accumulator;
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }

    if (scalar_is_zero(accumulator)) return false;

    blst_sk_inverse(&accumulator, &accumulator);

    for (size_t i = in.size(); i-- > 0;) {
        blst_sk_mul_n_check(&out[i], &out[i], &accumulator);
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }

    return true;
}

std::optional<Polynomial> derive_quotient(
    const Scalar_vec &poly_eval,
    const blst_scalar &z,
    const blst_scalar &y,
    const NTTRoots &roots
) {
    size_t m = 0;
    size_t len = poly_eval.size();

    Scalar_vec inverses(len, ZERO_SK);
    Scalar_vec inverses_in(len);
    Polynomial q_poly(len, ZERO_SK);

    for (size_t i{}; i < len; i++) {
        if (equal_scalars(z, roots.roots[i])) {
            m = i + 1;
            inverses_in[i] = ONE_SK;
            continue;
        }

        // (p_i - y) / (w_i - z)
        blst_sk_sub_n_check(&q_poly[i], &poly_eval[i], &y);
        blst_sk_sub_n_check(&inverses_in[i], &roots.roots[i], &z);
    }

    if (!batch_inv(inverses, inverses_in)) return std::nullopt;

    for (size_t i{}; i < len; i++) {
        blst_sk_mul_n_check(&q_poly[i], &q_poly[i], &inverses[i]);
    }

    // z is the root w_m, q(w_m) = sum over i != m of
    // (p_i - y) * w_i / (z * (z - w_i))
    blst_scalar tmp;
    if (m != 0) {
        q_poly[--m] = ZERO_SK;
        for (size_t i{}; i < len; i++) {
            if (i == m) {
                inverses_in[i] = ONE_SK;
                continue;
            }

            blst_sk_sub_n_check(&tmp, &z, &roots.roots[i]);
            blst_sk_mul_n_check(&inverses_in[i], &tmp, &z);
        }

        if (!batch_inv(inverses, inverses_in)) return std::nullopt;

        for (size_t i{}; i < len; i++) {
            if (i == m) continue;

            blst_sk_sub_n_check(&tmp, &poly_eval[i], &y);
            blst_sk_mul_n_check(&tmp, &tmp, &roots.roots[i]);

            blst_sk_mul_n_check(&tmp, &tmp, &inverses[i]);
            blst_sk_add_n_check(&q_poly[m], &q_poly[m], &tmp);
        }
    }

    return q_poly;
}

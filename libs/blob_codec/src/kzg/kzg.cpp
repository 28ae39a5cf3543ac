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

#include "fft.h"
#include "kzg.h"
#include <utility>


std::optional<Proof> prove_kzg(
    const Scalar_vec &evals,
    const blst_scalar &z,
    const blst_scalar &y,
    const KZGSettings &s
) {
    auto q_opt = derive_quotient(evals, z, y, s.roots);
    if (!q_opt.has_value()) return std::nullopt;

    // Q -> coeff form
    Polynomial Q = std::move(q_opt.value());
    inverse_fft_in_place(Q, s.roots.inv_roots);

    // COMMIT TO Q
    Proof P;
    commit_g1(&P, Q, s.setup);
    return P;
}

bool verify_kzg(
    const Commitment &C,
    const blst_scalar &z,
    const blst_scalar &y,
    const Proof &Pi,
    const SRS &S
) {
    if (S.g2_powers_aff.size() < 2) return false;

    // tmp = - [y]_1
    blst_p1 tmp;
    blst_p1_mult(&tmp, blst_p1_generator(), y.b, 256);
    blst_p1_cneg(&tmp, true);

    // C_Y_PI_Z = C + tmp
    blst_p1 C_Y_PI_Z;
    blst_p1_add_or_double(&C_Y_PI_Z, &C, &tmp);

    // tmp = z * Pi
    blst_p1_mult(&tmp, &Pi, z.b, 256);

    // C_Y_PI_Z + tmp
    blst_p1_add_or_double(&C_Y_PI_Z, &C_Y_PI_Z, &tmp);

    // e(P, Q) == 1 iff P is the identity, for Q != 0
    bool lhs_inf = blst_p1_is_inf(&C_Y_PI_Z);
    bool rhs_inf = blst_p1_is_inf(&Pi);
    if (lhs_inf || rhs_inf) return lhs_inf && rhs_inf;

    blst_p1_affine C_aff, Pi_aff;
    blst_p1_to_affine(&C_aff, &C_Y_PI_Z);
    blst_p1_to_affine(&Pi_aff, &Pi);

    // e(C - [y]_1 + (z * Pi), g2) = e(Pi, [s]_2)
    blst_fp12 lhs, rhs;
    blst_miller_loop(&lhs, &S.g2_powers_aff[0], &C_aff);
    blst_miller_loop(&rhs, &S.g2_powers_aff[1], &Pi_aff);

    blst_final_exp(&lhs, &lhs);
    blst_final_exp(&rhs, &rhs);

    return blst_fp12_is_equal(&lhs, &rhs);
}

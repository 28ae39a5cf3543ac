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
#include "helpers.h"
#include "settings.h"
#include <optional>

using Polynomial = Scalar_vec;

// C = sum(coeffs[i] * [s^i]_1), via pippenger
void commit_g1(blst_p1* C, const Polynomial& coeffs, const SRS& srs);

// Horner evaluation of coefficient form
blst_scalar eval_poly(const Polynomial &coeffs, const blst_scalar &z);

bool batch_inv(Scalar_vec &out, const Scalar_vec &in);

// q(x) = (p(x) - y) / (x - z) in evaluation form.
// z may or may not be one of the roots.
std::optional<Polynomial> derive_quotient(
    const Scalar_vec &poly_eval,
    const blst_scalar &z,
    const blst_scalar &y,
    const NTTRoots &roots
);

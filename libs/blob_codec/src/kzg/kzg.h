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
#include "blst.h"
#include "settings.h"
#include "polynomial.h"
#include <optional>

using Commitment = blst_p1;
using Proof = blst_p1;

// Opening proof of the polynomial given by evals at z, y == f(z).
// Returns Pi = [q(s)]_1, q(x) = (f(x) - y) / (x - z).
std::optional<Proof> prove_kzg(
    const Scalar_vec &evals,
    const blst_scalar &z,
    const blst_scalar &y,
    const KZGSettings &s
);

// e(C - [y]_1 + z * Pi, [1]_2) == e(Pi, [s]_2)
bool verify_kzg(
    const Commitment &C,
    const blst_scalar &z,
    const blst_scalar &y,
    const Proof &Pi,
    const SRS &S
);

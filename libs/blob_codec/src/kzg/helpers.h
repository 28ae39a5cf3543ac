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
#include "hashing.h"
#include <array>
#include <cstdint>
#include <vector>

using Scalar_vec = std::vector<blst_scalar>;

blst_scalar num_scalar(const uint64_t v);

const blst_scalar ZERO_SK = num_scalar(0);
const blst_scalar ONE_SK = num_scalar(1);

bool scalar_is_zero(const blst_scalar &s);
bool equal_scalars(const blst_scalar &a, const blst_scalar &b);

// r = base^exp mod r, exp as 32 big-endian bytes
blst_scalar modular_pow(const blst_scalar &base, const byte exp[32]);
blst_scalar modular_pow(const blst_scalar &base, uint64_t exp);

blst_p1 new_inf_p1();
Bytes48 compress_p1(const blst_p1 &p);
bool p1_from_bytes(blst_p1* dst, const Bytes48 &buff);

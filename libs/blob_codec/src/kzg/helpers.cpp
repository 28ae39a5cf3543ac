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

#include <cstring>
#include "helpers.h"


blst_scalar num_scalar(const uint64_t v) {
    blst_scalar s;

    uint64_t limbs[4] = {0};
    limbs[0] = v;          // low 64 bits

    blst_scalar_from_uint64(&s, limbs);
    return s;
}

bool scalar_is_zero(const blst_scalar &s) {
    return equal_scalars(s, ZERO_SK);
}

bool equal_scalars(const blst_scalar &a, const blst_scalar &b) {
    return std::memcmp(a.b, b.b, 32) == 0;
}

// square & multiply, most significant bit first
blst_scalar modular_pow(const blst_scalar &base, const byte exp[32]) {
    blst_scalar result = num_scalar(1);

    for (size_t i{}; i < 32; i++) {
        for (int bit{7}; bit >= 0; bit--) {
            blst_sk_mul_n_check(&result, &result, &result);
            if ((exp[i] >> bit) & 1)
                blst_sk_mul_n_check(&result, &result, &base);
        }
    }
    return result;
}

blst_scalar modular_pow(const blst_scalar &base, uint64_t exp) {
    byte be[32] = {0};
    for (size_t i{}; i < 8; i++)
        be[31 - i] = static_cast<byte>(exp >> (8 * i));
    return modular_pow(base, be);
}

blst_p1 new_inf_p1() {
    blst_p1 p1;
    blst_p1_mult(&p1, blst_p1_generator(), ZERO_SK.b, 256);
    return p1;
}

Bytes48 compress_p1(const blst_p1 &p) {
    Bytes48 buff;
    blst_p1_compress(buff.data(), &p);
    return buff;
}

bool p1_from_bytes(blst_p1* dst, const Bytes48 &buff) {
    blst_p1_affine aff;
    if (blst_p1_uncompress(&aff, buff.data()) != BLST_SUCCESS) return false;
    if (!blst_p1_affine_is_inf(&aff) && !blst_p1_affine_in_g1(&aff)) return false;

    blst_p1_from_affine(dst, &aff);
    return true;
}

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

#include "settings.h"
#include "helpers.h"
#include <cassert>
#include <stdexcept>

// r - 1, big-endian
static const byte BLS_MODULUS_MINUS_ONE[32] = {
    0x73, 0xed, 0xa7, 0x53, 0x29, 0x9d, 0x7d, 0x48,
    0x33, 0x39, 0xd8, 0x08, 0x09, 0xa1, 0xd8, 0x05,
    0x53, 0xbd, 0xa4, 0x02, 0xff, 0xfe, 0x5b, 0xfe,
    0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x00,
};

// 2-adicity of r - 1
const size_t MAX_LOG2_ROOTS = 32;

// 7 generates Fr*
const uint64_t PRIMITIVE_ROOT = 7;

NTTRoots build_roots(size_t n) {
    size_t log2_n{};
    while ((size_t(1) << log2_n) < n) log2_n++;

    if (n == 0 || (size_t(1) << log2_n) != n || log2_n > MAX_LOG2_ROOTS)
        throw std::invalid_argument("roots of unity: n must be a power of two <= 2^32");

    // m = (r - 1) / n
    byte m[32];
    for (size_t i{}; i < 32; i++) {
        size_t byte_shift = log2_n / 8;
        size_t bit_shift = log2_n % 8;

        byte hi = i >= byte_shift ? BLS_MODULUS_MINUS_ONE[i - byte_shift] : 0;
        byte lo = i >= byte_shift + 1 ? BLS_MODULUS_MINUS_ONE[i - byte_shift - 1] : 0;
        m[i] = bit_shift == 0
            ? hi
            : static_cast<byte>((hi >> bit_shift) | (lo << (8 - bit_shift)));
    }

    // w = g^m
    blst_scalar w = modular_pow(num_scalar(PRIMITIVE_ROOT), m);

    std::vector<blst_scalar> roots(n);
    std::vector<blst_scalar> inv_roots(n);

    roots[0] = num_scalar(1);
    inv_roots[0] = num_scalar(1);

    for (size_t i{1}; i < n; i++) {
        blst_sk_mul_n_check(&roots[i], &roots[i - 1], &w);
        blst_sk_inverse(&inv_roots[i], &roots[i]);
    }

    // SANITY CHECKS
    // w^n == 1
    assert(equal_scalars(modular_pow(w, n), ONE_SK));

    // w^(n/2) != 1
    assert(n == 1 || !equal_scalars(modular_pow(w, n / 2), ONE_SK));

    return {roots, inv_roots};
}

// =======================================
// ============= SRS =====================
// =======================================

size_t SRS::max_degree() const { return g1_powers_jacob.size() - 1; }

SRS::SRS(size_t degree, const blst_scalar &s) {
    g1_powers_jacob.resize(degree + 1);
    g1_powers_aff.resize(degree + 1);

    g2_powers_jacob.resize(2);
    g2_powers_aff.resize(2);

    g = *blst_p1_generator();
    h = *blst_p2_generator();

    // s(0) = 1
    blst_scalar pow_s = num_scalar(1);

    for (size_t i{}; i <= degree; i++) {
        blst_p1_mult(&g1_powers_jacob[i], &g, pow_s.b, 256);
        blst_sk_mul_n_check(&pow_s, &pow_s, &s);
    }

    // [1]_2, [s]_2
    g2_powers_jacob[0] = h;
    blst_p2_mult(&g2_powers_jacob[1], &h, s.b, 256);

    // Convert all to affine in a separate loop
    for (size_t i{}; i <= degree; i++)
        blst_p1_to_affine(&g1_powers_aff[i], &g1_powers_jacob[i]);
    for (size_t i{}; i < g2_powers_jacob.size(); i++)
        blst_p2_to_affine(&g2_powers_aff[i], &g2_powers_jacob[i]);
}

KZGSettings init_settings(size_t n, const blst_scalar &s, std::string tag) {
    NTTRoots roots = build_roots(n);
    SRS setup(n - 1, s);
    return {roots, setup, tag};
}

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
#include <vector>

// evaluation form <-> coefficient form over the roots of unity.
// a.size() must equal roots.size().
void fft_in_place(
    std::vector<blst_scalar> &a,
    const std::vector<blst_scalar> &roots
);

void inverse_fft_in_place(
    std::vector<blst_scalar> &a,
    const std::vector<blst_scalar> &inv_roots
);

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

#include <cstdio>
#include <string>
#include "tests.h"

int main(int argc, char* argv[]) {
    printf("\noptions == {encode, decode, split, pool, kzg, bindings}\n\n");
    printf("=====================================\n");

    if (argc > 1) {
        std::string a = argv[1];
        if (a == "encode") {
            main_encode();

        } else if (a == "decode") {
            main_decode();

        } else if (a == "split") {
            main_split();

        } else if (a == "pool") {
            main_pool();

        } else if (a == "kzg") {
            main_kzg();

        } else if (a == "bindings") {
            main_bindings();

        } else {
            printf("unknown suite: %s\n", a.c_str());
            return 1;
        }
        return 0;
    }

    main_encode();
    main_decode();
    main_split();
    main_pool();
    main_kzg();
    main_bindings();

    return 0;
}

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

#include <algorithm>
#include <cassert>
#include <cstdio>
#include "decode.h"
#include "encode.h"
#include "splitter.h"
#include "tests.h"

void test_chunking() {
    printf("TESTING CHUNK BOUNDARIES\n");

    assert(blob_count(0) == 0);
    assert(blob_count(1) == 1);
    assert(blob_count(MAX_BLOB_DATA_SIZE) == 1);
    assert(blob_count(MAX_BLOB_DATA_SIZE + 1) == 2);
    assert(blob_count(3 * MAX_BLOB_DATA_SIZE) == 3);

    assert(split_chunks(ByteSlice()).empty());

    std::vector<byte> data = test_payload(MAX_BLOB_DATA_SIZE + 1, 5);
    auto chunks = split_chunks(data);
    assert(chunks.size() == 2);
    assert(chunks[0].size() == MAX_BLOB_DATA_SIZE);
    assert(chunks[1].size() == 1);
    assert(chunks[0].data() == data.data());
    assert(chunks[1][0] == data.back());
}

void test_three_full_chunks() {
    printf("TESTING 3 * MAX_BLOB_DATA_SIZE SPLIT\n");

    std::vector<byte> data = test_payload(3 * MAX_BLOB_DATA_SIZE, 6);

    auto chunks = split_chunks(data);
    assert(chunks.size() == 3);
    for (const ByteSlice &c : chunks) assert(c.size() == MAX_BLOB_DATA_SIZE);

    auto blobs = create_blobs_from_data(data);
    assert(blobs.is_ok());
    assert(blobs.unwrap().size() == 3);

    // blob i is chunk i
    for (size_t i{}; i < 3; i++) {
        auto single = create_blob_from_data(chunks[i]);
        assert(single.unwrap() == blobs.unwrap()[i]);

        auto back = decode_blob(blobs.unwrap()[i]);
        assert(back.is_ok());
        assert(std::equal(back.unwrap().begin(), back.unwrap().end(), chunks[i].begin()));
    }
}

void test_empty_payload() {
    printf("TESTING EMPTY PAYLOAD\n");

    auto blobs = create_blobs_from_data(ByteSlice());
    assert(blobs.is_ok());
    assert(blobs.unwrap().empty());
}

void main_split() {
    test_chunking();
    test_three_full_chunks();
    test_empty_payload();

    printf("SUCCESSFUL SPLIT \n\n");
}

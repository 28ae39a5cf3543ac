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
#include "constants.h"
#include "hashing.h"
#include <array>

using Carrier = std::array<byte, CARRIER_SIZE>;

// Sequential writer over one blob. Every field element is written as
// one header byte followed by one 31-byte carrier, so header writes must
// land on offset % 32 == 0 and carrier writes on offset % 32 == 1.
// A misplaced write is a packer bug and throws std::logic_error.
class BlobWriter {
public:
    explicit BlobWriter(Blob &out);

    void write_header_byte(byte v);
    void write_carrier(const Carrier &buf);

    size_t offset() const { return offset_; }

private:
    Blob &out_;
    size_t offset_;
};

// Sequential reader over the payload being packed.
// Reads past the end of the input yield zeros.
class DataReader {
public:
    explicit DataReader(ByteSlice data) : data_(data), offset_(0) {}

    byte read_byte();
    Carrier read_carrier();

    // fills buf[start..] from the input, returns the bytes copied
    size_t read_into(Carrier &buf, size_t start);

    bool exhausted() const { return offset_ >= data_.size(); }
    size_t offset() const { return offset_; }

private:
    ByteSlice data_;
    size_t offset_;
};

// Sequential reader over one packed blob, the mirror of BlobWriter.
class BlobReader {
public:
    explicit BlobReader(const Blob &in) : in_(in), offset_(0) {}

    byte read_header_byte();
    const byte* read_carrier();

    size_t offset() const { return offset_; }

private:
    const Blob &in_;
    size_t offset_;
};

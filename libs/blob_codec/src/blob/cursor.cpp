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

#include "cursor.h"
#include <algorithm>
#include <stdexcept>
#include <string>

// =======================================
// ============= BLOB WRITER =============
// =======================================

BlobWriter::BlobWriter(Blob &out) : out_(out), offset_(0) {
    if (out_.size() != BYTES_PER_BLOB)
        throw std::logic_error(
            "blob encoding: output buffer is " + std::to_string(out_.size()) + " bytes");
}

void BlobWriter::write_header_byte(byte v) {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 0)
        throw std::logic_error(
            "blob encoding: invalid byte write offset: " + std::to_string(offset_));

    if ((v & HIGH_BITS_MASK) != 0)
        throw std::logic_error(
            "blob encoding: invalid 6-bit value: " + std::to_string(v));

    out_[offset_] = v;
    offset_ += 1;
}

void BlobWriter::write_carrier(const Carrier &buf) {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 1)
        throw std::logic_error(
            "blob encoding: invalid bytes31 write offset: " + std::to_string(offset_));

    std::copy(buf.begin(), buf.end(), out_.begin() + offset_);
    offset_ += CARRIER_SIZE;
}

// =======================================
// ============= DATA READER =============
// =======================================

byte DataReader::read_byte() {
    if (offset_ >= data_.size()) return 0;
    return data_[offset_++];
}

size_t DataReader::read_into(Carrier &buf, size_t start) {
    if (offset_ >= data_.size() || start >= buf.size()) return 0;

    size_t n = std::min(buf.size() - start, data_.size() - offset_);
    std::copy_n(data_.begin() + offset_, n, buf.begin() + start);
    offset_ += n;
    return n;
}

Carrier DataReader::read_carrier() {
    Carrier buf{};
    read_into(buf, 0);
    return buf;
}

// =======================================
// ============= BLOB READER =============
// =======================================

byte BlobReader::read_header_byte() {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 0)
        throw std::logic_error(
            "blob decoding: invalid byte read offset: " + std::to_string(offset_));

    return in_[offset_++];
}

const byte* BlobReader::read_carrier() {
    if (offset_ % BYTES_PER_FIELD_ELEMENT != 1)
        throw std::logic_error(
            "blob decoding: invalid bytes31 read offset: " + std::to_string(offset_));

    const byte* p = in_.data() + offset_;
    offset_ += CARRIER_SIZE;
    return p;
}

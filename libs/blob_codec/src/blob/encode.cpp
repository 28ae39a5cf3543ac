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

#include "encode.h"
#include "cursor.h"

static Carrier header_carrier(DataReader &reader, size_t len) {
    Carrier buf{};
    uint32_t ilen = static_cast<uint32_t>(len);

    buf[0] = ENCODING_VERSION;
    buf[1] = static_cast<byte>((ilen >> 16) & 0xFF);
    buf[2] = static_cast<byte>((ilen >> 8) & 0xFF);
    buf[3] = static_cast<byte>(ilen & 0xFF);

    reader.read_into(buf, BLOB_HEADER_SIZE);
    return buf;
}

Result<Blob, BlobError> create_blob_from_data(ByteSlice data) {
    if (data.size() > MAX_BLOB_DATA_SIZE)
        return input_too_large(data.size());

    Blob out(BYTES_PER_BLOB, 0);
    BlobWriter writer(out);
    DataReader reader(data);

    for (size_t round{}; round < ROUNDS; round++) {
        if (reader.exhausted()) break;

        // first field element
        Carrier buf = round == 0
            ? header_carrier(reader, data.size())
            : reader.read_carrier();
        byte x = reader.read_byte();
        writer.write_header_byte(x & SIX_BIT_MASK);
        writer.write_carrier(buf);

        // second: low nibble of y, top bits of x
        buf = reader.read_carrier();
        byte y = reader.read_byte();
        writer.write_header_byte((y & 0b0000'1111) | ((x & HIGH_BITS_MASK) >> 2));
        writer.write_carrier(buf);

        // third
        buf = reader.read_carrier();
        byte z = reader.read_byte();
        writer.write_header_byte(z & SIX_BIT_MASK);
        writer.write_carrier(buf);

        // fourth: top bits of z, high nibble of y
        buf = reader.read_carrier();
        writer.write_header_byte(((z & HIGH_BITS_MASK) >> 2) | ((y & 0b1111'0000) >> 4));
        writer.write_carrier(buf);
    }

    if (!reader.exhausted())
        return data_did_not_fit(reader.offset(), data.size());

    return out;
}

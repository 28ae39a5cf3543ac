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

#include "sidecar.h"
#include "splitter.h"

Result<Sidecar, BlobError> create_blob_sidecar_from_data_blocking(
    ByteSlice data,
    const CommitmentEngine &engine
) {
    auto blobs = create_blobs_from_data(data);
    if (blobs.is_err()) return blobs.unwrap_err();

    return engine.build_sidecar(blobs.take());
}

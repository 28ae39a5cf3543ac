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
#include "blob_pool.h"
#include "sidecar.h"
#include <future>
#include <vector>

// The data is moved into the job. engine must outlive the returned future.
std::future<Result<Sidecar, BlobError>> create_blob_sidecar_from_data_async(
    BlobPool &pool,
    std::vector<byte> data,
    const CommitmentEngine &engine
);

// same, on global_blob_pool()
std::future<Result<Sidecar, BlobError>> create_blob_sidecar_from_data_async(
    std::vector<byte> data,
    const CommitmentEngine &engine
);

std::future<Result<std::vector<Blob>, BlobError>> create_blobs_from_data_async(
    BlobPool &pool,
    std::vector<byte> data
);

/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <vector>

namespace s3up {

// A contiguous byte range of the source file, uploaded as one part.
// Part numbers are 1-based, as S3 wants them.
struct part_descriptor {
    unsigned number;
    uint64_t offset;
    uint64_t length;

    uint64_t end() const noexcept { return offset + length; }
    bool operator==(const part_descriptor&) const = default;
};

unsigned count_parts(uint64_t file_size, uint64_t chunk_size);

// Splits [0, file_size) into chunk_size long parts, the last one possibly
// shorter. Pure, the same input always gives the same plan.
std::vector<part_descriptor> plan_parts(uint64_t file_size, uint64_t chunk_size);

} // namespace s3up

/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/chunk_planner.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace s3up {

unsigned count_parts(uint64_t file_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Part size must be positive");
    }
    auto parts = file_size / chunk_size + (file_size % chunk_size != 0);
    if (parts > std::numeric_limits<unsigned>::max()) {
        throw std::invalid_argument(fmt::format("{} bytes in parts of {} bytes is too many parts", file_size, chunk_size));
    }
    return static_cast<unsigned>(parts);
}

std::vector<part_descriptor> plan_parts(uint64_t file_size, uint64_t chunk_size) {
    std::vector<part_descriptor> parts;
    parts.reserve(count_parts(file_size, chunk_size));

    unsigned number = 1;
    for (uint64_t offset = 0; offset < file_size; ++number) {
        auto length = std::min(chunk_size, file_size - offset);
        parts.push_back(part_descriptor{.number = number, .offset = offset, .length = length});
        offset += length;
    }
    return parts;
}

} // namespace s3up

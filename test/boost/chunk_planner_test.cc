/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE chunk_planner

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>
#include <fmt/format.h>

#include "s3up/chunk_planner.hh"

using s3up::part_descriptor;

namespace {

// The parts cover [0, size) exactly: contiguous, in order, numbered from 1,
// all of chunk bytes except the last one
void check_partition(uint64_t size, uint64_t chunk) {
    auto parts = s3up::plan_parts(size, chunk);
    BOOST_TEST_INFO(fmt::format("size={} chunk={}", size, chunk));
    BOOST_REQUIRE_EQUAL(parts.size(), s3up::count_parts(size, chunk));

    uint64_t expected_offset = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& p = parts[i];
        BOOST_REQUIRE_EQUAL(p.number, i + 1);
        BOOST_REQUIRE_EQUAL(p.offset, expected_offset);
        BOOST_REQUIRE_GT(p.length, 0);
        if (i + 1 < parts.size()) {
            BOOST_REQUIRE_EQUAL(p.length, chunk);
        } else {
            BOOST_REQUIRE_LE(p.length, chunk);
        }
        expected_offset = p.end();
    }
    BOOST_REQUIRE_EQUAL(expected_offset, size);
}

}

BOOST_AUTO_TEST_CASE(test_partition_edge_sizes) {
    const uint64_t chunk = 10'000'000;
    for (uint64_t size : {uint64_t(1), chunk - 1, chunk, chunk + 1, 2 * chunk - 1, 2 * chunk, 2 * chunk + 1, 12'000'000ul}) {
        check_partition(size, chunk);
    }
    check_partition(1, 1);
    check_partition(1000, 1);
    check_partition(5ul << 30, 10'240'000);
}

BOOST_AUTO_TEST_CASE(test_part_counts) {
    BOOST_REQUIRE_EQUAL(s3up::count_parts(0, 10), 0);
    BOOST_REQUIRE_EQUAL(s3up::count_parts(1, 10), 1);
    BOOST_REQUIRE_EQUAL(s3up::count_parts(10, 10), 1);
    BOOST_REQUIRE_EQUAL(s3up::count_parts(11, 10), 2);
    BOOST_REQUIRE_EQUAL(s3up::count_parts(20, 10), 2);
    BOOST_REQUIRE_EQUAL(s3up::count_parts(21, 10), 3);
}

BOOST_AUTO_TEST_CASE(test_empty_file_has_no_parts) {
    BOOST_REQUIRE(s3up::plan_parts(0, 10'000'000).empty());
}

BOOST_AUTO_TEST_CASE(test_zero_chunk_size) {
    BOOST_REQUIRE_THROW(s3up::plan_parts(100, 0), std::invalid_argument);
    BOOST_REQUIRE_THROW(s3up::count_parts(100, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_too_many_parts) {
    BOOST_REQUIRE_THROW(s3up::count_parts(std::numeric_limits<uint64_t>::max(), 1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_plan_is_deterministic) {
    auto a = s3up::plan_parts(123'456'789, 10'240'000);
    auto b = s3up::plan_parts(123'456'789, 10'240'000);
    BOOST_REQUIRE(a == b);
}

BOOST_AUTO_TEST_CASE(test_two_part_file) {
    auto parts = s3up::plan_parts(12'000'000, 10'000'000);
    std::vector<part_descriptor> expected{
        {.number = 1, .offset = 0, .length = 10'000'000},
        {.number = 2, .offset = 10'000'000, .length = 2'000'000},
    };
    BOOST_REQUIRE(parts == expected);
}

/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/object_key.hh"

#include <random>
#include <string>

#include <seastar/core/format.hh>

namespace s3up {

static constexpr std::string_view key_alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
static constexpr size_t key_segment_length = 4;

static std::string random_segment(std::random_device& rd) {
    std::uniform_int_distribution<size_t> pick(0, key_alphabet.size() - 1);
    std::string seg;
    seg.reserve(key_segment_length);
    for (size_t i = 0; i < key_segment_length; ++i) {
        seg.push_back(key_alphabet[pick(rd)]);
    }
    return seg;
}

seastar::sstring generate_object_key(std::string_view extension) {
    std::random_device rd;
    auto a = random_segment(rd);
    auto b = random_segment(rd);
    auto c = random_segment(rd);
    return seastar::format("{}/{}/{}.{}", a, b, c, extension);
}

} // namespace s3up

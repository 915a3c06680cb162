/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string_view>

#include <seastar/core/sstring.hh>

namespace s3up {

// Random key of the form "xxxx/xxxx/xxxx.<extension>", drawn from
// [0-9A-Za-z]. Spreads objects over many prefixes.
seastar::sstring generate_object_key(std::string_view extension);

} // namespace s3up

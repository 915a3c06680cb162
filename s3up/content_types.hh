/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string_view>

namespace s3up {

struct extension_info {
    // Without the leading dot, as spelled in the table (lower case)
    std::string_view extension;
    std::string_view content_type;
};

// Looks the file name up in the compiled-in extension table. The longest
// matching extension wins ("archive.tar.gz" is "tar.gz", not "gz"); case is
// ignored.
std::optional<extension_info> content_type_for(std::string_view file_name);

} // namespace s3up

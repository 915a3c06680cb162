/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/errors.hh"

namespace s3up {

part_upload_error::part_upload_error(unsigned part_number, const std::string& msg)
    : upload_error(msg)
    , _part_number(part_number)
{}

// Calls visit() on every exception of the chain, outermost first, until it
// returns true. An exception not derived from std::exception is passed as
// nullptr and ends the chain.
template <typename Visitor>
static bool walk_nested(std::exception_ptr ex, Visitor visit) {
    while (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            if (visit(&e)) {
                return true;
            }
            ex = nullptr;
            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                ex = std::current_exception();
            }
        } catch (...) {
            return visit(nullptr);
        }
    }
    return false;
}

int exit_code_for(std::exception_ptr ex) {
    auto invalid_input = walk_nested(std::move(ex), [] (const std::exception* e) {
        return dynamic_cast<const validation_error*>(e) || dynamic_cast<const config_error*>(e);
    });
    return invalid_input ? exit_invalid_input : exit_failure;
}

std::string describe_exception_chain(std::exception_ptr ex) {
    std::string ret;
    walk_nested(std::move(ex), [&ret] (const std::exception* e) {
        if (!ret.empty()) {
            ret += ": ";
        }
        ret += e ? e->what() : "unknown exception";
        return false;
    });
    return ret;
}

} // namespace s3up

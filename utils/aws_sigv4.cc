/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/aws_sigv4.hh"

#include <array>
#include <ctime>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>
#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

namespace utils::aws {

using sha256_digest = std::array<unsigned char, 32>;

static std::string to_hex(const sha256_digest& d) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(d.size() * 2);
    for (auto c : d) {
        ret.push_back(digits[c >> 4]);
        ret.push_back(digits[c & 0xf]);
    }
    return ret;
}

static sha256_digest hmac_sha256(std::string_view key, std::string_view msg) {
    sha256_digest digest;
    int ret = gnutls_hmac_fast(GNUTLS_MAC_SHA256, key.data(), key.size(), msg.data(), msg.size(), digest.data());
    if (ret != GNUTLS_E_SUCCESS) {
        throw std::runtime_error(fmt::format("HMAC-SHA256 failed: {}", gnutls_strerror(ret)));
    }
    return digest;
}

static std::string_view as_key(const sha256_digest& d) {
    return std::string_view(reinterpret_cast<const char*>(d.data()), d.size());
}

std::string sha256_hex(std::string_view data) {
    sha256_digest digest;
    int ret = gnutls_hash_fast(GNUTLS_DIG_SHA256, data.data(), data.size(), digest.data());
    if (ret != GNUTLS_E_SUCCESS) {
        throw std::runtime_error(fmt::format("SHA256 failed: {}", gnutls_strerror(ret)));
    }
    return to_hex(digest);
}

std::string format_time_point(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    ::gmtime_r(&t, &tm);
    char buf[32];
    auto len = std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return std::string(buf, len);
}

std::string uri_encode(std::string_view s, bool encode_slash) {
    std::string ret;
    ret.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            ret.push_back(c);
        } else {
            fmt::format_to(std::back_inserter(ret), "%{:02X}", c);
        }
    }
    return ret;
}

std::string get_signature(std::string_view secret_access_key,
                          std::string_view amz_date,
                          std::string_view canonical_uri,
                          std::string_view method,
                          std::string_view signed_headers_list,
                          const std::map<std::string_view, std::string_view>& signed_headers,
                          std::string_view payload_hash,
                          std::string_view region,
                          std::string_view service,
                          std::string_view query_string) {
    if (amz_date.size() < 8) {
        throw std::invalid_argument(fmt::format("Malformed request date {}", amz_date));
    }
    auto datestamp = amz_date.substr(0, 8);

    fmt::memory_buffer canonical_request;
    auto out = fmt::appender(canonical_request);
    fmt::format_to(out, "{}\n{}\n{}\n", method, canonical_uri, query_string);
    for (const auto& [name, value] : signed_headers) {
        fmt::format_to(out, "{}:{}\n", name, value);
    }
    fmt::format_to(out, "\n{}\n{}", signed_headers_list, payload_hash);

    auto credential_scope = fmt::format("{}/{}/{}/aws4_request", datestamp, region, service);
    auto string_to_sign = fmt::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", amz_date, credential_scope,
            sha256_hex(std::string_view(canonical_request.data(), canonical_request.size())));

    auto k_date = hmac_sha256(fmt::format("AWS4{}", secret_access_key), datestamp);
    auto k_region = hmac_sha256(as_key(k_date), region);
    auto k_service = hmac_sha256(as_key(k_region), service);
    auto k_signing = hmac_sha256(as_key(k_service), "aws4_request");
    return to_hex(hmac_sha256(as_key(k_signing), string_to_sign));
}

} // namespace utils::aws

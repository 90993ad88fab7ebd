// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace spool::core {

enum class CacheErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    invalid_url,
    invalid_range,
    range_mismatch,
    storage_write_error,
    storage_read_error,
    cache_corruption,
    cancelled,
    record_cleared,
    ssl_error,
    dns_error,
    too_many_redirects,
};

namespace detail {

struct CacheErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "spool::cache";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<CacheErrc>(ev)) {
            case CacheErrc::success:             return "Success";
            case CacheErrc::network_error:       return "Network error";
            case CacheErrc::timeout:             return "Operation timed out";
            case CacheErrc::not_found:           return "Resource not found (404)";
            case CacheErrc::server_error:        return "Server error (5xx)";
            case CacheErrc::invalid_url:         return "Invalid URL";
            case CacheErrc::invalid_range:       return "Invalid byte range";
            case CacheErrc::range_mismatch:      return "Response length disagrees with cached content length";
            case CacheErrc::storage_write_error: return "Cache storage write failed";
            case CacheErrc::storage_read_error:  return "Cache storage read failed";
            case CacheErrc::cache_corruption:    return "Cached metadata is corrupt";
            case CacheErrc::cancelled:           return "Request cancelled";
            case CacheErrc::record_cleared:      return "Cache record was cleared";
            case CacheErrc::ssl_error:           return "SSL/TLS error";
            case CacheErrc::dns_error:           return "DNS resolution failed";
            case CacheErrc::too_many_redirects:  return "Too many redirects";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::CacheErrcCategory& cache_errc_category() noexcept {
    static detail::CacheErrcCategory category;
    return category;
}

inline std::error_code make_error_code(CacheErrc e) noexcept {
    return {static_cast<int>(e), cache_errc_category()};
}

} // namespace spool::core

namespace std {

template<>
struct is_error_code_enum<spool::core::CacheErrc> : true_type {};

} // namespace std

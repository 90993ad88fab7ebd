// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::core {

// What the origin said about the body it is about to stream
struct OriginResponse {
    std::int32_t status{0};                      // 200 or 206
    std::optional<std::uint64_t> total_length;   // Content-Range total on 206, Content-Length on 200
    std::optional<std::uint64_t> body_length;    // Bytes this response will carry, if announced
    std::uint64_t range_start{0};                // Resource offset of the first body byte
    std::optional<std::string> content_type;
    bool accepts_ranges{false};                  // Accept-Ranges: bytes, or a 206 reply
};

// Receiver of one streaming origin response. Called on the fetching thread.
class FetchHandlers {
public:
    virtual ~FetchHandlers() = default;

    // Before the first body byte (or at the end, for an empty body).
    // A non-zero result aborts the transfer and becomes fetch()'s result.
    [[nodiscard]] virtual std::error_code on_response(const OriginResponse& response) = 0;

    // Each body increment in order; false aborts the transfer
    [[nodiscard]] virtual bool on_data(std::span<const std::byte> data) = 0;

    // Polled while waiting on the network; true aborts the transfer
    [[nodiscard]] virtual bool should_stop() const = 0;
};

// Byte-range capable origin transport
class OriginClient {
public:
    virtual ~OriginClient() = default;

    // GET url with "Range: bytes=start-end" (end inclusive; open when nullopt).
    // Returns {} after the whole body was delivered, CacheErrc::cancelled if a
    // handler aborted, otherwise the transport or HTTP failure.
    [[nodiscard]] virtual std::error_code
    fetch(std::string_view url, std::uint64_t start, std::optional<std::uint64_t> end_inclusive,
          FetchHandlers& handlers) noexcept = 0;
};

} // namespace spool::core

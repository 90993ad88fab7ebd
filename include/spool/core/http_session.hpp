// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <spool/core/origin_client.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace spool::core {

// Parsed "Content-Range: bytes start-end/total" header
struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};                  // Inclusive
    std::optional<std::uint64_t> total;    // nullopt for "/*"

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

// nullopt unless the value is a satisfied byte range
[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// libcurl origin client; one easy handle per fetch, so fetches on
// different threads never share state
class HttpSession final : public OriginClient {
public:
    explicit HttpSession(std::string user_agent = DEFAULT_USER_AGENT);

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::error_code
    fetch(std::string_view url, std::uint64_t start, std::optional<std::uint64_t> end_inclusive,
          FetchHandlers& handlers) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string user_agent_;
};

} // namespace spool::core

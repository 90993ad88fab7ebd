// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace spool::core {

// Human-readable byte count ("1.5 MB", "512 KB", "37 B")
[[nodiscard]] std::string format_bytes(std::uint64_t bytes) noexcept;

// Human-readable transfer rate ("2.3 MB/s")
[[nodiscard]] std::string format_speed(std::uint64_t bps) noexcept;

} // namespace spool::core

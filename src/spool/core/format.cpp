// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/format.hpp>
#include <iomanip>
#include <sstream>

namespace spool::core {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

std::string format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    try {
        if (bytes >= TB) {
            return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
        } else if (bytes >= GB) {
            return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
        } else if (bytes >= MB) {
            return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
        } else if (bytes >= KB) {
            return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
        }
        return std::to_string(bytes) + " B";
    } catch (const std::exception&) {
        return {};
    }
}

std::string format_speed(std::uint64_t bps) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;

    try {
        if (bps >= MB) {
            return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
        } else if (bps >= KB) {
            return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
        }
        return std::to_string(bps) + " B/s";
    } catch (const std::exception&) {
        return {};
    }
}

} // namespace spool::core

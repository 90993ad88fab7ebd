// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spool::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command { none, get, status, clear, info };

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> urls;
    std::string output_file;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length;
    core::CacheConfig config;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Fetch a byte range through the cache into a file
[[nodiscard]] CliResult get(const std::string& url, const CliArgs& args) noexcept;

// Show cached ranges and completeness
[[nodiscard]] CliResult status(const std::vector<std::string>& urls, const CliArgs& args) noexcept;

// Drop one resource, or the whole cache when urls is empty
[[nodiscard]] CliResult clear(const std::vector<std::string>& urls, const CliArgs& args) noexcept;

// Content length, type and range support (cache first)
[[nodiscard]] CliResult info(const std::string& url, const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace spool::cli

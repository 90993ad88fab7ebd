// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace spool::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Update progress
    void update(std::uint64_t current, std::uint64_t speed_bps = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    [[nodiscard]] std::string render_bar(double percent) const;
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
};

// Spinner for transfers of unknown length
class Spinner {
public:
    explicit Spinner(std::string_view label = {}) noexcept;

    void update(std::uint64_t current) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::string label_;
    std::size_t frame_{0};
};

} // namespace spool::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/progress_bar.hpp>
#include <spool/core/format.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace spool::cli {

using core::format_bytes;
using core::format_speed;

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::string_view label) noexcept
    : label_(label) {}

void Spinner::update(std::uint64_t current) noexcept {
    std::cerr << "\r" << SPINNER_FRAMES[frame_ % 4] << " ";
    if (!label_.empty()) {
        std::cerr << label_ << ": ";
    }
    std::cerr << format_bytes(current) << "          " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cerr << "\r done" << std::string(30, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cerr << "\r" << std::string(50, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;
    current_ = std::min(current, total_);

    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw every 1%
    int scaled = static_cast<int>(percent);
    if (scaled <= last_percent_ && !finished_) return;
    last_percent_ = scaled;

    try {
        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            line += ": ";
        }

        line += render_bar(percent);

        line += " ";
        if (scaled < 100) line += " ";
        if (scaled < 10) line += " ";
        line += std::to_string(scaled) + "%";

        line += " (";
        line += format_bytes(current_);
        line += "/";
        line += format_bytes(total_);
        line += ")";

        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);

            std::uint64_t remaining = total_ - current_;
            if (remaining > 0) {
                line += " ETA: ";
                line += format_time(remaining / speed_bps);
            }
        }

        // Clear rest of line
        line += std::string(10, ' ');

        std::cerr << line << std::flush;
    } catch (const std::exception&) {
        // Progress output is best effort
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    std::cerr << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cerr << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(std::max(empty, 0)), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace spool::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scribe::cli {

namespace {

constexpr std::string_view FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::string_view text) noexcept {
    const auto frame = FRAMES[frame_ % std::size(FRAMES)];
    ++frame_;

    std::string line = "\r";
    line += frame;
    line += ' ';
    line += text;
    const auto width = line.size();
    if (width < last_width_) {
        line += std::string(last_width_ - width, ' ');
    }
    last_width_ = width;
    std::cout << line << std::flush;
}

void Spinner::finish(std::string_view text) noexcept {
    clear();
    std::cout << text << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << '\r' << std::string(last_width_ + 1, ' ') << '\r' << std::flush;
    last_width_ = 0;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;

    current = std::min(current, total_);
    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on a whole-percent change
    const int pct_int = static_cast<int>(percent);
    if (pct_int == last_percent_ && !finished_) return;
    last_percent_ = pct_int;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    if (pct_int < 100) line += ' ';
    if (pct_int < 10) line += ' ';
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += format_bytes(current);
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        const std::uint64_t remaining = total_ - current;
        if (remaining > 0) {
            line += " ETA: ";
            line += format_time(remaining / speed_bps);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');

    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace scribe::cli

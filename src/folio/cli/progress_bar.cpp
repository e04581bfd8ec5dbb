// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace folio::cli {

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::label(std::string_view l) noexcept {
    label_ = l;
    current_ = 0;
    last_percent_ = -1;
    drawn_ = false;
}

void ProgressBar::update(std::uint64_t current, std::optional<std::uint64_t> total,
                         bool estimated) noexcept {
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += " ";
    }

    if (total && *total > 0) {
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(*total);
        percent = std::clamp(percent, 0.0, 100.0);

        // Only redraw if significant progress (every 1%)
        int scaled = static_cast<int>(percent);
        if (scaled == last_percent_ && drawn_) return;
        last_percent_ = scaled;

        line += render_bar(percent);
        line += " ";
        if (scaled < 10) line += " ";
        if (scaled < 100) line += " ";
        line += std::to_string(scaled) + "%";

        line += " (";
        line += format_bytes(current);
        line += "/";
        if (estimated) line += "~";
        line += format_bytes(*total);
        line += ")";
    } else {
        // Raw counter: redraw every 64 KB at most
        if (drawn_ && current - current_ < 64 * 1024) return;
        line += format_bytes(current);
        line += " received";
    }
    current_ = current;

    // Clear whatever the previous line left behind
    std::size_t width = line.size();
    if (width < last_width_) {
        line += std::string(last_width_ - width, ' ');
    }
    last_width_ = width;
    drawn_ = true;

    std::cout << line << std::flush;
}

void ProgressBar::finish(std::string_view status) noexcept {
    clear();
    std::cout << label_;
    if (!status.empty()) {
        std::cout << " " << status;
    }
    std::cout << std::endl;
    drawn_ = false;
    last_percent_ = -1;
}

void ProgressBar::clear() noexcept {
    if (last_width_ > 0) {
        std::cout << "\r" << std::string(last_width_, ' ') << "\r" << std::flush;
    }
    last_width_ = 0;
}

std::string ProgressBar::render_bar(double percent) const noexcept {
    const int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    for (int i = 0; i < filled; ++i) {
        bar += '=';
    }
    bar += '>';
    for (int i = 0; i < empty; ++i) {
        bar += ' ';
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

std::string ProgressBar::format_time(std::uint64_t seconds) noexcept {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace folio::cli

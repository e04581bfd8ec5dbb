// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace folio::cli {

// Single-line progress display for the canvas being fetched. Without a
// known total it degrades to a raw byte counter.
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw; `estimated` marks a total derived from pixel dimensions
    void update(std::uint64_t current, std::optional<std::uint64_t> total,
                bool estimated = false) noexcept;

    // Terminate the line with a status word
    void finish(std::string_view status) noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept;

    [[nodiscard]] bool active() const noexcept { return drawn_; }

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;
    [[nodiscard]] static std::string format_time(std::uint64_t seconds) noexcept;

private:
    [[nodiscard]] std::string render_bar(double percent) const noexcept;

    std::string label_;
    std::uint64_t current_{0};
    int last_percent_{-1};
    bool drawn_{false};
    std::size_t last_width_{0};
};

} // namespace folio::cli

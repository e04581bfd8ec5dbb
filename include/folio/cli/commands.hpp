// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/download_engine.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace folio::cli {

// CLI result: process exit code, or the setup error that stopped the run
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string manifest;                   // Path or http(s) URL
    std::string output_dir;
    std::optional<std::uint32_t> width;
    std::optional<std::uint32_t> canvas;
    std::optional<double> rate_limit;       // Requests per minute
    std::optional<double> delay;            // Seconds between requests
    std::optional<std::uint32_t> retries;
    bool resume{false};
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                      // Set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Map parsed arguments onto engine options
[[nodiscard]] core::EngineOptions engine_options(const CliArgs& args);

// Route spdlog to stderr at the level selected by -V / -q
void configure_logging(const CliArgs& args) noexcept;

// Download every canvas (or the selected one) of the manifest
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// List canvases without downloading
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Request cancellation of the running download (safe from a signal handler)
void request_interrupt() noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace folio::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace folio::core {

// Rate limiting
constexpr double BASE_DELAY_SEC = 0.5;
constexpr double MAX_BACKOFF_SEC = 30.0;
constexpr double BACKOFF_FACTOR = 2.0;                               // React fast to throttling
constexpr double DECAY_FACTOR = 0.9;                                 // Recover slowly

constexpr std::uint32_t RETRY_COUNT = 3;                             // Retries after the first attempt

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t IO_TIMEOUT_SEC = 60;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;                 // 64 KB

constexpr bool FOLLOW_REDIRECTS = true;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Size estimation from pixel dimensions (bytes per pixel, RGB 3 bytes * ratio)
constexpr double JPEG_BYTES_PER_PIXEL = 0.45;                       // ~15% of raw
constexpr double PNG_BYTES_PER_PIXEL = 1.8;                         // ~60% of raw
constexpr double TIFF_BYTES_PER_PIXEL = 3.0;                        // Uncompressed
constexpr std::uint64_t MIN_SIZE_ESTIMATE = 1024;
constexpr double ESTIMATE_GROWTH_FACTOR = 1.25;                     // Raise once exceeded

constexpr std::size_t MAX_LABEL_LENGTH = 200;

constexpr std::string_view LEDGER_FILENAME = ".iiif-download-state.json";
constexpr std::string_view LOCK_FILENAME = ".iiif-download.lock";
constexpr std::string_view PARTIAL_SUFFIX = ".part";
constexpr std::string_view DEFAULT_EXTENSION = "jpeg";
constexpr std::string_view DEFAULT_OUTPUT_DIR = "iiif_images";

constexpr std::string_view USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) folio/0.1";

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};

} // namespace folio::core

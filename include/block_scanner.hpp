// ============================================================================
// block_scanner.hpp -- block boundary scanner
//
// Given a BlockFormat, decides whether a byte window starts with a plausible
// record header and finds the first such offset in a buffer. Both functions
// are pure: the current time is passed in so results are reproducible.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "block_format.hpp"

namespace gzrotate {

/// Tolerance for `sec` fields around the current time.
inline constexpr int64_t SEC_TOLERANCE = 48 * 3600;

/// Validate a candidate header at the start of `window`.
/// @param window          Bytes starting at the candidate offset.
/// @param fmt             Parsed block format.
/// @param max_block_bytes Upper bound accepted for a `length` field.
/// @param now_sec         Current Unix time in seconds.
/// @return The declared payload length (0 if the format has no length field)
///         or std::nullopt if any field fails or the window is too short.
std::optional<uint64_t> validate_block_header(std::span<const uint8_t> window,
                                              const BlockFormat& fmt,
                                              uint64_t max_block_bytes,
                                              int64_t now_sec);

/// Find the first offset in [from, size - total_bytes] that validates.
/// @return The offset, or buffer.size() if no candidate validates.
std::size_t find_block_boundary(std::span<const uint8_t> buffer,
                                const BlockFormat& fmt,
                                uint64_t max_block_bytes,
                                int64_t now_sec,
                                std::size_t from = 0);

} // namespace gzrotate

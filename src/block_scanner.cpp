// ============================================================================
// block_scanner.cpp -- header validation and boundary search
// ============================================================================
#include "block_scanner.hpp"

namespace gzrotate {

/// Read an unsigned integer of `nbytes` at `p` in the given byte order.
static inline uint64_t load_uint(const uint8_t* p, std::size_t nbytes,
                                 ByteOrder order) noexcept {
  uint64_t v = 0;
  if (order == ByteOrder::Little) {
    for (std::size_t i = nbytes; i-- > 0;) v = (v << 8) | p[i];
  } else {
    for (std::size_t i = 0; i < nbytes; ++i) v = (v << 8) | p[i];
  }
  return v;
}

/// Sign-extend the low `bits` of `raw`.
static inline int64_t sign_extend(uint64_t raw, unsigned bits) noexcept {
  if (bits >= 64) return static_cast<int64_t>(raw);
  const uint64_t sign = uint64_t{1} << (bits - 1);
  return static_cast<int64_t>((raw ^ sign) - sign);
}

/// Range check on the field value, honouring signedness. Unsigned values
/// that do not fit in int64_t are out of every signed range we check.
static inline bool in_range(uint64_t raw, const HeaderFieldSpec& f,
                            int64_t lo, int64_t hi) noexcept {
  int64_t v;
  if (f.is_signed) {
    v = sign_extend(raw, f.width_bits);
  } else {
    if (raw > static_cast<uint64_t>(INT64_MAX)) return false;
    v = static_cast<int64_t>(raw);
  }
  return v >= lo && v <= hi;
}

std::optional<uint64_t> validate_block_header(std::span<const uint8_t> window,
                                              const BlockFormat& fmt,
                                              uint64_t max_block_bytes,
                                              int64_t now_sec) {
  if (window.size() < fmt.total_bytes) return std::nullopt;

  const int64_t max_len = max_block_bytes > static_cast<uint64_t>(INT64_MAX)
                            ? INT64_MAX
                            : static_cast<int64_t>(max_block_bytes);

  uint64_t payload = 0;
  std::size_t off = 0;
  for (const auto& f : fmt.fields) {
    const std::size_t n = f.width_bytes();
    const uint64_t raw = load_uint(window.data() + off, n,
                                   n == 1 ? ByteOrder::Little : fmt.byte_order);
    off += n;

    switch (f.type) {
      case FieldType::Seconds:
        // Guard the subtraction against overflow at the int64 extremes.
        if (!in_range(raw, f,
                      now_sec < INT64_MIN + SEC_TOLERANCE ? INT64_MIN
                                                          : now_sec - SEC_TOLERANCE,
                      now_sec > INT64_MAX - SEC_TOLERANCE ? INT64_MAX
                                                          : now_sec + SEC_TOLERANCE)) {
          return std::nullopt;
        }
        break;
      case FieldType::Microseconds:
        if (!in_range(raw, f, 0, 999999)) return std::nullopt;
        break;
      case FieldType::Nanoseconds:
        if (!in_range(raw, f, 0, 999999999)) return std::nullopt;
        break;
      case FieldType::Length:
        if (!in_range(raw, f, 0, max_len)) return std::nullopt;
        payload = f.is_signed ? static_cast<uint64_t>(sign_extend(raw, f.width_bits))
                              : raw;
        break;
      case FieldType::Magic:
        if (raw != f.magic) return std::nullopt;
        break;
      case FieldType::Ignore:
        break;
    }
  }
  return payload;
}

std::size_t find_block_boundary(std::span<const uint8_t> buffer,
                                const BlockFormat& fmt,
                                uint64_t max_block_bytes,
                                int64_t now_sec,
                                std::size_t from) {
  if (fmt.total_bytes == 0 || buffer.size() < fmt.total_bytes) {
    return buffer.size();
  }
  const std::size_t last = buffer.size() - fmt.total_bytes;
  for (std::size_t off = from; off <= last; ++off) {
    if (validate_block_header(buffer.subspan(off), fmt, max_block_bytes,
                              now_sec)) {
      return off;
    }
  }
  return buffer.size();
}

} // namespace gzrotate

// ============================================================================
// block_format.hpp -- Block header format descriptor
//
// Compiles the block header mini-language into an immutable field list used
// by the boundary scanner. The grammar is a concatenation of tokens
//
//     <[u|s]{8|16|32|64}[:TYPE]>
//
// where TYPE is one of `sec`, `usec`, `nsec`, `length`, a hexadecimal magic
// literal `0x...`, or omitted (any value accepted). Fields are adjacent in
// the byte stream, in declaration order. Multi-byte fields use the byte order
// given at parse time; 8-bit fields are order independent.
//
// Example (pcap record header): <u32:sec><u32:usec><u32:length><u32>
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gzrotate {

enum class ByteOrder : uint8_t { Little, Big };

enum class FieldType : uint8_t {
  Seconds,
  Microseconds,
  Nanoseconds,
  Length,
  Magic,
  Ignore,
};

// ============================================================================
// HeaderFieldSpec: one `<...>` token
// ============================================================================
struct HeaderFieldSpec {
  unsigned  width_bits{32};          // 8, 16, 32 or 64
  FieldType type{FieldType::Ignore};
  bool      is_signed{false};        // sign-extend before comparing
  uint64_t  magic{0};                // only for FieldType::Magic

  std::size_t width_bytes() const noexcept { return width_bits / 8; }
};

// ============================================================================
// BlockFormat: parsed descriptor, read-only after construction
// ============================================================================
struct BlockFormat {
  std::vector<HeaderFieldSpec> fields;
  std::size_t                  total_bytes{0};
  ByteOrder                    byte_order{ByteOrder::Little};
  std::optional<std::size_t>   length_index;   // index into `fields`
};

/// Thrown for any malformed block header specification.
class FormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Parse a block header specification.
/// @param spec       The textual format, e.g. "<u32:sec><u32:usec>".
/// @param byte_order Byte order applied to 16/32/64-bit fields.
/// @return The parsed descriptor.
/// @throws FormatError if no token matches, a width is not 8/16/32/64, a type
///         keyword is unknown, a magic literal is not valid hex or does not
///         fit its field, or more than one field is typed `length`.
BlockFormat parse_block_format(const std::string& spec, ByteOrder byte_order);

/// Parse "little" / "big" (case-insensitive).
/// @throws FormatError on anything else.
ByteOrder parse_byte_order(const std::string& s);

const char* to_string(ByteOrder order) noexcept;

} // namespace gzrotate

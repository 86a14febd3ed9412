// ============================================================================
// block_format.cpp -- block header mini-language parser
// ============================================================================
#include "block_format.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <regex>

namespace gzrotate {

/// Parse the hex digits of a magic literal (without the "0x" prefix).
static uint64_t parse_magic(const std::string& literal) {
  const char* first = literal.data() + 2;
  const char* last  = literal.data() + literal.size();
  uint64_t v = 0;
  const auto [ptr, ec] = std::from_chars(first, last, v, 16);
  if (first == last || ec != std::errc() || ptr != last) {
    throw FormatError("invalid magic number: " + literal);
  }
  return v;
}

BlockFormat parse_block_format(const std::string& spec, ByteOrder byte_order) {
  BlockFormat out;
  out.byte_order = byte_order;

  static const std::regex token_re(R"(<([us])(\d+)(?::([^>]+))?>)");

  auto it  = std::sregex_iterator(spec.begin(), spec.end(), token_re);
  auto end = std::sregex_iterator();
  if (it == end) {
    throw FormatError("invalid block header format: " + spec);
  }

  for (; it != end; ++it) {
    const std::smatch& m = *it;

    const std::string width_str = m[2].str();
    if (width_str != "8" && width_str != "16" && width_str != "32"
        && width_str != "64") {
      throw FormatError("invalid field width: " + width_str);
    }

    HeaderFieldSpec f;
    f.width_bits = static_cast<unsigned>(std::stoul(width_str));
    f.is_signed  = (m[1].str() == "s");

    if (m[3].matched) {
      const std::string type = m[3].str();
      if (type == "sec") {
        f.type = FieldType::Seconds;
      } else if (type == "usec") {
        f.type = FieldType::Microseconds;
      } else if (type == "nsec") {
        f.type = FieldType::Nanoseconds;
      } else if (type == "length") {
        if (out.length_index) {
          throw FormatError("more than one length field in: " + spec);
        }
        f.type = FieldType::Length;
        out.length_index = out.fields.size();
      } else if (type.rfind("0x", 0) == 0) {
        f.type  = FieldType::Magic;
        f.magic = parse_magic(type);
        if (f.width_bits < 64 && (f.magic >> f.width_bits) != 0) {
          throw FormatError("magic number " + type + " does not fit in "
                            + width_str + " bits");
        }
      } else {
        throw FormatError("unknown field type: " + type);
      }
    }

    out.total_bytes += f.width_bytes();
    out.fields.push_back(f);
  }

  return out;
}

ByteOrder parse_byte_order(const std::string& s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (lower == "little") return ByteOrder::Little;
  if (lower == "big")    return ByteOrder::Big;
  throw FormatError("endianness must be 'little' or 'big', got: " + s);
}

const char* to_string(ByteOrder order) noexcept {
  return order == ByteOrder::Big ? "big-endian" : "little-endian";
}

} // namespace gzrotate

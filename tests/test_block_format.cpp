// ============================================================================
// test_block_format.cpp -- Test the block header format parser
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "block_format.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using gzrotate::BlockFormat;
using gzrotate::ByteOrder;
using gzrotate::FieldType;
using gzrotate::FormatError;
using gzrotate::parse_block_format;
using gzrotate::parse_byte_order;

/// True if parsing `spec` throws FormatError.
static bool rejects(const std::string& spec) {
  try {
    parse_block_format(spec, ByteOrder::Little);
  } catch (const FormatError&) {
    return true;
  }
  return false;
}

// ============================================================================
// Test 1: pcap record header
// ============================================================================
void test_pcap_header() {
  BlockFormat f = parse_block_format("<u32:sec><u32:usec><u32:length><u32>",
                                     ByteOrder::Little);
  EXPECT_EQ(f.fields.size(), 4u);
  EXPECT_EQ(f.total_bytes, 16u);
  EXPECT_TRUE(f.byte_order == ByteOrder::Little);
  EXPECT_TRUE(f.fields[0].type == FieldType::Seconds);
  EXPECT_TRUE(f.fields[1].type == FieldType::Microseconds);
  EXPECT_TRUE(f.fields[2].type == FieldType::Length);
  EXPECT_TRUE(f.fields[3].type == FieldType::Ignore);
  EXPECT_TRUE(f.length_index.has_value());
  EXPECT_EQ(*f.length_index, 2u);
  for (const auto& fs : f.fields) {
    EXPECT_EQ(fs.width_bits, 32u);
    EXPECT_TRUE(!fs.is_signed);
  }
  std::puts("test_pcap_header: OK");
}

// ============================================================================
// Test 2: mixed widths, signedness, magic and byte order
// ============================================================================
void test_mixed_fields() {
  BlockFormat f = parse_block_format("<u16:0xCAFE><s8><u64:nsec><s32:length>",
                                     ByteOrder::Big);
  EXPECT_EQ(f.fields.size(), 4u);
  EXPECT_EQ(f.total_bytes, 2u + 1u + 8u + 4u);
  EXPECT_TRUE(f.byte_order == ByteOrder::Big);

  EXPECT_TRUE(f.fields[0].type == FieldType::Magic);
  EXPECT_EQ(f.fields[0].magic, 0xCAFEull);
  EXPECT_EQ(f.fields[0].width_bytes(), 2u);

  EXPECT_TRUE(f.fields[1].type == FieldType::Ignore);
  EXPECT_TRUE(f.fields[1].is_signed);

  EXPECT_TRUE(f.fields[2].type == FieldType::Nanoseconds);
  EXPECT_EQ(f.fields[2].width_bits, 64u);

  EXPECT_TRUE(f.fields[3].type == FieldType::Length);
  EXPECT_TRUE(f.fields[3].is_signed);
  EXPECT_EQ(*f.length_index, 3u);
  std::puts("test_mixed_fields: OK");
}

// ============================================================================
// Test 3: text that is not a token is skipped
// ============================================================================
void test_skips_stray_text() {
  BlockFormat f = parse_block_format("hdr: <u32:sec> then <u8> <garbage>",
                                     ByteOrder::Little);
  EXPECT_EQ(f.fields.size(), 2u);
  EXPECT_EQ(f.total_bytes, 5u);
  EXPECT_TRUE(!f.length_index.has_value());
  std::puts("test_skips_stray_text: OK");
}

// ============================================================================
// Test 4: malformed specifications
// ============================================================================
void test_rejects_malformed() {
  EXPECT_TRUE(rejects(""));
  EXPECT_TRUE(rejects("no tokens here"));
  EXPECT_TRUE(rejects("<u24:sec>"));              // width
  EXPECT_TRUE(rejects("<u0>"));
  EXPECT_TRUE(rejects("<u32:seconds>"));          // unknown type
  EXPECT_TRUE(rejects("<u32:0x>"));               // empty magic
  EXPECT_TRUE(rejects("<u32:0xZZ>"));             // not hex
  EXPECT_TRUE(rejects("<u64:0x11112222333344445>"));  // > 64 bits
  EXPECT_TRUE(rejects("<u8:0x1FF>"));             // does not fit the field
  EXPECT_TRUE(rejects("<u16:0XBEEF>"));           // prefix is lowercase 0x
  EXPECT_TRUE(rejects("<u16:0x-1>"));
  EXPECT_TRUE(rejects("<u16:0x12 >"));
  EXPECT_TRUE(rejects("<u32:length><u16:length>"));

  EXPECT_TRUE(!rejects("<u8:0xFF>"));
  EXPECT_TRUE(!rejects("<u64:0xFFFFFFFFFFFFFFFF>"));
  EXPECT_TRUE(!rejects("<u16:0xbeef>"));
  std::puts("test_rejects_malformed: OK");
}

// ============================================================================
// Test 5: endianness strings
// ============================================================================
void test_byte_order() {
  EXPECT_TRUE(parse_byte_order("little") == ByteOrder::Little);
  EXPECT_TRUE(parse_byte_order("BIG") == ByteOrder::Big);
  bool threw = false;
  try {
    parse_byte_order("middle");
  } catch (const FormatError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
  std::puts("test_byte_order: OK");
}

int main() {
  std::puts("Running block format tests...");
  test_pcap_header();
  test_mixed_fields();
  test_skips_stray_text();
  test_rejects_malformed();
  test_byte_order();
  std::puts("All block format tests PASSED.");
  return 0;
}

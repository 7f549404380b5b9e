#include <gtest/gtest.h>

#include <cuproof/core/buf.h>
#include <cuproof/core/convert.h>

#include "utils/test_macros.h"

namespace {

using namespace cuproof;

TEST(CoreConvert, BaseTypes) {
  bool b = true, b2;
  uint8_t u8 = 42, u82;
  uint16_t u16 = 4242, u162;
  uint32_t u32 = 42424242, u322;
  uint64_t u64 = 0x1234567890abcdef, u642;
  int32_t i32 = -42, i322;
  buf_t buf_in = mem_t("payload"), buf_out;

  buf_t buf = cuproof::ser(b, u8, u16, u32, u64, i32, buf_in);
  EXPECT_OK(deser(buf, b2, u82, u162, u322, u642, i322, buf_out));
  EXPECT_EQ(b, b2);
  EXPECT_EQ(u8, u82);
  EXPECT_EQ(u16, u162);
  EXPECT_EQ(u32, u322);
  EXPECT_EQ(u64, u642);
  EXPECT_EQ(i32, i322);
  EXPECT_TRUE(buf_in == buf_out);
}

TEST(CoreConvert, BigEndianLayout) {
  uint32_t v = 0x01020304;
  buf_t buf = cuproof::ser(v);
  ASSERT_EQ(buf.size(), 4);
  EXPECT_EQ(buf[0], 0x01);
  EXPECT_EQ(buf[3], 0x04);

  uint64_t code = 0x4355505246000001ULL;
  buf_t code_buf = cuproof::ser(code);
  ASSERT_EQ(code_buf.size(), 8);
  EXPECT_EQ(code_buf.take(5).to_string(), "CUPRF");
  EXPECT_EQ(code_buf[7], 0x01);

  uint16_t u16 = 0xbeef;
  buf_t u16_buf = cuproof::ser(u16);
  ASSERT_EQ(u16_buf.size(), 2);
  EXPECT_EQ(u16_buf[0], 0xbe);
}

TEST(CoreConvert, LengthPrefix) {
  for (uint32_t len : {0u, 0x7fu, 0x80u, 0x3fffu, 0x4000u, 0x1fffffu, 0x200000u, 0x1fffffffu}) {
    buf_t buf;
    {
      converter_t calc(true);
      calc.convert_len(len);
      buf.alloc(calc.get_offset());
      converter_t writer(buf.data());
      writer.convert_len(len);
    }
    converter_t reader{mem_t(buf)};
    uint32_t out = 0;
    reader.convert_len(out);
    EXPECT_FALSE(reader.is_error());
    EXPECT_EQ(out, len);
    EXPECT_EQ(reader.get_offset(), buf.size());
  }
}

TEST(CoreConvert, Vector) {
  std::vector<buf_t> vec = {buf_t(mem_t("a")), buf_t(mem_t("bc")), buf_t()};
  std::vector<buf_t> vec2;

  buf_t buf = cuproof::ser(vec);
  EXPECT_OK(deser(buf, vec2));
  ASSERT_EQ(vec2.size(), 3u);
  EXPECT_EQ(vec2[1].to_string(), "bc");
  EXPECT_TRUE(vec2[2].empty());
}

TEST(CoreConvert, CustomStruct) {
  struct custom_t {
    uint32_t a;
    bool b;
    std::string s;

    void convert(converter_t& converter) { converter.convert(a, b); }
  };

  custom_t in, out;
  in.a = 42;
  in.b = true;
  in.s = "this should not be serialized";

  buf_t buf = cuproof::ser(in);
  EXPECT_OK(deser(buf, out));
  EXPECT_EQ(in.a, out.a);
  EXPECT_EQ(in.b, out.b);
  EXPECT_EQ(out.s, "");
}

TEST(CoreConvert, RejectsMalformedInput) {
  uint32_t u32 = 7;
  bool b;
  buf_t buf = cuproof::ser(u32);

  EXPECT_ER(deser(buf.take(3), u32));

  buf_t longer = buf + mem_t("x");
  EXPECT_ER_MSG(deser(longer, u32), "unexpected trailing bytes");

  const uint8_t bad_bool[] = {2};
  EXPECT_ER(deser(mem_t(bad_bool, 1), b));

  // a vector claiming more elements than the input can hold
  const uint8_t bad_vector[] = {0x05, 0x00};
  std::vector<buf_t> vec;
  EXPECT_ER(deser(mem_t(bad_vector, 2), vec));
}

TEST(CoreConvert, CodeType) {
  uint64_t code = 0x1122334455667788;
  buf_t buf = cuproof::ser(code);

  converter_t good{mem_t(buf)};
  EXPECT_EQ(good.convert_code_type(code), code);
  EXPECT_FALSE(good.is_error());

  converter_t bad{mem_t(buf)};
  EXPECT_EQ(bad.convert_code_type(code + 1), 0u);
  EXPECT_TRUE(bad.is_error());
}

}  // namespace

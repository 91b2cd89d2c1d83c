#include "sipwire/sip/message.hpp"
#include "test_utils.hpp"

#include <iterator>
#include <string_view>

#include "gtest/gtest.h"

using namespace sipwire;
using namespace std::string_view_literals;

namespace sipwire::test {

TEST(HeaderTest, EmptyHeaderSentinel) {
  EXPECT_TRUE(kEmptyHeader.name.empty());
  EXPECT_TRUE(kEmptyHeader.value.empty());

  std::array<Header, 3> slots;
  slots.fill(kEmptyHeader);
  HeaderList headers{slots};
  EXPECT_EQ(headers.capacity(), 3u);
  EXPECT_EQ(headers.size(), 0u);
  EXPECT_TRUE(headers.empty());
  EXPECT_TRUE(headers.view().empty());
}

TEST(HeaderTest, ParseHeadersBlock) {
  auto buf = "Host: foo.bar\r\nAccept: */*\r\n\r\n"sv;
  HeaderSlots<4> h;

  auto result = parse_headers(as_bytes(buf), h.list);
  ASSERT_TRUE(result.is_done());
  EXPECT_EQ(result.consumed(), 30u);
  ASSERT_EQ(h.list.size(), 2u);
  EXPECT_EQ(h.list[0].name, "Host");
  EXPECT_EQ(h.list[0].value_text(), "foo.bar");
  EXPECT_EQ(h.list[1].name, "Accept");
  EXPECT_EQ(h.list[1].value_text(), "*/*");
}

TEST(HeaderTest, ParseHeadersOnlyBlankLine) {
  HeaderSlots<4> h;
  auto result = parse_headers(as_bytes("\r\nbody"sv), h.list);
  ASSERT_TRUE(result.is_done());
  EXPECT_EQ(result.consumed(), 2u);
  EXPECT_TRUE(h.list.empty());
}

TEST(HeaderTest, IterationCoversValidPrefixOnly) {
  HeaderSlots<8> h;
  ASSERT_TRUE(parse_headers(as_bytes("A: 1\r\nB: 2\r\n\r\n"sv), h.list));

  std::size_t n = 0;
  for (const auto& header : h.list) {
    EXPECT_FALSE(header.name.empty());
    ++n;
  }
  EXPECT_EQ(n, 2u);
  EXPECT_EQ(h.list.view().size(), 2u);
  EXPECT_EQ(h.list.capacity(), 8u);
}

TEST(HeaderTest, FindIsCaseInsensitive) {
  HeaderSlots<4> h;
  ASSERT_TRUE(parse_headers(
      as_bytes("Call-ID: a84b4c76e66710\r\nCSeq: 314159 INVITE\r\n\r\n"sv),
      h.list));

  auto call_id = h.list.find("call-id");
  ASSERT_TRUE(call_id.has_value());
  EXPECT_EQ(call_id->value_text(), "a84b4c76e66710");
  EXPECT_FALSE(h.list.find("Via").has_value());
}

TEST(HeaderTest, FindReturnsFirstDuplicate) {
  HeaderSlots<4> h;
  ASSERT_TRUE(parse_headers(
      as_bytes("Via: first\r\nVia: second\r\n\r\n"sv), h.list));
  EXPECT_EQ(h.list.find("VIA")->value_text(), "first");
}

TEST(HeaderTest, FindIgnoresStaleSlots) {
  HeaderSlots<4> h;
  ASSERT_TRUE(parse_headers(as_bytes("A: 1\r\nB: 2\r\n\r\n"sv), h.list));
  ASSERT_TRUE(parse_headers(as_bytes("A: 3\r\n\r\n"sv), h.list));
  EXPECT_EQ(h.list.size(), 1u);
  EXPECT_FALSE(h.list.find("B").has_value());
}

TEST(HeaderTest, ShorterReparseHidesEarlierHeaders) {
  HeaderSlots<4> h;
  ASSERT_TRUE(parse_headers(as_bytes("X: 1\r\nY: 2\r\n\r\n"sv), h.list));
  ASSERT_EQ(h.list.size(), 2u);

  ASSERT_TRUE(parse_headers(as_bytes("Z: 3\r\n\r\n"sv), h.list));
  ASSERT_EQ(h.list.size(), 1u);
  EXPECT_EQ(h.list[0].name, "Z");
  EXPECT_EQ(h.list.view().size(), 1u);
  EXPECT_EQ(std::distance(h.list.begin(), h.list.end()), 1);

  ASSERT_TRUE(h.list.at(0).has_value());
  EXPECT_EQ(h.list.at(0)->value_text(), "3");
  EXPECT_FALSE(h.list.at(1).has_value());
  EXPECT_FALSE(h.list.at(h.list.capacity()).has_value());
  EXPECT_FALSE(h.list.find("Y").has_value());
}

TEST(HeaderTest, AtOnEmptyList) {
  HeaderSlots<2> h;
  EXPECT_FALSE(h.list.at(0).has_value());
}

TEST(HeaderTest, ClearResetsLength) {
  HeaderSlots<2> h;
  ASSERT_TRUE(parse_headers(as_bytes("A: 1\r\n\r\n"sv), h.list));
  h.list.clear();
  EXPECT_TRUE(h.list.empty());
  EXPECT_EQ(h.list.capacity(), 2u);
}

TEST(HeaderTest, MoreHeadersThanSlots) {
  auto buf = "A: 1\r\nB: 2\r\nC: 3\r\n\r\n"sv;
  HeaderSlots<2> h;

  auto result = parse_headers(as_bytes(buf), h.list);
  ASSERT_TRUE(result.is_failed());
  EXPECT_EQ(result.error(), make_error_code(Error::TooManyHeaders));
  EXPECT_EQ(result.offset(), 12u);
  EXPECT_EQ(h.list.size(), 2u);
}

TEST(HeaderTest, ExactlyCapacityHeaders) {
  HeaderSlots<2> h;
  auto result = parse_headers(as_bytes("A: 1\r\nB: 2\r\n\r\n"sv), h.list);
  ASSERT_TRUE(result.is_done());
  EXPECT_EQ(h.list.size(), 2u);
}

TEST(HeaderTest, ZeroCapacityRejectsAnyHeader) {
  HeaderList none{std::span<Header>{}};
  auto result = parse_headers(as_bytes("A: 1\r\n\r\n"sv), none);
  ASSERT_TRUE(result.is_failed());
  EXPECT_EQ(result.error(), make_error_code(Error::TooManyHeaders));
  EXPECT_EQ(result.offset(), 0u);

  EXPECT_TRUE(parse_headers(as_bytes("\r\n"sv), none).is_done());
}

TEST(HeaderTest, LengthReflectsHeadersBeforeFailure) {
  HeaderSlots<4> h;
  auto result =
      parse_headers(as_bytes("A: 1\r\nB: 2\r\nC\x01: 3\r\n\r\n"sv), h.list);
  ASSERT_TRUE(result.is_failed());
  EXPECT_EQ(result.error(), make_error_code(Error::Delimiter));
  EXPECT_EQ(result.offset(), 13u);
  EXPECT_EQ(h.list.size(), 2u);
}

TEST(HeaderTest, LengthReflectsHeadersBeforeTruncation) {
  HeaderSlots<4> h;
  auto result = parse_headers(as_bytes("A: 1\r\nB: 2\r\nC: "sv), h.list);
  ASSERT_TRUE(result.is_incomplete());
  EXPECT_EQ(h.list.size(), 2u);
}

TEST(HeaderTest, BadValueByte) {
  HeaderSlots<4> h;
  auto result = parse_headers(as_bytes("A: x\xFFy\r\n\r\n"sv), h.list);
  ASSERT_TRUE(result.is_failed());
  EXPECT_EQ(result.error(), make_error_code(Error::HeaderValue));
  EXPECT_EQ(result.offset(), 4u);
}

TEST(HeaderTest, NonAsciiValueKeptAsBytes) {
  HeaderSlots<4> h;
  auto buf = "User-Agent: \xe3\x81\xb2\xe3/1.0\r\n\r\n"sv;
  ASSERT_TRUE(parse_headers(as_bytes(buf), h.list));
  EXPECT_EQ(h.list[0].value_text(), "\xe3\x81\xb2\xe3/1.0"sv);
}

TEST(HeaderTest, ValueLiesInsideInputBuffer) {
  auto buf = "Subject: lunch\r\n\r\n"sv;
  HeaderSlots<1> h;
  ASSERT_TRUE(parse_headers(as_bytes(buf), h.list));
  EXPECT_TRUE(points_into(buf, h.list[0].name));
  EXPECT_TRUE(points_into(buf, h.list[0].value));
  EXPECT_EQ(offset_of(buf, h.list[0].value_text()), 9u);
}

}  // namespace sipwire::test

#include <gtest/gtest.h>
#include <spal/schema/encoding/error.hpp>
#include <spal/schema/encoding/plutus/cbor.hpp>
#include <spal/schema/encoding/plutus/data.hpp>
#include <spal/schema/primitives.hpp>

#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

using spal::schema::encoding::decoding_error;
using spal::schema::encoding::decoding_error_kind;
using spal::schema::encoding::plutus::data;
using spal::schema::encoding::plutus::integer_t;
using spal::schema::encoding::plutus::map_entry;

std::string serialize_hex(const data& value) {
  return spal::schema::to_hex(
      spal::schema::encoding::plutus::serialize(value));
}

data deserialize_hex(const std::string_view hex) {
  auto bytes = spal::schema::from_hex(hex);
  return spal::schema::encoding::plutus::deserialize(
      spal::schema::make_bytes_view(bytes));
}

void expect_malformed(const std::string_view hex) {
  try {
    static_cast<void>(deserialize_hex(hex));
    FAIL() << "expected malformed_encoding for " << hex;
  } catch (const decoding_error& e) {
    EXPECT_EQ(e.kind(), decoding_error_kind::malformed_encoding) << hex;
  }
}

integer_t two_to_the_64() {
  return integer_t{std::numeric_limits<uint64_t>::max()} + 1;
}

}  // namespace

TEST(cbor, booleans_are_nullary_constructors_zero_and_one) {
  EXPECT_EQ(serialize_hex(data::make_boolean(false)), "d87980");
  EXPECT_EQ(serialize_hex(data::make_boolean(true)), "d87a80");
}

TEST(cbor, constructor_tags_cover_all_index_ranges) {
  EXPECT_EQ(serialize_hex(data::make_constr(6)), "d87f80");
  EXPECT_EQ(serialize_hex(data::make_constr(7)), "d9050080");
  EXPECT_EQ(serialize_hex(data::make_constr(127)), "d9057880");
  EXPECT_EQ(serialize_hex(data::make_constr(128)), "d86682188080");

  EXPECT_EQ(deserialize_hex("d9050080"), data::make_constr(7));
  EXPECT_EQ(deserialize_hex("d9057880"), data::make_constr(127));
  EXPECT_EQ(deserialize_hex("d86682188080"), data::make_constr(128));
}

TEST(cbor, general_constructor_carries_64_bit_index) {
  auto value = data::make_constr(4'294'967'296, {data::make_integer(-1)});
  EXPECT_EQ(serialize_hex(value), "d866821b00000001000000009f20ff");
  EXPECT_EQ(deserialize_hex("d866821b00000001000000009f20ff"), value);
}

TEST(cbor, non_empty_fields_use_indefinite_arrays) {
  auto value = data::make_constr(
      0, {data::make_integer(1), data::make_bytes({0xaa})});
  EXPECT_EQ(serialize_hex(value), "d8799f0141aaff");
  EXPECT_EQ(serialize_hex(data::make_list({})), "80");
  EXPECT_EQ(serialize_hex(data::make_list(
                {data::make_integer(1), data::make_integer(2)})),
            "9f0102ff");
}

TEST(cbor, definite_field_arrays_are_accepted_on_decode) {
  auto expected = data::make_constr(0, {data::make_integer(1)});
  EXPECT_EQ(deserialize_hex("d8798101"), expected);
  EXPECT_EQ(deserialize_hex("d8799f01ff"), expected);
}

TEST(cbor, maps_are_definite_length) {
  auto value = data::make_map({map_entry{.key = data::make_integer(1),
                                         .value = data::make_bytes({0xaa})}});
  EXPECT_EQ(serialize_hex(value), "a10141aa");
  EXPECT_EQ(deserialize_hex("bf0141aaff"), value);
}

TEST(cbor, integers_use_shortest_head) {
  EXPECT_EQ(serialize_hex(data::make_integer(0)), "00");
  EXPECT_EQ(serialize_hex(data::make_integer(23)), "17");
  EXPECT_EQ(serialize_hex(data::make_integer(24)), "1818");
  EXPECT_EQ(serialize_hex(data::make_integer(1'000'000)), "1a000f4240");
  EXPECT_EQ(serialize_hex(data::make_integer(
                integer_t{std::numeric_limits<uint64_t>::max()})),
            "1bffffffffffffffff");
  EXPECT_EQ(serialize_hex(data::make_integer(-1)), "20");
  EXPECT_EQ(serialize_hex(data::make_integer(-500)), "3901f3");
  EXPECT_EQ(serialize_hex(data::make_integer(integer_t{0} - two_to_the_64())),
            "3bffffffffffffffff");
}

TEST(cbor, integers_beyond_64_bits_use_bignum_tags) {
  auto positive = data::make_integer(two_to_the_64());
  EXPECT_EQ(serialize_hex(positive), "c249010000000000000000");
  EXPECT_EQ(deserialize_hex("c249010000000000000000"), positive);

  auto negative =
      data::make_integer(integer_t{integer_t{-1} - two_to_the_64()});
  EXPECT_EQ(serialize_hex(negative), "c349010000000000000000");
  EXPECT_EQ(deserialize_hex("c349010000000000000000"), negative);
}

TEST(cbor, long_byte_strings_are_chunked_at_64_bytes) {
  auto exact = spal::schema::bytes_t(64, 0x11);
  EXPECT_EQ(serialize_hex(data::make_bytes(exact)),
            "5840" + spal::schema::to_hex(exact));

  auto longer = spal::schema::bytes_t(65, 0x22);
  auto expected = std::string{"5f5840"} +
                  spal::schema::to_hex(spal::schema::bytes_t(64, 0x22)) +
                  "4122" + "ff";
  EXPECT_EQ(serialize_hex(data::make_bytes(longer)), expected);
  EXPECT_EQ(deserialize_hex(expected), data::make_bytes(longer));
}

TEST(cbor, nested_tree_round_trips) {
  auto value = data::make_constr(
      3,
      {data::make_list({data::make_boolean(true), data::make_integer(-42)}),
       data::make_map({map_entry{.key = data::make_bytes({0x01}),
                                 .value = data::make_constr(200)}}),
       data::make_bytes(spal::schema::bytes_t(130, 0x7f)),
       data::make_integer(integer_t{"123456789012345678901234567890"})});
  auto encoded = spal::schema::encoding::plutus::serialize(value);
  EXPECT_EQ(spal::schema::encoding::plutus::deserialize(
                spal::schema::make_bytes_view(encoded)),
            value);
}

TEST(cbor, rejects_truncated_and_trailing_input) {
  expect_malformed("");
  expect_malformed("1a000f42");
  expect_malformed("d8799f01");
  expect_malformed("43aabb");
  expect_malformed("0000");
  expect_malformed("f93c");
  expect_malformed("5f41aa");
}

TEST(cbor, rejects_items_outside_the_data_model) {
  expect_malformed("6161");    // text string
  expect_malformed("f93c00");  // half float
  expect_malformed("f5");      // simple true
  expect_malformed("c000");    // tag 0
  expect_malformed("d87901");  // constructor fields not an array
  expect_malformed("ff");      // stray break
  expect_malformed("1c");      // reserved additional information
  expect_malformed("dc");      // reserved tag head
  expect_malformed("bf0141aa");  // unterminated indefinite map
}

TEST(cbor, rejects_oversized_chunks_and_lengths) {
  expect_malformed("5841" + spal::schema::to_hex(spal::schema::bytes_t(65, 0)));
  expect_malformed("9b00000000ffffffff00");
  expect_malformed("5f6161ff");
}

TEST(cbor, rejects_excessive_nesting) {
  auto hex = std::string{};
  for (std::size_t i = 0;
       i < spal::schema::encoding::plutus::kMaxNestingDepth + 10; ++i) {
    hex += "81";
  }
  hex += "00";
  expect_malformed(hex);
}

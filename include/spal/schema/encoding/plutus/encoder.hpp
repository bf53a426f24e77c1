#pragma once
#include <spal/schema/encoding/encoder.hpp>
#include <spal/schema/encoding/error.hpp>
#include <spal/schema/encoding/plutus/access_request.hpp>
#include <spal/schema/encoding/plutus/cbor.hpp>
#include <spal/schema/encoding/plutus/data.hpp>
#include <spal/schema/encoding/plutus/identity_linkage.hpp>
#include <spal/schema/encoding/plutus/policy.hpp>
#include <spal/schema/encoding/plutus/primitives.hpp>
#include <iterator>
#include <spdlog/spdlog.h>

namespace spal::schema::encoding {

struct plutus_data_encoder_tag {};

/// Datum/redeemer codec producing the CBOR the on-chain script consumes.
///
/// `decode` throws `decoding_error`; `try_decode` logs the reason at debug
/// level and returns std::nullopt instead. `encode` throws `encoding_error`
/// only for values that break a type invariant (non UTF-8 text).
template <>
struct encoder<plutus_data_encoder_tag> final {
  template <typename T>
  spal::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, spal::schema::bytes_t& out);

  template <typename T>
  T decode(const spal::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const spal::schema::bytes_view_t& bytes);

  /// Lowercase hex of `encode(obj)`, the form wallet SDKs pass around.
  template <typename T>
  std::string encode_hex(const T& obj);

  /// Throws `decoding_error` (malformed_encoding) when `hex` is not hex.
  template <typename T>
  T decode_hex(std::string_view hex);

  template <typename T>
  plutus::data to_data(const T& obj);

  template <typename T>
  T from_data(const plutus::data& value);
};

template <typename T>
spal::schema::bytes_t encoder<plutus_data_encoder_tag>::encode(const T& obj) {
  return plutus::serialize(plutus::to_data(obj));
}

template <typename T>
void encoder<plutus_data_encoder_tag>::encode(const T& obj,
                                              spal::schema::bytes_t& out) {
  plutus::serialize(plutus::to_data(obj), out);
}

template <typename T>
T encoder<plutus_data_encoder_tag>::decode(
    const spal::schema::bytes_view_t& bytes) {
  return from_data<T>(plutus::deserialize(bytes));
}

template <typename T>
std::optional<T> encoder<plutus_data_encoder_tag>::try_decode(
    const spal::schema::bytes_view_t& bytes) {
  try {
    return decode<T>(bytes);
  } catch (const decoding_error& e) {
    spdlog::debug("Rejected {} byte data item: {}", bytes.size(), e.what());
    return std::nullopt;
  }
}

template <typename T>
std::string encoder<plutus_data_encoder_tag>::encode_hex(const T& obj) {
  return spal::schema::to_hex(encode(obj));
}

template <typename T>
T encoder<plutus_data_encoder_tag>::decode_hex(const std::string_view hex) {
  auto bytes = spal::schema::try_from_hex(hex);
  if (!bytes) {
    throw decoding_error{decoding_error_kind::malformed_encoding,
                         "input is not a hex string"};
  }
  return decode<T>(spal::schema::make_bytes_view(*bytes));
}

template <typename T>
plutus::data encoder<plutus_data_encoder_tag>::to_data(const T& obj) {
  return plutus::to_data(obj);
}

template <typename T>
T encoder<plutus_data_encoder_tag>::from_data(const plutus::data& value) {
  auto out = T{};
  plutus::from_data(value, out);
  return out;
}

}  // namespace spal::schema::encoding

#pragma once
#include <spal/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace spal::schema::encoding {

// The wire library is a build time choice: each library provides a tag type
// and a specialization of this template. Callers hold an
// `encoder<some_tag>` and never name the library's own types.
template <typename Library>
struct encoder {
  template <typename T>
  spal::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, spal::schema::bytes_t& out);

  template <typename T>
  T decode(const spal::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const spal::schema::bytes_view_t& bytes);

  template <typename T>
  std::string encode_hex(const T& obj);

  template <typename T>
  T decode_hex(std::string_view hex);
};

}  // namespace spal::schema::encoding

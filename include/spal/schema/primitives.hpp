#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spal::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash28_t = std::array<uint8_t, 28>;
using hash32_t = std::array<uint8_t, 32>;
using owner_key_hash_t = hash28_t;  // blake2b-224 of a payment key
using script_hash_t = hash28_t;
using lovelace_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);

/// Lowercase, two digits per byte, no separators and no prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::string to_hex(const hash28_t& hash);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

/// Accepts upper or lower case digits and an optional `0x` prefix.
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::optional<owner_key_hash_t> try_make_owner_key_hash(
    const bytes_view_t& bytes);
std::optional<owner_key_hash_t> try_make_owner_key_hash(
    const std::string_view& hex);

/// Strict RFC 3629 check: rejects overlongs, surrogates and code points past
/// U+10FFFF.
bool is_valid_utf8(const bytes_view_t& bytes);
bool is_valid_utf8(const std::string_view& text);

}  // namespace spal::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

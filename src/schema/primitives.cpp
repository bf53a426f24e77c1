#include <spal/common/critical.hpp>
#include <spal/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace spal::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<spal::schema::bytes_t> try_from_hex_internal(
    std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = spal::schema::bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <typename Array>
std::optional<Array> try_make_array(const bytes_view_t& bytes) {
  if (bytes.size() != std::tuple_size_v<Array>) {
    return std::nullopt;
  }
  auto out = Array{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

// Length of the sequence introduced by `lead`, or 0 when `lead` cannot start
// a sequence.
std::size_t utf8_sequence_length(const uint8_t lead) {
  if (lead < 0x80u) {
    return 1;
  }
  if (lead >= 0xC2u && lead <= 0xDFu) {
    return 2;
  }
  if (lead >= 0xE0u && lead <= 0xEFu) {
    return 3;
  }
  if (lead >= 0xF0u && lead <= 0xF4u) {
    return 4;
  }
  return 0;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const spal::schema::bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const spal::schema::bytes_t& bytes) {
  return to_hex(spal::schema::bytes_view_t{bytes.data(), bytes.size()});
}

std::string to_hex(const spal::schema::hash28_t& hash) {
  return to_hex(spal::schema::bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    spal::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_array<hash32_t>(make_bytes_view(*decoded));
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    spal::common::critical("make_hash32 expected 64 hex digits");
  }
  return *hash;
}

std::optional<owner_key_hash_t> try_make_owner_key_hash(
    const bytes_view_t& bytes) {
  return try_make_array<owner_key_hash_t>(bytes);
}

std::optional<owner_key_hash_t> try_make_owner_key_hash(
    const std::string_view& hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_array<owner_key_hash_t>(make_bytes_view(*decoded));
}

bool is_valid_utf8(const bytes_view_t& bytes) {
  auto index = std::size_t{0};
  while (index < bytes.size()) {
    const auto lead = bytes[index];
    const auto length = utf8_sequence_length(lead);
    if (length == 0 || (index + length) > bytes.size()) {
      return false;
    }
    for (std::size_t i = 1; i < length; ++i) {
      if ((bytes[index + i] & 0xC0u) != 0x80u) {
        return false;
      }
    }
    if (length >= 3) {
      const auto second = bytes[index + 1];
      // Overlong three/four byte forms, UTF-16 surrogates, > U+10FFFF.
      if ((lead == 0xE0u && second < 0xA0u) ||
          (lead == 0xEDu && second > 0x9Fu) ||
          (lead == 0xF0u && second < 0x90u) ||
          (lead == 0xF4u && second > 0x8Fu)) {
        return false;
      }
    }
    index += length;
  }
  return true;
}

bool is_valid_utf8(const std::string_view& text) {
  return is_valid_utf8(make_bytes_view(text));
}

}  // namespace spal::schema

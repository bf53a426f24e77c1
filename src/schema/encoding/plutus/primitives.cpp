#include <spal/schema/encoding/error.hpp>
#include <spal/schema/encoding/plutus/primitives.hpp>

#include <limits>
#include <string>

namespace spal::schema::encoding::plutus {

namespace {

[[noreturn]] void fail(const decoding_error_kind kind,
                       const std::string_view what,
                       const std::string& detail) {
  throw decoding_error{kind, std::string{what} + ": " + detail};
}

}  // namespace

data encode_bool(const bool value) {
  return data::make_boolean(value);
}

bool decode_bool(const data& value, const std::string_view what) {
  const auto* node = std::get_if<constr>(&value.value);
  if (node == nullptr) {
    fail(decoding_error_kind::type_mismatch, what,
         "expected boolean constructor, got " +
             std::string{kind_name(value)});
  }
  if (node->index > 1) {
    fail(decoding_error_kind::invalid_boolean, what,
         "constructor index " + std::to_string(node->index) +
             " is neither False (0) nor True (1)");
  }
  if (!node->fields.empty()) {
    fail(decoding_error_kind::invalid_boolean, what,
         "boolean constructor carries " +
             std::to_string(node->fields.size()) + " fields");
  }
  return node->index == 1;
}

data encode_uint(const uint64_t value) {
  return data::make_integer(integer_t{value});
}

uint64_t decode_uint(const data& value, const std::string_view what) {
  const auto* node = std::get_if<integer_t>(&value.value);
  if (node == nullptr) {
    fail(decoding_error_kind::type_mismatch, what,
         "expected integer, got " + std::string{kind_name(value)});
  }
  if (*node < 0 || *node > std::numeric_limits<uint64_t>::max()) {
    fail(decoding_error_kind::type_mismatch, what,
         "integer " + node->str() + " is outside the unsigned 64 bit range");
  }
  return node->convert_to<uint64_t>();
}

data encode_bytes(const spal::schema::bytes_view_t& value) {
  return data::make_bytes(spal::schema::make_bytes(value));
}

spal::schema::bytes_t decode_bytes(const data& value,
                                   const std::string_view what) {
  const auto* node = std::get_if<spal::schema::bytes_t>(&value.value);
  if (node == nullptr) {
    fail(decoding_error_kind::type_mismatch, what,
         "expected bytes, got " + std::string{kind_name(value)});
  }
  return *node;
}

data encode_utf8(const std::string_view value, const std::string_view what) {
  if (!spal::schema::is_valid_utf8(value)) {
    throw encoding_error{std::string{what} + ": text is not valid UTF-8"};
  }
  return data::make_bytes(spal::schema::make_bytes(value));
}

std::string decode_utf8(const data& value, const std::string_view what) {
  auto bytes = decode_bytes(value, what);
  if (!spal::schema::is_valid_utf8(spal::schema::make_bytes_view(bytes))) {
    fail(decoding_error_kind::type_mismatch, what,
         "bytes are not valid UTF-8 text");
  }
  return spal::schema::make_string(bytes);
}

const std::vector<data>& expect_constr(const data& value,
                                       const uint64_t index,
                                       const std::size_t field_count,
                                       const std::string_view what) {
  const auto* node = std::get_if<constr>(&value.value);
  if (node == nullptr) {
    fail(decoding_error_kind::wrong_constructor_shape, what,
         "expected constructor, got " + std::string{kind_name(value)});
  }
  if (node->index != index) {
    fail(decoding_error_kind::wrong_constructor_shape, what,
         "expected constructor index " + std::to_string(index) + ", got " +
             std::to_string(node->index));
  }
  if (node->fields.size() != field_count) {
    fail(decoding_error_kind::wrong_field_count, what,
         "expected " + std::to_string(field_count) + " fields, got " +
             std::to_string(node->fields.size()));
  }
  return node->fields;
}

}  // namespace spal::schema::encoding::plutus

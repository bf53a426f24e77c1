#pragma once
#include <spal/schema/encoding/plutus/data.hpp>
#include <spal/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Leaf conversions shared by the record codecs. Every decode helper throws
// `decoding_error`; `what` names the field for the message.
namespace spal::schema::encoding::plutus {

data encode_bool(bool value);
bool decode_bool(const data& value, std::string_view what);

data encode_uint(uint64_t value);
uint64_t decode_uint(const data& value, std::string_view what);

data encode_bytes(const spal::schema::bytes_view_t& value);
spal::schema::bytes_t decode_bytes(const data& value, std::string_view what);

/// Text carried as its UTF-8 bytes. Throws `encoding_error` when `value` is
/// not UTF-8.
data encode_utf8(std::string_view value, std::string_view what);
std::string decode_utf8(const data& value, std::string_view what);

/// Check that `value` is `constr(index, fields)` with exactly `field_count`
/// fields and return those fields.
const std::vector<data>& expect_constr(const data& value,
                                       uint64_t index,
                                       std::size_t field_count,
                                       std::string_view what);

}  // namespace spal::schema::encoding::plutus

#pragma once
#include <spal/schema/encoding/plutus/data.hpp>
#include <spal/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

// CBOR form of the data tree as the ledger reads it from inline datums and
// redeemers.
//
// Encoding follows the chain's own serializer byte for byte:
//   * constructor i in 0..6 is tag 121+i, 7..127 is tag 1280+(i-7), anything
//     larger is tag 102 over [i, fields];
//   * field lists and lists are 0x80 when empty, otherwise an indefinite
//     array closed by 0xff;
//   * maps are definite length;
//   * integers use major types 0/1 when the argument fits in 64 bits and
//     bignum tags 2/3 otherwise;
//   * byte strings longer than 64 bytes are split into 64 byte chunks inside
//     an indefinite byte string.
//
// Heads are written and parsed by libcbor; this layer decides which items
// the data model admits. Decoding accepts either array/map/byte string
// framing but rejects anything the ledger would reject: text strings, floats,
// simple values, unknown tags, chunks over 64 bytes, trailing input and
// excessive nesting.
namespace spal::schema::encoding::plutus {

inline constexpr std::size_t kBytesChunkSize = 64;
inline constexpr std::size_t kMaxNestingDepth = 256;

inline constexpr uint64_t kConstrTagSmallBase = 121;  // indices 0..6
inline constexpr uint64_t kConstrTagLargeBase = 1280;  // indices 7..127
inline constexpr uint64_t kConstrTagGeneral = 102;
inline constexpr uint64_t kPositiveBignumTag = 2;
inline constexpr uint64_t kNegativeBignumTag = 3;

spal::schema::bytes_t serialize(const data& value);
void serialize(const data& value, spal::schema::bytes_t& out);

/// Parse exactly one data item spanning all of `bytes`.
///
/// Throws `decoding_error` with kind `malformed_encoding` on any violation.
data deserialize(const spal::schema::bytes_view_t& bytes);

}  // namespace spal::schema::encoding::plutus

#pragma once
#include <spal/schema/policy.hpp>
#include <spal/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Outputs sitting at the script address, as reported by the wallet layer,
// and the subset of them that carry a decodable policy datum.
namespace spal::schema {

struct chain_output final {
  hash32_t tx_hash{};
  uint32_t output_index{};
  std::optional<bytes_t> inline_datum;
  lovelace_t lovelace{};
};

struct policy_output final {
  hash32_t tx_hash{};
  uint32_t output_index{};
  policy_t datum;
  lovelace_t lovelace{};
};

using chain_output_t = chain_output;
using policy_output_t = policy_output;

}  // namespace spal::schema

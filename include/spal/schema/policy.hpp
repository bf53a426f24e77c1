#pragma once
#include <spal/schema/identity_linkage.hpp>
#include <spal/schema/primitives.hpp>
#include <string>

// Schema type: policy datum.
// Access-control record locked at the script address. Layout version 1 has
// six on-chain fields; `id` is local bookkeeping and never leaves the host.
namespace spal::schema {

template <uint16_t Version>
struct policy;

template <>
struct policy<1> final {
  std::string id;
  owner_key_hash_t owner_pkh{};
  lovelace_t min_payment{};  // 0 = free
  duration_milliseconds_t max_retention_ms{};
  identity_linkage_t identity_linkage;
  bytes_t required_proof_hash;  // empty = no proof required
  std::string context_scope;    // e.g. "medical/allergies"

  bool operator==(const policy<1>&) const = default;
};

using policy_t = policy<1>;

}  // namespace spal::schema

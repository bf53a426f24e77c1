#pragma once

#include <spal/schema/access_request.hpp>
#include <spal/schema/policy.hpp>
#include <spal/schema/validation_outcome.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace spal::validation {

/// Identifier scheme the on-chain script treats as ephemeral.
inline constexpr auto kDefaultEphemeralDidPrefix = std::string_view{"did:key:z"};

struct validator_options final {
  /// A DID is ephemeral when it starts with any of these prefixes.
  std::vector<std::string> ephemeral_did_prefixes{
      std::string{kDefaultEphemeralDidPrefix}};
};

bool is_ephemeral_did(std::string_view did, const validator_options& options);

/// Off-chain mirror of the script's acceptance predicate.
///
/// Checks run in the script's order and stop at the first failure:
///   1. ephemeral identity, when the policy requires it;
///   2. payment, when `min_payment` is non-zero;
///   3. proof reference presence, when a proof hash is set.
/// Owner signatures, retention windows and proof validity are left to the
/// chain and the external proof verifier. Any change to the script must be
/// reflected here.
spal::schema::validation_outcome_t evaluate(
    const spal::schema::policy_t& policy,
    const spal::schema::access_request_t& request,
    const validator_options& options = {});

}  // namespace spal::validation

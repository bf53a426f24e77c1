#pragma once

#include <spal/schema/access_request.hpp>
#include <spal/schema/chain_output.hpp>
#include <spal/schema/policy.hpp>
#include <spal/schema/primitives.hpp>
#include <spal/schema/script_artifact.hpp>
#include <spal/schema/validation_outcome.hpp>
#include <spal/validation/validator.hpp>
#include <string>
#include <vector>

namespace spal::execution {

/// Host side half of the policy enforcer script.
///
/// Bound to one compiled validator for its whole lifetime; the enforcer owns
/// its copy of the artifact. All members are const and safe to call from
/// several threads at once. Transaction building and submission are the
/// wallet layer's job.
class enforcer final {
 public:
  explicit enforcer(spal::schema::script_artifact_t script,
                    spal::validation::validator_options options = {});

  const spal::schema::script_artifact_t& script() const;

  /// Script hash as lowercase hex, the key the ledger addresses it by.
  std::string script_hash_hex() const;

  /// Compiled validator bytes as lowercase hex.
  std::string compiled_code_hex() const;

  /// Pre-submission check mirroring the script. Rejections are logged at
  /// debug level and returned, never thrown.
  spal::schema::validation_outcome_t validate(
      const spal::schema::policy_t& policy,
      const spal::schema::access_request_t& request) const;

  /// Inline datum bytes to lock at the script address.
  spal::schema::bytes_t build_policy_datum(
      const spal::schema::policy_t& policy) const;

  /// Redeemer bytes to attach when spending a policy output.
  spal::schema::bytes_t build_access_redeemer(
      const spal::schema::access_request_t& request) const;

  /// Decode the policy datum of every output that carries one.
  ///
  /// Outputs without an inline datum are skipped silently; outputs whose
  /// datum does not decode are skipped with a warning. Decoded policies have
  /// an empty `id`.
  std::vector<spal::schema::policy_output_t> find_policy_outputs(
      const std::vector<spal::schema::chain_output_t>& outputs) const;

 private:
  spal::schema::script_artifact_t script_;
  spal::validation::validator_options options_;
};

}  // namespace spal::execution

#include <spal/validation/validator.hpp>

#include <spdlog/fmt/fmt.h>

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace spal::validation {

namespace {

spal::schema::validation_outcome_t reject(
    const spal::schema::validation_error_code code,
    std::string reason) {
  return spal::schema::validation_outcome_t{
      .valid = false, .code = code, .reason = std::move(reason)};
}

}  // namespace

bool is_ephemeral_did(const std::string_view did,
                      const validator_options& options) {
  return std::ranges::any_of(
      options.ephemeral_did_prefixes, [&](const std::string& prefix) {
        return !prefix.empty() && did.starts_with(prefix);
      });
}

spal::schema::validation_outcome_t evaluate(
    const spal::schema::policy_t& policy,
    const spal::schema::access_request_t& request,
    const validator_options& options) {
  if (policy.identity_linkage.ephemeral_required &&
      !is_ephemeral_did(request.requester_did, options)) {
    return reject(
        spal::schema::validation_error_code::ephemeral_identity_required,
        options.ephemeral_did_prefixes.empty()
            ? std::string{"ephemeral identity required for this policy"}
            : fmt::format("ephemeral identity required ({}) for this policy",
                          boost::algorithm::join(
                              options.ephemeral_did_prefixes, ", ")));
  }

  if (policy.min_payment > 0 && request.payment_amount < policy.min_payment) {
    return reject(spal::schema::validation_error_code::insufficient_payment,
                  fmt::format("insufficient payment: required {}, got {}",
                              policy.min_payment, request.payment_amount));
  }

  if (!policy.required_proof_hash.empty() &&
      request.proof_reference.empty()) {
    return reject(
        spal::schema::validation_error_code::proof_reference_required,
        "proof reference required but not provided");
  }

  return spal::schema::validation_outcome_t{.valid = true};
}

}  // namespace spal::validation

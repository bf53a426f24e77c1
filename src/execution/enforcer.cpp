#include <spdlog/spdlog.h>
#include <spal/execution/enforcer.hpp>
#include <spal/schema/encoding/plutus/encoder.hpp>
#include <spal/schema/validation_error_code.hpp>
#include <iterator>
#include <string_view>
#include <utility>

using namespace spal::schema;

namespace {

using encoder_t = spal::schema::encoding::encoder<
    spal::schema::encoding::plutus_data_encoder_tag>;

}  // namespace

namespace spal::execution {

enforcer::enforcer(script_artifact_t script,
                   spal::validation::validator_options options)
    : script_{std::move(script)}, options_{std::move(options)} {
  if (options_.ephemeral_did_prefixes.empty()) {
    spdlog::warn(
        "No ephemeral DID prefixes configured; policies requiring ephemeral "
        "identity will reject every request");
  }
  spdlog::info("Policy enforcer bound to script '{}' ({}, {} bytes)",
               script_.title, to_hex(script_.hash),
               script_.compiled_code.size());
}

const script_artifact_t& enforcer::script() const {
  return script_;
}

std::string enforcer::script_hash_hex() const {
  return to_hex(script_.hash);
}

std::string enforcer::compiled_code_hex() const {
  return to_hex(script_.compiled_code);
}

validation_outcome_t enforcer::validate(const policy_t& policy,
                                        const access_request_t& request) const {
  auto outcome = spal::validation::evaluate(policy, request, options_);
  if (!outcome.valid) {
    spdlog::debug("Rejected access by '{}' to '{}': [{}] {}",
                  request.requester_did, policy.context_scope,
                  outcome.code ? to_string(*outcome.code)
                               : std::string_view{"unknown"},
                  outcome.reason.value_or(""));
  }
  return outcome;
}

bytes_t enforcer::build_policy_datum(const policy_t& policy) const {
  auto encoder = encoder_t{};
  return encoder.encode(policy);
}

bytes_t enforcer::build_access_redeemer(const access_request_t& request) const {
  auto encoder = encoder_t{};
  return encoder.encode(request);
}

std::vector<policy_output_t> enforcer::find_policy_outputs(
    const std::vector<chain_output_t>& outputs) const {
  auto encoder = encoder_t{};
  auto result = std::vector<policy_output_t>{};
  for (const auto& output : outputs) {
    if (!output.inline_datum) {
      continue;
    }
    try {
      auto datum = encoder.decode<policy_t>(make_bytes_view(*output.inline_datum));
      result.push_back(policy_output_t{.tx_hash = output.tx_hash,
                                       .output_index = output.output_index,
                                       .datum = std::move(datum),
                                       .lovelace = output.lovelace});
    } catch (const spal::schema::encoding::decoding_error& e) {
      spdlog::warn("Skipping output {}#{}: invalid policy datum: {}",
                   to_hex(bytes_view_t{output.tx_hash.data(),
                                       output.tx_hash.size()}),
                   output.output_index, e.what());
    }
  }
  spdlog::debug("Found {} policy output(s) among {} output(s)", result.size(),
                outputs.size());
  return result;
}

}  // namespace spal::execution

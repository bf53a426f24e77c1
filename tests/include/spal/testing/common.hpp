#pragma once

#include <spal/schema/access_request.hpp>
#include <spal/schema/policy.hpp>
#include <spal/schema/primitives.hpp>
#include <spal/schema/script_artifact.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace spal::testing {

inline constexpr auto kEphemeralDid = std::string_view{
    "did:key:z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK"};
inline constexpr auto kPersistentDid =
    std::string_view{"did:web:clinic.example.org"};

inline spal::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = spal::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline spal::schema::owner_key_hash_t make_owner(const uint8_t seed) {
  auto out = spal::schema::owner_key_hash_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Health-record policy: paid, ephemeral identity, proof required.
inline spal::schema::policy_t make_policy() {
  return spal::schema::policy_t{
      .id = "spal:test:health",
      .owner_pkh = make_owner(0x10),
      .min_payment = 1'000'000,
      .max_retention_ms = 86'400'000,
      .identity_linkage = {.ephemeral_required = true,
                           .proof_of_root_allowed = true,
                           .zk_continuity_allowed = false},
      .required_proof_hash = spal::schema::bytes_t{0xde, 0xad, 0xbe, 0xef},
      .context_scope = "medical/allergies"};
}

/// Request that satisfies `make_policy()`.
inline spal::schema::access_request_t make_request() {
  return spal::schema::access_request_t{
      .requester_did = std::string{kEphemeralDid},
      .proof_reference =
          spal::schema::make_bytes(std::string_view{"proof123abc"}),
      .access_time = 1'704'067'200'000,
      .payment_amount = 1'000'000};
}

inline spal::schema::script_artifact_t make_script() {
  auto script = spal::schema::script_artifact_t{};
  script.title = "spal.spal.spend";
  script.plutus_version = "v3";
  script.hash = make_owner(0xA0);
  script.compiled_code = spal::schema::bytes_t{0x59, 0x01, 0x02, 0x01, 0x00};
  return script;
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace spal::testing

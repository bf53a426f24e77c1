#pragma once
#include <spal/schema/primitives.hpp>
#include <string>

// Schema type: compiled validator.
// Opaque on-chain bytecode plus the hash the ledger knows it by. Produced
// once (usually from a blueprint) and never modified after.
namespace spal::schema {

template <uint16_t Version>
struct script_artifact;

template <>
struct script_artifact<1> final {
  std::string title;
  std::string plutus_version;
  script_hash_t hash{};
  bytes_t compiled_code;

  bool operator==(const script_artifact<1>&) const = default;
};

using script_artifact_t = script_artifact<1>;

}  // namespace spal::schema

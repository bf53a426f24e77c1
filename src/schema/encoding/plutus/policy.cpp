#include <spal/schema/encoding/error.hpp>
#include <spal/schema/encoding/plutus/identity_linkage.hpp>
#include <spal/schema/encoding/plutus/policy.hpp>
#include <spal/schema/encoding/plutus/primitives.hpp>

#include <string>

using namespace spal::schema;

namespace spal::schema::encoding::plutus {

namespace {
constexpr auto kFieldCount = std::size_t{6};
}

// `id` stays off chain.
data to_data(const policy_t& o) {
  return data::make_constr(
      0, {encode_bytes(bytes_view_t{o.owner_pkh.data(), o.owner_pkh.size()}),
          encode_uint(o.min_payment), encode_uint(o.max_retention_ms),
          to_data(o.identity_linkage),
          encode_bytes(make_bytes_view(o.required_proof_hash)),
          encode_utf8(o.context_scope, "policy.context_scope")});
}

void from_data(const data& d, policy_t& o) {
  const auto& fields = expect_constr(d, 0, kFieldCount, "policy");

  auto owner = decode_bytes(fields[0], "policy.owner_pkh");
  auto owner_pkh = try_make_owner_key_hash(make_bytes_view(owner));
  if (!owner_pkh) {
    throw decoding_error{decoding_error_kind::type_mismatch,
                         "policy.owner_pkh: expected 28 bytes, got " +
                             std::to_string(owner.size())};
  }
  o.owner_pkh = *owner_pkh;
  o.min_payment = decode_uint(fields[1], "policy.min_payment");
  o.max_retention_ms = decode_uint(fields[2], "policy.max_retention_ms");
  from_data(fields[3], o.identity_linkage);
  o.required_proof_hash = decode_bytes(fields[4], "policy.required_proof_hash");
  o.context_scope = decode_utf8(fields[5], "policy.context_scope");
}

}  // namespace spal::schema::encoding::plutus

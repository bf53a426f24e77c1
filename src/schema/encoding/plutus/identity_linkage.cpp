#include <spal/schema/encoding/plutus/identity_linkage.hpp>
#include <spal/schema/encoding/plutus/primitives.hpp>

using namespace spal::schema;

namespace spal::schema::encoding::plutus {

namespace {
constexpr auto kFieldCount = std::size_t{3};
}

data to_data(const identity_linkage_t& o) {
  return data::make_constr(0, {encode_bool(o.ephemeral_required),
                               encode_bool(o.proof_of_root_allowed),
                               encode_bool(o.zk_continuity_allowed)});
}

void from_data(const data& d, identity_linkage_t& o) {
  const auto& fields = expect_constr(d, 0, kFieldCount, "identity_linkage");
  o.ephemeral_required =
      decode_bool(fields[0], "identity_linkage.ephemeral_required");
  o.proof_of_root_allowed =
      decode_bool(fields[1], "identity_linkage.proof_of_root_allowed");
  o.zk_continuity_allowed =
      decode_bool(fields[2], "identity_linkage.zk_continuity_allowed");
}

}  // namespace spal::schema::encoding::plutus

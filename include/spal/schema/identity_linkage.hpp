#pragma once
#include <spal/schema/primitives.hpp>

// Schema type: identity linkage.
// How a requester's session identity may relate to a persistent root
// identity. The three flags are independent.
namespace spal::schema {

template <uint16_t Version>
struct identity_linkage;

template <>
struct identity_linkage<1> final {
  bool ephemeral_required{};     // unlinkable did:key style identifier
  bool proof_of_root_allowed{};  // may prove root DID ownership for audit
  bool zk_continuity_allowed{};  // may prove cross-session continuity via ZK

  bool operator==(const identity_linkage<1>&) const = default;
};

using identity_linkage_t = identity_linkage<1>;

}  // namespace spal::schema

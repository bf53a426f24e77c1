#pragma once
#include <spal/schema/primitives.hpp>
#include <string>

// Schema type: access redeemer.
// Supplied by a requester when spending the policy output.
namespace spal::schema {

template <uint16_t Version>
struct access_request;

template <>
struct access_request<1> final {
  std::string requester_did;
  bytes_t proof_reference;  // empty = no proof supplied
  timestamp_milliseconds_t access_time{};
  lovelace_t payment_amount{};

  bool operator==(const access_request<1>&) const = default;
};

using access_request_t = access_request<1>;

}  // namespace spal::schema

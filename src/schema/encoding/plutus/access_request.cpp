#include <spal/schema/encoding/plutus/access_request.hpp>
#include <spal/schema/encoding/plutus/primitives.hpp>

using namespace spal::schema;

namespace spal::schema::encoding::plutus {

namespace {
constexpr auto kFieldCount = std::size_t{4};
}

data to_data(const access_request_t& o) {
  return data::make_constr(
      0, {encode_utf8(o.requester_did, "access_request.requester_did"),
          encode_bytes(make_bytes_view(o.proof_reference)),
          encode_uint(o.access_time), encode_uint(o.payment_amount)});
}

void from_data(const data& d, access_request_t& o) {
  const auto& fields = expect_constr(d, 0, kFieldCount, "access_request");
  o.requester_did = decode_utf8(fields[0], "access_request.requester_did");
  o.proof_reference =
      decode_bytes(fields[1], "access_request.proof_reference");
  o.access_time = decode_uint(fields[2], "access_request.access_time");
  o.payment_amount = decode_uint(fields[3], "access_request.payment_amount");
}

}  // namespace spal::schema::encoding::plutus

#pragma once
#include <spal/schema/access_request.hpp>
#include <spal/schema/encoding/plutus/data.hpp>

namespace spal::schema::encoding::plutus {

data to_data(const spal::schema::access_request_t& o);
void from_data(const data& d, spal::schema::access_request_t& o);

}  // namespace spal::schema::encoding::plutus

#pragma once
#include <spal/schema/policy.hpp>
#include <spal/schema/encoding/plutus/data.hpp>

namespace spal::schema::encoding::plutus {

data to_data(const spal::schema::policy_t& o);
void from_data(const data& d, spal::schema::policy_t& o);

}  // namespace spal::schema::encoding::plutus

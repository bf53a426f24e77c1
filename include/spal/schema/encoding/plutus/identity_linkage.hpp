#pragma once
#include <spal/schema/identity_linkage.hpp>
#include <spal/schema/encoding/plutus/data.hpp>

namespace spal::schema::encoding::plutus {

data to_data(const spal::schema::identity_linkage_t& o);
void from_data(const data& d, spal::schema::identity_linkage_t& o);

}  // namespace spal::schema::encoding::plutus

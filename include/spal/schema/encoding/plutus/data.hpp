#pragma once
#include <spal/schema/primitives.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

// Generic on-chain data model. Every datum and redeemer the validator sees is
// one of these trees; booleans and records are plain constructors.
namespace spal::schema::encoding::plutus {

using integer_t = boost::multiprecision::cpp_int;

struct data;
struct map_entry;

struct constr final {
  uint64_t index{};
  std::vector<data> fields;
};

struct map final {
  std::vector<map_entry> entries;
};

struct list final {
  std::vector<data> items;
};

struct data final {
  std::variant<constr, map, list, integer_t, spal::schema::bytes_t> value;

  static data make_constr(uint64_t index, std::vector<data> fields = {});
  static data make_boolean(bool value);
  static data make_integer(integer_t value);
  static data make_bytes(spal::schema::bytes_t value);
  static data make_list(std::vector<data> items);
  static data make_map(std::vector<map_entry> entries);
};

struct map_entry final {
  data key;
  data value;
};

bool operator==(const constr& lhs, const constr& rhs);
bool operator==(const map& lhs, const map& rhs);
bool operator==(const list& lhs, const list& rhs);
bool operator==(const map_entry& lhs, const map_entry& rhs);
bool operator==(const data& lhs, const data& rhs);

/// Short node name for diagnostics ("constr", "map", "list", "integer",
/// "bytes").
std::string_view kind_name(const data& value);

}  // namespace spal::schema::encoding::plutus

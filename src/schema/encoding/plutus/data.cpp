#include <spal/schema/encoding/plutus/data.hpp>

#include <utility>

namespace spal::schema::encoding::plutus {

data data::make_constr(const uint64_t index, std::vector<data> fields) {
  return data{constr{.index = index, .fields = std::move(fields)}};
}

data data::make_boolean(const bool value) {
  return make_constr(value ? 1 : 0);
}

data data::make_integer(integer_t value) {
  return data{std::move(value)};
}

data data::make_bytes(spal::schema::bytes_t value) {
  return data{std::move(value)};
}

data data::make_list(std::vector<data> items) {
  return data{list{.items = std::move(items)}};
}

data data::make_map(std::vector<map_entry> entries) {
  return data{map{.entries = std::move(entries)}};
}

bool operator==(const constr& lhs, const constr& rhs) {
  return lhs.index == rhs.index && lhs.fields == rhs.fields;
}

bool operator==(const map& lhs, const map& rhs) {
  return lhs.entries == rhs.entries;
}

bool operator==(const list& lhs, const list& rhs) {
  return lhs.items == rhs.items;
}

bool operator==(const map_entry& lhs, const map_entry& rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator==(const data& lhs, const data& rhs) {
  return lhs.value == rhs.value;
}

std::string_view kind_name(const data& value) {
  return std::visit(
      overloaded{
          [](const constr&) { return std::string_view{"constr"}; },
          [](const map&) { return std::string_view{"map"}; },
          [](const list&) { return std::string_view{"list"}; },
          [](const integer_t&) { return std::string_view{"integer"}; },
          [](const spal::schema::bytes_t&) { return std::string_view{"bytes"}; },
      },
      value.value);
}

}  // namespace spal::schema::encoding::plutus

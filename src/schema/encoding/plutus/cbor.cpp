#include <spal/common/critical.hpp>
#include <spal/schema/encoding/error.hpp>
#include <spal/schema/encoding/plutus/cbor.hpp>

#include <cbor.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace spal::schema::encoding::plutus {

namespace {

// Initial byte plus an eight byte argument.
constexpr auto kMaxHeadSize = std::size_t{9};

template <typename Encode>
void append_head(spal::schema::bytes_t& out, Encode&& encode) {
  auto head = std::array<unsigned char, kMaxHeadSize>{};
  const auto written = encode(head.data(), head.size());
  if (written == 0) {
    spal::common::critical("CBOR head did not fit in nine bytes");
  }
  out.insert(std::end(out), std::begin(head),
             std::begin(head) + static_cast<std::ptrdiff_t>(written));
}

void write_uint(const uint64_t value, spal::schema::bytes_t& out) {
  append_head(out, [&](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_uint(value, buffer, size);
  });
}

void write_tag(const uint64_t tag, spal::schema::bytes_t& out) {
  append_head(out, [&](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_tag(tag, buffer, size);
  });
}

void write_break(spal::schema::bytes_t& out) {
  append_head(out, [](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_break(buffer, size);
  });
}

void write_chunk(const spal::schema::bytes_view_t& chunk,
                 spal::schema::bytes_t& out) {
  append_head(out, [&](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_bytestring_start(chunk.size(), buffer, size);
  });
  out.insert(std::end(out), std::begin(chunk), std::end(chunk));
}

void write_bytes(const spal::schema::bytes_t& bytes,
                 spal::schema::bytes_t& out) {
  const auto view = spal::schema::make_bytes_view(bytes);
  if (view.size() <= kBytesChunkSize) {
    write_chunk(view, out);
    return;
  }
  append_head(out, [](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_indef_bytestring_start(buffer, size);
  });
  for (std::size_t offset = 0; offset < view.size();
       offset += kBytesChunkSize) {
    write_chunk(view.subspan(offset, std::min(kBytesChunkSize,
                                              view.size() - offset)),
                out);
  }
  write_break(out);
}

void write_magnitude(const integer_t& magnitude, spal::schema::bytes_t& out) {
  auto bytes = spal::schema::bytes_t{};
  boost::multiprecision::export_bits(magnitude, std::back_inserter(bytes), 8);
  write_bytes(bytes, out);
}

void write_integer(const integer_t& value, spal::schema::bytes_t& out) {
  static const auto kMaxArgument =
      integer_t{std::numeric_limits<uint64_t>::max()};
  if (value >= 0) {
    if (value <= kMaxArgument) {
      write_uint(value.convert_to<uint64_t>(), out);
      return;
    }
    write_tag(kPositiveBignumTag, out);
    write_magnitude(value, out);
    return;
  }
  // A negative n travels as the argument -1 - n.
  const integer_t argument = integer_t{-1} - value;
  if (argument <= kMaxArgument) {
    const auto raw = argument.convert_to<uint64_t>();
    append_head(out, [&](unsigned char* buffer, const std::size_t size) {
      return cbor_encode_negint(raw, buffer, size);
    });
    return;
  }
  write_tag(kNegativeBignumTag, out);
  write_magnitude(argument, out);
}

void write_data(const data& value, spal::schema::bytes_t& out);

void write_list(const std::vector<data>& items, spal::schema::bytes_t& out) {
  if (items.empty()) {
    append_head(out, [](unsigned char* buffer, const std::size_t size) {
      return cbor_encode_array_start(0, buffer, size);
    });
    return;
  }
  append_head(out, [](unsigned char* buffer, const std::size_t size) {
    return cbor_encode_indef_array_start(buffer, size);
  });
  for (const auto& item : items) {
    write_data(item, out);
  }
  write_break(out);
}

void write_constr(const constr& o, spal::schema::bytes_t& out) {
  if (o.index < 7) {
    write_tag(kConstrTagSmallBase + o.index, out);
  } else if (o.index < 128) {
    write_tag(kConstrTagLargeBase + (o.index - 7), out);
  } else {
    write_tag(kConstrTagGeneral, out);
    append_head(out, [](unsigned char* buffer, const std::size_t size) {
      return cbor_encode_array_start(2, buffer, size);
    });
    write_uint(o.index, out);
  }
  write_list(o.fields, out);
}

void write_data(const data& value, spal::schema::bytes_t& out) {
  std::visit(
      overloaded{
          [&](const constr& o) { write_constr(o, out); },
          [&](const map& o) {
            append_head(out, [&](unsigned char* buffer,
                                 const std::size_t size) {
              return cbor_encode_map_start(o.entries.size(), buffer, size);
            });
            for (const auto& entry : o.entries) {
              write_data(entry.key, out);
              write_data(entry.value, out);
            }
          },
          [&](const list& o) { write_list(o.items, out); },
          [&](const integer_t& o) { write_integer(o, out); },
          [&](const spal::schema::bytes_t& o) { write_bytes(o, out); },
      },
      value.value);
}

[[noreturn]] void malformed(const std::string& message) {
  throw decoding_error{decoding_error_kind::malformed_encoding, message};
}

// One CBOR head as reported by libcbor's streaming decoder. Anything the
// callbacks below leave untouched (floats, booleans, null, undefined) stays
// `simple`.
enum class item_kind : uint8_t {
  simple,
  unsigned_integer,
  negative_integer,
  byte_string,
  byte_string_start,
  text_string,
  array,
  indefinite_array,
  map,
  indefinite_map,
  tag,
  stop,
};

struct item_head final {
  item_kind kind{item_kind::simple};
  uint64_t argument{};
  spal::schema::bytes_view_t payload;
  std::size_t size{};
};

item_head& head_of(void* context) {
  return *static_cast<item_head*>(context);
}

void set_head(void* context, const item_kind kind, const uint64_t argument) {
  auto& head = head_of(context);
  head.kind = kind;
  head.argument = argument;
}

const cbor_callbacks& head_callbacks() {
  static const auto callbacks = [] {
    auto out = cbor_empty_callbacks;
    out.uint8 = [](void* c, uint8_t v) {
      set_head(c, item_kind::unsigned_integer, v);
    };
    out.uint16 = [](void* c, uint16_t v) {
      set_head(c, item_kind::unsigned_integer, v);
    };
    out.uint32 = [](void* c, uint32_t v) {
      set_head(c, item_kind::unsigned_integer, v);
    };
    out.uint64 = [](void* c, uint64_t v) {
      set_head(c, item_kind::unsigned_integer, v);
    };
    out.negint8 = [](void* c, uint8_t v) {
      set_head(c, item_kind::negative_integer, v);
    };
    out.negint16 = [](void* c, uint16_t v) {
      set_head(c, item_kind::negative_integer, v);
    };
    out.negint32 = [](void* c, uint32_t v) {
      set_head(c, item_kind::negative_integer, v);
    };
    out.negint64 = [](void* c, uint64_t v) {
      set_head(c, item_kind::negative_integer, v);
    };
    out.byte_string = [](void* c, cbor_data bytes, uint64_t length) {
      set_head(c, item_kind::byte_string, length);
      head_of(c).payload = spal::schema::bytes_view_t{
          bytes, static_cast<std::size_t>(length)};
    };
    out.byte_string_start = [](void* c) {
      set_head(c, item_kind::byte_string_start, 0);
    };
    out.string = [](void* c, cbor_data, uint64_t length) {
      set_head(c, item_kind::text_string, length);
    };
    out.string_start = [](void* c) {
      set_head(c, item_kind::text_string, 0);
    };
    out.array_start = [](void* c, uint64_t count) {
      set_head(c, item_kind::array, count);
    };
    out.indef_array_start = [](void* c) {
      set_head(c, item_kind::indefinite_array, 0);
    };
    out.map_start = [](void* c, uint64_t count) {
      set_head(c, item_kind::map, count);
    };
    out.indef_map_start = [](void* c) {
      set_head(c, item_kind::indefinite_map, 0);
    };
    out.tag = [](void* c, uint64_t value) {
      set_head(c, item_kind::tag, value);
    };
    out.indef_break = [](void* c) { set_head(c, item_kind::stop, 0); };
    return out;
  }();
  return callbacks;
}

// Recursive descent over the heads libcbor yields, admitting only what the
// ledger's data model admits.
class reader final {
 public:
  explicit reader(const spal::schema::bytes_view_t& bytes) : bytes_{bytes} {}

  data read_data(const std::size_t depth) {
    if (depth > kMaxNestingDepth) {
      malformed("nesting exceeds " + std::to_string(kMaxNestingDepth) +
                " levels");
    }
    const auto head = next();
    switch (head.kind) {
      case item_kind::unsigned_integer:
        return data::make_integer(integer_t{head.argument});
      case item_kind::negative_integer:
        return data::make_integer(integer_t{-1} - integer_t{head.argument});
      case item_kind::byte_string:
      case item_kind::byte_string_start:
        return data::make_bytes(read_bytes(head));
      case item_kind::array:
      case item_kind::indefinite_array:
        return data::make_list(read_items(head, depth));
      case item_kind::map:
      case item_kind::indefinite_map:
        return data::make_map(read_entries(head, depth));
      case item_kind::tag:
        return read_tagged(head.argument, depth);
      case item_kind::text_string:
        malformed("text strings are not valid data");
      case item_kind::stop:
        malformed("unexpected break");
      case item_kind::simple:
        break;
    }
    malformed("simple values and floats are not valid data");
  }

  bool at_end() const { return offset_ == bytes_.size(); }

  std::size_t offset() const { return offset_; }

 private:
  item_head peek() const {
    if (offset_ >= bytes_.size()) {
      malformed("unexpected end of input at offset " +
                std::to_string(offset_));
    }
    auto head = item_head{};
    const auto result =
        cbor_stream_decode(bytes_.data() + offset_, bytes_.size() - offset_,
                           &head_callbacks(), &head);
    if (result.status == CBOR_DECODER_NEDATA) {
      malformed("truncated item at offset " + std::to_string(offset_));
    }
    if (result.status != CBOR_DECODER_FINISHED) {
      malformed("ill-formed item at offset " + std::to_string(offset_));
    }
    head.size = result.read;
    return head;
  }

  item_head next() {
    auto head = peek();
    offset_ += head.size;
    return head;
  }

  bool consume_break() {
    if (peek().kind != item_kind::stop) {
      return false;
    }
    static_cast<void>(next());
    return true;
  }

  // A definite count can never exceed the bytes left, since every item takes
  // at least one byte. Checked before reserving.
  std::size_t checked_count(const uint64_t count) const {
    if (count > (bytes_.size() - offset_)) {
      malformed("length " + std::to_string(count) + " exceeds remaining input");
    }
    return static_cast<std::size_t>(count);
  }

  static void append_chunk(const item_head& head, spal::schema::bytes_t& out) {
    if (head.payload.size() > kBytesChunkSize) {
      malformed("byte string chunk of " + std::to_string(head.payload.size()) +
                " bytes exceeds " + std::to_string(kBytesChunkSize));
    }
    out.insert(std::end(out), std::begin(head.payload),
               std::end(head.payload));
  }

  spal::schema::bytes_t read_bytes(const item_head& head) {
    auto out = spal::schema::bytes_t{};
    if (head.kind == item_kind::byte_string) {
      append_chunk(head, out);
      return out;
    }
    while (!consume_break()) {
      const auto chunk = next();
      if (chunk.kind != item_kind::byte_string) {
        malformed("indefinite byte string holds a non byte string chunk");
      }
      append_chunk(chunk, out);
    }
    return out;
  }

  std::vector<data> read_items(const item_head& head, const std::size_t depth) {
    auto items = std::vector<data>{};
    if (head.kind == item_kind::indefinite_array) {
      while (!consume_break()) {
        items.push_back(read_data(depth + 1));
      }
      return items;
    }
    const auto count = checked_count(head.argument);
    items.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      items.push_back(read_data(depth + 1));
    }
    return items;
  }

  std::vector<map_entry> read_entries(const item_head& head,
                                      const std::size_t depth) {
    auto entries = std::vector<map_entry>{};
    auto read_entry = [&] {
      auto key = read_data(depth + 1);
      auto value = read_data(depth + 1);
      entries.push_back(map_entry{.key = std::move(key),
                                  .value = std::move(value)});
    };
    if (head.kind == item_kind::indefinite_map) {
      while (!consume_break()) {
        read_entry();
      }
      return entries;
    }
    const auto count = checked_count(head.argument);
    entries.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      read_entry();
    }
    return entries;
  }

  std::vector<data> read_fields(const std::size_t depth) {
    const auto head = next();
    if (head.kind != item_kind::array &&
        head.kind != item_kind::indefinite_array) {
      malformed("constructor fields must be an array");
    }
    return read_items(head, depth);
  }

  integer_t read_bignum() {
    const auto head = next();
    if (head.kind != item_kind::byte_string &&
        head.kind != item_kind::byte_string_start) {
      malformed("bignum tag must wrap a byte string");
    }
    const auto magnitude = read_bytes(head);
    auto value = integer_t{};
    if (!magnitude.empty()) {
      boost::multiprecision::import_bits(value, std::begin(magnitude),
                                         std::end(magnitude), 8);
    }
    return value;
  }

  data read_tagged(const uint64_t tag_number, const std::size_t depth) {
    if (tag_number >= kConstrTagSmallBase &&
        tag_number < (kConstrTagSmallBase + 7)) {
      return data::make_constr(tag_number - kConstrTagSmallBase,
                               read_fields(depth));
    }
    if (tag_number >= kConstrTagLargeBase &&
        tag_number <= (kConstrTagLargeBase + 120)) {
      return data::make_constr(tag_number - kConstrTagLargeBase + 7,
                               read_fields(depth));
    }
    if (tag_number == kConstrTagGeneral) {
      const auto pair = next();
      if (pair.kind != item_kind::array || pair.argument != 2) {
        malformed("general constructor must be a two element array");
      }
      const auto index = next();
      if (index.kind != item_kind::unsigned_integer) {
        malformed("general constructor index must be unsigned");
      }
      return data::make_constr(index.argument, read_fields(depth));
    }
    if (tag_number == kPositiveBignumTag) {
      return data::make_integer(read_bignum());
    }
    if (tag_number == kNegativeBignumTag) {
      return data::make_integer(integer_t{-1} - read_bignum());
    }
    malformed("unsupported tag " + std::to_string(tag_number));
  }

  spal::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace

spal::schema::bytes_t serialize(const data& value) {
  auto out = spal::schema::bytes_t{};
  write_data(value, out);
  return out;
}

void serialize(const data& value, spal::schema::bytes_t& out) {
  write_data(value, out);
}

data deserialize(const spal::schema::bytes_view_t& bytes) {
  auto in = reader{bytes};
  auto value = in.read_data(0);
  if (!in.at_end()) {
    malformed("trailing bytes after offset " + std::to_string(in.offset()));
  }
  return value;
}

}  // namespace spal::schema::encoding::plutus

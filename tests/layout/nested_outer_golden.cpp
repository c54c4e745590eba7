#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>

#include "safebytes.hpp"
#include "support/ref_model.hpp"

// tests/layout/nested_outer_golden.cpp
//
// A padded struct nested as the first member of an outer struct that appends a
// 4-byte field. The inner 24-byte image must reappear unchanged at offset 0, the
// outer tail padding must be filled, and so must the inner struct's own padding,
// which the outer gap pass cannot see.
//
//   inner  example2 @0   (24)
//   d      u32      @24  (4)
//   -- pad          @28  (4)

struct example2 {
  std::uint8_t a;
  alignas(8) std::uint64_t b;
  std::uint16_t c;
};

struct outer {
  example2 inner;
  std::uint32_t d;
};

SB_FIELDS(example2, a, b, c);
SB_FIELDS(outer, inner, d);

static_assert(sizeof(outer) == 32);

int main() {
  using namespace sb_test::ref;

  example2 alone;
  scribble(alone, 0x11);
  alone.a = 1;
  alone.b = 2;
  alone.c = 3;
  auto const inner_image = copy(sb::safe_bytes(alone));

  outer o;
  scribble(o, 0x22);
  o.inner.a = 1;
  o.inner.b = 2;
  o.inner.c = 3;
  o.d = 0x04030201u;

  auto bytes = sb::safe_bytes(o);
  if (bytes.size() != 32) return 1;

  // inner image verbatim, interior padding included
  if (!equal(bytes.first(24), inner_image)) return 2;

  if constexpr (std::endian::native == std::endian::little) {
    if (!bytes_at(bytes, 24, {0x01, 0x02, 0x03, 0x04})) return 3;
  } else {
    if (!bytes_at(bytes, 24, {0x04, 0x03, 0x02, 0x01})) return 4;
  }

  if (!bytes_at(bytes, 28, {0xFE, 0xFE, 0xFE, 0xFE})) return 5;

  // coverage: only nested field ranges may differ from the sentinel
  if (!padding_is_sentinel(bytes, {{0, 1}, {8, 8}, {16, 2}, {24, 4}})) return 6;

  // the metadata of the nested field carries the inner layout
  auto const fields = sb::get_fields(o);
  auto const& inner = std::get<0>(fields);
  if (inner.raw != sb::field{0, 24}) return 7;
  if (std::get<1>(inner.sub).raw != sb::field{8, 8}) return 8;
  if (std::get<1>(fields).raw != sb::field{24, 4}) return 9;

  assert(o.d == 0x04030201u);
  return 0;
}

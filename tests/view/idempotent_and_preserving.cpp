#include <cassert>
#include <cstddef>
#include <cstdint>

#include "safebytes.hpp"
#include "support/ref_model.hpp"

// tests/view/idempotent_and_preserving.cpp
//
// For a few nested shapes:
//  1) two views in a row are byte-identical (the second pass rewrites the same
//     gaps with the same sentinel);
//  2) every field's bytes in the parent view equal that field's own view;
//  3) no field value changes.

struct vec3 {
  float x, y, z;
};

struct body {
  std::uint8_t id;
  vec3 pos;
  double mass;
  std::uint16_t flags[3];
};

struct world {
  std::uint32_t tick;
  body bodies[2];
  bool paused;
};

SB_FIELDS(vec3, x, y, z);
SB_FIELDS(body, id, pos, mass, flags);
SB_FIELDS(world, tick, bodies, paused);

static void populate(world& w) {
  sb_test::ref::scribble(w, 0xC3);
  w.tick = 1000;
  for (int i = 0; i < 2; ++i) {
    body& b = w.bodies[i];
    b.id = static_cast<std::uint8_t>(i + 1);
    b.pos = vec3{1.0f * i, 2.0f, 3.0f};
    b.mass = 10.0 + i;
    b.flags[0] = 1;
    b.flags[1] = 2;
    b.flags[2] = 3;
  }
  w.paused = true;
}

int main() {
  using namespace sb_test::ref;

  world w;
  populate(w);

  // 1) idempotence
  auto const first = copy(sb::safe_bytes(w));
  auto const second = copy(sb::safe_bytes(w));
  if (!equal(first, second)) return 1;

  // 2) data preservation, field by field, two levels deep
  body b1 = w.bodies[1];
  auto const body_image = copy(sb::safe_bytes(b1));
  std::size_t const b1_at = offsetof(world, bodies) + sizeof(body);
  if (!equal(std::span<std::byte const>(first).subspan(b1_at, sizeof(body)), body_image)) return 2;

  double mass = w.bodies[1].mass;
  if (!bytes_match(first, b1_at + offsetof(body, mass), raw_bytes(mass))) return 3;

  std::uint32_t tick = w.tick;
  if (!bytes_match(first, offsetof(world, tick), raw_bytes(tick))) return 4;

  // padding coverage: every byte outside the nested field ranges, taken from
  // offsetof, is the sentinel
  std::size_t const b0 = offsetof(world, bodies);
  if (!padding_is_sentinel(first, {
        {offsetof(world, tick), sizeof(std::uint32_t)},
        {b0 + offsetof(body, id), 1},
        {b0 + offsetof(body, pos), sizeof(vec3)},
        {b0 + offsetof(body, mass), sizeof(double)},
        {b0 + offsetof(body, flags), sizeof(std::uint16_t[3])},
        {b1_at + offsetof(body, id), 1},
        {b1_at + offsetof(body, pos), sizeof(vec3)},
        {b1_at + offsetof(body, mass), sizeof(double)},
        {b1_at + offsetof(body, flags), sizeof(std::uint16_t[3])},
        {offsetof(world, paused), sizeof(bool)},
      })) return 5;

  // id is followed by a gap before the 4-aligned vec3
  if (!bytes_at(first, b0 + 1, {0xFE, 0xFE, 0xFE})) return 6;

  // 3) values intact
  assert(w.tick == 1000u);
  assert(w.bodies[0].id == 1u && w.bodies[1].id == 2u);
  assert(w.bodies[1].pos.x == 1.0f);
  assert(w.bodies[1].mass == 11.0);
  assert(w.bodies[0].flags[2] == 3u);
  assert(w.paused);

  // view aliases the value
  auto view = sb::safe_bytes(w);
  if (static_cast<void const*>(view.data()) != static_cast<void const*>(&w)) return 7;

  return 0;
}

#pragma once

#include <cstdint>

namespace core {

// Xorshift32 over caller-owned state. A zero state is replaced by a fixed
// non-zero seed so the generator never gets stuck.
uint32_t NextU32(uint32_t &state);

// Uniform-ish integer in [0, bound). Returns 0 when bound is 0.
uint32_t NextBelow(uint32_t &state, uint32_t bound);

} // namespace core

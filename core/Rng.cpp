#include "core/Rng.hpp"

namespace core {

uint32_t NextU32(uint32_t &state) {
  if (state == 0u) {
    state = 0x9E3779B9u;
  }
  state ^= state << 13;
  state ^= state >> 17;
  state ^= state << 5;
  return state;
}

uint32_t NextBelow(uint32_t &state, const uint32_t bound) {
  if (bound == 0u) {
    return 0u;
  }
  return NextU32(state) % bound;
}

} // namespace core

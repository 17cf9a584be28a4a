#include "murmurhash3.hpp"

namespace sbsync {

static inline uint32_t
ROTL32(uint32_t x, int8_t r)
{
  return (x << r) | (x >> (32 - r));
}

// MurmurHash3_x86_32, little-endian block reads
uint32_t
MurmurHash3(uint32_t nHashSeed, const uint8_t* data, size_t size)
{
  uint32_t h1 = nHashSeed;
  const uint32_t c1 = 0xcc9e2d51;
  const uint32_t c2 = 0x1b873593;

  const size_t nblocks = size / 4;

  for (size_t i = 0; i < nblocks; ++i) {
    const uint8_t* block = data + i*4;
    uint32_t k1 = static_cast<uint32_t>(block[0]) |
                  (static_cast<uint32_t>(block[1]) << 8) |
                  (static_cast<uint32_t>(block[2]) << 16) |
                  (static_cast<uint32_t>(block[3]) << 24);

    k1 *= c1;
    k1 = ROTL32(k1, 15);
    k1 *= c2;

    h1 ^= k1;
    h1 = ROTL32(h1, 13);
    h1 = h1 * 5 + 0xe6546b64;
  }

  const uint8_t* tail = data + nblocks*4;
  uint32_t k1 = 0;

  switch (size & 3) {
    case 3:
      k1 ^= static_cast<uint32_t>(tail[2]) << 16;
      // fall through
    case 2:
      k1 ^= static_cast<uint32_t>(tail[1]) << 8;
      // fall through
    case 1:
      k1 ^= tail[0];
      k1 *= c1;
      k1 = ROTL32(k1, 15);
      k1 *= c2;
      h1 ^= k1;
  }

  h1 ^= static_cast<uint32_t>(size);
  h1 ^= h1 >> 16;
  h1 *= 0x85ebca6b;
  h1 ^= h1 >> 13;
  h1 *= 0xc2b2ae35;
  h1 ^= h1 >> 16;

  return h1;
}

} // namespace sbsync

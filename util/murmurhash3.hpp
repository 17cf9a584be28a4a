#ifndef SBSYNC_UTIL_MURMURHASH3_HPP
#define SBSYNC_UTIL_MURMURHASH3_HPP

#include <inttypes.h>
#include <cstddef>
#include <string>

namespace sbsync {

uint32_t
MurmurHash3(uint32_t nHashSeed, const uint8_t* data, size_t size);

inline uint32_t
MurmurHash3(uint32_t nHashSeed, const std::string& data)
{
  return MurmurHash3(nHashSeed, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace sbsync

#endif // SBSYNC_UTIL_MURMURHASH3_HPP

#ifndef PLX_HASH_H
#define PLX_HASH_H

#include <cstdint>
#include <cstdio>
#include <string>

// 64-bit FNV-1a, used for content-addressable output names
inline uint64_t plx_fnv1a64(const std::string& data)
{
  const uint64_t FNV_OFFSET = 1469598103934665603ULL;
  const uint64_t FNV_PRIME = 1099511628211ULL;
  uint64_t h = FNV_OFFSET;
  for (unsigned char c : data) {
    h ^= c;
    h *= FNV_PRIME;
  }
  return h;
}

inline std::string plx_fnv1a64_hex(const std::string& data)
{
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(plx_fnv1a64(data)));
  return std::string(buf);
}

#endif // PLX_HASH_H

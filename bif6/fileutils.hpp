#pragma once

#include <cstdint>
#include <cstring>
#include <istream>

namespace bif6 {

// BIF6 stores every multi-byte field little-endian.

inline uint16_t read_le16(const char* buf) {
  const unsigned char* p = reinterpret_cast<const unsigned char*>(buf);
  return static_cast<uint16_t>(p[0]) |
         static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

inline uint32_t read_le32(const char* buf) {
  const unsigned char* p = reinterpret_cast<const unsigned char*>(buf);
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline float read_le_float(const char* buf) {
  uint32_t bits = read_le32(buf);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

// reads up to n bytes, returns the number actually read
inline size_t read_some(std::istream& stream, char* buf, size_t n) {
  stream.read(buf, std::streamsize(n));
  return size_t(stream.gcount());
}

}

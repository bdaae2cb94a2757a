#pragma once

#include "bif6/errors.hpp"
#include "bif6/fileutils.hpp"

#include <cstdint>
#include <cstring>
#include <istream>
#include <string>

namespace bif6 {

const char MAGIC[6] = {'\0', '\0', 'B', 'I', 'F', '6'};
const size_t MAGIC_SIZE = sizeof(MAGIC);
const size_t HEADER_SIZE = MAGIC_SIZE + 3 * sizeof(uint16_t);

struct FileHeader {
  // advisory: the record sequence itself is terminated by end of file
  uint16_t interval_count;
  uint16_t width;
  uint16_t height;

  FileHeader() : interval_count(0), width(0), height(0) {}

  uint64_t pixelCount() const { return uint64_t(width) * height; }

  static bool hasMagic(const char* buf) {
    return std::memcmp(buf, MAGIC, MAGIC_SIZE) == 0;
  }

  void read(std::istream& stream) {
    char buf[HEADER_SIZE];
    size_t n = read_some(stream, buf, HEADER_SIZE);
    if (stream.bad())
      throw IOError("read error in BIF6 header");

    Location where{0, FormatError::HEADER};
    if (n < MAGIC_SIZE)
      throw FormatError(FormatError::Truncated,
          "file is too short to be a BIF6 file", where);
    if (!hasMagic(buf))
      throw FormatError(FormatError::InvalidMagic,
          "invalid BIF6 magic, not a BIF6 file?", where);
    if (n < HEADER_SIZE) {
      where.offset = n;
      throw FormatError(FormatError::Truncated, "incomplete BIF6 header", where);
    }

    interval_count = read_le16(buf + 6);
    width = read_le16(buf + 8);
    height = read_le16(buf + 10);
  }
};

}

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace bif6 {

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

// Position of a field inside the stream, used to annotate format errors.
struct Location {
  uint64_t offset;
  int64_t record;
};

class FormatError : public std::runtime_error {
 public:
  enum Kind {
    InvalidMagic,
    Truncated,
    InvalidDimensions,
    InvalidRange
  };

  enum : int64_t { HEADER = -1 };

  FormatError(Kind kind, const std::string& str, const Location& where) :
      std::runtime_error(formatMessage(str, where)),
      kind_(kind), offset_(where.offset), record_(where.record)
  {
  }

  Kind kind() const { return kind_; }

  // byte offset at which the offending field starts
  uint64_t offset() const { return offset_; }

  // zero-based record index, or HEADER
  int64_t record() const { return record_; }

  static const char* kindName(Kind kind) {
    switch (kind) {
      case InvalidMagic: return "invalid magic";
      case Truncated: return "truncated";
      case InvalidDimensions: return "invalid dimensions";
      case InvalidRange: return "invalid m/z range";
    }
    return "unknown";
  }

 private:
  Kind kind_;
  uint64_t offset_;
  int64_t record_;

  static std::string formatMessage(const std::string& str, const Location& where) {
    std::ostringstream ss;
    ss << str << " (";
    if (where.record == HEADER)
      ss << "header";
    else
      ss << "record " << where.record;
    ss << ", offset " << where.offset << ")";
    return ss.str();
  }
};

}

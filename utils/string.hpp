#pragma once

#include <string>

namespace utils {

  inline bool endsWith(const std::string& s, const std::string& tail) {
    if (s.length() < tail.length())
      return false;
    return s.compare(s.length() - tail.length(), tail.length(), tail) == 0;
  }

}

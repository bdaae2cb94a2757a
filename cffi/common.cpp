#include "cffi/common.hpp"

#include <string>

namespace cffi {
  // one message per thread, readers on different threads don't interfere
  static thread_local std::string last_error;

  void setErrorMessage(const std::string& e) {
    last_error = e;
  }

  void clearErrorMessage() {
    last_error.clear();
  }
}

extern "C" {

  SIMS_EXTERN const char* sims_strerror() {
    return cffi::last_error.c_str();
  }
}

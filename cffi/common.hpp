#pragma once

#if defined _WIN32
  #define SIMS_EXTERN __declspec(dllexport)
#else
  #define SIMS_EXTERN __attribute__ ((visibility ("default")))
#endif

extern "C" {
  SIMS_EXTERN const char* sims_strerror();
}

#include <string>
#include <exception>
#include <functional>

namespace cffi {
  void setErrorMessage(const std::string& e);
  void clearErrorMessage();

  template <typename R>
  R wrap_catch(R on_error, std::function<R()>&& setter) {
    clearErrorMessage();
    try {
      return setter();
    } catch (std::exception& e) {
      setErrorMessage(e.what());
      return on_error;
    }
  }
}

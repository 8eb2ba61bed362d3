#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace hrrr::common {

// Exception type for internal errors (library bugs, not bad input)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in the hrrr inventory library.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace hrrr::common

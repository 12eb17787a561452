#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace ctxerr::common {

// Exception type for generator bugs (broken invariants between pipeline
// stages), never for rejected user input
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in ctxerr, not in the item description.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace ctxerr::common

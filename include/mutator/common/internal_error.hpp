#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mutator::common {

// Broken pass invariant (a mutator bug). Malformed input is reported through
// Diagnostic instead.
class InternalError : public std::logic_error {
 public:
  InternalError(std::string_view component, const std::string& detail)
      : std::logic_error(
            std::format("internal error in {}: {}", component, detail)),
        component_(component) {
  }

  [[nodiscard]] auto Component() const -> const std::string& {
    return component_;
  }

 private:
  std::string component_;
};

template <typename... Args>
[[noreturn]] void ThrowInternalError(
    std::string_view component, std::format_string<Args...> fmt,
    Args&&... args) {
  throw InternalError(
      component, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace mutator::common

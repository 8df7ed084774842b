#include "mutator/mutation/options.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace mutator::mutation {

auto KeySlotName(KeySlot slot) -> std::string {
  return std::format("KeyI{}", static_cast<uint32_t>(slot));
}

auto ParseKeySlot(std::string_view name) -> std::optional<KeySlot> {
  constexpr std::string_view kPrefix = "KeyI";
  if (!name.starts_with(kPrefix)) {
    return std::nullopt;
  }
  std::string_view digits = name.substr(kPrefix.size());
  if (digits.empty() || digits.size() > 2) {
    return std::nullopt;
  }
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  if (digits.size() == 2 && digits[0] == '0') {
    return std::nullopt;
  }

  uint32_t value = 0;
  for (char c : digits) {
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value >= kKeySlotCount) {
    return std::nullopt;
  }
  return static_cast<KeySlot>(value);
}

}  // namespace mutator::mutation

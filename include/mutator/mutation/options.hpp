#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "mutator/il/instruction.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::mutation {

// Well-known configuration integers referenced by key-field markers.
enum class KeySlot : uint8_t {
  kKeyI0,
  kKeyI1,
  kKeyI2,
  kKeyI3,
  kKeyI4,
  kKeyI5,
  kKeyI6,
  kKeyI7,
  kKeyI8,
  kKeyI9,
  kKeyI10,
  kKeyI11,
  kKeyI12,
  kKeyI13,
  kKeyI14,
  kKeyI15,
};

inline constexpr size_t kKeySlotCount = 16;

// "KeyI<n>" for slot n.
auto KeySlotName(KeySlot slot) -> std::string;

// Accepts exactly "KeyI" followed by 0..15: one digit, or two digits without
// a leading zero. Everything else (including "KeyI16" and "KeyI01") is
// rejected.
auto ParseKeySlot(std::string_view name) -> std::optional<KeySlot>;

using KeyValueMap = absl::flat_hash_map<KeySlot, int32_t>;

// Rewrites the instructions computing a placeholder's argument. Receives the
// isolated argument span (never the marker call itself) and returns the
// replacement for "argument; call Placeholder".
using PlaceholderTransform = std::function<std::vector<il::Instruction>(
    std::span<const il::Instruction> argument)>;

// Expands a crypt marker. Receives the owning procedure and the locals
// holding the data block and the key; returns the replacement for
// "ldloc block; ldloc key; call Crypt".
using CryptTransform = std::function<std::vector<il::Instruction>(
    const il::Procedure& procedure, const il::Local& block,
    const il::Local& key)>;

// Pass configuration. Must be complete before the pass runs and is not
// mutated while it runs.
struct MutationOptions {
  KeyValueMap key_values;
  PlaceholderTransform placeholder;  // Empty: placeholder markers fail
  CryptTransform crypt;              // Empty: crypt markers fail
};

}  // namespace mutator::mutation

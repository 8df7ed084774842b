#include "mutator/il/procedure.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace mutator::il {

auto Procedure::AddLocal(std::string name) -> const Local* {
  locals_.push_back(
      Local{
          .index = static_cast<uint32_t>(locals_.size()),
          .name = std::move(name),
      });
  return &locals_.back();
}

auto Procedure::InternLabel(std::string_view name) -> const Label* {
  if (const Label* existing = FindLabel(name)) {
    return existing;
  }
  labels_.push_back(Label{.name = std::string(name)});
  return &labels_.back();
}

auto Procedure::FindLocal(std::string_view name) const -> const Local* {
  for (const auto& local : locals_) {
    if (local.name == name) {
      return &local;
    }
  }
  return nullptr;
}

auto Procedure::FindLabel(std::string_view name) const -> const Label* {
  for (const auto& label : labels_) {
    if (label.name == name) {
      return &label;
    }
  }
  return nullptr;
}

}  // namespace mutator::il

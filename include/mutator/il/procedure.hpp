#pragma once

#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mutator/il/instruction.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::il {

// A procedure owns its locals and labels (stable addresses) and its body.
// The body is a plain vector: passes address it by index and never hold an
// iterator across a mutation.
class Procedure final {
 public:
  Procedure(std::string name, bool returns_value)
      : name_(std::move(name)), returns_value_(returns_value) {
  }

  Procedure(const Procedure&) = delete;
  auto operator=(const Procedure&) -> Procedure& = delete;

  Procedure(Procedure&&) = default;
  auto operator=(Procedure&&) -> Procedure& = default;

  ~Procedure() = default;

  auto AddLocal(std::string name) -> const Local*;

  // Returns the existing label of that name, or creates it.
  auto InternLabel(std::string_view name) -> const Label*;

  [[nodiscard]] auto FindLocal(std::string_view name) const -> const Local*;
  [[nodiscard]] auto FindLabel(std::string_view name) const -> const Label*;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto ReturnsValue() const -> bool {
    return returns_value_;
  }

  [[nodiscard]] auto Locals() const -> const std::deque<Local>& {
    return locals_;
  }

  [[nodiscard]] auto Labels() const -> const std::deque<Label>& {
    return labels_;
  }

  auto Body() -> std::vector<Instruction>& {
    return body_;
  }

  [[nodiscard]] auto Body() const -> const std::vector<Instruction>& {
    return body_;
  }

 private:
  std::string name_;
  bool returns_value_ = false;
  std::deque<Local> locals_;
  std::deque<Label> labels_;
  std::vector<Instruction> body_;
};

}  // namespace mutator::il

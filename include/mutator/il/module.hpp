#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"

namespace mutator::il {

// Owns the symbolic types, their members and the procedures of a module.
// Element addresses are stable for the lifetime of the module (including
// across moves), so instructions may point at them directly.
class Module final {
 public:
  Module() = default;
  ~Module() = default;

  Module(const Module&) = delete;
  auto operator=(const Module&) -> Module& = delete;

  Module(Module&&) = default;
  auto operator=(Module&&) -> Module& = default;

  auto AddType(std::string name) -> const TypeDef*;
  auto AddField(const TypeDef* owner, std::string name) -> const FieldDef*;
  auto AddMethod(
      const TypeDef* owner, std::string name, uint32_t param_count,
      bool returns_value) -> const MethodDef*;
  auto AddProcedure(std::string name, bool returns_value) -> Procedure&;

  [[nodiscard]] auto FindType(std::string_view name) const -> const TypeDef*;
  [[nodiscard]] auto FindField(const TypeDef* owner, std::string_view name) const
      -> const FieldDef*;
  [[nodiscard]] auto FindMethod(
      const TypeDef* owner, std::string_view name) const -> const MethodDef*;
  [[nodiscard]] auto FindProcedure(std::string_view name) -> Procedure*;

  [[nodiscard]] auto Types() const -> const std::deque<TypeDef>& {
    return types_;
  }

  [[nodiscard]] auto Fields() const -> const std::deque<FieldDef>& {
    return fields_;
  }

  [[nodiscard]] auto Methods() const -> const std::deque<MethodDef>& {
    return methods_;
  }

  auto Procedures() -> std::deque<Procedure>& {
    return procedures_;
  }

  [[nodiscard]] auto Procedures() const -> const std::deque<Procedure>& {
    return procedures_;
  }

 private:
  std::deque<TypeDef> types_;
  std::deque<FieldDef> fields_;
  std::deque<MethodDef> methods_;
  std::deque<Procedure> procedures_;
};

}  // namespace mutator::il

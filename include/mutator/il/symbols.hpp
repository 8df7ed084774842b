#pragma once

#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace mutator::il {

// Symbols are owned by Module (types, fields, methods) or Procedure (locals,
// labels) in node-stable storage. Instructions refer to them by pointer and
// all comparisons are by identity, never by name.

struct TypeDef {
  std::string name;
};

struct FieldDef {
  std::string name;
  const TypeDef* declaring_type = nullptr;

  [[nodiscard]] auto QualifiedName() const -> std::string {
    return fmt::format("{}.{}", declaring_type->name, name);
  }
};

struct MethodDef {
  std::string name;
  const TypeDef* declaring_type = nullptr;
  uint32_t param_count = 0;
  bool returns_value = false;

  [[nodiscard]] auto QualifiedName() const -> std::string {
    return fmt::format("{}.{}", declaring_type->name, name);
  }
};

struct Local {
  uint32_t index = 0;
  std::string name;
};

struct Label {
  std::string name;
};

}  // namespace mutator::il

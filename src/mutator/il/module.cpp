#include "mutator/il/module.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "mutator/il/procedure.hpp"

namespace mutator::il {

auto Module::AddType(std::string name) -> const TypeDef* {
  types_.push_back(TypeDef{.name = std::move(name)});
  return &types_.back();
}

auto Module::AddField(const TypeDef* owner, std::string name)
    -> const FieldDef* {
  fields_.push_back(FieldDef{.name = std::move(name), .declaring_type = owner});
  return &fields_.back();
}

auto Module::AddMethod(
    const TypeDef* owner, std::string name, uint32_t param_count,
    bool returns_value) -> const MethodDef* {
  methods_.push_back(
      MethodDef{
          .name = std::move(name),
          .declaring_type = owner,
          .param_count = param_count,
          .returns_value = returns_value,
      });
  return &methods_.back();
}

auto Module::AddProcedure(std::string name, bool returns_value)
    -> Procedure& {
  procedures_.emplace_back(std::move(name), returns_value);
  return procedures_.back();
}

auto Module::FindType(std::string_view name) const -> const TypeDef* {
  for (const auto& type : types_) {
    if (type.name == name) {
      return &type;
    }
  }
  return nullptr;
}

auto Module::FindField(const TypeDef* owner, std::string_view name) const
    -> const FieldDef* {
  for (const auto& field : fields_) {
    if (field.declaring_type == owner && field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

auto Module::FindMethod(const TypeDef* owner, std::string_view name) const
    -> const MethodDef* {
  for (const auto& method : methods_) {
    if (method.declaring_type == owner && method.name == name) {
      return &method;
    }
  }
  return nullptr;
}

auto Module::FindProcedure(std::string_view name) -> Procedure* {
  for (auto& proc : procedures_) {
    if (proc.Name() == name) {
      return &proc;
    }
  }
  return nullptr;
}

}  // namespace mutator::il

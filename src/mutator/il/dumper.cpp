#include "mutator/il/dumper.hpp"

#include <format>
#include <ostream>
#include <sstream>
#include <string>

#include "mutator/il/instruction.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::il {

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  --indent_;
}

void Dumper::Dump(const Module& module) {
  for (const auto& type : module.Types()) {
    *out_ << std::format("type {}\n", type.name);
  }
  for (const auto& field : module.Fields()) {
    *out_ << std::format("field {}\n", field.QualifiedName());
  }
  for (const auto& method : module.Methods()) {
    *out_ << std::format(
        "method {}({}){}\n", method.QualifiedName(), method.param_count,
        method.returns_value ? " -> value" : "");
  }
  for (const auto& proc : module.Procedures()) {
    *out_ << "\n";
    Dump(proc);
  }
}

void Dumper::Dump(const Procedure& proc) {
  PrintIndent();
  *out_ << std::format(
      "proc {}{}\n", proc.Name(), proc.ReturnsValue() ? " -> value" : "");
  Indent();
  for (const auto& local : proc.Locals()) {
    PrintIndent();
    *out_ << std::format("local {}\n", local.name);
  }
  for (const auto& instr : proc.Body()) {
    PrintIndent();
    *out_ << instr.ToString() << "\n";
  }
  Dedent();
  PrintIndent();
  *out_ << "end\n";
}

auto DumpToString(const Module& module) -> std::string {
  std::ostringstream out;
  Dumper dumper(&out);
  dumper.Dump(module);
  return out.str();
}

auto DumpToString(const Procedure& proc) -> std::string {
  std::ostringstream out;
  Dumper dumper(&out);
  dumper.Dump(proc);
  return out.str();
}

}  // namespace mutator::il

#pragma once

#include <ostream>
#include <string>

#include "mutator/il/module.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::il {

// Writes modules in the textual listing format accepted by ReadModule.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const Module& module);
  void Dump(const Procedure& proc);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  std::ostream* out_;
  int indent_ = 0;
};

// Convenience: dump a module or a single procedure to a string.
auto DumpToString(const Module& module) -> std::string;
auto DumpToString(const Procedure& proc) -> std::string;

}  // namespace mutator::il

#include "mutator/il/reader.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"

namespace mutator::il {

namespace {

auto Tokenize(std::string_view line) -> std::vector<std::string_view> {
  if (auto hash = line.find('#'); hash != std::string_view::npos) {
    line = line.substr(0, hash);
  }
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() &&
           (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r')) {
      ++pos;
    }
    size_t start = pos;
    while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' &&
           line[pos] != '\r') {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(line.substr(start, pos - start));
    }
  }
  return tokens;
}

class ListingReader {
 public:
  explicit ListingReader(std::string_view source_name)
      : source_name_(source_name) {
  }

  auto Read(std::string_view text) -> Result<Module> {
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t eol = text.find('\n', pos);
      if (eol == std::string_view::npos) {
        eol = text.size();
      }
      ++line_;
      auto result = ReadLine(Tokenize(text.substr(pos, eol - pos)));
      if (!result) {
        return std::unexpected(std::move(result.error()));
      }
      pos = eol + 1;
    }
    if (proc_ != nullptr) {
      return Fail(std::format("procedure '{}' is missing 'end'", proc_->Name()));
    }
    return std::move(module_);
  }

 private:
  auto Fail(std::string msg) const -> std::unexpected<Diagnostic> {
    return std::unexpected(
        Diagnostic::HostError(
            FileLocation{.path = std::string(source_name_), .line = line_},
            std::move(msg)));
  }

  auto ReadLine(const std::vector<std::string_view>& tokens) -> Result<void> {
    if (tokens.empty()) {
      return {};
    }
    if (proc_ != nullptr) {
      return ReadProcedureLine(tokens);
    }

    std::string_view directive = tokens[0];
    if (directive == "type") {
      if (tokens.size() != 2) {
        return Fail("expected 'type <name>'");
      }
      if (module_.FindType(tokens[1]) != nullptr) {
        return Fail(std::format("duplicate type '{}'", tokens[1]));
      }
      module_.AddType(std::string(tokens[1]));
      return {};
    }
    if (directive == "field") {
      return ReadField(tokens);
    }
    if (directive == "method") {
      return ReadMethod(tokens);
    }
    if (directive == "proc") {
      return ReadProcHeader(tokens);
    }
    return Fail(std::format("unknown directive '{}'", directive));
  }

  // Splits "Type.Member" at the last '.' and resolves the type.
  auto ResolveOwner(std::string_view qualified)
      -> Result<std::pair<const TypeDef*, std::string_view>> {
    auto dot = qualified.rfind('.');
    if (dot == std::string_view::npos || dot == 0 ||
        dot + 1 == qualified.size()) {
      return Fail(
          std::format("expected qualified member name, got '{}'", qualified));
    }
    std::string_view type_name = qualified.substr(0, dot);
    const TypeDef* owner = module_.FindType(type_name);
    if (owner == nullptr) {
      return Fail(std::format("undefined type '{}'", type_name));
    }
    return std::pair{owner, qualified.substr(dot + 1)};
  }

  auto ReadField(const std::vector<std::string_view>& tokens) -> Result<void> {
    if (tokens.size() != 2) {
      return Fail("expected 'field <Type.Name>'");
    }
    auto owner = ResolveOwner(tokens[1]);
    if (!owner) {
      return std::unexpected(std::move(owner.error()));
    }
    auto [type, name] = *owner;
    if (module_.FindField(type, name) != nullptr) {
      return Fail(std::format("duplicate field '{}'", tokens[1]));
    }
    module_.AddField(type, std::string(name));
    return {};
  }

  auto ReadMethod(const std::vector<std::string_view>& tokens)
      -> Result<void> {
    bool returns_value = false;
    if (tokens.size() == 4 && tokens[2] == "->" && tokens[3] == "value") {
      returns_value = true;
    } else if (tokens.size() != 2) {
      return Fail("expected 'method <Type.Name>(<params>) [-> value]'");
    }

    std::string_view signature = tokens[1];
    auto open = signature.find('(');
    if (open == std::string_view::npos || signature.back() != ')') {
      return Fail(std::format("malformed method signature '{}'", signature));
    }
    std::string_view count_text =
        signature.substr(open + 1, signature.size() - open - 2);
    uint32_t param_count = 0;
    auto [ptr, ec] = std::from_chars(
        count_text.data(), count_text.data() + count_text.size(), param_count);
    if (ec != std::errc{} || ptr != count_text.data() + count_text.size() ||
        count_text.empty()) {
      return Fail(std::format("malformed parameter count '{}'", count_text));
    }

    auto owner = ResolveOwner(signature.substr(0, open));
    if (!owner) {
      return std::unexpected(std::move(owner.error()));
    }
    auto [type, name] = *owner;
    if (module_.FindMethod(type, name) != nullptr) {
      return Fail(
          std::format("duplicate method '{}'", signature.substr(0, open)));
    }
    module_.AddMethod(type, std::string(name), param_count, returns_value);
    return {};
  }

  auto ReadProcHeader(const std::vector<std::string_view>& tokens)
      -> Result<void> {
    bool returns_value = false;
    if (tokens.size() == 4 && tokens[2] == "->" && tokens[3] == "value") {
      returns_value = true;
    } else if (tokens.size() != 2) {
      return Fail("expected 'proc <name> [-> value]'");
    }
    if (module_.FindProcedure(tokens[1]) != nullptr) {
      return Fail(std::format("duplicate procedure '{}'", tokens[1]));
    }
    proc_ = &module_.AddProcedure(std::string(tokens[1]), returns_value);
    defined_labels_.clear();
    return {};
  }

  auto ReadProcedureLine(const std::vector<std::string_view>& tokens)
      -> Result<void> {
    std::string_view head = tokens[0];
    if (head == "end") {
      if (tokens.size() != 1) {
        return Fail("unexpected tokens after 'end'");
      }
      for (const auto& label : proc_->Labels()) {
        if (!defined_labels_.contains(label.name)) {
          return Fail(
              std::format(
                  "label '{}' referenced but not defined in '{}'", label.name,
                  proc_->Name()));
        }
      }
      proc_ = nullptr;
      return {};
    }
    if (head == "local") {
      if (tokens.size() != 2) {
        return Fail("expected 'local <name>'");
      }
      if (!proc_->Body().empty()) {
        return Fail("locals must be declared before the first instruction");
      }
      if (proc_->FindLocal(tokens[1]) != nullptr) {
        return Fail(std::format("duplicate local '{}'", tokens[1]));
      }
      proc_->AddLocal(std::string(tokens[1]));
      return {};
    }

    auto opcode = ParseOpcode(head);
    if (!opcode) {
      return Fail(std::format("unknown instruction '{}'", head));
    }
    const OpcodeInfo& info = GetOpcodeInfo(*opcode);
    size_t expected_tokens = info.operand == OperandKind::kNone ? 1 : 2;
    if (tokens.size() != expected_tokens) {
      return Fail(
          std::format(
              "'{}' takes {} operand", head,
              expected_tokens == 1 ? "no" : "one"));
    }

    auto instr = ReadOperand(*opcode, info.operand, tokens);
    if (!instr) {
      return std::unexpected(std::move(instr.error()));
    }
    proc_->Body().push_back(*instr);
    return {};
  }

  auto ReadOperand(
      Opcode opcode, OperandKind kind,
      const std::vector<std::string_view>& tokens) -> Result<Instruction> {
    switch (kind) {
      case OperandKind::kNone:
        return Instruction::Simple(opcode);

      case OperandKind::kInt32: {
        auto value = ParseInt32(tokens[1]);
        if (!value) {
          return Fail(std::format("malformed integer '{}'", tokens[1]));
        }
        return Instruction{.opcode = opcode, .operand = *value};
      }

      case OperandKind::kLocal: {
        const Local* local = proc_->FindLocal(tokens[1]);
        if (local == nullptr) {
          return Fail(std::format("undefined local '{}'", tokens[1]));
        }
        return Instruction{.opcode = opcode, .operand = local};
      }

      case OperandKind::kField: {
        auto owner = ResolveOwner(tokens[1]);
        if (!owner) {
          return std::unexpected(std::move(owner.error()));
        }
        const FieldDef* field = module_.FindField(owner->first, owner->second);
        if (field == nullptr) {
          return Fail(std::format("undefined field '{}'", tokens[1]));
        }
        return Instruction{.opcode = opcode, .operand = field};
      }

      case OperandKind::kMethod: {
        auto owner = ResolveOwner(tokens[1]);
        if (!owner) {
          return std::unexpected(std::move(owner.error()));
        }
        const MethodDef* method =
            module_.FindMethod(owner->first, owner->second);
        if (method == nullptr) {
          return Fail(std::format("undefined method '{}'", tokens[1]));
        }
        return Instruction{.opcode = opcode, .operand = method};
      }

      case OperandKind::kLabel: {
        if (opcode == Opcode::kLabel) {
          auto [_, inserted] = defined_labels_.emplace(tokens[1]);
          if (!inserted) {
            return Fail(std::format("duplicate label '{}'", tokens[1]));
          }
        }
        return Instruction{
            .opcode = opcode, .operand = proc_->InternLabel(tokens[1])};
      }
    }
    return Fail("unhandled operand kind");
  }

  std::string_view source_name_;
  uint32_t line_ = 0;
  Module module_;
  Procedure* proc_ = nullptr;
  std::unordered_set<std::string> defined_labels_;
};

}  // namespace

auto ParseInt32(std::string_view text) -> std::optional<int32_t> {
  bool negative = false;
  if (!text.empty() && text[0] == '-') {
    negative = true;
    text.remove_prefix(1);
  }
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    text.remove_prefix(2);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  uint64_t magnitude = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), magnitude, base);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }

  if (negative) {
    constexpr uint64_t kMaxNegative =
        static_cast<uint64_t>(std::numeric_limits<int32_t>::max()) + 1;
    if (magnitude > kMaxNegative) {
      return std::nullopt;
    }
    return static_cast<int32_t>(-static_cast<int64_t>(magnitude));
  }
  if (magnitude > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<int32_t>(static_cast<uint32_t>(magnitude));
}

auto ReadModule(std::string_view text, std::string_view source_name)
    -> Result<Module> {
  ListingReader reader(source_name);
  return reader.Read(text);
}

auto ReadModuleFile(const std::filesystem::path& path) -> Result<Module> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open listing '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ReadModule(buffer.str(), path.string());
}

}  // namespace mutator::il

#include "mutator/mutation/crypt_expander.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/symbols.hpp"
#include "mutator/mutation/splice.hpp"

namespace mutator::mutation {

namespace {

constexpr size_t kCryptPatternLength = 3;

}  // namespace

auto CryptExpander::Expand(il::Procedure& procedure, size_t call_index) const
    -> Result<Splice> {
  InstrLocation loc{.procedure = procedure.Name(), .index = call_index};

  if (transform_ == nullptr || !*transform_) {
    return std::unexpected(
        Diagnostic::ConfigError(
            ErrorCode::kMissingProcessor, loc,
            "found mutation crypt, but no crypt processor is configured"));
  }

  auto& body = procedure.Body();
  if (call_index < 2) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kMalformedCryptOperands, loc,
            "crypt marker must be preceded by 'ldloc <block>; ldloc <key>'"));
  }

  size_t start = call_index - 2;
  const il::Instruction& load_block = body[start];
  const il::Instruction& load_key = body[start + 1];
  if (load_block.opcode != il::Opcode::kLoadLocal ||
      load_key.opcode != il::Opcode::kLoadLocal) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kMalformedCryptOperands, loc,
            std::format(
                "crypt marker must be preceded by 'ldloc <block>; ldloc "
                "<key>', found '{}; {}'",
                load_block.ToString(), load_key.ToString())));
  }

  const il::Local* block = load_block.AsLocal();
  const il::Local* key = load_key.AsLocal();
  SpliceBody(body, start, kCryptPatternLength, {});

  std::vector<il::Instruction> replacement =
      (*transform_)(procedure, *block, *key);
  Splice splice = SpliceBody(body, start, 0, std::move(replacement));

  spdlog::debug(
      "{}@{}: crypt(block={}, key={}) expanded to {} instructions",
      procedure.Name(), start, block->name, key->name, splice.length);
  return splice;
}

}  // namespace mutator::mutation

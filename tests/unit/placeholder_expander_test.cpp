#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include "mutator/analysis/stack_tracer.hpp"
#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/internal_error.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/options.hpp"
#include "mutator/mutation/placeholder_expander.hpp"
#include "tests/common/marker_module.hpp"

namespace mutator::mutation {
namespace {

using il::Instruction;
using il::Opcode;
using test::Ldc;
using test::MarkerModule;
using test::Op;

// Returns a fixed trace regardless of the body.
class FixedTracer : public analysis::ProvenanceTracer {
 public:
  explicit FixedTracer(std::vector<size_t> starts)
      : starts_(std::move(starts)) {
  }

  [[nodiscard]] auto TraceArguments(
      const il::Procedure& /*procedure*/, size_t /*consumer_index*/) const
      -> Result<std::vector<size_t>> override {
    return starts_;
  }

 private:
  std::vector<size_t> starts_;
};

class PlaceholderExpanderTest : public ::testing::Test {
 protected:
  MarkerModule m_;
  il::Procedure& proc_ = m_.module.AddProcedure("Expand", true);
  const il::Local* x_ = proc_.AddLocal("x");
  analysis::StackTracer tracer_;

  // Records the span it was given and returns a fixed replacement.
  std::vector<Instruction> received_;
  std::vector<Instruction> replacement_ = {Ldc(9), Ldc(10), Op(Opcode::kXor)};
  PlaceholderTransform transform_ =
      [this](std::span<const Instruction> argument) {
        received_.assign(argument.begin(), argument.end());
        return replacement_;
      };
};

TEST_F(PlaceholderExpanderTest, ReplacesArgumentAndCall) {
  proc_.Body() = {
      Ldc(100), Instruction::LoadLocal(x_), Op(Opcode::kNeg),
      Instruction::Call(m_.placeholder), Op(Opcode::kAdd), Op(Opcode::kReturn)};

  PlaceholderExpander expander(&tracer_, &transform_);
  auto splice = expander.Expand(proc_, 3);
  ASSERT_TRUE(splice.has_value());

  std::vector<Instruction> expected_arg = {
      Instruction::LoadLocal(x_), Op(Opcode::kNeg)};
  EXPECT_EQ(received_, expected_arg);

  std::vector<Instruction> expected = {
      Ldc(100),         Ldc(9),          Ldc(10), Op(Opcode::kXor),
      Op(Opcode::kAdd), Op(Opcode::kReturn)};
  EXPECT_EQ(proc_.Body(), expected);
  EXPECT_EQ(splice->start, 1U);
  EXPECT_EQ(splice->length, 3U);
  EXPECT_EQ(splice->End(), 4U);
}

TEST_F(PlaceholderExpanderTest, EmptyReplacement) {
  replacement_.clear();
  proc_.Body() = {
      Instruction::LoadLocal(x_), Instruction::Call(m_.placeholder),
      Op(Opcode::kReturn)};

  PlaceholderExpander expander(&tracer_, &transform_);
  auto splice = expander.Expand(proc_, 1);
  ASSERT_TRUE(splice.has_value());
  EXPECT_EQ(splice->start, 0U);
  EXPECT_EQ(splice->length, 0U);
  EXPECT_EQ(proc_.Body(), std::vector<Instruction>{Op(Opcode::kReturn)});
}

TEST_F(PlaceholderExpanderTest, MissingProcessorCheckedBeforeTracing) {
  // The argument is not traceable either; the configuration error wins.
  proc_.Body() = {Op(Opcode::kAdd), Instruction::Call(m_.placeholder)};
  std::vector<Instruction> before = proc_.Body();

  PlaceholderTransform empty;
  PlaceholderExpander expander(&tracer_, &empty);
  auto splice = expander.Expand(proc_, 1);
  ASSERT_FALSE(splice.has_value());
  EXPECT_EQ(splice.error().Code(), ErrorCode::kMissingProcessor);
  EXPECT_EQ(splice.error().primary.kind, DiagKind::kConfigError);
  EXPECT_EQ(proc_.Body(), before);
}

TEST_F(PlaceholderExpanderTest, TraceFailureLeavesBodyUntouched) {
  const il::Label* label = proc_.InternLabel("L");
  proc_.Body() = {
      Instruction::LoadLocal(x_), Instruction::MakeLabel(label),
      Instruction::Call(m_.placeholder)};
  std::vector<Instruction> before = proc_.Body();

  PlaceholderExpander expander(&tracer_, &transform_);
  auto splice = expander.Expand(proc_, 2);
  ASSERT_FALSE(splice.has_value());
  EXPECT_EQ(splice.error().Code(), ErrorCode::kTraceFailure);
  EXPECT_FALSE(splice.error().notes.empty());
  EXPECT_EQ(proc_.Body(), before);
  EXPECT_TRUE(received_.empty());
}

TEST_F(PlaceholderExpanderTest, WrongArityIsTraceFailure) {
  const il::MethodDef* wide =
      m_.module.AddMethod(m_.marker, "Placeholder2", 2, true);
  proc_.Body() = {Ldc(1), Ldc(2), Instruction::Call(wide)};

  PlaceholderExpander expander(&tracer_, &transform_);
  auto splice = expander.Expand(proc_, 2);
  ASSERT_FALSE(splice.has_value());
  EXPECT_EQ(splice.error().Code(), ErrorCode::kTraceFailure);
}

// ============================================================================
// Tracer contract
// ============================================================================

TEST_F(PlaceholderExpanderTest, ArgumentStartAfterCallIsInternalError) {
  proc_.Body() = {Ldc(1), Instruction::Call(m_.placeholder), Ldc(2)};
  std::vector<Instruction> before = proc_.Body();

  FixedTracer tracer(std::vector<size_t>{2});
  PlaceholderExpander expander(&tracer, &transform_);
  EXPECT_THROW((void)expander.Expand(proc_, 1), common::InternalError);
  EXPECT_EQ(proc_.Body(), before);
  EXPECT_TRUE(received_.empty());
}

TEST_F(PlaceholderExpanderTest, EmptyArgumentSpanIsInternalError) {
  proc_.Body() = {Ldc(1), Instruction::Call(m_.placeholder), Ldc(2)};
  std::vector<Instruction> before = proc_.Body();

  FixedTracer tracer(std::vector<size_t>{1});
  PlaceholderExpander expander(&tracer, &transform_);
  EXPECT_THROW((void)expander.Expand(proc_, 1), common::InternalError);
  EXPECT_EQ(proc_.Body(), before);
}

TEST_F(PlaceholderExpanderTest, InjectedTracerSpanIsHonored) {
  proc_.Body() = {
      Ldc(1), Ldc(2), Op(Opcode::kAdd), Instruction::Call(m_.placeholder),
      Op(Opcode::kReturn)};

  // Narrower than the real argument; the expander trusts any in-range start.
  FixedTracer tracer(std::vector<size_t>{2});
  PlaceholderExpander expander(&tracer, &transform_);
  auto splice = expander.Expand(proc_, 3);
  ASSERT_TRUE(splice.has_value());
  std::vector<Instruction> expected_arg = {Op(Opcode::kAdd)};
  EXPECT_EQ(received_, expected_arg);
  EXPECT_EQ(splice->start, 2U);
}

}  // namespace
}  // namespace mutator::mutation

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/mutation/key_field.hpp"
#include "mutator/mutation/options.hpp"
#include "tests/common/marker_module.hpp"

namespace mutator::mutation {
namespace {

using il::Instruction;
using test::Ldc;
using test::MarkerModule;

class KeyFieldResolverTest : public ::testing::Test {
 protected:
  MarkerModule m_;
  il::Procedure& proc_ = m_.module.AddProcedure("Keys", true);
  KeyValueMap values_;
  KeyFieldResolver resolver_{&values_};
};

TEST_F(KeyFieldResolverTest, ResolvesEverySlot) {
  for (size_t i = 0; i < kKeySlotCount; ++i) {
    values_[static_cast<KeySlot>(i)] = static_cast<int32_t>(1000 + i);
  }
  for (size_t i = 0; i < kKeySlotCount; ++i) {
    proc_.Body().push_back(Instruction::LoadStaticField(m_.Key(i)));
  }

  for (size_t i = 0; i < kKeySlotCount; ++i) {
    ASSERT_TRUE(resolver_.Resolve(proc_, i).has_value()) << "slot " << i;
  }

  ASSERT_EQ(proc_.Body().size(), kKeySlotCount);
  for (size_t i = 0; i < kKeySlotCount; ++i) {
    EXPECT_EQ(proc_.Body()[i], Ldc(static_cast<int32_t>(1000 + i)));
  }
}

TEST_F(KeyFieldResolverTest, RewritesInPlace) {
  values_[KeySlot::kKeyI2] = -7;
  proc_.Body() = {
      Ldc(1), Instruction::LoadStaticField(m_.Key(2)),
      Instruction::Simple(il::Opcode::kXor)};

  ASSERT_TRUE(resolver_.Resolve(proc_, 1).has_value());

  std::vector<Instruction> expected = {
      Ldc(1), Ldc(-7), Instruction::Simple(il::Opcode::kXor)};
  EXPECT_EQ(proc_.Body(), expected);
}

TEST_F(KeyFieldResolverTest, OutOfRangeSlotIsUnrecognized) {
  values_[KeySlot::kKeyI15] = 1;
  proc_.Body() = {Instruction::LoadStaticField(m_.key16)};

  auto result = resolver_.Resolve(proc_, 0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Code(), ErrorCode::kUnrecognizedKeyField);
  EXPECT_EQ(result.error().primary.kind, DiagKind::kError);
}

TEST_F(KeyFieldResolverTest, OtherNameIsUnrecognized) {
  proc_.Body() = {Instruction::LoadStaticField(m_.key_other)};

  auto result = resolver_.Resolve(proc_, 0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Code(), ErrorCode::kUnrecognizedKeyField);
}

TEST_F(KeyFieldResolverTest, MissingValueLeavesInstructionUntouched) {
  values_[KeySlot::kKeyI0] = 1;
  Instruction original = Instruction::LoadStaticField(m_.Key(4));
  proc_.Body() = {original};

  auto result = resolver_.Resolve(proc_, 0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().Code(), ErrorCode::kMissingKeyValue);
  EXPECT_NE(result.error().primary.message.find("KeyI4"), std::string::npos);
  EXPECT_EQ(
      result.error().primary.location,
      DiagLocation(InstrLocation{.procedure = "Keys", .index = 0}));
  EXPECT_EQ(proc_.Body().front(), original);
}

TEST_F(KeyFieldResolverTest, ExtremeValues) {
  values_[KeySlot::kKeyI0] = INT32_MIN;
  values_[KeySlot::kKeyI1] = INT32_MAX;
  proc_.Body() = {
      Instruction::LoadStaticField(m_.Key(0)),
      Instruction::LoadStaticField(m_.Key(1))};

  ASSERT_TRUE(resolver_.Resolve(proc_, 0).has_value());
  ASSERT_TRUE(resolver_.Resolve(proc_, 1).has_value());
  EXPECT_EQ(proc_.Body()[0], Ldc(INT32_MIN));
  EXPECT_EQ(proc_.Body()[1], Ldc(INT32_MAX));
}

}  // namespace
}  // namespace mutator::mutation

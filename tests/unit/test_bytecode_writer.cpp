// File: tests/unit/test_bytecode_writer.cpp
// Purpose: Verify instruction emission, labels and program assembly errors.
// Key invariants: Jumps are forward-only with 16-bit offsets; every label must
//                 be marked; every registered function must be supplied.
// Ownership/Lifetime: Standalone unit test executable.
// Links: bytecode/BytecodeWriter.hpp

#include "RulesTestSupport.hpp"

#include <cstdint>
#include <vector>

using namespace rulesvm::test;
using rulesvm::bytecode::makeFunction;
using rulesvm::support::ErrorCategory;
using rulesvm::support::Expected;
using rulesvm::support::TrapKind;

namespace
{

Expected<Value> constantFn(std::span<const Value>)
{
    return Value::string("ok");
}

} // namespace

TEST(BytecodeWriter, WritesBigEndianShorts)
{
    BytecodeWriter w;
    w.markResultStart();
    w.writeOpcode(Opcode::LOAD_CONST_W);
    w.writeShort(0x1234);
    w.writeOpcode(Opcode::RETURN_VALUE);
    auto program = w.build({}, {}, {}, resultRef(0));
    ASSERT_TRUE(program);
    const auto code = program.value().code();
    ASSERT_EQ(code.size(), 4u);
    EXPECT_EQ(code[1], 0x12);
    EXPECT_EQ(code[2], 0x34);
}

TEST(BytecodeWriter, PatchesForwardJumps)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::LOAD_REGISTER, {0});
    const auto label = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(label);
    loadConst(w, Value::string("fallback"));
    w.markLabel(label);
    emit(w, Opcode::RETURN_VALUE);

    auto program = built(w.build({param("x")}, {}, {}, resultRef(0)));
    ASSERT_TRUE(program);
    const auto code = program->code();
    // JNN_OR_POP at 2, LOAD_CONST at 5, RETURN_VALUE at 7.
    EXPECT_EQ(code[3], 0);
    EXPECT_EQ(code[4], 2);
    EXPECT_EQ(code[7], static_cast<uint8_t>(Opcode::RETURN_VALUE));
}

TEST(BytecodeWriter, LabelRightAfterPlaceholderEncodesZero)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::LOAD_REGISTER, {0});
    const auto label = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(label);
    w.markLabel(label);
    emit(w, Opcode::RETURN_VALUE);

    auto program = built(w.build({param("x")}, {}, {}, resultRef(0)));
    ASSERT_TRUE(program);
    const auto code = program->code();
    EXPECT_EQ(code[3], 0);
    EXPECT_EQ(code[4], 0);
}

TEST(BytecodeWriter, SequentialJumpsArePatchedIndependently)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::LOAD_REGISTER, {0});
    const auto a = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(a);
    w.markLabel(a);
    const auto b = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(b);
    loadConst(w, Value::string("fallback"));
    w.markLabel(b);
    emit(w, Opcode::RETURN_VALUE);

    auto program = built(w.build({param("x")}, {}, {}, resultRef(0)));
    ASSERT_TRUE(program);
    const auto code = program->code();
    // First JNN_OR_POP at 2, second at 5, LOAD_CONST at 8.
    EXPECT_EQ(code[3], 0);
    EXPECT_EQ(code[4], 0);
    EXPECT_EQ(code[6], 0);
    EXPECT_EQ(code[7], 2);
}

TEST(BytecodeWriter, RejectsBackwardJump)
{
    BytecodeWriter w;
    w.markResultStart();
    const auto label = w.createLabel();
    w.markLabel(label);
    emit(w, Opcode::LOAD_REGISTER, {0});
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(label);
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({param("x")}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().category, ErrorCategory::Compile);
    EXPECT_EQ(program.error().kind, TrapKind::InvalidJump);
}

TEST(BytecodeWriter, RejectsUnmarkedLabel)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::LOAD_REGISTER, {0});
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(w.createLabel());
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({param("x")}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().kind, TrapKind::InvalidJump);
    EXPECT_EQ(program.error().message, "Label 0 was never marked");
}

TEST(BytecodeWriter, RejectsLabelMarkedTwice)
{
    BytecodeWriter w;
    w.markResultStart();
    const auto label = w.createLabel();
    w.markLabel(label);
    w.markLabel(label);
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().message, "Label 0 marked twice");
}

TEST(BytecodeWriter, RejectsJumpOffsetsBeyond16Bits)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::LOAD_REGISTER, {0});
    const auto label = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(label);
    for (int i = 0; i < 0x10000; ++i)
        emit(w, Opcode::ISSET);
    w.markLabel(label);
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({param("x")}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().kind, TrapKind::InvalidJump);
}

TEST(BytecodeWriter, DeduplicatesFunctionsAndConstants)
{
    BytecodeWriter w;
    EXPECT_EQ(w.registerFunction("f"), 0u);
    EXPECT_EQ(w.registerFunction("g"), 1u);
    EXPECT_EQ(w.registerFunction("f"), 0u);
    EXPECT_EQ(w.getConstantIndex(Value::string("s")), 0u);
    EXPECT_EQ(w.getConstantIndex(Value::string("s")), 0u);
}

TEST(BytecodeWriter, ReportsEveryMissingFunction)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::FN0, {static_cast<uint8_t>(w.registerFunction("a"))});
    emit(w, Opcode::FN0, {static_cast<uint8_t>(w.registerFunction("b"))});
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().kind, TrapKind::MissingFunction);
    EXPECT_EQ(program.error().message, "Missing bytecode functions: [a, b]");
}

TEST(BytecodeWriter, ChecksCallsBehindAnEarlyReturn)
{
    BytecodeWriter w;
    w.markResultStart();
    loadConst(w, Value::string("x"));
    const auto label = w.createLabel();
    w.writeOpcode(Opcode::JNN_OR_POP);
    w.writeJumpPlaceholder(label);
    loadConst(w, Value::string("y"));
    emit(w, Opcode::RETURN_VALUE);
    w.markLabel(label);
    emit(w, Opcode::FN1, {7});
    emit(w, Opcode::RETURN_VALUE);

    auto program = w.build({}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().category, ErrorCategory::Compile);
    EXPECT_EQ(program.error().kind, TrapKind::Bounds);
    EXPECT_EQ(program.error().message, "Function index 7 out of range at address 8");
}

TEST(BytecodeWriter, ChecksCallsInEveryBody)
{
    BytecodeWriter w;
    w.markResultStart();
    loadConst(w, Value::string("x"));
    emit(w, Opcode::RETURN_VALUE);
    w.markResultStart();
    emit(w, Opcode::FN0, {3});
    emit(w, Opcode::RETURN_VALUE);

    auto program = w.build({}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().message, "Function index 3 out of range at address 3");
}

TEST(BytecodeWriter, VerifiesFixedCallArity)
{
    BytecodeWriter w;
    w.markResultStart();
    loadConst(w, Value::string("x"));
    emit(w, Opcode::FN1, {static_cast<uint8_t>(w.registerFunction("two"))});
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({}, {makeFunction("two", 2, constantFn)}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().category, ErrorCategory::Compile);
    EXPECT_EQ(program.error().kind, TrapKind::ArityMismatch);
    EXPECT_EQ(program.error().message,
              "Function two expects 2 arguments but FN1 passes 1 at address 2");
}

TEST(BytecodeWriter, RejectsInvalidBdd)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::RETURN_VALUE);
    auto badRoot = w.build({}, {}, {}, resultRef(1));
    ASSERT_FALSE(badRoot);
    EXPECT_EQ(badRoot.error().category, ErrorCategory::Format);
}

TEST(BytecodeWriter, RejectsDuplicateRegisterDefinitions)
{
    BytecodeWriter w;
    w.markResultStart();
    emit(w, Opcode::RETURN_VALUE);
    auto program = w.build({param("a"), param("a")}, {}, {}, resultRef(0));
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().message, "Duplicate register name: a");
}

TEST(BytecodeWriter, SerializeRejectsWideIntegers)
{
    BytecodeWriter w;
    w.markResultStart();
    loadConst(w, Value::integer(int64_t{1} << 40));
    emit(w, Opcode::RETURN_VALUE);
    auto program = built(w.build({}, {}, {}, resultRef(0)));
    ASSERT_TRUE(program);
    auto image = BytecodeWriter::serialize(*program);
    ASSERT_FALSE(image);
    EXPECT_EQ(image.error().category, ErrorCategory::Compile);
}

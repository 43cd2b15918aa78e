// File: tests/unit/test_disassembler.cpp
// Purpose: Verify the text rendering of programs, constants and instructions.
// Key invariants: Instruction lines carry a 4-digit address, a 22-column
//                 mnemonic, operands and an optional annotation with no
//                 trailing whitespace.
// Ownership/Lifetime: Standalone unit test executable.
// Links: bytecode/Disassembler.hpp

#include "RulesTestSupport.hpp"

#include "bytecode/BytecodeWalker.hpp"
#include "bytecode/Disassembler.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace rulesvm::test;
using rulesvm::bytecode::BytecodeWalker;
using rulesvm::bytecode::disassemble;
using rulesvm::bytecode::FunctionSlot;
using rulesvm::bytecode::formatConstant;
using rulesvm::bytecode::formatInstruction;
using rulesvm::bytecode::StringTemplate;

namespace
{

std::string line(unsigned address, const char *mnemonic, const std::string &rest = {})
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04u: %-22s", address, mnemonic);
    std::string out = buf + rest;
    while (!out.empty() && out.back() == ' ')
        out.pop_back();
    return out;
}

std::vector<std::string> instructionLines(const Bytecode &program, uint32_t start)
{
    std::vector<std::string> out;
    BytecodeWalker walker(program.code(), start);
    while (walker.hasNext())
    {
        out.push_back(formatInstruction(program, walker));
        if (!walker.currentOpcode() || walker.isReturn() || !walker.advance())
            break;
    }
    return out;
}

} // namespace

TEST(Disassembler, FormatsConstants)
{
    EXPECT_EQ(formatConstant(Value()), "null");
    EXPECT_EQ(formatConstant(Value::string("a\"b\n")), "\"a\\\"b\\n\"");
    EXPECT_EQ(formatConstant(Value::integer(-5)), "Integer[-5]");
    EXPECT_EQ(formatConstant(Value::boolean(true)), "Boolean[true]");
    EXPECT_EQ(formatConstant(Value::list({Value::integer(1), Value()})), "List[2 items]");
    EXPECT_EQ(formatConstant(Value::map({{"k", Value()}})), "Map[1 entries]");

    StringTemplate tpl;
    tpl.parts = {{false, "a"}, {true, ""}, {false, "b"}};
    EXPECT_EQ(formatConstant(Value::stringTemplate(tpl)), "Template[3 parts]");
}

TEST(Disassembler, TruncatesLongStrings)
{
    const std::string fifty(50, 'x');
    EXPECT_EQ(formatConstant(Value::string(fifty)), "\"" + fifty + "\"");

    const std::string sixty(60, 'y');
    EXPECT_EQ(formatConstant(Value::string(sixty)), "\"" + std::string(47, 'y') + "...\"");
}

TEST(Disassembler, FormatsInstructionsWithAnnotations)
{
    auto program = built(resultProgram(
        [](BytecodeWriter &w)
        {
            emit(w, Opcode::LOAD_REGISTER, {0});
            const auto label = w.createLabel();
            w.writeOpcode(Opcode::JNN_OR_POP);
            w.writeJumpPlaceholder(label);
            loadConst(w, Value::string("fallback"));
            w.markLabel(label);
            emit(w, Opcode::SUBSTRING, {0, 3, 1});
            emit(w, Opcode::GET_PROPERTY_REG,
                 {0, 0, static_cast<uint8_t>(w.getConstantIndex(Value::string("region")))});
            emit(w, Opcode::RETURN_ENDPOINT, {2});
        },
        {param("Region")}));
    ASSERT_TRUE(program);

    const auto lines = instructionLines(*program, 0);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], line(0, "LOAD_REGISTER", " 0  ; Region"));
    EXPECT_EQ(lines[1], line(2, "JNN_OR_POP", " 2  ; -> 0007"));
    EXPECT_EQ(lines[2], line(5, "LOAD_CONST", " 0  ; \"fallback\""));
    EXPECT_EQ(lines[3], line(7, "SUBSTRING", " 0 3 1  ; start=0, end=3, reverse=true"));
    EXPECT_EQ(lines[4], line(11, "GET_PROPERTY_REG", " 0 1  ; Region.region"));
    EXPECT_EQ(lines[5], line(15, "RETURN_ENDPOINT", " 2  ; headers=false, properties=true"));
}

TEST(Disassembler, OperandlessInstructionsHaveNoTrailingSpaces)
{
    auto program = built(resultProgram(
        [](BytecodeWriter &w)
        {
            emit(w, Opcode::LIST0);
            emit(w, Opcode::RETURN_VALUE);
        }));
    ASSERT_TRUE(program);

    const auto lines = instructionLines(*program, 0);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "0000: LIST0");
    EXPECT_EQ(lines[1], "0001: RETURN_VALUE");
}

TEST(Disassembler, ReportsUnknownOpcodes)
{
    auto program = built(resultProgram([](BytecodeWriter &w) { w.writeByte(0xEE); }));
    ASSERT_TRUE(program);

    const auto lines = instructionLines(*program, 0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "0000: UNKNOWN_OPCODE(0xEE)");
}

TEST(Disassembler, ReportsTruncatedOperands)
{
    auto program = built(resultProgram([](BytecodeWriter &w) { w.writeOpcode(Opcode::LOAD_CONST_W); }));
    ASSERT_TRUE(program);

    BytecodeWalker walker(program->code());
    EXPECT_EQ(formatInstruction(*program, walker), "0000: LOAD_CONST_W" + std::string(11, ' ') + "<truncated>");
}

TEST(Disassembler, PrintsEverySection)
{
    BytecodeWriter w;
    w.markConditionStart();
    emit(w, Opcode::TEST_REGISTER_ISSET, {0});
    emit(w, Opcode::RETURN_VALUE);
    w.markResultStart();
    loadConst(w, Value::string("https://example.com"));
    emit(w, Opcode::RETURN_ENDPOINT, {0});

    auto program = built(w.build({param("Region", true, std::nullopt, "SDK::Region"), temp("t")},
                                 {},
                                 bddNodes({0, resultRef(0), Bdd::kFalseRef}),
                                 nodeRef(1)));
    ASSERT_TRUE(program);

    const std::string text = disassemble(*program);
    for (const char *expected : {"=== Bytecode Program ===\n",
                                 "Version: 1.1\n",
                                 "Conditions: 1\n",
                                 "Results: 1\n",
                                 "Registers: 2\n",
                                 "BDD Root: node[1]\n",
                                 "Instructions: 4\n",
                                 "Opcode Usage: LOAD_CONST=1, TEST_REGISTER_ISSET=1, "
                                 "RETURN_ENDPOINT=1, RETURN_VALUE=1\n",
                                 "=== Functions ===\n",
                                 "  0: Region [required] builtin=SDK::Region\n",
                                 "  1: t [temp]\n",
                                 "=== Constant Pool ===\n  0: \"https://example.com\"\n",
                                 "=== BDD Structure ===\nNodes: 2\nRoot: node[1]\n",
                                 "     1: var=0 high=result[0] low=FALSE\n",
                                 "Condition 0 (offset 0):\n",
                                 "Result 0 (offset 3):\n"})
    {
        EXPECT_NE(text.find(expected), std::string::npos) << "missing: " << expected;
    }
}

TEST(Disassembler, MarksUnresolvedFunctions)
{
    Bytecode::Parts parts;
    parts.code = {static_cast<uint8_t>(Opcode::FN1), 0, static_cast<uint8_t>(Opcode::RETURN_VALUE)};
    parts.resultOffsets = {0};
    parts.functions = {FunctionSlot{"lookup", nullptr}};
    parts.bdd = Bdd({}, resultRef(0));
    auto program = built(Bytecode::create(std::move(parts)));
    ASSERT_TRUE(program);

    const std::string text = disassemble(*program);
    EXPECT_NE(text.find("  0: lookup (unresolved)\n"), std::string::npos);
    EXPECT_NE(text.find(line(0, "FN1", " 0  ; lookup")), std::string::npos);
}

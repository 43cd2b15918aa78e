//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Disassembler.cpp
// Purpose: Text rendering of program metadata, pools, BDD and bodies.
// Key invariants: Section order is fixed: summary, functions, registers,
//                 constant pool, BDD, conditions, results.
// Ownership/Lifetime: Stateless.
// Links: bytecode/Disassembler.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/Disassembler.hpp"

#include "bytecode/Uri.hpp"

#include <array>
#include <cstdio>
#include <sstream>

namespace rulesvm::bytecode
{

namespace
{

constexpr size_t kMaxShownString = 50;
constexpr size_t kTruncatedString = 47;

std::string escape(const std::string &s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string constantAt(const Bytecode &program, int32_t index)
{
    if (index < 0 || static_cast<size_t>(index) >= program.constants().size())
        return "<invalid constant>";
    return formatConstant(program.constants()[index]);
}

std::string registerAt(const Bytecode &program, int32_t index)
{
    if (index < 0 || static_cast<uint32_t>(index) >= program.registerCount())
        return "<invalid register>";
    return program.registers()[index].name;
}

std::string functionAt(const Bytecode &program, int32_t index)
{
    if (index < 0 || static_cast<size_t>(index) >= program.functions().size())
        return "<invalid function>";
    return program.functions()[index].name;
}

std::string propertyAt(const Bytecode &program, int32_t index)
{
    if (index < 0 || static_cast<size_t>(index) >= program.constants().size())
        return "<invalid constant>";
    const Value &v = program.constants()[index];
    if (const auto *s = v.asString())
        return *s;
    return formatConstant(v);
}

std::string annotate(const Bytecode &program, Opcode op, const std::array<int32_t, 3> &ops, const BytecodeWalker &walker)
{
    switch (op)
    {
        case Opcode::LOAD_CONST:
        case Opcode::LOAD_CONST_W:
            return constantAt(program, ops[0]);
        case Opcode::SET_REGISTER:
        case Opcode::LOAD_REGISTER:
        case Opcode::TEST_REGISTER_ISSET:
        case Opcode::TEST_REGISTER_NOT_SET:
        case Opcode::TEST_REGISTER_IS_TRUE:
        case Opcode::TEST_REGISTER_IS_FALSE:
            return registerAt(program, ops[0]);
        case Opcode::GET_INDEX_REG:
            return registerAt(program, ops[0]) + "[" + std::to_string(ops[1]) + "]";
        case Opcode::GET_PROPERTY_REG:
            return registerAt(program, ops[0]) + "." + propertyAt(program, ops[1]);
        case Opcode::GET_PROPERTY:
            return propertyAt(program, ops[0]);
        case Opcode::FN0:
        case Opcode::FN1:
        case Opcode::FN2:
        case Opcode::FN3:
        case Opcode::FN:
            return functionAt(program, ops[0]);
        case Opcode::RESOLVE_TEMPLATE:
            return constantAt(program, ops[1]);
        case Opcode::JNN_OR_POP:
        {
            auto target = walker.jumpTarget();
            if (!target)
                return "<invalid target>";
            char buf[16];
            std::snprintf(buf, sizeof(buf), "-> %04u", target.value());
            return buf;
        }
        case Opcode::RETURN_ENDPOINT:
            return std::string("headers=") + ((ops[0] & kEndpointHasHeaders) ? "true" : "false") +
                   ", properties=" + ((ops[0] & kEndpointHasProperties) ? "true" : "false");
        case Opcode::SUBSTRING:
            return "start=" + std::to_string(ops[0]) + ", end=" + std::to_string(ops[1]) +
                   ", reverse=" + (ops[2] ? "true" : "false");
        default:
            return {};
    }
}

void listBody(const Bytecode &program, uint32_t start, std::ostream &os)
{
    BytecodeWalker walker(program.code(), start);
    while (walker.hasNext())
    {
        os << "  " << formatInstruction(program, walker) << '\n';
        if (!walker.currentOpcode() || walker.isReturn())
            return;
        for (int i = 0; i < walker.operandCount(); ++i)
        {
            if (!walker.operand(i))
                return;
        }
        walker.advance();
    }
}

} // namespace

std::string formatConstant(const Value &value)
{
    switch (value.kind())
    {
        case Value::Kind::Null:
            return "null";
        case Value::Kind::String:
        {
            const std::string &s = *value.asString();
            if (s.size() > kMaxShownString)
                return "\"" + escape(s.substr(0, kTruncatedString)) + "...\"";
            return "\"" + escape(s) + "\"";
        }
        case Value::Kind::Integer:
            return "Integer[" + std::to_string(*value.asInteger()) + "]";
        case Value::Kind::Boolean:
            return std::string("Boolean[") + (*value.asBoolean() ? "true" : "false") + "]";
        case Value::Kind::List:
            return "List[" + std::to_string(value.asList()->size()) + " items]";
        case Value::Kind::Map:
            return "Map[" + std::to_string(value.asMap()->size()) + " entries]";
        case Value::Kind::Template:
            return "Template[" + std::to_string(value.asTemplate()->parts.size()) + " parts]";
        case Value::Kind::Uri:
            return "Uri[" + value.asUri()->text() + "]";
    }
    return "?";
}

std::string formatInstruction(const Bytecode &program, const BytecodeWalker &walker)
{
    char head[16];
    std::snprintf(head, sizeof(head), "%04u: ", walker.position());
    std::string line = head;

    auto op = walker.currentOpcode();
    if (!op)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "UNKNOWN_OPCODE(0x%02X)", walker.rawOpcode());
        return line + buf;
    }

    char mnemonic[32];
    std::snprintf(mnemonic, sizeof(mnemonic), "%-22s", opcodeName(*op));
    line += mnemonic;

    std::array<int32_t, 3> ops{};
    for (int i = 0; i < walker.operandCount(); ++i)
    {
        auto v = walker.operand(i);
        if (!v)
            return line + " <truncated>";
        ops[i] = v.value();
        line += ' ';
        line += std::to_string(ops[i]);
    }

    std::string note = annotate(program, *op, ops, walker);
    if (!note.empty())
    {
        line += "  ; ";
        line += note;
    }
    while (!line.empty() && line.back() == ' ')
        line.pop_back();
    return line;
}

void disassemble(const Bytecode &program, std::ostream &os)
{
    const Bdd &bdd = program.bdd();

    os << "=== Bytecode Program ===\n";
    os << "Version: " << (program.version() >> 8) << "." << (program.version() & 0xFF) << "\n";
    os << "Conditions: " << program.conditionCount() << "\n";
    os << "Results: " << program.resultCount() << "\n";
    os << "Registers: " << program.registerCount() << "\n";
    os << "Functions: " << program.functions().size() << "\n";
    os << "Constants: " << program.constants().size() << "\n";
    os << "BDD Nodes: " << bdd.nodeCount() << "\n";
    os << "BDD Root: " << Bdd::formatReference(bdd.root()) << "\n";

    std::array<uint32_t, kMaxOpcode + 1> usage{};
    uint32_t total = 0;
    {
        BytecodeWalker walker(program.code());
        while (walker.hasNext())
        {
            auto op = walker.currentOpcode();
            if (!op)
                break;
            ++usage[static_cast<uint8_t>(*op)];
            ++total;
            walker.advance();
        }
    }
    os << "Instructions: " << total << "\n";
    os << "Opcode Usage:";
    bool first = true;
    for (size_t i = 0; i < usage.size(); ++i)
    {
        if (usage[i] == 0)
            continue;
        os << (first ? " " : ", ") << opcodeName(static_cast<Opcode>(i)) << "=" << usage[i];
        first = false;
    }
    os << "\n";

    os << "\n=== Functions ===\n";
    for (size_t i = 0; i < program.functions().size(); ++i)
    {
        const auto &slot = program.functions()[i];
        os << "  " << i << ": " << slot.name;
        if (slot.function)
            os << " (" << slot.function->argumentCount() << " args)";
        else
            os << " (unresolved)";
        os << "\n";
    }

    os << "\n=== Registers ===\n";
    for (size_t i = 0; i < program.registers().size(); ++i)
    {
        const auto &reg = program.registers()[i];
        os << "  " << i << ": " << reg.name;
        if (reg.required)
            os << " [required]";
        if (reg.temporary)
            os << " [temp]";
        if (reg.defaultValue)
            os << " default=" << formatConstant(*reg.defaultValue);
        if (reg.builtin)
            os << " builtin=" << *reg.builtin;
        os << "\n";
    }

    os << "\n=== Constant Pool ===\n";
    for (size_t i = 0; i < program.constants().size(); ++i)
        os << "  " << i << ": " << formatConstant(program.constants()[i]) << "\n";

    os << "\n=== BDD Structure ===\n";
    os << "Nodes: " << bdd.nodeCount() << "\n";
    os << "Root: " << Bdd::formatReference(bdd.root()) << "\n";
    for (uint32_t i = 0; i < bdd.nodeCount(); ++i)
    {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "  %4u: ", i);
        os << buf << "var=" << bdd.variable(i) << " high=" << Bdd::formatReference(bdd.high(i))
           << " low=" << Bdd::formatReference(bdd.low(i)) << "\n";
    }

    os << "\n=== Conditions ===\n";
    for (uint32_t i = 0; i < program.conditionCount(); ++i)
    {
        os << "Condition " << i << " (offset " << program.conditionOffset(i) << "):\n";
        listBody(program, program.conditionOffset(i), os);
    }

    os << "\n=== Results ===\n";
    for (uint32_t i = 0; i < program.resultCount(); ++i)
    {
        os << "Result " << i << " (offset " << program.resultOffset(i) << "):\n";
        listBody(program, program.resultOffset(i), os);
    }
}

std::string disassemble(const Bytecode &program)
{
    std::ostringstream os;
    disassemble(program, os);
    return os.str();
}

} // namespace rulesvm::bytecode

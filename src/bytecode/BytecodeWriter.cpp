//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeWriter.cpp
// Purpose: Program builder and binary image serializer.
// Key invariants: A jump offset is the distance from the byte after its
//                 placeholder to the label, so a label marked immediately
//                 after the placeholder encodes 0.
// Ownership/Lifetime: See BytecodeWriter.hpp.
// Links: bytecode/BytecodeReader.cpp (inverse of serialize()).
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeWriter.hpp"

#include "bytecode/ByteOrder.hpp"
#include "bytecode/Uri.hpp"

#include <limits>
#include <utility>

namespace rulesvm::bytecode
{

void BytecodeWriter::writeByte(uint8_t value)
{
    code_.push_back(value);
}

void BytecodeWriter::writeShort(uint16_t value)
{
    code_.push_back(static_cast<uint8_t>(value >> 8));
    code_.push_back(static_cast<uint8_t>(value));
}

uint32_t BytecodeWriter::getConstantIndex(const Value &value)
{
    return constants_.indexOf(value);
}

uint32_t BytecodeWriter::registerFunction(std::string_view name)
{
    return detail::findOrAddToPool(functionNames_,
                                   std::string(name),
                                   [](const std::string &a, const std::string &b) { return a == b; });
}

void BytecodeWriter::markConditionStart()
{
    conditionOffsets_.push_back(position());
}

void BytecodeWriter::markResultStart()
{
    resultOffsets_.push_back(position());
}

BytecodeWriter::Label BytecodeWriter::createLabel()
{
    labels_.emplace_back();
    return static_cast<Label>(labels_.size() - 1);
}

void BytecodeWriter::writeJumpPlaceholder(Label label)
{
    const uint32_t at = position();
    writeShort(0);
    if (label >= labels_.size())
    {
        fail(support::TrapKind::InvalidJump, "Unknown label " + std::to_string(label));
        return;
    }
    auto &state = labels_[label];
    if (state.position)
    {
        fail(support::TrapKind::InvalidJump,
             "Backward jump to label " + std::to_string(label) + " at offset " +
                 std::to_string(at));
        return;
    }
    state.placeholders.push_back(at);
}

void BytecodeWriter::markLabel(Label label)
{
    if (label >= labels_.size())
    {
        fail(support::TrapKind::InvalidJump, "Unknown label " + std::to_string(label));
        return;
    }
    auto &state = labels_[label];
    if (state.position)
    {
        fail(support::TrapKind::InvalidJump, "Label " + std::to_string(label) + " marked twice");
        return;
    }
    state.position = position();
    for (uint32_t placeholder : state.placeholders)
        patch(placeholder, *state.position);
    state.placeholders.clear();
}

void BytecodeWriter::patch(uint32_t placeholder, uint32_t target)
{
    const uint32_t offset = target - (placeholder + 2);
    if (offset > std::numeric_limits<uint16_t>::max())
    {
        fail(support::TrapKind::InvalidJump,
             "Jump offset " + std::to_string(offset) + " exceeds 16 bits at offset " +
                 std::to_string(placeholder));
        return;
    }
    code_[placeholder] = static_cast<uint8_t>(offset >> 8);
    code_[placeholder + 1] = static_cast<uint8_t>(offset);
}

void BytecodeWriter::fail(support::TrapKind kind, std::string message)
{
    if (!error_)
        error_ = support::makeCompileError(kind, std::move(message));
}

support::Expected<Bytecode> BytecodeWriter::build(
    std::vector<RegisterDefinition> registers,
    const std::vector<std::shared_ptr<const RulesFunction>> &functions,
    std::vector<int32_t> bddNodes,
    int32_t bddRoot)
{
    if (error_)
        return *error_;
    for (size_t i = 0; i < labels_.size(); ++i)
    {
        if (!labels_[i].placeholders.empty())
            return support::makeCompileError(support::TrapKind::InvalidJump,
                                             "Label " + std::to_string(i) + " was never marked");
    }
    if (constants_.size() > std::numeric_limits<uint16_t>::max())
        return support::makeCompileError(support::TrapKind::PoolOverflow,
                                         "Too many constants: " +
                                             std::to_string(constants_.size()));
    if (functionNames_.size() > 256)
        return support::makeCompileError(support::TrapKind::PoolOverflow,
                                         "Too many functions: " +
                                             std::to_string(functionNames_.size()));

    Bytecode::Parts parts;
    std::string missing;
    for (const auto &name : functionNames_)
    {
        std::shared_ptr<const RulesFunction> impl;
        for (const auto &fn : functions)
        {
            if (fn && fn->name() == name)
            {
                impl = fn;
                break;
            }
        }
        if (!impl)
        {
            missing += missing.empty() ? name : ", " + name;
            continue;
        }
        parts.functions.push_back(FunctionSlot{name, std::move(impl)});
    }
    if (!missing.empty())
        return support::makeCompileError(support::TrapKind::MissingFunction,
                                         "Missing bytecode functions: [" + missing + "]");

    parts.code = std::move(code_);
    parts.conditionOffsets = std::move(conditionOffsets_);
    parts.resultOffsets = std::move(resultOffsets_);
    parts.registers = std::move(registers);
    parts.constants = constants_.take();
    parts.bdd = Bdd(std::move(bddNodes), bddRoot);
    functionNames_.clear();
    labels_.clear();
    return Bytecode::create(std::move(parts));
}

//===----------------------------------------------------------------------===//
// Serialization
//===----------------------------------------------------------------------===//

namespace
{

constexpr uint8_t kTagNull = 0;
constexpr uint8_t kTagString = 1;
constexpr uint8_t kTagInteger = 2;
constexpr uint8_t kTagBoolean = 3;
constexpr uint8_t kTagList = 4;
constexpr uint8_t kTagMap = 5;
constexpr uint8_t kTagTemplate = 6;

support::Expected<void> writeString(ByteSink &out, const std::string &s)
{
    if (s.size() > std::numeric_limits<uint16_t>::max())
        return support::makeCompileError(support::TrapKind::PoolOverflow,
                                         "String too long to encode: " +
                                             std::to_string(s.size()) + " bytes");
    out.string(s);
    return {};
}

support::Expected<void> writeCount(ByteSink &out, size_t n, const char *what)
{
    if (n > std::numeric_limits<uint16_t>::max())
        return support::makeCompileError(support::TrapKind::PoolOverflow,
                                         std::string(what) + " too large to encode: " +
                                             std::to_string(n));
    out.u16(static_cast<uint16_t>(n));
    return {};
}

support::Expected<void> writeConstant(ByteSink &out, const Value &v, uint32_t depth)
{
    if (depth > kMaxConstantDepth)
        return support::makeCompileError(support::TrapKind::PoolOverflow,
                                         "Constant nesting depth exceeds " +
                                             std::to_string(kMaxConstantDepth));
    switch (v.kind())
    {
        case Value::Kind::Null:
            out.u8(kTagNull);
            return {};
        case Value::Kind::String:
            out.u8(kTagString);
            return writeString(out, *v.asString());
        case Value::Kind::Integer:
        {
            const int64_t n = *v.asInteger();
            if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max())
                return support::makeCompileError(support::TrapKind::TypeError,
                                                 "Integer constant out of 32-bit range: " +
                                                     std::to_string(n));
            out.u8(kTagInteger);
            out.i32(static_cast<int32_t>(n));
            return {};
        }
        case Value::Kind::Boolean:
            out.u8(kTagBoolean);
            out.u8(*v.asBoolean() ? 1 : 0);
            return {};
        case Value::Kind::List:
        {
            const auto &items = *v.asList();
            out.u8(kTagList);
            if (auto ok = writeCount(out, items.size(), "List"); !ok)
                return ok;
            for (const auto &item : items)
            {
                if (auto ok = writeConstant(out, item, depth + 1); !ok)
                    return ok;
            }
            return {};
        }
        case Value::Kind::Map:
        {
            const auto &entries = *v.asMap();
            out.u8(kTagMap);
            if (auto ok = writeCount(out, entries.size(), "Map"); !ok)
                return ok;
            for (const auto &[key, item] : entries)
            {
                if (auto ok = writeString(out, key); !ok)
                    return ok;
                if (auto ok = writeConstant(out, item, depth + 1); !ok)
                    return ok;
            }
            return {};
        }
        case Value::Kind::Template:
        {
            const auto &parts = v.asTemplate()->parts;
            out.u8(kTagTemplate);
            if (auto ok = writeCount(out, parts.size(), "Template"); !ok)
                return ok;
            for (const auto &part : parts)
            {
                out.u8(part.placeholder ? 1 : 0);
                if (!part.placeholder)
                {
                    if (auto ok = writeString(out, part.text); !ok)
                        return ok;
                }
            }
            return {};
        }
        case Value::Kind::Uri:
            return support::makeCompileError(support::TrapKind::TypeError,
                                             "URI values cannot be stored in the constant pool: " +
                                                 v.asUri()->text());
    }
    return {};
}

support::Expected<void> writeRegister(ByteSink &out, const RegisterDefinition &reg)
{
    if (auto ok = writeString(out, reg.name); !ok)
        return ok;
    out.u8(reg.required ? 1 : 0);
    out.u8(reg.temporary ? 1 : 0);
    out.u8(reg.defaultValue ? 1 : 0);
    if (reg.defaultValue)
    {
        if (auto ok = writeConstant(out, *reg.defaultValue, 0); !ok)
            return ok;
    }
    out.u8(reg.builtin ? 1 : 0);
    if (reg.builtin)
        return writeString(out, *reg.builtin);
    return {};
}

} // namespace

support::Expected<std::vector<uint8_t>> BytecodeWriter::serialize(const Bytecode &program)
{
    ByteSink functions;
    for (const auto &slot : program.functions())
    {
        if (auto ok = writeString(functions, slot.name); !ok)
            return ok.error();
    }
    ByteSink registers;
    for (const auto &reg : program.registers())
    {
        if (auto ok = writeRegister(registers, reg); !ok)
            return ok.error();
    }
    ByteSink pool;
    for (const auto &value : program.constants())
    {
        if (auto ok = writeConstant(pool, value, 0); !ok)
            return ok.error();
    }

    const uint32_t conditionTable = kHeaderSize;
    const uint32_t resultTable = conditionTable + 4 * program.conditionCount();
    const uint32_t functionTable = resultTable + 4 * program.resultCount();
    const uint32_t bddTable =
        functionTable + static_cast<uint32_t>(functions.size() + registers.size());
    const uint32_t codeStart = bddTable + 4 * static_cast<uint32_t>(program.bdd().nodes().size());
    const uint32_t constantPool = codeStart + static_cast<uint32_t>(program.code().size());

    ByteSink out;
    out.u32(kBytecodeMagic);
    out.u16(program.version());
    out.u16(static_cast<uint16_t>(program.conditionCount()));
    out.u16(static_cast<uint16_t>(program.resultCount()));
    out.u16(static_cast<uint16_t>(program.registerCount()));
    out.u16(static_cast<uint16_t>(program.constants().size()));
    out.u16(static_cast<uint16_t>(program.functions().size()));
    out.u32(program.bdd().nodeCount());
    out.i32(program.bdd().root());
    out.u32(conditionTable);
    out.u32(resultTable);
    out.u32(functionTable);
    out.u32(constantPool);
    out.u32(bddTable);

    for (uint32_t offset : program.conditionOffsets())
        out.u32(codeStart + offset);
    for (uint32_t offset : program.resultOffsets())
        out.u32(codeStart + offset);
    out.raw(functions.take());
    out.raw(registers.take());
    for (int32_t entry : program.bdd().nodes())
        out.i32(entry);
    out.raw(program.code());
    out.raw(pool.take());
    return out.take();
}

} // namespace rulesvm::bytecode

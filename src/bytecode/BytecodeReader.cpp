//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeReader.cpp
// Purpose: Binary image decoder with header, section and constant validation.
// Key invariants: Section offsets must be monotonic: condition table, result
//                 table, function table, BDD table, constant pool. The
//                 register table sits between the function table and the BDD
//                 table; instructions sit between the BDD table and the pool.
// Ownership/Lifetime: Stateless.
// Links: bytecode/BytecodeReader.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeReader.hpp"

#include "bytecode/ByteOrder.hpp"

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace rulesvm::bytecode
{

namespace
{

/// @brief Header fields in file order.
struct Header
{
    uint32_t magic = 0;
    uint16_t version = 0;
    uint16_t conditionCount = 0;
    uint16_t resultCount = 0;
    uint16_t registerCount = 0;
    uint16_t constantCount = 0;
    uint16_t functionCount = 0;
    uint32_t bddNodeCount = 0;
    int32_t bddRoot = 0;
    uint32_t conditionTable = 0;
    uint32_t resultTable = 0;
    uint32_t functionTable = 0;
    uint32_t constantPool = 0;
    uint32_t bddTable = 0;
};

std::string hex32(uint32_t v)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", v);
    return buf;
}

support::RulesError truncated(const ByteSource &src)
{
    return support::makeFormatError("Unexpected end of bytecode at offset " +
                                    std::to_string(src.failureOffset()));
}

/// @brief Recursive constant decoder bounded by kMaxConstantDepth.
class ConstantDecoder
{
  public:
    explicit ConstantDecoder(ByteSource &src) : src_(src) {}

    support::Expected<Value> read(uint32_t depth)
    {
        if (depth > kMaxConstantDepth)
            return support::makeFormatError("Constant nesting depth exceeds " +
                                            std::to_string(kMaxConstantDepth));
        const size_t at = src_.position();
        const uint8_t tag = src_.u8();
        if (src_.failed())
            return truncated(src_);
        switch (tag)
        {
            case 0:
                return Value::null();
            case 1:
            {
                std::string s = src_.string();
                if (src_.failed())
                    return truncated(src_);
                return Value::string(std::move(s));
            }
            case 2:
            {
                const int32_t n = src_.i32();
                if (src_.failed())
                    return truncated(src_);
                return Value::integer(n);
            }
            case 3:
            {
                const uint8_t b = src_.u8();
                if (src_.failed())
                    return truncated(src_);
                return Value::boolean(b != 0);
            }
            case 4:
            {
                const uint16_t count = src_.u16();
                if (src_.failed())
                    return truncated(src_);
                Value::List items;
                items.reserve(count);
                for (uint16_t i = 0; i < count; ++i)
                {
                    auto item = read(depth + 1);
                    if (!item)
                        return item;
                    items.push_back(std::move(item.value()));
                }
                return Value::list(std::move(items));
            }
            case 5:
            {
                const uint16_t count = src_.u16();
                if (src_.failed())
                    return truncated(src_);
                Value::Map entries;
                for (uint16_t i = 0; i < count; ++i)
                {
                    std::string key = src_.string();
                    if (src_.failed())
                        return truncated(src_);
                    auto item = read(depth + 1);
                    if (!item)
                        return item;
                    entries.insert_or_assign(std::move(key), std::move(item.value()));
                }
                return Value::map(std::move(entries));
            }
            case 6:
            {
                const uint16_t count = src_.u16();
                StringTemplate tpl;
                for (uint16_t i = 0; i < count && !src_.failed(); ++i)
                {
                    StringTemplate::Part part;
                    part.placeholder = src_.u8() != 0;
                    if (!part.placeholder)
                        part.text = src_.string();
                    tpl.parts.push_back(std::move(part));
                }
                if (src_.failed())
                    return truncated(src_);
                return Value::stringTemplate(std::move(tpl));
            }
            default:
                return support::makeFormatError("Unknown constant type tag " +
                                                std::to_string(tag) + " at offset " +
                                                std::to_string(at));
        }
    }

  private:
    ByteSource &src_;
};

support::Expected<void> checkLayout(const Header &h, size_t size)
{
    const bool monotonic = h.conditionTable >= kHeaderSize && h.resultTable >= h.conditionTable &&
                           h.functionTable >= h.resultTable && h.bddTable >= h.functionTable &&
                           h.constantPool >= h.bddTable && h.constantPool <= size;
    if (!monotonic)
        return support::makeFormatError("Invalid offsets in bytecode header");

    const uint64_t conditionEnd = h.conditionTable + 4ull * h.conditionCount;
    const uint64_t resultEnd = h.resultTable + 4ull * h.resultCount;
    const uint64_t bddEnd = h.bddTable + 12ull * h.bddNodeCount;
    if (conditionEnd > h.resultTable)
        return support::makeFormatError("Invalid offsets: condition table overlaps result table");
    if (resultEnd > h.functionTable)
        return support::makeFormatError("Invalid offsets: result table overlaps function table");
    if (bddEnd > h.constantPool)
        return support::makeFormatError("Invalid offsets: BDD table overlaps constant pool");
    if (h.registerCount > kMaxRegisters)
        return support::makeFormatError("Too many registers: " + std::to_string(h.registerCount));
    return {};
}

/// @brief Read a table of absolute body offsets and rebase them on the code section.
support::Expected<std::vector<uint32_t>> readBodyTable(ByteSource &src,
                                                       uint32_t count,
                                                       uint32_t codeStart,
                                                       uint32_t codeEnd,
                                                       const char *what)
{
    std::vector<uint32_t> offsets;
    offsets.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        const uint32_t absolute = src.u32();
        if (src.failed())
            return truncated(src);
        if (absolute < codeStart || absolute >= codeEnd)
            return support::makeFormatError(std::string("Invalid ") + what + " offset at index " +
                                            std::to_string(i));
        offsets.push_back(absolute - codeStart);
    }
    return offsets;
}

support::Expected<RegisterDefinition> readRegister(ByteSource &src)
{
    RegisterDefinition reg;
    reg.name = src.string();
    reg.required = src.u8() != 0;
    reg.temporary = src.u8() != 0;
    const bool hasDefault = src.u8() != 0;
    if (src.failed())
        return truncated(src);
    if (hasDefault)
    {
        ConstantDecoder decoder(src);
        auto value = decoder.read(0);
        if (!value)
            return value.error();
        reg.defaultValue = std::move(value.value());
    }
    const bool hasBuiltin = src.u8() != 0;
    if (hasBuiltin)
        reg.builtin = src.string();
    if (src.failed())
        return truncated(src);
    return reg;
}

} // namespace

support::Expected<Bytecode> BytecodeReader::read(std::span<const uint8_t> image,
                                                 const FunctionRegistry &functions,
                                                 ReadOptions options)
{
    if (image.size() < kHeaderSize)
        return support::makeFormatError("Invalid bytecode: too short");

    ByteSource src(image);
    Header h;
    h.magic = src.u32();
    if (h.magic != kBytecodeMagic)
        return support::makeFormatError("Invalid magic number: " + hex32(h.magic) +
                                        " (expected " + hex32(kBytecodeMagic) + ")");
    h.version = src.u16();
    if (h.version != kBytecodeVersion)
        return support::makeFormatError(
            "Unsupported bytecode version: " + std::to_string(h.version >> 8) + "." +
                std::to_string(h.version & 0xFF) + " (expected " +
                std::to_string(kBytecodeVersion >> 8) + "." +
                std::to_string(kBytecodeVersion & 0xFF) + ")",
            support::TrapKind::UnsupportedVersion);
    h.conditionCount = src.u16();
    h.resultCount = src.u16();
    h.registerCount = src.u16();
    h.constantCount = src.u16();
    h.functionCount = src.u16();
    h.bddNodeCount = src.u32();
    h.bddRoot = src.i32();
    h.conditionTable = src.u32();
    h.resultTable = src.u32();
    h.functionTable = src.u32();
    h.constantPool = src.u32();
    h.bddTable = src.u32();

    if (auto ok = checkLayout(h, image.size()); !ok)
        return ok.error();

    const auto codeStart = static_cast<uint32_t>(h.bddTable + 12ull * h.bddNodeCount);
    const uint32_t codeEnd = h.constantPool;

    Bytecode::Parts parts;
    parts.version = h.version;

    src.seek(h.conditionTable);
    auto conditions = readBodyTable(src, h.conditionCount, codeStart, codeEnd, "condition");
    if (!conditions)
        return conditions.error();
    parts.conditionOffsets = std::move(conditions.value());

    src.seek(h.resultTable);
    auto results = readBodyTable(src, h.resultCount, codeStart, codeEnd, "result");
    if (!results)
        return results.error();
    parts.resultOffsets = std::move(results.value());

    src.seek(h.functionTable);
    std::vector<std::string> names;
    names.reserve(h.functionCount);
    for (uint16_t i = 0; i < h.functionCount; ++i)
        names.push_back(src.string());
    if (src.failed())
        return truncated(src);

    parts.registers.reserve(h.registerCount);
    for (uint16_t i = 0; i < h.registerCount; ++i)
    {
        auto reg = readRegister(src);
        if (!reg)
            return reg.error();
        parts.registers.push_back(std::move(reg.value()));
    }
    if (src.position() != h.bddTable)
        return support::makeFormatError(
            "Invalid offsets: register table does not end at the BDD table");

    std::vector<int32_t> nodes;
    nodes.reserve(3ull * h.bddNodeCount);
    for (uint64_t i = 0; i < 3ull * h.bddNodeCount; ++i)
        nodes.push_back(src.i32());
    if (src.failed())
        return truncated(src);
    parts.bdd = Bdd(std::move(nodes), h.bddRoot);

    parts.code.assign(image.begin() + codeStart, image.begin() + codeEnd);

    src.seek(h.constantPool);
    ConstantDecoder decoder(src);
    parts.constants.reserve(h.constantCount);
    for (uint16_t i = 0; i < h.constantCount; ++i)
    {
        auto value = decoder.read(0);
        if (!value)
            return value.error();
        parts.constants.push_back(std::move(value.value()));
    }
    if (src.position() != image.size())
        return support::makeFormatError("Unexpected trailing bytes after constant pool at offset " +
                                        std::to_string(src.position()));

    std::string missing;
    for (auto &name : names)
    {
        auto it = functions.find(name);
        std::shared_ptr<const RulesFunction> impl = it != functions.end() ? it->second : nullptr;
        if (!impl && !options.allowUnresolvedFunctions)
            missing += missing.empty() ? name : ", " + name;
        parts.functions.push_back(FunctionSlot{std::move(name), std::move(impl)});
    }
    if (!missing.empty())
        return support::makeCompileError(support::TrapKind::MissingFunction,
                                         "Missing bytecode functions: [" + missing + "]");

    return Bytecode::create(std::move(parts));
}

} // namespace rulesvm::bytecode

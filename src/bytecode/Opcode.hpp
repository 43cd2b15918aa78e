//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Opcode.hpp
// Purpose: Opcode numbering, operand layout and classification helpers for the
//          rules bytecode.
// Key invariants: Opcode values are the on-disk encoding of format version 1.1
//                 and must never be renumbered.
//                 Instruction length is fully determined by the opcode byte.
// Ownership: Header-only constants; opcodeName() lives in Opcode.cpp.
// Lifetime: Static.
// Links: bytecode/BytecodeWalker.hpp, vm/BytecodeEvaluator.hpp
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding:
// - [opcode:8] followed by zero to three operand bytes.
// - 16-bit operands are big-endian.
//
// Stack Model:
// - Each condition or result body runs on an empty operand stack and ends
//   with a RETURN_* opcode.
// - Registers hold the parameters and temporaries shared by all bodies of one
//   evaluation.

#pragma once

#include <cstdint>
#include <optional>

namespace rulesvm::bytecode
{

/// @brief Magic number "RULE" stored big-endian at offset 0 of every image.
constexpr uint32_t kBytecodeMagic = 0x52554C45;

/// @brief Format version 1.1, major in the high byte.
constexpr uint16_t kBytecodeVersion = 0x0101;

/// @brief Size in bytes of the fixed file header.
constexpr uint32_t kHeaderSize = 44;

/// @brief Maximum number of registers addressable by a u8 operand.
constexpr uint32_t kMaxRegisters = 256;

/// @brief Maximum nesting depth of list/map constants.
constexpr uint32_t kMaxConstantDepth = 100;

/// @brief Rules bytecode opcodes.
/// @details Grouped by category:
///          - 0-3    Constants and registers
///          - 4-7    Null/boolean tests
///          - 8-17   Aggregate construction
///          - 18-23  Templates and function calls
///          - 24-27  Property and index access
///          - 28-33  Truth tests and comparisons
///          - 34-37  Inlined standard library
///          - 38-40  Returns
///          - 41-42  Split and short-circuit jump
enum class Opcode : uint8_t
{
    // Constants and registers
    LOAD_CONST = 0,    ///< Push constant[u8].
    LOAD_CONST_W = 1,  ///< Push constant[u16].
    SET_REGISTER = 2,  ///< Pop TOS into register[u8].
    LOAD_REGISTER = 3, ///< Push register[u8].

    // Null/boolean tests
    NOT = 4,                   ///< Pop v; push true iff v is boolean false.
    ISSET = 5,                 ///< Pop v; push true iff v is not null.
    TEST_REGISTER_ISSET = 6,   ///< Push true iff register[u8] is not null.
    TEST_REGISTER_NOT_SET = 7, ///< Push true iff register[u8] is null.

    // Aggregate construction
    LIST0 = 8,  ///< Push an empty list.
    LIST1 = 9,  ///< Pop one value; push a one-element list.
    LIST2 = 10, ///< Pop two values; push a two-element list in push order.
    LISTN = 11, ///< Pop u8 values; push a list in push order.
    MAP0 = 12,  ///< Push an empty map.
    MAP1 = 13,  ///< Pop one (value, key) pair; push a map.
    MAP2 = 14,  ///< Pop two pairs; push a map.
    MAP3 = 15,  ///< Pop three pairs; push a map.
    MAP4 = 16,  ///< Pop four pairs; push a map.
    MAPN = 17,  ///< Pop u8 pairs; push a map.

    // Templates and function calls
    RESOLVE_TEMPLATE = 18, ///< Pop u8 strings; push template[u16] filled in.
    FN0 = 19,              ///< Call function[u8] with no arguments.
    FN1 = 20,              ///< Call function[u8] with one argument.
    FN2 = 21,              ///< Call function[u8] with two arguments.
    FN3 = 22,              ///< Call function[u8] with three arguments.
    FN = 23,               ///< Call function[u8] with its declared argument count.

    // Property and index access
    GET_PROPERTY = 24,     ///< Pop target; push target.property(constant[u16]).
    GET_INDEX = 25,        ///< Pop list; push list[u8] or null.
    GET_PROPERTY_REG = 26, ///< Push register[u8].property(constant[u16]).
    GET_INDEX_REG = 27,    ///< Push register[u8][u8] or null.

    // Truth tests and comparisons
    IS_TRUE = 28,                ///< Pop v; push true iff v is boolean true.
    TEST_REGISTER_IS_TRUE = 29,  ///< Push true iff register[u8] is boolean true.
    TEST_REGISTER_IS_FALSE = 30, ///< Push true iff register[u8] is boolean false.
    EQUALS = 31,                 ///< Pop two values; push structural equality.
    STRING_EQUALS = 32,          ///< Pop two strings; push equality (null is unequal).
    BOOLEAN_EQUALS = 33,         ///< Pop two booleans; push equality (null is unequal).

    // Inlined standard library
    SUBSTRING = 34,           ///< Pop string; push substring [u8 start, u8 end, u8 fromEnd].
    IS_VALID_HOST_LABEL = 35, ///< Pop allowDots and label; push validity.
    PARSE_URL = 36,           ///< Pop string; push URI or null.
    URI_ENCODE = 37,          ///< Pop string; push percent-encoded string.

    // Returns
    RETURN_ERROR = 38,    ///< Pop message; raise a rule error.
    RETURN_ENDPOINT = 39, ///< Pop url [properties] [headers] per u8 flags; return endpoint.
    RETURN_VALUE = 40,    ///< Pop v; return it.

    // Split and short-circuit jump
    SPLIT = 41,      ///< Pop limit, delimiter and string; push list of parts.
    JNN_OR_POP = 42, ///< Jump forward u16 if TOS is set, otherwise pop it.
};

/// @brief Highest assigned opcode value.
constexpr uint8_t kMaxOpcode = static_cast<uint8_t>(Opcode::JNN_OR_POP);

/// @brief RETURN_ENDPOINT flag: a header map is on the stack.
constexpr uint8_t kEndpointHasHeaders = 0x01;

/// @brief RETURN_ENDPOINT flag: a property map is on the stack.
constexpr uint8_t kEndpointHasProperties = 0x02;

/// @brief Get the mnemonic of an opcode.
/// @return Static string; "UNKNOWN" for unassigned values.
const char *opcodeName(Opcode op);

/// @brief Decode a raw byte into an opcode.
/// @return The opcode, or empty when @p byte is unassigned.
std::optional<Opcode> decodeOpcode(uint8_t byte);

/// @brief Total instruction length in bytes (opcode plus operands).
inline constexpr int instructionLength(Opcode op)
{
    switch (op)
    {
        case Opcode::LOAD_CONST:
        case Opcode::SET_REGISTER:
        case Opcode::LOAD_REGISTER:
        case Opcode::TEST_REGISTER_ISSET:
        case Opcode::TEST_REGISTER_NOT_SET:
        case Opcode::LISTN:
        case Opcode::MAPN:
        case Opcode::FN0:
        case Opcode::FN1:
        case Opcode::FN2:
        case Opcode::FN3:
        case Opcode::FN:
        case Opcode::GET_INDEX:
        case Opcode::TEST_REGISTER_IS_TRUE:
        case Opcode::TEST_REGISTER_IS_FALSE:
        case Opcode::RETURN_ENDPOINT:
            return 2;
        case Opcode::LOAD_CONST_W:
        case Opcode::GET_PROPERTY:
        case Opcode::GET_INDEX_REG:
        case Opcode::JNN_OR_POP:
            return 3;
        case Opcode::RESOLVE_TEMPLATE:
        case Opcode::GET_PROPERTY_REG:
        case Opcode::SUBSTRING:
            return 4;
        default:
            return 1;
    }
}

/// @brief Operand widths in bytes, in encoding order.
/// @details Unused trailing entries are zero.
struct OperandLayout
{
    uint8_t count = 0;    ///< Number of operands.
    uint8_t widths[3]{};  ///< Width of each operand (1 or 2).
};

/// @brief Operand layout of @p op.
inline constexpr OperandLayout operandLayout(Opcode op)
{
    switch (op)
    {
        case Opcode::LOAD_CONST_W:
        case Opcode::GET_PROPERTY:
        case Opcode::JNN_OR_POP:
            return {1, {2, 0, 0}};
        case Opcode::GET_INDEX_REG:
            return {2, {1, 1, 0}};
        case Opcode::RESOLVE_TEMPLATE:
        case Opcode::GET_PROPERTY_REG:
            return {2, {1, 2, 0}};
        case Opcode::SUBSTRING:
            return {3, {1, 1, 1}};
        default:
            return instructionLength(op) == 2 ? OperandLayout{1, {1, 0, 0}} : OperandLayout{};
    }
}

/// @brief Check whether @p op ends a condition or result body.
inline constexpr bool isReturn(Opcode op)
{
    return op == Opcode::RETURN_ERROR || op == Opcode::RETURN_ENDPOINT ||
           op == Opcode::RETURN_VALUE;
}

/// @brief Check whether @p op carries a jump offset.
inline constexpr bool isJump(Opcode op)
{
    return op == Opcode::JNN_OR_POP;
}

/// @brief Fixed call arity of FN0..FN3, or empty for other opcodes (including FN).
inline constexpr std::optional<uint32_t> fixedCallArity(Opcode op)
{
    switch (op)
    {
        case Opcode::FN0:
            return 0u;
        case Opcode::FN1:
            return 1u;
        case Opcode::FN2:
            return 2u;
        case Opcode::FN3:
            return 3u;
        default:
            return std::nullopt;
    }
}

/// @brief Check whether @p op calls an extension function.
inline constexpr bool isCall(Opcode op)
{
    return op == Opcode::FN || fixedCallArity(op).has_value();
}

} // namespace rulesvm::bytecode

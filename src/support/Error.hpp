//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/Error.hpp
// Purpose: Error record shared by the loader, the compile-side builders and the
//          evaluator.
// Key invariants: Every error carries exactly one category and one trap kind.
//                 Only evaluation errors carry an instruction address.
// Ownership/Lifetime: Plain value type; copied freely.
// Links: support/Expected.hpp, vm/BytecodeEvaluator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rulesvm::support
{

/// @brief Phase in which an error was detected.
enum class ErrorCategory : uint8_t
{
    Format,    ///< Binary image is malformed or from an unsupported version.
    Compile,   ///< Program construction or function linking failed.
    Evaluation ///< Failure while running a condition, result or the BDD.
};

/// @brief Fine-grained classification of an error.
/// @details Tests and embedders switch on the kind; the message is for humans.
enum class TrapKind : uint8_t
{
    None = 0,           ///< No trap.
    InvalidFormat,      ///< Truncated image, bad magic, bad offsets or tags.
    UnsupportedVersion, ///< Version field does not match the reader.
    MissingFunction,    ///< Function name not present in the registry.
    ArityMismatch,      ///< Call opcode arity differs from the function's arity.
    DuplicateRegister,  ///< Register name allocated twice.
    RegisterOverflow,   ///< More than 256 registers.
    UnknownRegister,    ///< Lookup of a register that was never allocated.
    PoolOverflow,       ///< Constant or function table exceeds its index width.
    InvalidJump,        ///< Unmarked label, backward jump or offset overflow.
    InvalidOpcode,      ///< Unknown opcode byte.
    StackUnderflow,     ///< Pop from an empty operand stack.
    Bounds,             ///< Operand or index outside its table.
    TypeError,          ///< Operand value of the wrong kind.
    MissingParameter,   ///< Required register left without a value.
    FunctionError,      ///< Extension function reported a failure.
    InvalidUri,         ///< Endpoint URL failed to parse.
    RuleError,          ///< RETURN_ERROR raised by the rule set.
    MissingReturn,      ///< Body ran off its end without a RETURN opcode.
    NoMatch,            ///< BDD ended on a terminal where a result was required.
    BddCycle,           ///< BDD traversal revisited more nodes than exist.
    IOError,            ///< Reading a bytecode file failed.
};

/// @brief Structured error record.
struct RulesError
{
    ErrorCategory category = ErrorCategory::Evaluation; ///< Detection phase.
    TrapKind kind = TrapKind::None;                     ///< Classification.
    std::string message;                                ///< Human-readable text.
    std::optional<uint32_t> address;                    ///< Instruction address, if any.
};

/// @brief Lowercase name of @p category ("format", "compile", "evaluation").
const char *toString(ErrorCategory category);

/// @brief Stable name of @p kind for diagnostics.
std::string_view toString(TrapKind kind);

/// @brief Create a format error with kind InvalidFormat unless overridden.
RulesError makeFormatError(std::string message, TrapKind kind = TrapKind::InvalidFormat);

/// @brief Create a compile-time error.
RulesError makeCompileError(TrapKind kind, std::string message);

/// @brief Create an evaluation error, optionally tied to an instruction address.
RulesError makeEvaluationError(TrapKind kind,
                               std::string message,
                               std::optional<uint32_t> address = std::nullopt);

/// @brief Print @p error as "error[category]: message" followed by a newline.
void printError(const RulesError &error, std::ostream &os);

} // namespace rulesvm::support

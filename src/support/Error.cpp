//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/Error.cpp
// Purpose: Construction and formatting helpers for RulesError.
// Key invariants: Category names are lowercase and stable.
// Ownership/Lifetime: Stateless helpers.
// Links: support/Error.hpp
//
//===----------------------------------------------------------------------===//

#include "support/Error.hpp"

#include <utility>

namespace rulesvm::support
{

const char *toString(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::Format:
            return "format";
        case ErrorCategory::Compile:
            return "compile";
        case ErrorCategory::Evaluation:
            return "evaluation";
    }
    return "unknown";
}

std::string_view toString(TrapKind kind)
{
    switch (kind)
    {
        case TrapKind::None:
            return "None";
        case TrapKind::InvalidFormat:
            return "InvalidFormat";
        case TrapKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case TrapKind::MissingFunction:
            return "MissingFunction";
        case TrapKind::ArityMismatch:
            return "ArityMismatch";
        case TrapKind::DuplicateRegister:
            return "DuplicateRegister";
        case TrapKind::RegisterOverflow:
            return "RegisterOverflow";
        case TrapKind::UnknownRegister:
            return "UnknownRegister";
        case TrapKind::PoolOverflow:
            return "PoolOverflow";
        case TrapKind::InvalidJump:
            return "InvalidJump";
        case TrapKind::InvalidOpcode:
            return "InvalidOpcode";
        case TrapKind::StackUnderflow:
            return "StackUnderflow";
        case TrapKind::Bounds:
            return "Bounds";
        case TrapKind::TypeError:
            return "TypeError";
        case TrapKind::MissingParameter:
            return "MissingParameter";
        case TrapKind::FunctionError:
            return "FunctionError";
        case TrapKind::InvalidUri:
            return "InvalidUri";
        case TrapKind::RuleError:
            return "RuleError";
        case TrapKind::MissingReturn:
            return "MissingReturn";
        case TrapKind::NoMatch:
            return "NoMatch";
        case TrapKind::BddCycle:
            return "BddCycle";
        case TrapKind::IOError:
            return "IOError";
    }
    return "Unknown";
}

RulesError makeFormatError(std::string message, TrapKind kind)
{
    return RulesError{ErrorCategory::Format, kind, std::move(message), std::nullopt};
}

RulesError makeCompileError(TrapKind kind, std::string message)
{
    return RulesError{ErrorCategory::Compile, kind, std::move(message), std::nullopt};
}

RulesError makeEvaluationError(TrapKind kind, std::string message, std::optional<uint32_t> address)
{
    return RulesError{ErrorCategory::Evaluation, kind, std::move(message), address};
}

void printError(const RulesError &error, std::ostream &os)
{
    os << "error[" << toString(error.category) << "]: " << error.message << '\n';
}

} // namespace rulesvm::support

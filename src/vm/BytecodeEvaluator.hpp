//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/BytecodeEvaluator.hpp
// Purpose: Stack-based interpreter for condition and result bodies, and the
//          BDD traversal that ties them together.
// Key invariants: Program, filler, extensions and builtins outlive the
//                 evaluator. Operand stack starts at kInitialStackSize slots
//                 and doubles when full. Every instruction-level failure
//                 traps with the instruction address.
// Ownership: Evaluator borrows the program and its collaborators; owns the
//            register file and operand stack.
// Lifetime: One evaluator per resolution call; reusable after reset().
// Links: bytecode/Bytecode.hpp, vm/RegisterFiller.hpp, vm/Trace.hpp
//
//===----------------------------------------------------------------------===//
//
// The evaluator executes one body at a time starting from its offset in the
// shared instruction section. A body ends at its first RETURN opcode; running
// into the next body or off the end of the section is a MissingReturn trap.

#pragma once

#include "bytecode/Bdd.hpp"
#include "bytecode/Bytecode.hpp"
#include "support/Expected.hpp"
#include "vm/Context.hpp"
#include "vm/RegisterFiller.hpp"
#include "vm/RulesExtension.hpp"
#include "vm/Trace.hpp"
#include "vm/UriCache.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rulesvm::vm
{

/// @brief Evaluator execution state.
enum class EvalState
{
    Ready,   ///< Registers filled, no body running.
    Running, ///< Currently executing a body.
    Halted,  ///< Last body returned normally.
    Trapped  ///< Last body aborted with a trap.
};

using ExtensionList = std::vector<std::shared_ptr<const RulesExtension>>;

class BytecodeEvaluator
{
  public:
    /// @brief Construct an evaluator for @p program.
    /// @param filler Strategy that initialises the register file.
    /// @param extensions Extensions whose endpoint hooks run after RETURN_ENDPOINT.
    /// @param builtins Builtin providers handed to @p filler.
    /// @param uriCache Shared cache for PARSE_URL and endpoint URLs; may be null.
    /// @param trace Tracing configuration.
    BytecodeEvaluator(const bytecode::Bytecode &program,
                      const RegisterFiller &filler,
                      std::span<const std::shared_ptr<const RulesExtension>> extensions,
                      const BuiltinProviders &builtins,
                      UriCache *uriCache = nullptr,
                      TraceConfig trace = {});

    /// @brief Fill registers for a new evaluation.
    /// @details @p context must stay alive until the evaluation finishes.
    support::Expected<void> reset(const Context &context, const ParamMap &params);

    /// @brief Run condition @p conditionIndex.
    /// @return True when the body returned a value that is neither null nor false.
    support::Expected<bool> test(uint32_t conditionIndex);

    /// @brief Run result @p resultIndex; a negative index yields a no-match result.
    support::Expected<RunResult> resolveResult(int32_t resultIndex);

    /// @brief Traverse the BDD, running conditions as they are reached.
    support::Expected<bytecode::BddOutcome> evaluateBdd();

    /// @brief reset(), evaluateBdd() and resolveResult() in one call.
    support::Expected<RunResult> run(const Context &context, const ParamMap &params);

    const std::vector<Value> &registers() const
    {
        return registers_;
    }

    EvalState state() const
    {
        return state_;
    }

    support::TrapKind trapKind() const
    {
        return trapKind_;
    }

    const std::string &trapMessage() const
    {
        return trapMessage_;
    }

    /// @brief Current operand stack capacity.
    size_t stackCapacity() const
    {
        return stack_.size();
    }

  private:
    /// @brief How a body finished.
    struct BodyExit
    {
        Value value;                      ///< RETURN_VALUE payload.
        std::optional<Endpoint> endpoint; ///< RETURN_ENDPOINT payload.
    };

    /// @brief Run the body occupying [start, end) of the code section.
    support::Expected<BodyExit> execute(uint32_t start,
                                        uint32_t end,
                                        TraceSink::BodyKind body,
                                        uint32_t index);

    /// @brief Record a trap at the current instruction and stop the body.
    void trap(support::TrapKind kind, const std::string &message);

    void push(Value value);

    /// @brief Push a checked operation's value, or trap with its error.
    void pushChecked(support::Expected<Value> result);
    bool pop(Value &out);
    bool popN(uint32_t count, std::vector<Value> &out);
    bool peek(const Value *&out);

    bool checkOperands(uint32_t length);
    bool readRegister(uint32_t idx, const Value *&out);
    bool readConstant(uint32_t idx, const Value *&out);
    bool popString(const char *what, const std::string *&out, Value &holder);

    bool callFunction(uint32_t fnIndex, std::optional<uint32_t> arity);
    bool resolveTemplate(uint32_t argc, uint32_t templateIndex);
    bool buildMap(uint32_t pairs);
    bool returnEndpoint(uint8_t flags, BodyExit &exit);
    std::shared_ptr<const bytecode::Uri> parseUri(const std::string &text);

    const bytecode::Bytecode &program_;
    const RegisterFiller &filler_;
    std::span<const std::shared_ptr<const RulesExtension>> extensions_;
    const BuiltinProviders &builtins_;
    UriCache *uriCache_;
    TraceSink tracer_;

    const Context *context_ = nullptr;
    std::vector<Value> registers_;
    std::vector<Value> stack_;
    size_t sp_ = 0;
    uint32_t pc_ = 0;
    uint32_t instrStart_ = 0;
    uint32_t bodyEnd_ = 0;

    EvalState state_ = EvalState::Ready;
    support::TrapKind trapKind_ = support::TrapKind::None;
    std::string trapMessage_;
    support::RulesError trapError_;
};

} // namespace rulesvm::vm

// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for BDD steps and executed
//          bytecode instructions.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     output stream.
// Links: vm/BytecodeEvaluator.cpp
#pragma once

#include "bytecode/Bdd.hpp"
#include "bytecode/Bytecode.hpp"

#include <cstdint>
#include <ostream>

namespace rulesvm::vm
{

/// @brief Configuration for evaluator tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,         ///< Tracing disabled
        Bdd,         ///< Trace BDD decisions and outcomes
        Instructions ///< Trace BDD decisions and every executed instruction
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines prefixed with "[rules] ".
class TraceSink
{
  public:
    /// @brief Body being executed when a step is recorded.
    enum class BodyKind
    {
        Condition,
        Result
    };

    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of the instruction at @p pc.
    /// @details Emitted only in Instructions mode, e.g.
    ///          "[rules] cond 0 0004 LOAD_REGISTER 0 ; region".
    void onStep(const bytecode::Bytecode &program, BodyKind body, uint32_t index, uint32_t pc);

    /// @brief Record the outcome of condition @p index.
    void onCondition(uint32_t index, bool holds);

    /// @brief Record the outcome of a BDD traversal.
    void onOutcome(const bytecode::BddOutcome &outcome);

    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    std::ostream &stream() const;

    TraceConfig cfg;
};

} // namespace rulesvm::vm

//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/BytecodeEvaluator.cpp
// Purpose: Dispatch loop and BDD driver for rule bodies.
// Key invariants: sp_ never exceeds stack_.size(); pops are checked before
//                 use; a trap leaves state_ == Trapped and ends the body.
// Ownership/Lifetime: See BytecodeEvaluator.hpp.
// Links: bytecode/Opcode.hpp, vm/Stdlib.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/BytecodeEvaluator.hpp"

#include "vm/Stdlib.hpp"
#include "vm/VMConfig.hpp"

#include <utility>

namespace rulesvm::vm
{

using bytecode::Opcode;
using support::TrapKind;

namespace
{

const Context &emptyContext()
{
    static const Context ctx;
    return ctx;
}

} // namespace

BytecodeEvaluator::BytecodeEvaluator(
    const bytecode::Bytecode &program,
    const RegisterFiller &filler,
    std::span<const std::shared_ptr<const RulesExtension>> extensions,
    const BuiltinProviders &builtins,
    UriCache *uriCache,
    TraceConfig trace)
    : program_(program), filler_(filler), extensions_(extensions), builtins_(builtins),
      uriCache_(uriCache), tracer_(trace), registers_(program.registerTemplate()),
      stack_(kInitialStackSize)
{
}

support::Expected<void> BytecodeEvaluator::reset(const Context &context, const ParamMap &params)
{
    context_ = &context;
    sp_ = 0;
    state_ = EvalState::Ready;
    trapKind_ = TrapKind::None;
    trapMessage_.clear();
    return filler_.fill(registers_, context, params, builtins_);
}

//===----------------------------------------------------------------------===//
// Operand stack and operand access
//===----------------------------------------------------------------------===//

void BytecodeEvaluator::trap(TrapKind kind, const std::string &message)
{
    trapKind_ = kind;
    trapMessage_ = message + " at address " + std::to_string(instrStart_);
    trapError_ = support::makeEvaluationError(kind, trapMessage_, instrStart_);
    state_ = EvalState::Trapped;
}

void BytecodeEvaluator::push(Value value)
{
    if (sp_ == stack_.size())
        stack_.resize(stack_.size() * 2);
    stack_[sp_++] = std::move(value);
}

bool BytecodeEvaluator::pop(Value &out)
{
    if (sp_ == 0)
    {
        trap(TrapKind::StackUnderflow, "Stack underflow");
        return false;
    }
    out = std::move(stack_[--sp_]);
    stack_[sp_] = Value();
    return true;
}

/// @brief Pop @p count values; @p out receives them in push order.
bool BytecodeEvaluator::popN(uint32_t count, std::vector<Value> &out)
{
    if (sp_ < count)
    {
        trap(TrapKind::StackUnderflow, "Stack underflow");
        return false;
    }
    out.clear();
    out.reserve(count);
    for (size_t i = sp_ - count; i < sp_; ++i)
    {
        out.push_back(std::move(stack_[i]));
        stack_[i] = Value();
    }
    sp_ -= count;
    return true;
}

bool BytecodeEvaluator::peek(const Value *&out)
{
    if (sp_ == 0)
    {
        trap(TrapKind::StackUnderflow, "Stack underflow");
        return false;
    }
    out = &stack_[sp_ - 1];
    return true;
}

bool BytecodeEvaluator::checkOperands(uint32_t length)
{
    if (instrStart_ + length > bodyEnd_)
    {
        trap(TrapKind::Bounds, "Truncated operands");
        return false;
    }
    return true;
}

bool BytecodeEvaluator::readRegister(uint32_t idx, const Value *&out)
{
    if (idx >= registers_.size())
    {
        trap(TrapKind::Bounds, "Register index " + std::to_string(idx) + " out of range");
        return false;
    }
    out = &registers_[idx];
    return true;
}

bool BytecodeEvaluator::readConstant(uint32_t idx, const Value *&out)
{
    const auto &pool = program_.constants();
    if (idx >= pool.size())
    {
        trap(TrapKind::Bounds, "Constant index " + std::to_string(idx) + " out of range");
        return false;
    }
    out = &pool[idx];
    return true;
}

/// @brief Pop a string or null; @p out is null for a null operand.
bool BytecodeEvaluator::popString(const char *what, const std::string *&out, Value &holder)
{
    if (!pop(holder))
        return false;
    out = nullptr;
    if (holder.isNull())
        return true;
    out = holder.asString();
    if (!out)
    {
        trap(TrapKind::TypeError,
             std::string(what) + " expected a string but got " + bytecode::kindName(holder.kind()));
        return false;
    }
    return true;
}

void BytecodeEvaluator::pushChecked(support::Expected<Value> result)
{
    if (!result)
    {
        trap(result.error().kind, result.error().message);
        return;
    }
    push(std::move(result.value()));
}

std::shared_ptr<const bytecode::Uri> BytecodeEvaluator::parseUri(const std::string &text)
{
    if (uriCache_)
        return uriCache_->get(text);
    auto parsed = bytecode::Uri::parse(text);
    if (!parsed)
        return nullptr;
    return std::make_shared<const bytecode::Uri>(std::move(*parsed));
}

//===----------------------------------------------------------------------===//
// Compound instructions
//===----------------------------------------------------------------------===//

bool BytecodeEvaluator::callFunction(uint32_t fnIndex, std::optional<uint32_t> arity)
{
    const auto &slots = program_.functions();
    if (fnIndex >= slots.size())
    {
        trap(TrapKind::Bounds, "Function index " + std::to_string(fnIndex) + " out of range");
        return false;
    }
    const auto &slot = slots[fnIndex];
    if (!slot.function)
    {
        trap(TrapKind::MissingFunction, "Function " + slot.name + " is not linked");
        return false;
    }
    std::vector<Value> args;
    if (!popN(arity.value_or(slot.function->argumentCount()), args))
        return false;
    auto result = slot.function->apply(args);
    if (!result)
    {
        trap(TrapKind::FunctionError,
             "Function " + slot.name + " failed: " + result.error().message);
        return false;
    }
    push(std::move(result.value()));
    return true;
}

bool BytecodeEvaluator::resolveTemplate(uint32_t argc, uint32_t templateIndex)
{
    const Value *constant = nullptr;
    if (!readConstant(templateIndex, constant))
        return false;
    const auto *tpl = constant->asTemplate();
    if (!tpl)
    {
        trap(TrapKind::TypeError,
             "Constant " + std::to_string(templateIndex) + " is not a template");
        return false;
    }
    if (tpl->placeholderCount() != argc)
    {
        trap(TrapKind::TypeError,
             "Template expects " + std::to_string(tpl->placeholderCount()) +
                 " arguments but got " + std::to_string(argc));
        return false;
    }
    std::vector<Value> args;
    if (!popN(argc, args))
        return false;
    std::string out;
    size_t next = 0;
    for (const auto &part : tpl->parts)
    {
        if (!part.placeholder)
        {
            out += part.text;
            continue;
        }
        const auto *s = args[next].asString();
        if (!s)
        {
            trap(TrapKind::TypeError,
                 std::string("Template argument ") + std::to_string(next) +
                     " expected a string but got " + bytecode::kindName(args[next].kind()));
            return false;
        }
        out += *s;
        ++next;
    }
    push(Value::string(std::move(out)));
    return true;
}

/// @brief Build a map from @p pairs (value, key) pairs; later keys win.
bool BytecodeEvaluator::buildMap(uint32_t pairs)
{
    std::vector<Value> items;
    if (!popN(pairs * 2, items))
        return false;
    Value::Map map;
    for (size_t i = 0; i < items.size(); i += 2)
    {
        const auto *key = items[i + 1].asString();
        if (!key)
        {
            trap(TrapKind::TypeError,
                 std::string("Map key must be a string but got ") +
                     bytecode::kindName(items[i + 1].kind()));
            return false;
        }
        map.insert_or_assign(*key, std::move(items[i]));
    }
    push(Value::map(std::move(map)));
    return true;
}

bool BytecodeEvaluator::returnEndpoint(uint8_t flags, BodyExit &exit)
{
    Value url;
    if (!pop(url))
        return false;
    std::shared_ptr<const bytecode::Uri> uri = url.uriHandle();
    if (!uri)
    {
        const auto *text = url.asString();
        if (!text)
        {
            trap(TrapKind::TypeError,
                 std::string("Endpoint URL must be a string but got ") +
                     bytecode::kindName(url.kind()));
            return false;
        }
        uri = parseUri(*text);
        if (!uri)
        {
            trap(TrapKind::InvalidUri, "Invalid endpoint URL: " + *text);
            return false;
        }
    }

    Value::Map properties;
    if (flags & bytecode::kEndpointHasProperties)
    {
        Value v;
        if (!pop(v))
            return false;
        const auto *map = v.asMap();
        if (!map)
        {
            trap(TrapKind::TypeError,
                 std::string("Endpoint properties must be a map but got ") +
                     bytecode::kindName(v.kind()));
            return false;
        }
        properties = *map;
    }

    HeaderMap headers;
    if (flags & bytecode::kEndpointHasHeaders)
    {
        Value v;
        if (!pop(v))
            return false;
        const auto *map = v.asMap();
        if (!map)
        {
            trap(TrapKind::TypeError,
                 std::string("Endpoint headers must be a map but got ") +
                     bytecode::kindName(v.kind()));
            return false;
        }
        for (const auto &[name, entry] : *map)
        {
            std::vector<std::string> values;
            if (const auto *single = entry.asString())
            {
                values.push_back(*single);
            }
            else if (const auto *list = entry.asList())
            {
                for (const auto &item : *list)
                {
                    const auto *s = item.asString();
                    if (!s)
                    {
                        trap(TrapKind::TypeError, "Header " + name + " must hold strings");
                        return false;
                    }
                    values.push_back(*s);
                }
            }
            else
            {
                trap(TrapKind::TypeError, "Header " + name + " must hold strings");
                return false;
            }
            headers.emplace(name, std::move(values));
        }
    }

    Endpoint endpoint;
    endpoint.uri = std::move(uri);
    endpoint.headers = headers;
    endpoint.properties = properties;
    const Context &ctx = context_ ? *context_ : emptyContext();
    for (const auto &ext : extensions_)
        ext->extractEndpointProperties(endpoint, ctx, properties, headers);
    exit.endpoint = std::move(endpoint);
    return true;
}

//===----------------------------------------------------------------------===//
// Dispatch loop
//===----------------------------------------------------------------------===//

support::Expected<BytecodeEvaluator::BodyExit> BytecodeEvaluator::execute(
    uint32_t start, uint32_t end, TraceSink::BodyKind body, uint32_t index)
{
    const auto code = program_.code();
    auto u8 = [&](uint32_t at) -> uint32_t { return code[instrStart_ + 1 + at]; };
    auto u16 = [&](uint32_t at) -> uint32_t
    { return (uint32_t{code[instrStart_ + 1 + at]} << 8) | code[instrStart_ + 2 + at]; };

#if !RULESVM_VM_TRACE
    (void)body;
    (void)index;
#endif

    BodyExit exit;
    sp_ = 0;
    pc_ = start;
    bodyEnd_ = end;
    state_ = EvalState::Running;

    while (state_ == EvalState::Running)
    {
        instrStart_ = pc_;
        if (pc_ >= bodyEnd_)
        {
            trap(TrapKind::MissingReturn, "Reached end of body without a return");
            break;
        }
        const auto decoded = bytecode::decodeOpcode(code[pc_]);
        if (!decoded)
        {
            trap(TrapKind::InvalidOpcode, "Unknown opcode " + std::to_string(code[pc_]));
            break;
        }
        const Opcode op = *decoded;
        const auto length = static_cast<uint32_t>(bytecode::instructionLength(op));
        if (!checkOperands(length))
            break;
#if RULESVM_VM_TRACE
        if (tracer_.config().mode == TraceConfig::Instructions)
            tracer_.onStep(program_, body, index, instrStart_);
#endif
        pc_ += length;

        switch (op)
        {
            //==================================================================
            // Constants and registers
            //==================================================================
            case Opcode::LOAD_CONST:
            case Opcode::LOAD_CONST_W:
            {
                const Value *v = nullptr;
                if (readConstant(op == Opcode::LOAD_CONST ? u8(0) : u16(0), v))
                    push(*v);
                break;
            }

            case Opcode::SET_REGISTER:
            {
                const Value *reg = nullptr;
                Value v;
                if (readRegister(u8(0), reg) && pop(v))
                    registers_[u8(0)] = std::move(v);
                break;
            }

            case Opcode::LOAD_REGISTER:
            {
                const Value *reg = nullptr;
                if (readRegister(u8(0), reg))
                    push(*reg);
                break;
            }

            case Opcode::TEST_REGISTER_ISSET:
            case Opcode::TEST_REGISTER_NOT_SET:
            {
                const Value *reg = nullptr;
                if (readRegister(u8(0), reg))
                    push(Value::boolean(reg->isSet() == (op == Opcode::TEST_REGISTER_ISSET)));
                break;
            }

            case Opcode::TEST_REGISTER_IS_TRUE:
            {
                const Value *reg = nullptr;
                if (readRegister(u8(0), reg))
                    push(Value::boolean(reg->isTrue()));
                break;
            }

            case Opcode::TEST_REGISTER_IS_FALSE:
            {
                const Value *reg = nullptr;
                if (readRegister(u8(0), reg))
                    push(Value::boolean(reg->isFalse()));
                break;
            }

            //==================================================================
            // Predicates
            //==================================================================
            case Opcode::NOT:
            {
                Value v;
                if (pop(v))
                    push(Value::boolean(v.isFalse()));
                break;
            }

            case Opcode::ISSET:
            {
                Value v;
                if (pop(v))
                    push(Value::boolean(v.isSet()));
                break;
            }

            case Opcode::IS_TRUE:
            {
                Value v;
                if (pop(v))
                    push(Value::boolean(v.isTrue()));
                break;
            }

            case Opcode::EQUALS:
            {
                Value b;
                Value a;
                if (pop(b) && pop(a))
                    push(Value::boolean(a == b));
                break;
            }

            case Opcode::STRING_EQUALS:
            case Opcode::BOOLEAN_EQUALS:
            {
                Value b;
                Value a;
                if (!pop(b) || !pop(a))
                    break;
                if (a.isNull() || b.isNull())
                {
                    push(Value::boolean(false));
                    break;
                }
                const bool strings = op == Opcode::STRING_EQUALS;
                const Value::Kind want = strings ? Value::Kind::String : Value::Kind::Boolean;
                if (a.kind() != want || b.kind() != want)
                {
                    const Value &bad = a.kind() != want ? a : b;
                    trap(TrapKind::TypeError,
                         std::string(bytecode::opcodeName(op)) + " expected " +
                             bytecode::kindName(want) + " but got " +
                             bytecode::kindName(bad.kind()));
                    break;
                }
                push(Value::boolean(a == b));
                break;
            }

            //==================================================================
            // Collections
            //==================================================================
            case Opcode::LIST0:
            case Opcode::LIST1:
            case Opcode::LIST2:
            case Opcode::LISTN:
            {
                const uint32_t count = op == Opcode::LISTN
                                           ? u8(0)
                                           : static_cast<uint32_t>(op) -
                                                 static_cast<uint32_t>(Opcode::LIST0);
                std::vector<Value> items;
                if (popN(count, items))
                    push(Value::list(std::move(items)));
                break;
            }

            case Opcode::MAP0:
            case Opcode::MAP1:
            case Opcode::MAP2:
            case Opcode::MAP3:
            case Opcode::MAP4:
            case Opcode::MAPN:
            {
                const uint32_t pairs = op == Opcode::MAPN
                                           ? u8(0)
                                           : static_cast<uint32_t>(op) -
                                                 static_cast<uint32_t>(Opcode::MAP0);
                buildMap(pairs);
                break;
            }

            case Opcode::RESOLVE_TEMPLATE:
                resolveTemplate(u8(0), u16(1));
                break;

            case Opcode::GET_PROPERTY:
            case Opcode::GET_PROPERTY_REG:
            {
                const bool fromReg = op == Opcode::GET_PROPERTY_REG;
                const Value *name = nullptr;
                if (!readConstant(fromReg ? u16(1) : u16(0), name))
                    break;
                const auto *key = name->asString();
                if (!key)
                {
                    trap(TrapKind::TypeError, "Property name constant is not a string");
                    break;
                }
                if (fromReg)
                {
                    const Value *reg = nullptr;
                    if (readRegister(u8(0), reg))
                        push(stdlib::getProperty(*reg, *key));
                    break;
                }
                Value target;
                if (pop(target))
                    push(stdlib::getProperty(target, *key));
                break;
            }

            case Opcode::GET_INDEX:
            {
                Value target;
                if (pop(target))
                    push(stdlib::getIndex(target, u8(0)));
                break;
            }

            case Opcode::GET_INDEX_REG:
            {
                const Value *reg = nullptr;
                if (readRegister(u8(0), reg))
                    push(stdlib::getIndex(*reg, u8(1)));
                break;
            }

            //==================================================================
            // Function calls
            //==================================================================
            case Opcode::FN0:
            case Opcode::FN1:
            case Opcode::FN2:
            case Opcode::FN3:
            case Opcode::FN:
                callFunction(u8(0), bytecode::fixedCallArity(op));
                break;

            //==================================================================
            // Standard library
            //==================================================================
            case Opcode::SUBSTRING:
            {
                Value input;
                if (pop(input))
                    pushChecked(stdlib::checkedSubstring("SUBSTRING",
                                                         input,
                                                         Value::integer(u8(0)),
                                                         Value::integer(u8(1)),
                                                         Value::boolean(u8(2) != 0)));
                break;
            }

            case Opcode::IS_VALID_HOST_LABEL:
            {
                Value allowDots;
                Value label;
                if (pop(allowDots) && pop(label))
                    pushChecked(
                        stdlib::checkedIsValidHostLabel("IS_VALID_HOST_LABEL", label, allowDots));
                break;
            }

            case Opcode::PARSE_URL:
            {
                Value holder;
                const std::string *text = nullptr;
                if (!popString("PARSE_URL", text, holder))
                    break;
                std::shared_ptr<const bytecode::Uri> uri = text ? parseUri(*text) : nullptr;
                push(uri && !uri->hasQuery() ? Value::uri(std::move(uri)) : Value());
                break;
            }

            case Opcode::URI_ENCODE:
            {
                Value holder;
                const std::string *text = nullptr;
                if (popString("URI_ENCODE", text, holder))
                    push(text ? Value::string(stdlib::uriEncode(*text)) : Value());
                break;
            }

            case Opcode::SPLIT:
            {
                Value limit;
                Value delimiter;
                Value input;
                if (pop(limit) && pop(delimiter) && pop(input))
                    pushChecked(stdlib::checkedSplit("SPLIT", input, delimiter, limit));
                break;
            }

            //==================================================================
            // Control flow and returns
            //==================================================================
            case Opcode::JNN_OR_POP:
            {
                const Value *top = nullptr;
                if (!peek(top))
                    break;
                if (top->isSet())
                {
                    pc_ = instrStart_ + 3 + u16(0);
                    break;
                }
                Value discarded;
                pop(discarded);
                break;
            }

            case Opcode::RETURN_VALUE:
                if (pop(exit.value))
                    state_ = EvalState::Halted;
                break;

            case Opcode::RETURN_ENDPOINT:
                if (returnEndpoint(static_cast<uint8_t>(u8(0)), exit))
                    state_ = EvalState::Halted;
                break;

            case Opcode::RETURN_ERROR:
            {
                Value message;
                if (!pop(message))
                    break;
                trapKind_ = TrapKind::RuleError;
                trapMessage_ = message.toDisplayString();
                trapError_ =
                    support::makeEvaluationError(TrapKind::RuleError, trapMessage_, instrStart_);
                state_ = EvalState::Trapped;
                break;
            }
        }
    }

    if (state_ == EvalState::Trapped)
        return trapError_;
    return exit;
}

//===----------------------------------------------------------------------===//
// Bodies and BDD
//===----------------------------------------------------------------------===//

support::Expected<bool> BytecodeEvaluator::test(uint32_t conditionIndex)
{
    if (conditionIndex >= program_.conditionCount())
        return support::makeEvaluationError(
            TrapKind::Bounds, "Condition index " + std::to_string(conditionIndex) + " out of range");
    auto exit = execute(program_.conditionOffset(conditionIndex),
                        program_.conditionEnd(conditionIndex),
                        TraceSink::BodyKind::Condition,
                        conditionIndex);
    if (!exit)
        return exit.error();
    const bool holds = exit.value().endpoint.has_value() || exit.value().value.truthy();
    tracer_.onCondition(conditionIndex, holds);
    return holds;
}

support::Expected<RunResult> BytecodeEvaluator::resolveResult(int32_t resultIndex)
{
    RunResult result;
    if (resultIndex < 0)
        return result;
    if (static_cast<uint32_t>(resultIndex) >= program_.resultCount())
        return support::makeEvaluationError(
            TrapKind::Bounds, "Result index " + std::to_string(resultIndex) + " out of range");
    auto exit = execute(program_.resultOffset(static_cast<uint32_t>(resultIndex)),
                        program_.resultEnd(static_cast<uint32_t>(resultIndex)),
                        TraceSink::BodyKind::Result,
                        static_cast<uint32_t>(resultIndex));
    if (!exit)
        return exit.error();
    result.resultIndex = resultIndex;
    result.endpoint = std::move(exit.value().endpoint);
    result.value = std::move(exit.value().value);
    return result;
}

support::Expected<bytecode::BddOutcome> BytecodeEvaluator::evaluateBdd()
{
    auto outcome = program_.bdd().evaluate([this](uint32_t condition) { return test(condition); });
    if (outcome)
        tracer_.onOutcome(outcome.value());
    return outcome;
}

support::Expected<RunResult> BytecodeEvaluator::run(const Context &context, const ParamMap &params)
{
    if (auto filled = reset(context, params); !filled)
        return filled.error();
    auto outcome = evaluateBdd();
    if (!outcome)
        return outcome.error();
    if (!outcome.value().hasResult())
    {
        RunResult result;
        result.terminalValue = outcome.value().terminalValue;
        return result;
    }
    return resolveResult(outcome.value().resultIndex);
}

} // namespace rulesvm::vm

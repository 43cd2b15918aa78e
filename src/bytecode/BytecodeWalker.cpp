// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/BytecodeWalker.hpp"

#include <string>

namespace rulesvm::bytecode
{

std::optional<Opcode> BytecodeWalker::currentOpcode() const
{
    if (!hasNext())
        return std::nullopt;
    return decodeOpcode(code_[pc_]);
}

int BytecodeWalker::instructionLength() const
{
    auto op = currentOpcode();
    return op ? bytecode::instructionLength(*op) : -1;
}

int BytecodeWalker::operandCount() const
{
    auto op = currentOpcode();
    return op ? operandLayout(*op).count : 0;
}

support::Expected<int32_t> BytecodeWalker::operand(int index) const
{
    auto op = currentOpcode();
    if (!op)
        return support::makeFormatError("No decodable instruction at offset " +
                                        std::to_string(pc_));
    const OperandLayout layout = operandLayout(*op);
    if (index < 0 || index >= layout.count)
        return support::makeFormatError("Operand index " + std::to_string(index) +
                                            " out of range for " + opcodeName(*op),
                                        support::TrapKind::Bounds);

    size_t at = pc_ + 1;
    for (int i = 0; i < index; ++i)
        at += layout.widths[i];
    const uint8_t width = layout.widths[index];
    if (at + width > code_.size())
        return support::makeFormatError("Truncated instruction at offset " + std::to_string(pc_));
    if (width == 1)
        return static_cast<int32_t>(code_[at]);
    return static_cast<int32_t>((code_[at] << 8) | code_[at + 1]);
}

support::Expected<uint32_t> BytecodeWalker::jumpTarget() const
{
    auto op = currentOpcode();
    if (!op || !isJump(*op))
        return support::makeFormatError("Instruction at offset " + std::to_string(pc_) +
                                        " is not a jump");
    auto offset = operand(0);
    if (!offset)
        return offset.error();
    return pc_ + static_cast<uint32_t>(bytecode::instructionLength(*op)) +
           static_cast<uint32_t>(offset.value());
}

bool BytecodeWalker::isReturn() const
{
    auto op = currentOpcode();
    return op && bytecode::isReturn(*op);
}

bool BytecodeWalker::advance()
{
    const int len = instructionLength();
    if (len < 0)
        return false;
    pc_ += static_cast<uint32_t>(len);
    return true;
}

} // namespace rulesvm::bytecode

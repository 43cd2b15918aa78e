// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Opcode.hpp"

namespace rulesvm::bytecode
{

const char *opcodeName(Opcode op)
{
    switch (op)
    {
        // Constants and registers
        case Opcode::LOAD_CONST:
            return "LOAD_CONST";
        case Opcode::LOAD_CONST_W:
            return "LOAD_CONST_W";
        case Opcode::SET_REGISTER:
            return "SET_REGISTER";
        case Opcode::LOAD_REGISTER:
            return "LOAD_REGISTER";

        // Null/boolean tests
        case Opcode::NOT:
            return "NOT";
        case Opcode::ISSET:
            return "ISSET";
        case Opcode::TEST_REGISTER_ISSET:
            return "TEST_REGISTER_ISSET";
        case Opcode::TEST_REGISTER_NOT_SET:
            return "TEST_REGISTER_NOT_SET";

        // Aggregate construction
        case Opcode::LIST0:
            return "LIST0";
        case Opcode::LIST1:
            return "LIST1";
        case Opcode::LIST2:
            return "LIST2";
        case Opcode::LISTN:
            return "LISTN";
        case Opcode::MAP0:
            return "MAP0";
        case Opcode::MAP1:
            return "MAP1";
        case Opcode::MAP2:
            return "MAP2";
        case Opcode::MAP3:
            return "MAP3";
        case Opcode::MAP4:
            return "MAP4";
        case Opcode::MAPN:
            return "MAPN";

        // Templates and function calls
        case Opcode::RESOLVE_TEMPLATE:
            return "RESOLVE_TEMPLATE";
        case Opcode::FN0:
            return "FN0";
        case Opcode::FN1:
            return "FN1";
        case Opcode::FN2:
            return "FN2";
        case Opcode::FN3:
            return "FN3";
        case Opcode::FN:
            return "FN";

        // Property and index access
        case Opcode::GET_PROPERTY:
            return "GET_PROPERTY";
        case Opcode::GET_INDEX:
            return "GET_INDEX";
        case Opcode::GET_PROPERTY_REG:
            return "GET_PROPERTY_REG";
        case Opcode::GET_INDEX_REG:
            return "GET_INDEX_REG";

        // Truth tests and comparisons
        case Opcode::IS_TRUE:
            return "IS_TRUE";
        case Opcode::TEST_REGISTER_IS_TRUE:
            return "TEST_REGISTER_IS_TRUE";
        case Opcode::TEST_REGISTER_IS_FALSE:
            return "TEST_REGISTER_IS_FALSE";
        case Opcode::EQUALS:
            return "EQUALS";
        case Opcode::STRING_EQUALS:
            return "STRING_EQUALS";
        case Opcode::BOOLEAN_EQUALS:
            return "BOOLEAN_EQUALS";

        // Inlined standard library
        case Opcode::SUBSTRING:
            return "SUBSTRING";
        case Opcode::IS_VALID_HOST_LABEL:
            return "IS_VALID_HOST_LABEL";
        case Opcode::PARSE_URL:
            return "PARSE_URL";
        case Opcode::URI_ENCODE:
            return "URI_ENCODE";

        // Returns
        case Opcode::RETURN_ERROR:
            return "RETURN_ERROR";
        case Opcode::RETURN_ENDPOINT:
            return "RETURN_ENDPOINT";
        case Opcode::RETURN_VALUE:
            return "RETURN_VALUE";

        // Split and short-circuit jump
        case Opcode::SPLIT:
            return "SPLIT";
        case Opcode::JNN_OR_POP:
            return "JNN_OR_POP";
    }
    return "UNKNOWN";
}

std::optional<Opcode> decodeOpcode(uint8_t byte)
{
    if (byte > kMaxOpcode)
        return std::nullopt;
    return static_cast<Opcode>(byte);
}

} // namespace rulesvm::bytecode

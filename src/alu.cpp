/**
 * alu.cpp
 *
 * Implementation of ALU operations.
 * Add and subtract go through the unsigned type so wraparound is well defined.
 */

#include "alu.hpp"

Word ALU::execute(AluOp op, Word a, Word b) {
    UWord ua = static_cast<UWord>(a);
    UWord ub = static_cast<UWord>(b);

    switch (op) {
        case AluOp::ADD:
            return static_cast<Word>(ua + ub);
        case AluOp::SUB:
            return static_cast<Word>(ua - ub);

        // Pass-through (for SETIMM and ADDRESS)
        case AluOp::PASS_B:
            return b;

        default:
            return 0;
    }
}

bool ALU::branch_taken(Opcode op, Word cond_val) {
    switch (op) {
        case Opcode::BRANCH:         return true;
        case Opcode::BRANCH_IF_ZERO: return cond_val == 0;
        default:                     return false;
    }
}

Word ALU::effective_address(Word base, Word offset) {
    return execute(AluOp::ADD, base, offset);
}

/**
 * alu.hpp
 *
 * Arithmetic Logic Unit.
 * 64-bit two's-complement arithmetic; overflow wraps, never traps.
 */

#ifndef ALU_HPP
#define ALU_HPP

#include "common.hpp"

class ALU {
public:
    // Execute an ALU operation
    static Word execute(AluOp op, Word a, Word b);

    // Evaluate branch condition (BRANCH is always taken)
    static bool branch_taken(Opcode op, Word cond_val);

    // Effective address for LOAD/STORE
    static Word effective_address(Word base, Word offset);
};

#endif // ALU_HPP

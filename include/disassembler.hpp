/**
 * disassembler.hpp
 *
 * Renders resolved instructions back to assembly text.
 */

#ifndef DISASSEMBLER_HPP
#define DISASSEMBLER_HPP

#include "common.hpp"

class Disassembler {
public:
    // Canonical text, e.g. "LOAD X2, X0, 0"
    static std::string format(const Instruction& ins);
};

#endif // DISASSEMBLER_HPP

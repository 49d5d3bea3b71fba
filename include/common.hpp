/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used throughout the
 * IKEA assembler and emulator.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = int64_t;           // 64-bit signed (register and memory cell)
using UWord = uint64_t;         // Unsigned view, used for wrapping arithmetic
using Address = int64_t;        // Memory address or instruction index

constexpr int NUM_REGISTERS = 32;

// =============================================================================
// ALU Operations
// =============================================================================

enum class AluOp {
    ADD, SUB,
    PASS_B                  // Pass second operand through (for SETIMM/ADDRESS)
};

// =============================================================================
// Opcodes
// =============================================================================

enum class Opcode {
    ADDRESS,            // Xd, data symbol
    LOAD,               // Xd, Xbase, imm
    STORE,              // Xsrc, Xbase, imm
    ADD,                // Xd, Xa, Xb
    SUB,                // Xd, Xa, Xb
    SETIMM,             // Xd, imm
    BRANCH,             // label
    BRANCH_IF_ZERO,     // Xcond, label
    UNKNOWN
};

// =============================================================================
// Resolved Instruction
// =============================================================================

struct Instruction {
    Opcode op = Opcode::UNKNOWN;

    int rd = 0;                 // Destination (or STORE source) register
    int rs1 = 0;                // Base / first operand / condition register
    int rs2 = 0;                // Second operand register
    Word imm = 0;               // Immediate or resolved data address
    Address target = 0;         // Branch target (instruction index)

    int line = 0;               // Source line
    std::string symbol;         // Symbol operand as written, for display

    bool is_branch() const { return op == Opcode::BRANCH || op == Opcode::BRANCH_IF_ZERO; }
};

// =============================================================================
// Symbols
// =============================================================================

enum class SymbolKind {
    LABEL,      // Bound to an instruction index
    DATA        // Bound to a memory address
};

struct Symbol {
    SymbolKind kind = SymbolKind::LABEL;
    Address value = 0;
    int line = 0;               // Line of the declaration
};

// =============================================================================
// Resolved Program
// =============================================================================

struct Program {
    std::vector<Instruction> instructions;
    std::vector<Word> data;                     // Initial memory image
    std::map<std::string, Symbol> symbols;
    std::map<Address, std::string> source_map;  // Instruction index -> source line
};

// =============================================================================
// Utility Functions
// =============================================================================

// Format as hex string (two's complement for negative values)
inline std::string to_hex(Word value, int width = 16) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(width)
        << static_cast<UWord>(value);
    return oss.str();
}

// Register name
inline std::string reg_name(int reg) {
    return "X" + std::to_string(reg);
}

// Opcode to mnemonic
inline std::string op_name(Opcode op) {
    switch (op) {
        case Opcode::ADDRESS: return "ADDRESS";
        case Opcode::LOAD: return "LOAD";
        case Opcode::STORE: return "STORE";
        case Opcode::ADD: return "ADD";
        case Opcode::SUB: return "SUB";
        case Opcode::SETIMM: return "SETIMM";
        case Opcode::BRANCH: return "BRANCH";
        case Opcode::BRANCH_IF_ZERO: return "BRANCH_IF_ZERO";
        default: return "UNKNOWN";
    }
}

// Mnemonic to opcode (expects upper case)
inline Opcode op_from_name(const std::string& name) {
    static const std::map<std::string, Opcode> ops = {
        {"ADDRESS", Opcode::ADDRESS},
        {"LOAD", Opcode::LOAD},
        {"STORE", Opcode::STORE},
        {"ADD", Opcode::ADD},
        {"SUB", Opcode::SUB},
        {"SETIMM", Opcode::SETIMM},
        {"BRANCH", Opcode::BRANCH},
        {"BRANCH_IF_ZERO", Opcode::BRANCH_IF_ZERO}
    };
    auto it = ops.find(name);
    return (it != ops.end()) ? it->second : Opcode::UNKNOWN;
}

#endif // COMMON_HPP

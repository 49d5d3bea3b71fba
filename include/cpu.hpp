/**
 * cpu.hpp
 *
 * IKEA interpreter.
 * Executes one resolved instruction per step: fetch, execute, memory,
 * writeback, then update the PC. Falling off the end of the program halts.
 */

#ifndef CPU_HPP
#define CPU_HPP

#include "common.hpp"
#include "memory.hpp"
#include "register_file.hpp"
#include "alu.hpp"

class CPU {
public:
    enum class StopReason {
        HALTED,         // PC ran past the last instruction
        BREAKPOINT,
        STEP_LIMIT
    };

    CPU(Memory& mem, RegisterFile& regs);

    // Take a copy of the program and reset to its initial state
    void load(const Program& program, size_t extra_words = 0);

    // Registers and PC to zero, memory back to the loaded image
    void reset();

    // Execute one instruction, returns false if halted or at a breakpoint.
    // Throws MemoryFault (with the faulting PC) on an out-of-range access.
    bool step();

    // Run until halt, breakpoint, or max_steps instructions (0 = no limit)
    StopReason run(uint64_t max_steps = 0);

    // State access
    Address get_pc() const;
    // Resume from addr; clears the halt and any recorded fault
    void set_pc(Address addr);
    uint64_t get_instruction_count() const;
    uint64_t get_branch_count() const;
    bool is_halted() const;
    const std::vector<Instruction>& get_instructions() const;
    const std::optional<MemoryFault>& get_fault() const;

    // Index of the last executed instruction (for display)
    Address get_last_pc() const;

    // Trace each executed instruction to out (nullptr disables)
    void set_trace(std::ostream* out);

    // Breakpoints
    void add_breakpoint(Address addr);
    void remove_breakpoint(Address addr);
    void clear_breakpoints();
    bool has_breakpoint(Address addr) const;
    const std::vector<Address>& get_breakpoints() const;

private:
    Memory& mem;
    RegisterFile& regs;
    std::vector<Instruction> program;
    std::vector<Word> image;
    size_t extra_words;
    Address pc;
    uint64_t instructions;
    uint64_t branches;
    bool halted;
    Address last_pc;
    std::optional<MemoryFault> fault;
    std::ostream* trace;
    std::vector<Address> breakpoints;

    bool at_end() const;

    // Stages
    const Instruction& fetch() const;
    Word execute(const Instruction& ins, Word rs1_val, Word rs2_val);
    Word memory_access(const Instruction& ins, Word alu_result, Word rd_val);
    void writeback(const Instruction& ins, Word result);
    Address next_pc(const Instruction& ins, Word rs1_val);
};

#endif // CPU_HPP

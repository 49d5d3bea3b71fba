/**
 * cpu.cpp
 *
 * Interpreter implementation.
 * All stages complete in one step; a fault aborts the step before writeback.
 */

#include "cpu.hpp"
#include "disassembler.hpp"
#include <algorithm>

CPU::CPU(Memory& mem, RegisterFile& regs)
    : mem(mem), regs(regs), extra_words(0), pc(0),
      instructions(0), branches(0), halted(false), last_pc(0), trace(nullptr) {}

void CPU::load(const Program& prog, size_t extra) {
    program = prog.instructions;
    image = prog.data;
    extra_words = extra;
    breakpoints.clear();
    reset();
}

void CPU::reset() {
    pc = 0;
    instructions = 0;
    branches = 0;
    halted = false;
    last_pc = 0;
    fault.reset();
    regs.reset();
    mem.load(image, extra_words);
}

bool CPU::at_end() const {
    return pc < 0 || pc >= static_cast<Address>(program.size());
}

// =============================================================================
// Fetch
// =============================================================================

const Instruction& CPU::fetch() const {
    return program[static_cast<size_t>(pc)];
}

// =============================================================================
// Execute
// =============================================================================

Word CPU::execute(const Instruction& ins, Word rs1_val, Word rs2_val) {
    switch (ins.op) {
        case Opcode::ADD:
            return ALU::execute(AluOp::ADD, rs1_val, rs2_val);
        case Opcode::SUB:
            return ALU::execute(AluOp::SUB, rs1_val, rs2_val);
        case Opcode::LOAD:
        case Opcode::STORE:
            return ALU::effective_address(rs1_val, ins.imm);
        case Opcode::ADDRESS:
        case Opcode::SETIMM:
            return ALU::execute(AluOp::PASS_B, 0, ins.imm);
        default:
            return 0;
    }
}

// =============================================================================
// Memory Access
// =============================================================================

Word CPU::memory_access(const Instruction& ins, Word alu_result, Word rd_val) {
    if (ins.op == Opcode::LOAD) {
        return mem.read(alu_result);
    }
    if (ins.op == Opcode::STORE) {
        mem.write(alu_result, rd_val);
    }
    return alu_result;
}

// =============================================================================
// Writeback
// =============================================================================

void CPU::writeback(const Instruction& ins, Word result) {
    switch (ins.op) {
        case Opcode::ADDRESS:
        case Opcode::LOAD:
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::SETIMM:
            regs.write(ins.rd, result);
            break;
        default:
            break;
    }
}

// =============================================================================
// Next PC
// =============================================================================

Address CPU::next_pc(const Instruction& ins, Word rs1_val) {
    if (ins.is_branch() && ALU::branch_taken(ins.op, rs1_val)) {
        branches++;
        return ins.target;
    }
    return pc + 1;
}

// =============================================================================
// Step (execute one instruction)
// =============================================================================

bool CPU::step() {
    if (halted) return false;

    if (at_end()) {
        halted = true;
        return false;
    }

    // Fetch
    const Instruction& ins = fetch();
    last_pc = pc;

    if (trace) {
        *trace << "[" << pc << "] " << Disassembler::format(ins) << "\n";
    }

    // Read registers (STORE takes its source from rd)
    Word rs1_val = regs.read(ins.rs1);
    Word rs2_val = regs.read(ins.rs2);
    Word rd_val = regs.read(ins.rd);

    // Execute
    Word alu_result = execute(ins, rs1_val, rs2_val);

    // Memory
    Word result;
    try {
        result = memory_access(ins, alu_result, rd_val);
    } catch (const MemoryFault& f) {
        halted = true;
        fault.emplace(f.address(), f.memory_size(), pc);
        throw *fault;
    }

    // Writeback
    writeback(ins, result);

    // Update PC
    pc = next_pc(ins, rs1_val);
    instructions++;

    if (at_end()) {
        halted = true;
        return false;
    }

    // Check breakpoint
    if (has_breakpoint(pc)) {
        return false;
    }

    return true;
}

// =============================================================================
// Run
// =============================================================================

CPU::StopReason CPU::run(uint64_t max_steps) {
    uint64_t executed = 0;
    while (true) {
        if (max_steps > 0 && executed >= max_steps) {
            return StopReason::STEP_LIMIT;
        }
        bool cont = step();
        executed++;
        if (!cont) {
            return halted ? StopReason::HALTED : StopReason::BREAKPOINT;
        }
    }
}

// =============================================================================
// Accessors
// =============================================================================

Address CPU::get_pc() const { return pc; }

void CPU::set_pc(Address addr) {
    if (addr < 0 || addr > static_cast<Address>(program.size())) {
        throw std::out_of_range("PC out of range: " + std::to_string(addr));
    }
    pc = addr;
    halted = false;
    fault.reset();
}

uint64_t CPU::get_instruction_count() const { return instructions; }
uint64_t CPU::get_branch_count() const { return branches; }
bool CPU::is_halted() const { return halted; }
const std::vector<Instruction>& CPU::get_instructions() const { return program; }
const std::optional<MemoryFault>& CPU::get_fault() const { return fault; }
Address CPU::get_last_pc() const { return last_pc; }
void CPU::set_trace(std::ostream* out) { trace = out; }

// =============================================================================
// Breakpoints
// =============================================================================

void CPU::add_breakpoint(Address addr) {
    if (!has_breakpoint(addr)) {
        breakpoints.push_back(addr);
    }
}

void CPU::remove_breakpoint(Address addr) {
    breakpoints.erase(
        std::remove(breakpoints.begin(), breakpoints.end(), addr),
        breakpoints.end()
    );
}

void CPU::clear_breakpoints() {
    breakpoints.clear();
}

bool CPU::has_breakpoint(Address addr) const {
    return std::find(breakpoints.begin(), breakpoints.end(), addr) != breakpoints.end();
}

const std::vector<Address>& CPU::get_breakpoints() const {
    return breakpoints;
}

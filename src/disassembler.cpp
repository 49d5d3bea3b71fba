/**
 * disassembler.cpp
 *
 * Implementation of instruction formatting.
 */

#include "disassembler.hpp"

std::string Disassembler::format(const Instruction& ins) {
    std::ostringstream oss;
    std::string name = op_name(ins.op);

    switch (ins.op) {
        case Opcode::ADDRESS:
            oss << name << " " << reg_name(ins.rd) << ", ";
            if (!ins.symbol.empty()) oss << ins.symbol;
            else oss << ins.imm;
            break;

        case Opcode::LOAD:
        case Opcode::STORE:
            oss << name << " " << reg_name(ins.rd) << ", "
                << reg_name(ins.rs1) << ", " << ins.imm;
            break;

        case Opcode::ADD:
        case Opcode::SUB:
            oss << name << " " << reg_name(ins.rd) << ", "
                << reg_name(ins.rs1) << ", " << reg_name(ins.rs2);
            break;

        case Opcode::SETIMM:
            oss << name << " " << reg_name(ins.rd) << ", " << ins.imm;
            break;

        case Opcode::BRANCH:
            oss << name << " ";
            if (!ins.symbol.empty()) oss << ins.symbol;
            else oss << "@" << ins.target;
            break;

        case Opcode::BRANCH_IF_ZERO:
            oss << name << " " << reg_name(ins.rs1) << ", ";
            if (!ins.symbol.empty()) oss << ins.symbol;
            else oss << "@" << ins.target;
            break;

        default:
            oss << "unknown";
            break;
    }

    return oss.str();
}

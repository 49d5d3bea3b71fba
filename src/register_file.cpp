/**
 * register_file.cpp
 *
 * Implementation of the general-purpose registers.
 */

#include "register_file.hpp"
#include <cctype>

RegisterFile::RegisterFile() {
    reset();
}

void RegisterFile::reset() {
    regs.fill(0);
}

Word RegisterFile::read(int reg) const {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        throw std::out_of_range("Invalid register: " + std::to_string(reg));
    }
    return regs[reg];
}

void RegisterFile::write(int reg, Word value) {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        throw std::out_of_range("Invalid register: " + std::to_string(reg));
    }
    regs[reg] = value;
}

void RegisterFile::dump(std::ostream& out) const {
    out << "Registers:\n";
    for (int row = 0; row < NUM_REGISTERS / 4; row++) {
        out << "  ";
        for (int col = 0; col < 4; col++) {
            int reg = row * 4 + col;
            out << std::setw(3) << std::left << reg_name(reg) << std::right
                << " = " << to_hex(regs[reg]);
            if (col < 3) out << "  ";
        }
        out << "\n";
    }
}

void RegisterFile::dump_reg(int reg, std::ostream& out) const {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        out << "Invalid register: " << reg << "\n";
        return;
    }
    out << reg_name(reg) << " = " << to_hex(regs[reg])
        << " (" << regs[reg] << ")\n";
}

const std::array<Word, NUM_REGISTERS>& RegisterFile::get_all() const {
    return regs;
}

int RegisterFile::parse_name(const std::string& name) {
    if (name.size() < 2 || name.size() > 3) return -1;
    if (name[0] != 'X' && name[0] != 'x') return -1;

    int n = 0;
    for (size_t i = 1; i < name.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return -1;
        n = n * 10 + (name[i] - '0');
    }
    // "X01" is not a register name
    if (name.size() == 3 && name[1] == '0') return -1;
    return (n < NUM_REGISTERS) ? n : -1;
}

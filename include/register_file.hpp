/**
 * register_file.hpp
 *
 * General-purpose registers X0-X31.
 * None of them is hardwired; all start at zero.
 */

#ifndef REGISTER_FILE_HPP
#define REGISTER_FILE_HPP

#include "common.hpp"

class RegisterFile {
public:
    RegisterFile();
    void reset();

    // Read register value
    Word read(int reg) const;

    // Write register value
    void write(int reg, Word value);

    // Display
    void dump(std::ostream& out = std::cout) const;
    void dump_reg(int reg, std::ostream& out = std::cout) const;

    // Direct access for inspection
    const std::array<Word, NUM_REGISTERS>& get_all() const;

    // Parse "X5" / "x5", returns -1 if not a register name
    static int parse_name(const std::string& name);

private:
    std::array<Word, NUM_REGISTERS> regs;
};

#endif // REGISTER_FILE_HPP

/**
 * memory.hpp
 *
 * Memory subsystem for the IKEA emulator.
 * Word-addressable, fixed size, bounds-checked.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"

// Raised when an access falls outside [0, size)
class MemoryFault : public std::runtime_error {
public:
    static constexpr Address NO_PC = -1;

    MemoryFault(Address address, size_t size, Address pc = NO_PC);

    Address address() const { return addr; }
    size_t memory_size() const { return size; }
    Address pc() const { return fault_pc; }

private:
    Address addr;
    size_t size;
    Address fault_pc;

    static std::string describe(Address address, size_t size, Address pc);
};

class Memory {
public:
    Memory();
    void reset();

    // Replace contents with an image plus zeroed scratch cells
    void load(const std::vector<Word>& image, size_t extra_words = 0);

    // Word access
    Word read(Address addr);
    void write(Address addr, Word value);

    bool in_range(Address addr) const;
    size_t size() const;

    // Display
    void dump(Address start, size_t count = 8, std::ostream& out = std::cout) const;

    // Direct access for inspection
    const std::vector<Word>& get_all() const;

    // Stats
    uint64_t get_read_count() const;
    uint64_t get_write_count() const;

private:
    std::vector<Word> cells;
    uint64_t read_count;
    uint64_t write_count;
};

#endif // MEMORY_HPP

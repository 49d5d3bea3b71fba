/**
 * memory.cpp
 *
 * Implementation of the memory subsystem.
 * The size is fixed when a program is loaded; nothing grows on access.
 */

#include "memory.hpp"
#include <algorithm>

// =============================================================================
// Fault
// =============================================================================

MemoryFault::MemoryFault(Address address, size_t size, Address pc)
    : std::runtime_error(describe(address, size, pc)),
      addr(address), size(size), fault_pc(pc) {}

std::string MemoryFault::describe(Address address, size_t size, Address pc) {
    std::ostringstream oss;
    oss << "Memory fault";
    if (pc != NO_PC) oss << " at instruction " << pc;
    oss << ": address " << address << " out of range [0, " << size << ")";
    return oss.str();
}

// =============================================================================
// Setup
// =============================================================================

Memory::Memory() : read_count(0), write_count(0) {}

void Memory::reset() {
    cells.clear();
    read_count = 0;
    write_count = 0;
}

void Memory::load(const std::vector<Word>& image, size_t extra_words) {
    reset();
    cells = image;
    cells.resize(image.size() + extra_words, 0);
}

// =============================================================================
// Word Access
// =============================================================================

bool Memory::in_range(Address addr) const {
    return addr >= 0 && static_cast<UWord>(addr) < cells.size();
}

Word Memory::read(Address addr) {
    if (!in_range(addr)) {
        throw MemoryFault(addr, cells.size());
    }
    read_count++;
    return cells[static_cast<size_t>(addr)];
}

void Memory::write(Address addr, Word value) {
    if (!in_range(addr)) {
        throw MemoryFault(addr, cells.size());
    }
    write_count++;
    cells[static_cast<size_t>(addr)] = value;
}

size_t Memory::size() const {
    return cells.size();
}

// =============================================================================
// Display
// =============================================================================

void Memory::dump(Address start, size_t count, std::ostream& out) const {
    if (!in_range(start)) {
        out << "Address " << start << " out of range [0, " << cells.size() << ")\n";
        return;
    }

    // Only cells that exist are shown
    size_t first = static_cast<size_t>(start);
    size_t last = first + std::min(count, cells.size() - first);
    out << "Memory [" << first << ", " << last << ") of " << cells.size() << " words:\n";
    for (size_t addr = first; addr < last; addr++) {
        Word val = cells[addr];
        out << "  " << std::setw(6) << addr << ": " << to_hex(val)
            << " (" << val << ")\n";
    }
}

const std::vector<Word>& Memory::get_all() const {
    return cells;
}

// =============================================================================
// Stats
// =============================================================================

uint64_t Memory::get_read_count() const {
    return read_count;
}

uint64_t Memory::get_write_count() const {
    return write_count;
}

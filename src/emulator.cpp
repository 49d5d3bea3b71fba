/**
 * emulator.cpp
 *
 * Top-level emulator implementation.
 */

#include "emulator.hpp"
#include "disassembler.hpp"
#include "image_writer.hpp"
#include <algorithm>
#include <sstream>

static bool parse_number(const std::string& str, long long& value) {
    try {
        size_t pos = 0;
        if (str.size() > 2 && (str[1] == 'x' || str[1] == 'X')) {
            value = std::stoll(str, &pos, 16);
        } else {
            value = std::stoll(str, &pos, 10);
        }
        return pos == str.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static std::string lower(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::tolower);
    return r;
}

Emulator::Emulator(std::ostream& out)
    : out(out), cpu(mem, regs), running(true), program_loaded(false) {}

// =============================================================================
// Program Loading
// =============================================================================

bool Emulator::install(const Assembler::Result& result) {
    if (!result.success) {
        out << "Assembly failed:\n";
        for (const auto& err : result.errors) {
            out << "  [" << Assembler::kind_name(err.kind) << "] " << err.to_string() << "\n";
        }
        return false;
    }

    program = result.program;
    cpu.load(program, config.extra_words);
    cpu.set_trace(config.trace ? &out : nullptr);

    program_loaded = true;
    return true;
}

bool Emulator::load(const std::string& filename) {
    if (!install(assembler.assemble_file(filename))) {
        return false;
    }

    out << "Loaded " << program.instructions.size() << " instructions, "
        << program.data.size() << " data words\n";
    return true;
}

bool Emulator::load_source(const std::string& source) {
    return install(assembler.assemble(source));
}

// =============================================================================
// Command Loop
// =============================================================================

void Emulator::run(std::istream& in) {
    print_welcome();

    std::string input;
    while (running) {
        print_prompt();
        if (!std::getline(in, input)) break;
        if (!execute_command(input)) break;
    }

    out << "Goodbye!\n";
}

bool Emulator::execute_command(const std::string& input) {
    auto tokens = tokenize(input);
    if (tokens.empty()) return true;

    std::string cmd = lower(tokens[0]);

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
        return false;
    }
    else if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    }
    else if (cmd == "load" || cmd == "l") {
        if (tokens.size() < 2) {
            out << "Usage: load <filename>\n";
        } else {
            cmd_load(tokens[1]);
        }
    }
    else if (cmd == "run" || cmd == "r") {
        cmd_run();
    }
    else if (cmd == "step" || cmd == "s") {
        long long count = 1;
        if (tokens.size() > 1 && (!parse_number(tokens[1], count) || count < 1)) {
            out << "Invalid step count: " << tokens[1] << "\n";
            return true;
        }
        cmd_step(static_cast<uint64_t>(count));
    }
    else if (cmd == "reset") {
        cmd_reset();
    }
    else if (cmd == "regs" || cmd == "registers") {
        cmd_regs();
    }
    else if (cmd == "reg") {
        if (tokens.size() < 2) {
            out << "Usage: reg <register>\n";
        } else {
            cmd_reg(tokens[1]);
        }
    }
    else if (cmd == "mem" || cmd == "memory" || cmd == "m") {
        Address addr = 0;
        long long count = 8;
        if (tokens.size() > 1 && !resolve_address(tokens[1], addr)) return true;
        if (tokens.size() > 2 && (!parse_number(tokens[2], count) || count < 1)) {
            out << "Invalid count: " << tokens[2] << "\n";
            return true;
        }
        cmd_mem(addr, static_cast<size_t>(count));
    }
    else if (cmd == "pc") {
        if (tokens.size() > 1) {
            Address addr = 0;
            if (resolve_address(tokens[1], addr)) cmd_set_pc(addr);
        } else {
            cmd_pc();
        }
    }
    else if (cmd == "break" || cmd == "b") {
        if (tokens.size() < 2) {
            cmd_breakpoints();
        } else {
            cmd_break(tokens[1]);
        }
    }
    else if (cmd == "delete") {
        if (tokens.size() < 2) {
            out << "Usage: delete <index|label>\n";
        } else {
            cmd_delete(tokens[1]);
        }
    }
    else if (cmd == "clear") {
        cmd_clear();
    }
    else if (cmd == "symbols" || cmd == "sym") {
        cmd_symbols();
    }
    else if (cmd == "disasm" || cmd == "d") {
        Address addr = 0;
        long long count = 10;
        if (tokens.size() > 1 && !resolve_address(tokens[1], addr)) return true;
        if (tokens.size() > 2 && (!parse_number(tokens[2], count) || count < 1)) {
            out << "Invalid count: " << tokens[2] << "\n";
            return true;
        }
        cmd_disasm(addr, static_cast<size_t>(count));
    }
    else if (cmd == "stats") {
        cmd_stats();
    }
    else if (cmd == "limit") {
        cmd_limit(tokens);
    }
    else if (cmd == "trace") {
        cmd_trace(tokens);
    }
    else if (cmd == "extra") {
        cmd_extra(tokens);
    }
    else if (cmd == "image") {
        if (tokens.size() < 2) {
            out << "Usage: image <filename>\n";
        } else {
            cmd_image(tokens[1]);
        }
    }
    else {
        out << "Unknown command: " << cmd << ". Type 'help' for commands.\n";
    }

    return true;
}

// =============================================================================
// Command Implementations
// =============================================================================

void Emulator::cmd_help() {
    out << "Commands:\n"
        << "  load <file>        Load assembly file\n"
        << "  run                Run until halt, breakpoint, or step limit\n"
        << "  step [n]           Execute n instructions (default 1)\n"
        << "  reset              Reset registers, memory, and PC\n"
        << "  regs               Show all registers\n"
        << "  reg <Xn>           Show single register\n"
        << "  mem [addr] [n]     Show n memory words (address or data symbol)\n"
        << "  pc [index]         Show or set PC (index or label)\n"
        << "  break <index>      Set breakpoint (index or label)\n"
        << "  delete <index>     Remove breakpoint\n"
        << "  clear              Clear all breakpoints\n"
        << "  symbols            Show symbol table\n"
        << "  disasm [index] [n] Disassemble instructions\n"
        << "  stats              Show statistics\n"
        << "  limit [n]          Show or set the run step limit (0 = none)\n"
        << "  trace [on|off]     Show or toggle instruction trace\n"
        << "  extra [n]          Show or set scratch memory words for next load/reset\n"
        << "  image <file>       Write memory as a Logisim image file\n"
        << "  quit               Exit emulator\n";
}

void Emulator::cmd_load(const std::string& filename) {
    load(filename);
}

void Emulator::cmd_run() {
    if (!program_loaded) {
        out << "No program loaded\n";
        return;
    }

    try {
        CPU::StopReason reason = cpu.run(config.step_limit);
        switch (reason) {
            case CPU::StopReason::HALTED:
                out << "Halted after " << cpu.get_instruction_count() << " instructions\n";
                break;
            case CPU::StopReason::BREAKPOINT:
                out << "Breakpoint hit\n";
                print_instruction(cpu.get_pc());
                break;
            case CPU::StopReason::STEP_LIMIT:
                out << "Step limit (" << config.step_limit << ") reached at PC="
                    << cpu.get_pc() << "\n";
                break;
        }
    } catch (const MemoryFault& fault) {
        report_fault(fault);
    }
}

void Emulator::cmd_step(uint64_t count) {
    if (!program_loaded) {
        out << "No program loaded\n";
        return;
    }

    for (uint64_t i = 0; i < count; i++) {
        if (cpu.is_halted()) {
            out << "Program halted\n";
            break;
        }

        bool cont;
        try {
            cont = cpu.step();
        } catch (const MemoryFault& fault) {
            report_fault(fault);
            break;
        }
        print_instruction(cpu.get_last_pc());

        if (!cont) {
            if (cpu.is_halted()) {
                out << "Program halted\n";
            } else {
                out << "Breakpoint hit\n";
            }
            break;
        }
    }
}

void Emulator::cmd_reset() {
    if (!program_loaded) {
        out << "No program loaded\n";
        return;
    }

    // Breakpoints survive a reset, a reload clears them
    std::vector<Address> saved = cpu.get_breakpoints();
    cpu.load(program, config.extra_words);
    for (Address bp : saved) cpu.add_breakpoint(bp);

    out << "Reset complete\n";
}

void Emulator::cmd_regs() {
    regs.dump(out);
}

void Emulator::cmd_reg(const std::string& name) {
    int reg = RegisterFile::parse_name(name);
    if (reg >= 0) {
        regs.dump_reg(reg, out);
    } else {
        out << "Unknown register: " << name << "\n";
    }
}

void Emulator::cmd_mem(Address addr, size_t count) {
    mem.dump(addr, count, out);
}

void Emulator::cmd_pc() {
    out << "PC = " << cpu.get_pc() << "\n";
    print_instruction(cpu.get_pc());
}

void Emulator::cmd_set_pc(Address addr) {
    try {
        cpu.set_pc(addr);
        out << "PC set to " << addr << "\n";
    } catch (const std::out_of_range& e) {
        out << e.what() << "\n";
    }
}

void Emulator::cmd_break(const std::string& target) {
    Address addr = 0;
    if (!resolve_address(target, addr)) return;

    cpu.add_breakpoint(addr);
    out << "Breakpoint set at " << addr << "\n";
}

void Emulator::cmd_delete(const std::string& target) {
    Address addr = 0;
    if (!resolve_address(target, addr)) return;

    if (!cpu.has_breakpoint(addr)) {
        out << "No breakpoint at " << addr << "\n";
        return;
    }
    cpu.remove_breakpoint(addr);
    out << "Breakpoint removed at " << addr << "\n";
}

void Emulator::cmd_breakpoints() {
    const auto& bps = cpu.get_breakpoints();
    if (bps.empty()) {
        out << "No breakpoints\n";
        return;
    }
    out << "Breakpoints:\n";
    for (Address bp : bps) {
        out << "  " << bp << "\n";
    }
}

void Emulator::cmd_clear() {
    cpu.clear_breakpoints();
    out << "All breakpoints cleared\n";
}

void Emulator::cmd_symbols() {
    if (!program_loaded) {
        out << "No program loaded\n";
        return;
    }

    out << "Symbols:\n";
    for (const auto& [name, sym] : program.symbols) {
        out << "  " << (sym.kind == SymbolKind::LABEL ? "text " : "data ")
            << std::setw(6) << sym.value << "  " << name << "\n";
    }
}

void Emulator::cmd_disasm(Address addr, size_t count) {
    const auto& ins = cpu.get_instructions();
    out << "Disassembly:\n";
    if (addr < 0 || addr >= static_cast<Address>(ins.size())) return;

    size_t first = static_cast<size_t>(addr);
    size_t last = first + std::min(count, ins.size() - first);
    for (size_t i = first; i < last; i++) {
        Address pc = static_cast<Address>(i);

        // Check if there's source for this index
        std::string src;
        auto it = program.source_map.find(pc);
        if (it != program.source_map.end()) {
            src = "  ; " + it->second;
        }

        out << (pc == cpu.get_pc() ? "> " : "  ") << std::setw(4) << pc << ": "
            << std::left << std::setw(28) << Disassembler::format(ins[i])
            << std::right << src << "\n";
    }
}

void Emulator::cmd_stats() {
    out << "Statistics:\n";
    out << "  Instructions: " << cpu.get_instruction_count() << "\n";
    out << "  Branches taken: " << cpu.get_branch_count() << "\n";
    out << "  Memory words: " << mem.size() << "\n";
    out << "  Memory reads: " << mem.get_read_count() << "\n";
    out << "  Memory writes: " << mem.get_write_count() << "\n";
    out << "  Halted: " << (cpu.is_halted() ? "yes" : "no") << "\n";
    if (cpu.get_fault()) {
        out << "  Fault: " << cpu.get_fault()->what() << "\n";
    }
}

void Emulator::cmd_limit(const std::vector<std::string>& tokens) {
    if (tokens.size() > 1) {
        long long n = 0;
        if (!parse_number(tokens[1], n) || n < 0) {
            out << "Invalid step limit: " << tokens[1] << "\n";
            return;
        }
        config.step_limit = static_cast<uint64_t>(n);
    }
    out << "Step limit: ";
    if (config.step_limit == 0) out << "none\n";
    else out << config.step_limit << "\n";
}

void Emulator::cmd_trace(const std::vector<std::string>& tokens) {
    if (tokens.size() > 1) {
        std::string s = lower(tokens[1]);
        if (s == "on" || s == "1" || s == "true") {
            config.trace = true;
        } else if (s == "off" || s == "0" || s == "false") {
            config.trace = false;
        } else {
            out << "Use 'on' or 'off'\n";
            return;
        }
        cpu.set_trace(config.trace ? &out : nullptr);
    }
    out << "Trace: " << (config.trace ? "on" : "off") << "\n";
}

void Emulator::cmd_extra(const std::vector<std::string>& tokens) {
    if (tokens.size() > 1) {
        long long n = 0;
        if (!parse_number(tokens[1], n) || n < 0) {
            out << "Invalid word count: " << tokens[1] << "\n";
            return;
        }
        config.extra_words = static_cast<size_t>(n);
    }
    out << "Extra memory words: " << config.extra_words << "\n";
}

void Emulator::cmd_image(const std::string& filename) {
    if (!ImageWriter::write_file(filename, mem.get_all())) {
        out << "Cannot write image: " << filename << "\n";
        return;
    }
    out << "Wrote " << mem.size() << " words to " << filename << "\n";
}

// =============================================================================
// Helpers
// =============================================================================

void Emulator::print_welcome() {
    out << "\n";
    out << "IKEA Emulator\n";
    out << "Type 'help' for commands\n";
    out << "\n";
}

void Emulator::print_prompt() {
    out << "[" << cpu.get_pc() << "] > ";
}

void Emulator::print_instruction(Address pc) {
    const auto& ins = cpu.get_instructions();
    if (pc < 0 || pc >= static_cast<Address>(ins.size())) {
        out << std::setw(4) << pc << ": <end of program>\n";
        return;
    }
    out << std::setw(4) << pc << ": " << Disassembler::format(ins[static_cast<size_t>(pc)]) << "\n";
}

void Emulator::report_fault(const MemoryFault& fault) {
    out << fault.what() << "\n";
    print_instruction(fault.pc());
}

bool Emulator::resolve_address(const std::string& str, Address& addr) {
    // Try as symbol first
    auto it = program.symbols.find(str);
    if (it != program.symbols.end()) {
        addr = it->second.value;
        return true;
    }

    long long value = 0;
    if (!parse_number(str, value)) {
        out << "Invalid address: " << str << "\n";
        return false;
    }
    addr = static_cast<Address>(value);
    return true;
}

std::vector<std::string> Emulator::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

const Emulator::Config& Emulator::get_config() const { return config; }
const Memory& Emulator::get_memory() const { return mem; }
const RegisterFile& Emulator::get_registers() const { return regs; }
const CPU& Emulator::get_cpu() const { return cpu; }

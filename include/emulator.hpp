/**
 * emulator.hpp
 *
 * Top-level emulator controller.
 * Ties together the assembler and the CPU and handles user commands.
 */

#ifndef EMULATOR_HPP
#define EMULATOR_HPP

#include "common.hpp"
#include "memory.hpp"
#include "register_file.hpp"
#include "assembler.hpp"
#include "cpu.hpp"

class Emulator {
public:
    struct Config {
        uint64_t step_limit = 1000000;  // 0 = unlimited
        bool trace = false;
        size_t extra_words = 0;         // Scratch cells after the data image
    };

    explicit Emulator(std::ostream& out = std::cout);

    // Load program from file
    bool load(const std::string& filename);

    // Load program from string
    bool load_source(const std::string& source);

    // Run the command loop
    void run(std::istream& in = std::cin);

    // Execute a single command, returns false to quit
    bool execute_command(const std::string& input);

    const Config& get_config() const;
    const Memory& get_memory() const;
    const RegisterFile& get_registers() const;
    const CPU& get_cpu() const;

private:
    std::ostream& out;
    Memory mem;
    RegisterFile regs;
    CPU cpu;
    Assembler assembler;
    Program program;
    Config config;

    bool running;
    bool program_loaded;

    bool install(const Assembler::Result& result);

    // Command handlers
    void cmd_help();
    void cmd_load(const std::string& filename);
    void cmd_run();
    void cmd_step(uint64_t count);
    void cmd_reset();
    void cmd_regs();
    void cmd_reg(const std::string& name);
    void cmd_mem(Address addr, size_t count);
    void cmd_pc();
    void cmd_set_pc(Address addr);
    void cmd_break(const std::string& target);
    void cmd_delete(const std::string& target);
    void cmd_breakpoints();
    void cmd_clear();
    void cmd_symbols();
    void cmd_disasm(Address addr, size_t count);
    void cmd_stats();
    void cmd_limit(const std::vector<std::string>& tokens);
    void cmd_trace(const std::vector<std::string>& tokens);
    void cmd_extra(const std::vector<std::string>& tokens);
    void cmd_image(const std::string& filename);

    // Helpers
    void print_welcome();
    void print_prompt();
    void print_instruction(Address pc);
    void report_fault(const MemoryFault& fault);
    bool resolve_address(const std::string& str, Address& addr);
    std::vector<std::string> tokenize(const std::string& input);
};

#endif // EMULATOR_HPP

/**
 * assembler.hpp
 *
 * Two-pass assembler for IKEA assembly.
 * Source is parsed into statements first; pass 1 binds labels and data
 * symbols, pass 2 resolves every operand against the complete table.
 */

#ifndef ASSEMBLER_HPP
#define ASSEMBLER_HPP

#include "common.hpp"

class Assembler {
public:
    enum class ErrorKind {
        UNDEFINED_SYMBOL,
        DUPLICATE_SYMBOL,
        MALFORMED_INSTRUCTION,
        MALFORMED_DATA,
        MISSING_SECTION,
        IO
    };

    struct Error {
        ErrorKind kind;
        int line;                   // 0 when not tied to a line
        std::string message;

        std::string to_string() const;
    };

    // Result of assembly
    struct Result {
        bool success = false;
        Program program;            // Empty unless success
        std::vector<Error> errors;

        bool has_error(ErrorKind kind) const;
    };

    // Assemble from string
    Result assemble(const std::string& source);

    // Assemble from file
    Result assemble_file(const std::string& filename);

    static std::string kind_name(ErrorKind kind);

private:
    enum class Section { NONE, TEXT, DATA };

    // One non-blank source line after comment stripping
    struct Statement {
        int line = 0;
        Section section = Section::NONE;
        std::string label;              // Declared label / data name, may be empty
        std::string mnemonic;           // Upper case, empty for bare labels and data
        std::vector<std::string> operands;
        std::string value;              // Data literal
        std::string source;             // Trimmed source text
    };

    // State during assembly
    std::vector<Statement> statements;
    std::map<std::string, Symbol> symbols;
    std::vector<Error> errors;
    bool saw_text;
    bool saw_data;

    // String helpers
    static std::string trim(const std::string& s);
    static std::string to_upper(const std::string& s);
    static std::vector<std::string> split(const std::string& s, char delim);

    // Token classification
    static bool is_identifier(const std::string& s);
    static bool looks_like_register(const std::string& s);

    // Parsing helpers
    int parse_reg(const std::string& s, int line);
    bool parse_imm(const std::string& s, Word& val);

    // Front end
    void parse(const std::string& source);
    void parse_line(const std::string& orig, int line, Section& section);

    // Pass 1: collect bindings
    void collect_symbols();
    void bind(const std::string& name, SymbolKind kind, Address value, int line);

    // Pass 2: resolve operands
    Program resolve();
    bool resolve_instruction(const Statement& st, Instruction& ins);
    bool resolve_symbol(const std::string& name, SymbolKind want, int line, Address& value);
    bool expect_operands(const Statement& st, size_t count);

    // Error helper
    void error(ErrorKind kind, int line, const std::string& msg);
};

#endif // ASSEMBLER_HPP

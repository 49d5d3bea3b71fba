/**
 * assembler.cpp
 *
 * Two-pass assembler implementation.
 * Parse:  Split the source into statements
 * Pass 1: Bind labels and data symbols
 * Pass 2: Resolve operands and build the program
 */

#include "assembler.hpp"
#include "register_file.hpp"
#include <algorithm>
#include <cctype>

// =============================================================================
// String Helpers
// =============================================================================

std::string Assembler::trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string Assembler::to_upper(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::toupper);
    return r;
}

// Keeps empty pieces: "a,,b" splits into three
std::vector<std::string> Assembler::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        out.push_back(trim(s.substr(start, pos - start)));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

// =============================================================================
// Token Classification
// =============================================================================

bool Assembler::is_identifier(const std::string& s) {
    if (s.empty()) return false;
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && s[0] != '_') return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool Assembler::looks_like_register(const std::string& s) {
    if (s.size() < 2 || (s[0] != 'X' && s[0] != 'x')) return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// =============================================================================
// Parsing Helpers
// =============================================================================

int Assembler::parse_reg(const std::string& s, int line) {
    if (!looks_like_register(s)) {
        error(ErrorKind::MALFORMED_INSTRUCTION, line, "Expected register, got '" + s + "'");
        return -1;
    }
    int reg = RegisterFile::parse_name(s);
    if (reg < 0) {
        error(ErrorKind::MALFORMED_INSTRUCTION, line, "Invalid register: " + s);
    }
    return reg;
}

bool Assembler::parse_imm(const std::string& s, Word& val) {
    std::string t = trim(s);
    size_t digits = (!t.empty() && (t[0] == '-' || t[0] == '+')) ? 1 : 0;
    if (t.size() == digits) return false;
    bool all_digits = std::all_of(t.begin() + digits, t.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!all_digits) return false;

    try {
        val = static_cast<Word>(std::stoll(t));
        return true;
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

// =============================================================================
// Errors
// =============================================================================

void Assembler::error(ErrorKind kind, int line, const std::string& msg) {
    errors.push_back({kind, line, msg});
}

std::string Assembler::Error::to_string() const {
    if (line > 0) return "Line " + std::to_string(line) + ": " + message;
    return message;
}

bool Assembler::Result::has_error(ErrorKind kind) const {
    return std::any_of(errors.begin(), errors.end(),
                       [kind](const Error& e) { return e.kind == kind; });
}

std::string Assembler::kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNDEFINED_SYMBOL:      return "UndefinedSymbol";
        case ErrorKind::DUPLICATE_SYMBOL:      return "DuplicateSymbol";
        case ErrorKind::MALFORMED_INSTRUCTION: return "MalformedInstruction";
        case ErrorKind::MALFORMED_DATA:        return "MalformedData";
        case ErrorKind::MISSING_SECTION:       return "MissingSection";
        case ErrorKind::IO:                    return "Io";
        default:                               return "Unknown";
    }
}

// =============================================================================
// Parse
// =============================================================================

void Assembler::parse_line(const std::string& orig, int line, Section& section) {
    std::string text = orig;

    // Remove comments
    size_t hash = text.find('#');
    if (hash != std::string::npos) text = text.substr(0, hash);
    text = trim(text);
    if (text.empty()) return;

    // Section directive?
    if (text[0] == '.') {
        std::string dir = to_upper(text);
        if (dir == ".TEXT") {
            section = Section::TEXT;
            saw_text = true;
        } else if (dir == ".DATA") {
            section = Section::DATA;
            saw_data = true;
        } else {
            error(ErrorKind::MALFORMED_INSTRUCTION, line, "Unknown directive: " + text);
        }
        return;
    }

    Statement st;
    st.line = line;
    st.section = section;
    st.source = text;

    if (section == Section::NONE) {
        error(ErrorKind::MALFORMED_INSTRUCTION, line, "Statement outside of .text/.data: " + text);
        return;
    }

    size_t colon = text.find(':');

    if (section == Section::DATA) {
        if (colon == std::string::npos) {
            error(ErrorKind::MALFORMED_DATA, line, "Expected 'name: value', got '" + text + "'");
            return;
        }
        st.label = trim(text.substr(0, colon));
        st.value = trim(text.substr(colon + 1));
        if (!is_identifier(st.label) || looks_like_register(st.label)) {
            error(ErrorKind::MALFORMED_DATA, line, "Invalid data name: '" + st.label + "'");
            return;
        }
        statements.push_back(st);
        return;
    }

    // Text section: optional label, then optional instruction
    std::string rest = text;
    if (colon != std::string::npos) {
        st.label = trim(text.substr(0, colon));
        rest = trim(text.substr(colon + 1));
        if (!is_identifier(st.label) || looks_like_register(st.label)) {
            error(ErrorKind::MALFORMED_INSTRUCTION, line, "Invalid label: '" + st.label + "'");
            return;
        }
    }

    if (!rest.empty()) {
        size_t sp = rest.find_first_of(" \t");
        if (sp != std::string::npos) {
            st.mnemonic = to_upper(rest.substr(0, sp));
            st.operands = split(rest.substr(sp), ',');
        } else {
            st.mnemonic = to_upper(rest);
        }
        st.source = rest;
    }

    statements.push_back(st);
}

void Assembler::parse(const std::string& source) {
    std::istringstream ss(source);
    std::string l;
    Section section = Section::NONE;
    int line = 0;
    while (std::getline(ss, l)) {
        line++;
        parse_line(l, line, section);
    }

    if (!saw_text) error(ErrorKind::MISSING_SECTION, 0, "Missing .text section");
    if (!saw_data) error(ErrorKind::MISSING_SECTION, 0, "Missing .data section");
}

// =============================================================================
// Pass 1: Bindings
// =============================================================================

void Assembler::bind(const std::string& name, SymbolKind kind, Address value, int line) {
    auto it = symbols.find(name);
    if (it != symbols.end()) {
        error(ErrorKind::DUPLICATE_SYMBOL, line,
              "Duplicate symbol: " + name + " (first declared on line " +
              std::to_string(it->second.line) + ")");
        return;
    }
    symbols[name] = Symbol{kind, value, line};
}

void Assembler::collect_symbols() {
    Address text_index = 0;
    Address data_addr = 0;

    for (const auto& st : statements) {
        if (st.section == Section::TEXT) {
            // A label binds to the next instruction
            if (!st.label.empty()) bind(st.label, SymbolKind::LABEL, text_index, st.line);
            if (!st.mnemonic.empty()) text_index++;
        } else if (st.section == Section::DATA) {
            bind(st.label, SymbolKind::DATA, data_addr, st.line);
            data_addr++;
        }
    }
}

// =============================================================================
// Pass 2: Resolution
// =============================================================================

bool Assembler::expect_operands(const Statement& st, size_t count) {
    if (st.operands.size() == count) return true;
    error(ErrorKind::MALFORMED_INSTRUCTION, st.line,
          st.mnemonic + " expects " + std::to_string(count) + " operand(s), got " +
          std::to_string(st.operands.size()));
    return false;
}

bool Assembler::resolve_symbol(const std::string& name, SymbolKind want, int line,
                               Address& value) {
    const char* wanted = (want == SymbolKind::LABEL) ? "label" : "data symbol";

    if (looks_like_register(name) || !is_identifier(name)) {
        error(ErrorKind::MALFORMED_INSTRUCTION, line,
              std::string("Expected ") + wanted + ", got '" + name + "'");
        return false;
    }

    auto it = symbols.find(name);
    if (it == symbols.end()) {
        error(ErrorKind::UNDEFINED_SYMBOL, line, "Undefined symbol: " + name);
        return false;
    }
    if (it->second.kind != want) {
        error(ErrorKind::MALFORMED_INSTRUCTION, line,
              std::string("Expected ") + wanted + ", but '" + name + "' is a " +
              (it->second.kind == SymbolKind::LABEL ? "label" : "data symbol"));
        return false;
    }

    value = it->second.value;
    return true;
}

bool Assembler::resolve_instruction(const Statement& st, Instruction& ins) {
    ins.op = op_from_name(st.mnemonic);
    ins.line = st.line;
    const auto& ops = st.operands;
    bool ok = true;

    auto reg = [&](size_t i) {
        int r = parse_reg(ops[i], st.line);
        if (r < 0) ok = false;
        return r < 0 ? 0 : r;
    };
    auto imm = [&](size_t i) {
        Word v = 0;
        if (!parse_imm(ops[i], v)) {
            error(ErrorKind::MALFORMED_INSTRUCTION, st.line,
                  "Expected integer immediate, got '" + ops[i] + "'");
            ok = false;
        }
        return v;
    };
    auto sym = [&](size_t i, SymbolKind kind) {
        Address v = 0;
        if (!resolve_symbol(ops[i], kind, st.line, v)) ok = false;
        ins.symbol = ops[i];
        return v;
    };

    for (size_t i = 0; i < ops.size(); i++) {
        if (ops[i].empty()) {
            error(ErrorKind::MALFORMED_INSTRUCTION, st.line,
                  "Empty operand " + std::to_string(i + 1) + " in " + st.mnemonic);
            return false;
        }
    }

    switch (ins.op) {
        case Opcode::ADDRESS:
            if (!expect_operands(st, 2)) return false;
            ins.rd = reg(0);
            ins.imm = sym(1, SymbolKind::DATA);
            break;

        case Opcode::LOAD:
        case Opcode::STORE:
            if (!expect_operands(st, 3)) return false;
            ins.rd = reg(0);
            ins.rs1 = reg(1);
            ins.imm = imm(2);
            break;

        case Opcode::ADD:
        case Opcode::SUB:
            if (!expect_operands(st, 3)) return false;
            ins.rd = reg(0);
            ins.rs1 = reg(1);
            ins.rs2 = reg(2);
            break;

        case Opcode::SETIMM:
            if (!expect_operands(st, 2)) return false;
            ins.rd = reg(0);
            ins.imm = imm(1);
            break;

        case Opcode::BRANCH:
            if (!expect_operands(st, 1)) return false;
            ins.target = sym(0, SymbolKind::LABEL);
            break;

        case Opcode::BRANCH_IF_ZERO:
            if (!expect_operands(st, 2)) return false;
            ins.rs1 = reg(0);
            ins.target = sym(1, SymbolKind::LABEL);
            break;

        default:
            error(ErrorKind::MALFORMED_INSTRUCTION, st.line, "Unknown instruction: " + st.mnemonic);
            return false;
    }

    return ok;
}

Program Assembler::resolve() {
    Program prog;

    for (const auto& st : statements) {
        if (st.section == Section::TEXT) {
            if (st.mnemonic.empty()) continue;
            Instruction ins;
            Address index = static_cast<Address>(prog.instructions.size());
            if (!resolve_instruction(st, ins)) {
                // Keep indices in step with pass 1
                ins = Instruction();
            }
            prog.source_map[index] = st.source;
            prog.instructions.push_back(ins);
        } else if (st.section == Section::DATA) {
            Word val = 0;
            if (!parse_imm(st.value, val)) {
                error(ErrorKind::MALFORMED_DATA, st.line,
                      "Expected integer value for " + st.label + ", got '" + st.value + "'");
            }
            prog.data.push_back(val);
        }
    }

    prog.symbols = symbols;
    return prog;
}

// =============================================================================
// Main Assemble
// =============================================================================

Assembler::Result Assembler::assemble(const std::string& source) {
    Result res;

    // Reset state
    statements.clear();
    symbols.clear();
    errors.clear();
    saw_text = false;
    saw_data = false;

    parse(source);
    collect_symbols();
    Program prog = resolve();

    res.success = errors.empty();
    if (res.success) res.program = std::move(prog);
    res.errors = errors;
    return res;
}

Assembler::Result Assembler::assemble_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Result res;
        res.success = false;
        res.errors.push_back({ErrorKind::IO, 0, "Cannot open file: " + filename});
        return res;
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return assemble(buf.str());
}

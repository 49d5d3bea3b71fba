#include <gtest/gtest.h>

#include "assembler.hpp"

namespace {

using Kind = Assembler::ErrorKind;

const char* kReference = R"(
.text
    ADDRESS X0, donut
    ADDRESS X1, jumbo
    LOAD X2, X0, 0
    LOAD X3, X1, 0
    SUB X4, X3, X2
    BRANCH_IF_ZERO X4, _amogus
    STORE X4, X0, 0
    BRANCH _end
_amogus:
    ADD X5, X2, X3
    STORE X5, X0, 0
_end:
    SETIMM X6, 8
.data
donut: 5
jumbo: 5
)";

TEST(AssemblerTest, ReferenceProgram) {
    Assembler as;
    auto res = as.assemble(kReference);
    ASSERT_TRUE(res.success);

    const Program& p = res.program;
    ASSERT_EQ(p.instructions.size(), 11u);
    EXPECT_EQ(p.data, (std::vector<Word>{5, 5}));

    EXPECT_EQ(p.symbols.at("donut").kind, SymbolKind::DATA);
    EXPECT_EQ(p.symbols.at("donut").value, 0);
    EXPECT_EQ(p.symbols.at("jumbo").value, 1);
    EXPECT_EQ(p.symbols.at("_amogus").kind, SymbolKind::LABEL);
    EXPECT_EQ(p.symbols.at("_amogus").value, 8);
    EXPECT_EQ(p.symbols.at("_end").value, 10);

    const Instruction& addr = p.instructions[1];
    EXPECT_EQ(addr.op, Opcode::ADDRESS);
    EXPECT_EQ(addr.rd, 1);
    EXPECT_EQ(addr.imm, 1);

    const Instruction& load = p.instructions[2];
    EXPECT_EQ(load.op, Opcode::LOAD);
    EXPECT_EQ(load.rd, 2);
    EXPECT_EQ(load.rs1, 0);
    EXPECT_EQ(load.imm, 0);

    const Instruction& sub = p.instructions[4];
    EXPECT_EQ(sub.op, Opcode::SUB);
    EXPECT_EQ(sub.rd, 4);
    EXPECT_EQ(sub.rs1, 3);
    EXPECT_EQ(sub.rs2, 2);

    const Instruction& bz = p.instructions[5];
    EXPECT_EQ(bz.op, Opcode::BRANCH_IF_ZERO);
    EXPECT_EQ(bz.rs1, 4);
    EXPECT_EQ(bz.target, 8);

    EXPECT_EQ(p.instructions[7].op, Opcode::BRANCH);
    EXPECT_EQ(p.instructions[7].target, 10);

    const Instruction& set = p.instructions[10];
    EXPECT_EQ(set.op, Opcode::SETIMM);
    EXPECT_EQ(set.rd, 6);
    EXPECT_EQ(set.imm, 8);

    EXPECT_EQ(p.source_map.at(4), "SUB X4, X3, X2");
}

TEST(AssemblerTest, ForwardAndBackwardReferencesAgree) {
    Assembler as;
    auto fwd = as.assemble(
        ".text\n"
        "BRANCH target\n"
        "SETIMM X1, 1\n"
        "target:\n"
        "SETIMM X2, 2\n"
        ".data\n");
    auto back = as.assemble(
        ".text\n"
        "target:\n"
        "SETIMM X2, 2\n"
        "BRANCH target\n"
        ".data\n");
    ASSERT_TRUE(fwd.success);
    ASSERT_TRUE(back.success);
    EXPECT_EQ(fwd.program.instructions[0].target, 2);
    EXPECT_EQ(fwd.program.symbols.at("target").value, 2);
    EXPECT_EQ(back.program.instructions[1].target, 0);
    EXPECT_EQ(back.program.symbols.at("target").value, 0);
}

TEST(AssemblerTest, DataMayFollowOrPrecedeText) {
    Assembler as;
    auto res = as.assemble(
        ".data\n"
        "a: -3\n"
        "b: +4\n"
        ".text\n"
        "ADDRESS X0, b\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.program.data, (std::vector<Word>{-3, 4}));
    EXPECT_EQ(res.program.instructions[0].imm, 1);
}

TEST(AssemblerTest, CommentsWhitespaceAndCase) {
    Assembler as;
    auto res = as.assemble(
        "# header comment\n"
        ".text   # code\n"
        "\n"
        "start:   setimm   x3 ,  -12   # lower case works\n"
        "   # nothing here\n"
        "Branch_If_Zero X3,start\n"
        ".data\n"
        "  value :  7  # seven\n");
    ASSERT_TRUE(res.success) << res.errors[0].to_string();
    ASSERT_EQ(res.program.instructions.size(), 2u);
    EXPECT_EQ(res.program.instructions[0].op, Opcode::SETIMM);
    EXPECT_EQ(res.program.instructions[0].rd, 3);
    EXPECT_EQ(res.program.instructions[0].imm, -12);
    EXPECT_EQ(res.program.instructions[1].op, Opcode::BRANCH_IF_ZERO);
    EXPECT_EQ(res.program.instructions[1].target, 0);
    EXPECT_EQ(res.program.data, (std::vector<Word>{7}));
}

TEST(AssemblerTest, LabelAtEndBindsToInstructionCount) {
    Assembler as;
    auto res = as.assemble(".text\nBRANCH done\nSETIMM X1, 1\ndone:\n.data\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.program.symbols.at("done").value, 2);
}

TEST(AssemblerTest, ConsecutiveLabelsShareIndex) {
    Assembler as;
    auto res = as.assemble(".text\nSETIMM X1, 1\na:\nb:\nSETIMM X2, 2\n.data\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.program.symbols.at("a").value, 1);
    EXPECT_EQ(res.program.symbols.at("b").value, 1);
}

TEST(AssemblerTest, UndefinedSymbol) {
    Assembler as;
    auto res = as.assemble(".text\nADDRESS X0, nowhere\nBRANCH missing\n.data\n");
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.has_error(Kind::UNDEFINED_SYMBOL));
    EXPECT_EQ(res.errors.size(), 2u);
    EXPECT_TRUE(res.program.instructions.empty());
    EXPECT_TRUE(res.program.data.empty());
    EXPECT_EQ(res.errors[0].to_string(), "Line 2: Undefined symbol: nowhere");
}

TEST(AssemblerTest, DuplicateLabel) {
    Assembler as;
    auto res = as.assemble(".text\nx:\nSETIMM X1, 1\nx:\nSETIMM X1, 2\n.data\n");
    EXPECT_FALSE(res.success);
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, Kind::DUPLICATE_SYMBOL);
    EXPECT_EQ(res.errors[0].line, 4);
}

TEST(AssemblerTest, DuplicateAcrossLabelAndData) {
    Assembler as;
    auto res = as.assemble(".text\nshared:\nSETIMM X1, 1\n.data\nshared: 3\n");
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.has_error(Kind::DUPLICATE_SYMBOL));
}

TEST(AssemblerTest, DuplicateData) {
    Assembler as;
    auto res = as.assemble(".text\n.data\nv: 1\nv: 2\n");
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.has_error(Kind::DUPLICATE_SYMBOL));
}

TEST(AssemblerTest, MalformedInstructions) {
    const char* bodies[] = {
        "ADD X1, X2",               // too few operands
        "ADD X1, X2, X3, X4",       // too many operands
        "SETIMM X1",                // missing immediate
        "ADD X1, X2, 5",            // immediate where a register is expected
        "LOAD X1, X2, X3",          // register where an immediate is expected
        "ADDRESS X1, X2",           // register where a symbol is expected
        "ADDRESS X1, 4",            // integer where a symbol is expected
        "BRANCH X3",                // register where a label is expected
        "SETIMM X40, 1",            // no such register
        "SETIMM X1, 12abc",         // not a base-10 literal
        "SETIMM X1, 99999999999999999999",  // does not fit
        "MULTIPLY X1, X2, X3",      // unknown mnemonic
        "ADD X1 X2 X3",             // missing commas
        "HALT",                     // unknown, no operands
        "ADD X1, X2,, X3",          // empty operand in the middle
        "ADD X1, X2, X3,",          // trailing comma
        "SETIMM X1, 5,",            // trailing comma
        "BRANCH ,t",                // leading comma
    };
    for (const char* body : bodies) {
        Assembler as;
        auto res = as.assemble(std::string(".text\n") + body + "\n.data\nd: 0\n");
        EXPECT_FALSE(res.success) << body;
        EXPECT_TRUE(res.has_error(Kind::MALFORMED_INSTRUCTION)) << body;
        EXPECT_TRUE(res.program.instructions.empty()) << body;
    }
}

TEST(AssemblerTest, EmptyOperandIsReported) {
    Assembler as;
    auto res = as.assemble(".text\nt:\nADD X1, X2,, X3\n.data\n");
    EXPECT_FALSE(res.success);
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].kind, Kind::MALFORMED_INSTRUCTION);
    EXPECT_EQ(res.errors[0].to_string(), "Line 3: Empty operand 3 in ADD");
}

TEST(AssemblerTest, SymbolOfWrongKind) {
    Assembler as;
    auto a = as.assemble(".text\nhere:\nADDRESS X1, here\n.data\n");
    EXPECT_TRUE(a.has_error(Kind::MALFORMED_INSTRUCTION));

    auto b = as.assemble(".text\nBRANCH d\n.data\nd: 1\n");
    EXPECT_TRUE(b.has_error(Kind::MALFORMED_INSTRUCTION));
}

TEST(AssemblerTest, RegisterNameCannotBeDeclared) {
    Assembler as;
    auto a = as.assemble(".text\nX1:\nSETIMM X1, 1\n.data\n");
    EXPECT_TRUE(a.has_error(Kind::MALFORMED_INSTRUCTION));

    auto b = as.assemble(".text\n.data\nX2: 5\n");
    EXPECT_TRUE(b.has_error(Kind::MALFORMED_DATA));
}

TEST(AssemblerTest, MalformedData) {
    const char* lines[] = {"v 5", "v:", "v: five", "v: 1.5", "9v: 1"};
    for (const char* line : lines) {
        Assembler as;
        auto res = as.assemble(std::string(".text\n.data\n") + line + "\n");
        EXPECT_FALSE(res.success) << line;
        EXPECT_TRUE(res.has_error(Kind::MALFORMED_DATA)) << line;
    }
}

TEST(AssemblerTest, MissingSections) {
    Assembler as;
    auto no_data = as.assemble(".text\nSETIMM X1, 1\n");
    EXPECT_TRUE(no_data.has_error(Kind::MISSING_SECTION));

    auto no_text = as.assemble(".data\nv: 1\n");
    EXPECT_TRUE(no_text.has_error(Kind::MISSING_SECTION));
}

TEST(AssemblerTest, StatementBeforeSection) {
    Assembler as;
    auto res = as.assemble("SETIMM X1, 1\n.text\n.data\n");
    EXPECT_TRUE(res.has_error(Kind::MALFORMED_INSTRUCTION));
}

TEST(AssemblerTest, UnknownDirective) {
    Assembler as;
    auto res = as.assemble(".text\n.word 5\n.data\n");
    EXPECT_TRUE(res.has_error(Kind::MALFORMED_INSTRUCTION));
}

TEST(AssemblerTest, AllErrorsAreReported) {
    Assembler as;
    auto res = as.assemble(
        ".text\n"
        "BRANCH nowhere\n"
        "ADD X1, X2\n"
        "dup:\n"
        "dup:\n"
        ".data\n"
        "v: x\n");
    EXPECT_TRUE(res.has_error(Kind::UNDEFINED_SYMBOL));
    EXPECT_TRUE(res.has_error(Kind::MALFORMED_INSTRUCTION));
    EXPECT_TRUE(res.has_error(Kind::DUPLICATE_SYMBOL));
    EXPECT_TRUE(res.has_error(Kind::MALFORMED_DATA));
}

TEST(AssemblerTest, ReuseAfterFailure) {
    Assembler as;
    EXPECT_FALSE(as.assemble(".text\nBRANCH nowhere\n.data\n").success);
    auto ok = as.assemble(kReference);
    EXPECT_TRUE(ok.success);
    EXPECT_TRUE(ok.errors.empty());
}

TEST(AssemblerTest, MissingFile) {
    Assembler as;
    auto res = as.assemble_file("/nonexistent/program.ikea");
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.has_error(Kind::IO));
}

TEST(AssemblerTest, KindNames) {
    EXPECT_EQ(Assembler::kind_name(Kind::UNDEFINED_SYMBOL), "UndefinedSymbol");
    EXPECT_EQ(Assembler::kind_name(Kind::DUPLICATE_SYMBOL), "DuplicateSymbol");
    EXPECT_EQ(Assembler::kind_name(Kind::MALFORMED_INSTRUCTION), "MalformedInstruction");
}

}  // namespace

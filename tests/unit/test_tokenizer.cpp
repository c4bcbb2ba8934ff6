#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "mepa/program/opcode_table.hpp"
#include "mepa/program/tokenizer.hpp"

using namespace mepa;

void test_opcode_lookup() {
    std::cout << "Testing opcode lookup..." << std::endl;

    const auto &table = OpcodeTable::instance();
    assert(table.lookup("CRCT") == Opcode::CRCT);
    assert(table.lookup("crct") == Opcode::CRCT);
    assert(table.lookup("DsVf") == Opcode::DSVF);
    assert(table.lookup("") == Opcode::None);
    assert(table.lookup("CRCTX") == Opcode::Unknown);

    assert(OpcodeTable::info(Opcode::AMEM).arg_count == 1);
    assert(OpcodeTable::info(Opcode::SOMA).arg_count == -1);
    assert(std::string(OpcodeTable::mnemonic(Opcode::IMPR)) == "IMPR");

    std::cout << "  ✓ Opcode lookup test passed" << std::endl;
}

void test_plain_instruction() {
    std::cout << "Testing plain instruction parsing..." << std::endl;

    auto inst = Tokenizer::parse_line("crct 5");
    assert(!inst.has_label());
    assert(inst.opcode == Opcode::CRCT);
    assert(inst.mnemonic == "CRCT");
    assert(inst.args == std::vector<std::string>{"5"});
    assert(inst.raw_text == "crct 5");
    assert(inst.to_string() == "CRCT 5");

    auto bare = Tokenizer::parse_line("  SOMA  ");
    assert(bare.opcode == Opcode::SOMA);
    assert(bare.args.empty());

    std::cout << "  ✓ Plain instruction test passed" << std::endl;
}

void test_labels() {
    std::cout << "Testing label parsing..." << std::endl;

    auto labeled = Tokenizer::parse_line("L1: CRCT 5");
    assert(labeled.label == "L1");
    assert(labeled.opcode == Opcode::CRCT);
    assert(labeled.to_string() == "L1: CRCT 5");

    // Label without whitespace after the colon
    auto tight = Tokenizer::parse_line("LOOP:DSVS LOOP");
    assert(tight.label == "LOOP");
    assert(tight.opcode == Opcode::DSVS);
    assert(tight.args == std::vector<std::string>{"LOOP"});

    // Label-only line is an empty instruction
    auto only = Tokenizer::parse_line("END:");
    assert(only.label == "END");
    assert(only.is_empty());

    // Numeric labels are plain identifiers too
    auto numeric = Tokenizer::parse_line("99: NADA");
    assert(numeric.label == "99");

    // Text before the colon that is not an identifier is not a label
    auto not_label = Tokenizer::parse_line("A B: NADA");
    assert(!not_label.has_label());
    assert(not_label.mnemonic == "A");
    assert(not_label.opcode == Opcode::Unknown);

    assert(Tokenizer::is_label("foo_1"));
    assert(!Tokenizer::is_label(""));
    assert(!Tokenizer::is_label("a-b"));

    std::cout << "  ✓ Label parsing test passed" << std::endl;
}

void test_empty_and_unknown() {
    std::cout << "Testing empty and unknown lines..." << std::endl;

    assert(Tokenizer::parse_line("").is_empty());
    assert(Tokenizer::parse_line("   \t").is_empty());

    auto unknown = Tokenizer::parse_line("FROB 1 2");
    assert(unknown.opcode == Opcode::Unknown);
    assert(unknown.mnemonic == "FROB");
    assert(unknown.args.size() == 2);

    std::cout << "  ✓ Empty and unknown line test passed" << std::endl;
}

void test_split_words() {
    std::cout << "Testing word splitting..." << std::endl;

    assert((Tokenizer::split_words("a  b\tc") == std::vector<std::string>{"a", "b", "c"}));
    assert((Tokenizer::split_words("'a b' c") == std::vector<std::string>{"a b", "c"}));
    assert((Tokenizer::split_words("\"x\\\"y\" z") == std::vector<std::string>{"x\"y", "z"}));
    assert((Tokenizer::split_words("a\\ b") == std::vector<std::string>{"a b"}));
    // Inside double quotes only " \\ $ and ` are escapable
    assert((Tokenizer::split_words("\"\\$x\\`y\"") == std::vector<std::string>{"$x`y"}));
    assert((Tokenizer::split_words("\"a\\nb\"") == std::vector<std::string>{"a\\nb"}));
    assert(Tokenizer::split_words("").empty());

    // Unbalanced quote falls back to whitespace splitting
    assert((Tokenizer::split_words("CRCT 'oops") == std::vector<std::string>{"CRCT", "'oops"}));
    // So does a dangling escape
    assert((Tokenizer::split_words("CRCT 1\\") == std::vector<std::string>{"CRCT", "1\\"}));

    std::cout << "  ✓ Word splitting test passed" << std::endl;
}

void test_trim() {
    std::cout << "Testing trim..." << std::endl;

    assert(Tokenizer::trim("  x y \r\n") == "x y");
    assert(Tokenizer::trim("   ").empty());
    assert(Tokenizer::trim("x") == "x");

    std::cout << "  ✓ Trim test passed" << std::endl;
}

int main() {
    std::cout << "Running Tokenizer Tests" << std::endl;
    std::cout << "=======================" << std::endl;

    try {
        test_opcode_lookup();
        test_plain_instruction();
        test_labels();
        test_empty_and_unknown();
        test_split_words();
        test_trim();

        std::cout << std::endl;
        std::cout << "✓ All tokenizer tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}

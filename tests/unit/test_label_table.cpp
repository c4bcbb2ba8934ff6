#include <cassert>
#include <iostream>

#include "mepa/editor/program.hpp"
#include "mepa/machine/machine.hpp"
#include "mepa/program/label_table.hpp"

using namespace mepa;

void test_define_and_lookup() {
    std::cout << "Testing label define/lookup..." << std::endl;

    LabelTable table;
    assert(!table.lookup("L1").has_value());

    table.define("L1", 20);
    table.define("END", 90);
    assert(table.lookup("L1") == 20);
    assert(table.lookup("END") == 90);
    // Names are case-sensitive
    assert(!table.lookup("l1").has_value());

    std::cout << "  ✓ Define/lookup test passed" << std::endl;
}

void test_redefinition() {
    std::cout << "Testing label redefinition..." << std::endl;

    LabelTable table;
    table.define("L1", 20);
    table.define("L1", 50);
    assert(table.lookup("L1") == 50);

    table.reset();
    assert(!table.lookup("L1").has_value());

    std::cout << "  ✓ Redefinition test passed" << std::endl;
}

void test_rebuilt_from_program() {
    std::cout << "Testing labels follow program edits..." << std::endl;

    Program program;
    program.open_buffer("10 A: NADA\n20 B: NADA\n");
    Machine machine(program);
    assert(machine.labels().lookup("A") == 10);
    assert(machine.labels().lookup("B") == 20);

    program.set_line(10, "NADA");
    program.set_line(30, "A: PARA");
    machine.rebuild();
    assert(machine.labels().lookup("A") == 30);
    assert(machine.labels().lookup("B") == 20);

    program.delete_line(20);
    machine.rebuild();
    assert(!machine.labels().lookup("B").has_value());

    std::cout << "  ✓ Program rebuild test passed" << std::endl;
}

int main() {
    std::cout << "Running Label Table Tests" << std::endl;
    std::cout << "=========================" << std::endl;

    try {
        test_define_and_lookup();
        test_redefinition();
        test_rebuilt_from_program();

        std::cout << std::endl;
        std::cout << "✓ All label table tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}

// Runs the programs shipped under samples/ end to end
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "mepa/editor/program.hpp"
#include "mepa/machine/debugger.hpp"
#include "mepa/machine/machine.hpp"

using namespace mepa;

namespace {

std::string sample_path(const std::string &name) {
    return std::string(MEPA_SAMPLES_DIR) + "/" + name;
}

} // namespace

void test_factorial() {
    std::cout << "Testing factorial sample..." << std::endl;

    Program program;
    assert(program.load_file(sample_path("factorial.mepa")) == 0);

    Machine machine(program);
    auto result = machine.run();
    assert(result.success);
    assert(result.halt == HaltReason::Para);
    assert(result.output == std::vector<Word>{120});
    assert(machine.state().stack == std::vector<Word>{120});
    assert(machine.state().memory.empty());

    std::cout << "  ✓ Factorial sample passed" << std::endl;
}

void test_countdown() {
    std::cout << "Testing countdown sample..." << std::endl;

    Program program;
    assert(program.load_file(sample_path("countdown.mepa")) == 1);

    Machine machine(program);
    auto result = machine.run();
    assert(result.success);
    assert((result.output == std::vector<Word>{3, 2, 1, 0}));
    assert(machine.state().stack.empty());
    assert(machine.state().memory.size() == 1);
    assert(machine.labels().lookup("DONE") == 150);

    std::cout << "  ✓ Countdown sample passed" << std::endl;
}

void test_debug_matches_run() {
    std::cout << "Testing stepping a sample matches running it..." << std::endl;

    Program program;
    program.load_file(sample_path("factorial.mepa"));
    Machine machine(program);

    auto run = machine.run();

    Debugger debugger(machine);
    debugger.start();
    std::vector<Word> stepped_output;
    uint64_t steps = 0;
    while (true) {
        auto report = debugger.step();
        assert(report.success);
        ++steps;
        stepped_output.insert(stepped_output.end(), report.output.begin(), report.output.end());
        if (report.finished) {
            break;
        }
    }
    assert(stepped_output == run.output);
    assert(steps == run.steps);

    std::cout << "  ✓ Debug/run comparison passed" << std::endl;
}

int main() {
    std::cout << "Running Sample Program Tests" << std::endl;
    std::cout << "============================" << std::endl;

    try {
        test_factorial();
        test_countdown();
        test_debug_matches_run();

        std::cout << std::endl;
        std::cout << "✓ All sample program tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}

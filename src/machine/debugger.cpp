/**
 * @file debugger.cpp
 * @brief Debug controller implementation
 *
 * The debugger owns a session only while the machine generation it started
 * is still current. Any later reset of the machine, such as a RUN, makes the
 * session stale, and the debugger then behaves as if it were Idle.
 */

#include "mepa/machine/debugger.hpp"

#include <utility>

namespace mepa {

Debugger::Debugger(Machine &machine) : machine_(machine) {}

Debugger::Report Debugger::start() {
    if (auto error = machine_.reset()) {
        session_.reset();
        return failure(std::move(*error));
    }

    machine_.state().mode = Mode::DebugPaused;
    session_ = machine_.generation();

    Report report;
    report.success = true;
    describe_pending(report);
    return report;
}

Debugger::Report Debugger::step() {
    if (!is_active() || mode() != Mode::DebugPaused) {
        return failure(MachineError{ErrorKind::NotDebugging, std::nullopt, "Not in debug mode"});
    }

    const size_t emitted_before = machine_.output().size();
    StepResult result = machine_.step();

    Report report;
    const auto &output = machine_.output();
    report.output.assign(output.begin() + static_cast<std::ptrdiff_t>(emitted_before),
                         output.end());

    if (auto *failed = std::get_if<Failed>(&result)) {
        // A failed step ends the session; its state is not reusable
        machine_.discard();
        session_.reset();
        report.error = std::move(failed->error);
        return report;
    }

    report.success = true;
    if (auto *halted = std::get_if<Halted>(&result)) {
        report.finished = true;
        report.halt = halted->reason;
        return report;
    }

    describe_pending(report);
    return report;
}

Debugger::Report Debugger::stop() {
    if (!is_active()) {
        return failure(MachineError{ErrorKind::NotDebugging, std::nullopt, "Not in debug mode"});
    }

    machine_.discard();
    session_.reset();

    Report report;
    report.success = true;
    return report;
}

bool Debugger::is_active() const {
    if (!session_ || *session_ != machine_.generation()) {
        return false;
    }
    return mode() == Mode::DebugPaused || mode() == Mode::Halted;
}

void Debugger::describe_pending(Report &report) const {
    report.next_line = machine_.current_line();
    if (const Instruction *instruction = machine_.current_instruction()) {
        report.next_text = instruction->raw_text;
    }
}

Debugger::Report Debugger::failure(MachineError error) {
    Report report;
    report.error = std::move(error);
    return report;
}

} // namespace mepa

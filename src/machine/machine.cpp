/**
 * @file machine.cpp
 * @brief MEPA stack machine implementation
 *
 * Binary operators pop the right operand first: for "CRCT a; CRCT b; SUBT"
 * the result is a - b. Arithmetic wraps on 64-bit overflow. DIVI rounds
 * toward negative infinity (-7 / 2 = -4).
 */

#include "mepa/machine/machine.hpp"

#include <new>
#include <utility>

#include "mepa/editor/program.hpp"
#include "mepa/program/integer.hpp"

namespace mepa {

namespace {

Word wrap_add(Word a, Word b) {
    return static_cast<Word>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

Word wrap_sub(Word a, Word b) {
    return static_cast<Word>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

Word wrap_mul(Word a, Word b) {
    return static_cast<Word>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

Word floor_div(Word a, Word b) {
    // INT64_MIN / -1 overflows; wrap like the other operators
    if (b == -1) {
        return wrap_sub(0, a);
    }
    Word q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

Machine::Machine(const Program &program) : program_(program) {
    rebuild();
}

void Machine::rebuild() {
    lines_.clear();
    instructions_.clear();
    line_index_.clear();
    labels_.reset();

    // std::map iterates in ascending line order, so a duplicated label
    // ends up bound to its highest line number
    for (const auto &[line_num, text] : program_.lines()) {
        line_index_[line_num] = lines_.size();
        lines_.push_back(line_num);
        instructions_.push_back(Tokenizer::parse_line(text));

        const auto &instruction = instructions_.back();
        if (instruction.has_label()) {
            labels_.define(*instruction.label, line_num);
        }
    }
}

std::optional<MachineError> Machine::reset() {
    rebuild();
    state_ = MachineState{};
    output_.clear();
    instruction_count_ = 0;
    halt_reason_ = HaltReason::EndOfProgram;
    ++generation_;

    if (lines_.empty()) {
        return MachineError{ErrorKind::EmptyProgram, std::nullopt, "No code to execute"};
    }

    // Start at INPP when present, else at the first line
    for (size_t i = 0; i < instructions_.size(); ++i) {
        if (instructions_[i].opcode == Opcode::INPP) {
            state_.pc = i;
            break;
        }
    }
    return std::nullopt;
}

void Machine::discard() {
    state_ = MachineState{};
    output_.clear();
}

StepResult Machine::step() {
    if (state_.mode == Mode::Halted) {
        return Halted{halt_reason_};
    }
    if (at_end()) {
        state_.mode = Mode::Halted;
        halt_reason_ = HaltReason::EndOfProgram;
        return Halted{halt_reason_};
    }

    const int line = lines_[state_.pc];
    const Instruction &instruction = instructions_[state_.pc];

    if (trace_handler_) {
        trace_handler_(line, instruction, state_);
    }

    StepResult result;
    try {
        result = execute_instruction(instruction);
    } catch (const MachineFault &fault) {
        return Failed{MachineError{fault.kind(), line, fault.what()}};
    } catch (const std::bad_alloc &) {
        return Failed{MachineError{ErrorKind::InvalidAllocation, line, "Out of memory"}};
    }

    ++instruction_count_;

    if (std::holds_alternative<Continue>(result)) {
        ++state_.pc;
        if (at_end()) {
            state_.mode = Mode::Halted;
            halt_reason_ = HaltReason::EndOfProgram;
            return Halted{halt_reason_};
        }
    } else if (const auto *halted = std::get_if<Halted>(&result)) {
        state_.mode = Mode::Halted;
        halt_reason_ = halted->reason;
    }

    return result;
}

RunResult Machine::run() {
    RunResult result;

    if (auto error = reset()) {
        result.error = error;
        return result;
    }

    state_.mode = Mode::Running;
    while (true) {
        if (step_limit_ != 0 && instruction_count_ >= step_limit_) {
            result.error = MachineError{ErrorKind::StepLimit, current_line(),
                                        "Step limit of " + std::to_string(step_limit_) +
                                            " exceeded"};
            state_.mode = Mode::Idle;
            break;
        }

        StepResult step_result = step();
        if (auto *failed = std::get_if<Failed>(&step_result)) {
            result.error = failed->error;
            state_.mode = Mode::Idle;
            break;
        }
        if (auto *halted = std::get_if<Halted>(&step_result)) {
            result.success = true;
            result.halt = halted->reason;
            break;
        }
    }

    result.output = output_;
    result.steps = instruction_count_;
    return result;
}

Snapshot Machine::inspect() const {
    Snapshot snapshot;
    snapshot.memory = state_.memory;
    snapshot.stack = state_.stack;
    return snapshot;
}

std::optional<int> Machine::current_line() const {
    if (at_end()) {
        return std::nullopt;
    }
    return lines_[state_.pc];
}

const Instruction *Machine::current_instruction() const {
    if (at_end()) {
        return nullptr;
    }
    return &instructions_[state_.pc];
}

void Machine::set_output_handler(OutputHandler handler) {
    output_handler_ = std::move(handler);
}

void Machine::set_trace_handler(TraceHandler handler) {
    trace_handler_ = std::move(handler);
}

// =========================================
// Instruction execution
// =========================================

StepResult Machine::execute_instruction(const Instruction &instruction) {
    require_args(instruction);

    switch (instruction.opcode) {
    case Opcode::None:
    case Opcode::INPP:
    case Opcode::NADA:
        break;

    case Opcode::PARA:
        return Halted{HaltReason::Para};

    // Memory management
    case Opcode::AMEM: {
        Word n = int_arg(instruction, 0);
        auto &memory = state_.memory;
        if (n < 0 || static_cast<uint64_t>(n) > memory.max_size() - memory.size()) {
            throw MachineFault(ErrorKind::InvalidAllocation,
                               "AMEM invalid argument: " + std::to_string(n));
        }
        memory.resize(memory.size() + static_cast<size_t>(n), 0);
        break;
    }

    case Opcode::DMEM: {
        Word n = int_arg(instruction, 0);
        auto &memory = state_.memory;
        if (n < 0 || static_cast<uint64_t>(n) > memory.size()) {
            throw MachineFault(ErrorKind::InvalidAllocation,
                               "DMEM invalid argument: " + std::to_string(n));
        }
        memory.resize(memory.size() - static_cast<size_t>(n));
        break;
    }

    // Loads and stores
    case Opcode::CRCT:
        push(int_arg(instruction, 0));
        break;

    case Opcode::CRVL: {
        Word n = int_arg(instruction, 0);
        check_address(n);
        push(state_.memory[static_cast<size_t>(n)]);
        break;
    }

    case Opcode::ARMZ: {
        Word n = int_arg(instruction, 0);
        Word value = pop();
        check_address(n);
        state_.memory[static_cast<size_t>(n)] = value;
        break;
    }

    // Arithmetic
    case Opcode::SOMA:
        binary_op(wrap_add);
        break;

    case Opcode::SUBT:
        binary_op(wrap_sub);
        break;

    case Opcode::MULT:
        binary_op(wrap_mul);
        break;

    case Opcode::DIVI: {
        Word b = pop();
        Word a = pop();
        if (b == 0) {
            throw MachineFault(ErrorKind::DivisionByZero, "Division by zero");
        }
        push(floor_div(a, b));
        break;
    }

    case Opcode::INVR:
        push(wrap_sub(0, pop()));
        break;

    // Logic (non-zero is true)
    case Opcode::CONJ:
        binary_op([](Word a, Word b) -> Word { return a != 0 && b != 0; });
        break;

    case Opcode::DISJ:
        binary_op([](Word a, Word b) -> Word { return a != 0 || b != 0; });
        break;

    // Comparison
    case Opcode::CMME:
        binary_op([](Word a, Word b) -> Word { return a < b; });
        break;

    case Opcode::CMMA:
        binary_op([](Word a, Word b) -> Word { return a > b; });
        break;

    case Opcode::CMIG:
        binary_op([](Word a, Word b) -> Word { return a == b; });
        break;

    case Opcode::CMDG:
        binary_op([](Word a, Word b) -> Word { return a != b; });
        break;

    case Opcode::CMEG:
        binary_op([](Word a, Word b) -> Word { return a <= b; });
        break;

    case Opcode::CMAG:
        binary_op([](Word a, Word b) -> Word { return a >= b; });
        break;

    // Branching
    case Opcode::DSVS: {
        size_t target = resolve_target(instruction);
        state_.pc = target;
        return Jumped{lines_[target]};
    }

    case Opcode::DSVF: {
        // Condition is consumed even when the branch is not taken
        Word condition = pop();
        if (condition != 0) {
            break;
        }
        size_t target = resolve_target(instruction);
        state_.pc = target;
        return Jumped{lines_[target]};
    }

    // Output
    case Opcode::IMPR: {
        Word value = peek();
        output_.push_back(value);
        if (output_handler_) {
            output_handler_(value);
        }
        break;
    }

    case Opcode::Unknown:
        throw MachineFault(ErrorKind::UnknownOpcode,
                           "Unknown instruction: '" + instruction.mnemonic + "'");
    }

    return Continue{};
}

void Machine::push(Word value) {
    state_.stack.push_back(value);
}

Word Machine::pop() {
    if (state_.stack.empty()) {
        throw MachineFault(ErrorKind::StackUnderflow, "Stack empty");
    }
    Word value = state_.stack.back();
    state_.stack.pop_back();
    return value;
}

Word Machine::peek() const {
    if (state_.stack.empty()) {
        throw MachineFault(ErrorKind::StackUnderflow, "Stack empty");
    }
    return state_.stack.back();
}

void Machine::binary_op(const std::function<Word(Word, Word)> &op) {
    Word b = pop();
    Word a = pop();
    push(op(a, b));
}

void Machine::require_args(const Instruction &instruction) const {
    int expected = OpcodeTable::info(instruction.opcode).arg_count;
    if (expected < 0 || instruction.args.size() == static_cast<size_t>(expected)) {
        return;
    }
    throw MachineFault(ErrorKind::MalformedArguments,
                       instruction.mnemonic + " requires " + std::to_string(expected) +
                           " argument" + (expected == 1 ? "" : "s"));
}

Word Machine::int_arg(const Instruction &instruction, size_t index) const {
    const std::string &token = instruction.args.at(index);
    auto value = parse_integer<Word>(token);
    if (!value) {
        throw MachineFault(ErrorKind::MalformedArguments,
                           instruction.mnemonic + ": invalid integer '" + token + "'");
    }
    return *value;
}

void Machine::check_address(Word address) const {
    const auto size = state_.memory.size();
    if (address < 0) {
        throw MachineFault(ErrorKind::MemoryOutOfBounds,
                           "Negative memory address " + std::to_string(address));
    }
    if (static_cast<uint64_t>(address) >= size) {
        std::string bounds = size == 0 ? "no memory allocated"
                                       : "0.." + std::to_string(size - 1);
        throw MachineFault(ErrorKind::MemoryOutOfBounds,
                           "Memory address " + std::to_string(address) +
                               " out of bounds (" + bounds + ")");
    }
}

size_t Machine::resolve_target(const Instruction &instruction) const {
    const std::string &target = instruction.args.at(0);

    if (auto line_num = parse_integer<int>(target)) {
        auto it = line_index_.find(*line_num);
        if (it != line_index_.end()) {
            return it->second;
        }
    }

    if (auto line_num = labels_.lookup(target)) {
        return line_index_.at(*line_num);
    }

    throw MachineFault(ErrorKind::UnresolvedTarget,
                       instruction.mnemonic + ": label/line " + target + " not found");
}

} // namespace mepa

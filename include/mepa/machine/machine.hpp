/**
 * @file machine.hpp
 * @brief MEPA stack machine
 *
 * Executes a Program against an operand stack and a flat integer memory.
 *
 * Features:
 * - Full MEPA instruction set (arithmetic, logic, comparison, jumps)
 * - Jump targets resolved by line number first, then by label
 * - Per-step execution with a tagged step result
 * - Run-to-completion with optional step limit
 * - Output and trace callbacks
 *
 * The program counter is an index into the ascending sequence of line
 * numbers, not a line number. Line index, parsed instructions and labels
 * are a snapshot taken by rebuild(); reset() always rebuilds, so edits made
 * between runs are picked up and edits during a run are not.
 */

#ifndef MEPA_MACHINE_HPP
#define MEPA_MACHINE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "mepa/machine/errors.hpp"
#include "mepa/program/label_table.hpp"
#include "mepa/program/tokenizer.hpp"

namespace mepa {

class Program;

using Word = int64_t;

/**
 * @brief Execution mode of the machine
 */
enum class Mode {
    Idle,        ///< No execution in progress
    Running,     ///< Run-to-completion in progress
    DebugPaused, ///< Waiting for the next single step
    Halted,      ///< PARA executed or program exhausted
};

/**
 * @brief Mutable machine state
 *
 * Rebuilt from scratch on every reset.
 */
struct MachineState {
    std::vector<Word> stack;  ///< Operand stack, top at back()
    std::vector<Word> memory; ///< Allocated memory cells
    size_t pc{0};             ///< Index into the sorted line sequence
    Mode mode{Mode::Idle};    ///< Current mode
};

/**
 * @brief Why execution stopped
 */
enum class HaltReason {
    Para,         ///< PARA executed
    EndOfProgram, ///< Program counter ran past the last line
};

// Step results

/// Instruction executed, control falls through to the next line
struct Continue {};

/// Instruction executed and transferred control
struct Jumped {
    int target_line{0};
};

/// Machine halted; no further steps will execute
struct Halted {
    HaltReason reason{HaltReason::EndOfProgram};
};

/// Instruction failed; the run is over
struct Failed {
    MachineError error;
};

using StepResult = std::variant<Continue, Jumped, Halted, Failed>;

/**
 * @brief Outcome of a run-to-completion
 */
struct RunResult {
    bool success{false};                       ///< True if the program halted normally
    HaltReason halt{HaltReason::EndOfProgram}; ///< Halt reason when successful
    std::vector<Word> output;                  ///< Values emitted by IMPR
    uint64_t steps{0};                         ///< Instructions executed
    std::optional<MachineError> error;         ///< Terminal error, if any
};

/**
 * @brief Copy of memory and stack for inspection
 */
struct Snapshot {
    std::vector<Word> memory;
    std::vector<Word> stack;
};

/**
 * @brief Output callback for IMPR
 * @param value Top-of-stack value
 */
using OutputHandler = std::function<void(Word value)>;

/**
 * @brief Trace callback, invoked before each instruction executes
 * @param line Line number
 * @param instruction Instruction about to execute
 * @param state Machine state before execution
 */
using TraceHandler =
    std::function<void(int line, const Instruction &instruction, const MachineState &state)>;

/**
 * @brief MEPA execution engine
 *
 * Holds a reference to the program; the program must outlive the machine.
 */
class Machine {
  public:
    /**
     * @brief Construct machine over a program
     * @param program Program image
     */
    explicit Machine(const Program &program);

    /**
     * @brief Re-derive line index, instructions and labels from the program
     *
     * Must be called after the program changes and before the next run;
     * reset() calls it itself.
     */
    void rebuild();

    /**
     * @brief Discard all state and position at the start instruction
     *
     * Start is the first INPP line if any, else the first line.
     *
     * @return std::optional<MachineError> EmptyProgram if there are no lines
     */
    std::optional<MachineError> reset();

    /**
     * @brief Execute the instruction at the program counter
     * @return StepResult Continue, Jumped, Halted or Failed
     */
    StepResult step();

    /**
     * @brief Reset and run until PARA, end of program, or error
     * @return RunResult Run outcome
     */
    RunResult run();

    /**
     * @brief Copy current memory and stack
     */
    Snapshot inspect() const;

    /**
     * @brief Line number at the program counter
     * @return std::optional<int> Line number, nullopt past the end
     */
    std::optional<int> current_line() const;

    /**
     * @brief Instruction at the program counter
     * @return const Instruction* Instruction, nullptr past the end
     */
    const Instruction *current_instruction() const;

    /**
     * @brief Check if the program counter is past the last line
     */
    bool at_end() const {
        return state_.pc >= lines_.size();
    }

    /**
     * @brief Discard machine state and return to Idle
     */
    void discard();

    void set_output_handler(OutputHandler handler);
    void set_trace_handler(TraceHandler handler);

    /**
     * @brief Limit steps per run (0 = unlimited)
     */
    void set_step_limit(uint64_t limit) {
        step_limit_ = limit;
    }

    MachineState &state() {
        return state_;
    }

    const MachineState &state() const {
        return state_;
    }

    const LabelTable &labels() const {
        return labels_;
    }

    /**
     * @brief Instructions executed since the last reset
     */
    uint64_t instruction_count() const {
        return instruction_count_;
    }

    /**
     * @brief Number of resets so far; identifies the current session
     */
    uint64_t generation() const {
        return generation_;
    }

    /**
     * @brief Values emitted by IMPR since the last reset
     */
    const std::vector<Word> &output() const {
        return output_;
    }

  private:
    const Program &program_;
    MachineState state_;
    std::vector<int> lines_;                      ///< Sorted line numbers
    std::vector<Instruction> instructions_;       ///< Parallel to lines_
    std::unordered_map<int, size_t> line_index_; ///< Line number to index
    LabelTable labels_;
    OutputHandler output_handler_;
    TraceHandler trace_handler_;
    std::vector<Word> output_;
    uint64_t instruction_count_{0};
    uint64_t step_limit_{0};
    uint64_t generation_{0};
    HaltReason halt_reason_{HaltReason::EndOfProgram};

    /**
     * @brief Execute one decoded instruction
     * @param instruction Instruction to execute
     * @return StepResult Continue, Jumped or Halted
     * @throws MachineFault on any execution error
     */
    StepResult execute_instruction(const Instruction &instruction);

    // Stack helpers

    void push(Word value);
    Word pop();
    Word peek() const;

    /**
     * @brief Pop b then a and push op(a, b)
     */
    void binary_op(const std::function<Word(Word, Word)> &op);

    // Argument helpers

    void require_args(const Instruction &instruction) const;
    Word int_arg(const Instruction &instruction, size_t index) const;
    void check_address(Word address) const;

    /**
     * @brief Resolve a jump instruction's target to a line index
     *
     * The target token is tried as a line number, then as a label.
     *
     * @param instruction DSVS or DSVF instruction
     * @return size_t Line index
     * @throws MachineFault UnresolvedTarget if neither exists
     */
    size_t resolve_target(const Instruction &instruction) const;
};

} // namespace mepa

#endif // MEPA_MACHINE_HPP

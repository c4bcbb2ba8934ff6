/**
 * @file errors.hpp
 * @brief Execution error taxonomy for the MEPA machine
 *
 * Every execution error is terminal for the current run. Opcode handlers
 * raise MachineFault; Machine::step() converts it into a MachineError tagged
 * with the failing line number and hands it back inside the step result.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace mepa {

/**
 * @brief Classes of execution failure
 */
enum class ErrorKind {
    StackUnderflow,     ///< Operator needed more stack entries than present
    MemoryOutOfBounds,  ///< CRVL/ARMZ address outside [0, memory length)
    InvalidAllocation,  ///< AMEM/DMEM negative size or DMEM over-release
    MalformedArguments, ///< Wrong argument count or non-integer argument
    UnresolvedTarget,   ///< Jump to a missing line or label
    UnknownOpcode,      ///< Mnemonic outside the instruction set
    DivisionByZero,     ///< DIVI with zero divisor
    EmptyProgram,       ///< Start requested with no lines
    NotDebugging,       ///< Debug command outside a debug session
    StepLimit,          ///< Configured step limit exceeded
};

/**
 * @brief Structured execution error returned to callers
 */
struct MachineError {
    MachineError(ErrorKind kind, std::optional<int> line, std::string message)
        : kind(kind), line(line), message(std::move(message)) {}

    ErrorKind kind;
    std::optional<int> line; ///< Failing line number, if one was executing
    std::string message;     ///< Human-readable cause

    /**
     * @brief Render "Error at line N: message" (or just the message)
     */
    std::string to_string() const;
};

/**
 * @brief Exception raised by opcode handlers inside a single step
 *
 * Never escapes Machine::step().
 */
class MachineFault : public std::runtime_error {
  public:
    MachineFault(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

} // namespace mepa

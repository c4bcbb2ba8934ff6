/**
 * @file debugger.hpp
 * @brief Single-step debug controller for the MEPA machine
 *
 * State machine over the machine's mode:
 *
 *     Idle --start()--> DebugPaused --step()--> DebugPaused
 *                            |                      |
 *                            +----step() halts----> Halted
 *     DebugPaused/Halted --stop()--> Idle
 *
 * A step that fails ends the session and returns to Idle. Starting a new
 * session, or a run-to-completion on the same machine, discards whatever
 * session was in progress.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mepa/machine/machine.hpp"

namespace mepa {

/**
 * @brief Debug controller wrapping a Machine
 */
class Debugger {
  public:
    /**
     * @brief Outcome of a debug command
     */
    struct Report {
        bool success{false};                       ///< False if error is set
        bool finished{false};                      ///< Machine halted during this command
        HaltReason halt{HaltReason::EndOfProgram}; ///< Halt reason when finished
        std::optional<int> next_line;              ///< Line about to execute
        std::string next_text;                     ///< Raw text of that line
        std::vector<Word> output;                  ///< Values emitted by this step
        std::optional<MachineError> error;         ///< Error, if any
    };

    /**
     * @brief Construct debugger over a machine
     * @param machine Machine reference (must outlive the debugger)
     */
    explicit Debugger(Machine &machine);

    /**
     * @brief Reset the machine and pause before the first instruction
     * @return Report Pending instruction, or EmptyProgram error
     */
    Report start();

    /**
     * @brief Execute exactly one instruction
     *
     * Valid only while DebugPaused.
     *
     * @return Report Next pending instruction, completion, or error
     */
    Report step();

    /**
     * @brief End the session and discard machine state
     *
     * Valid while DebugPaused or Halted.
     *
     * @return Report Success, or NotDebugging error when Idle
     */
    Report stop();

    /**
     * @brief Copy memory and stack of the session
     */
    Snapshot inspect() const {
        return machine_.inspect();
    }

    /**
     * @brief Check if a session is open (paused or halted)
     */
    bool is_active() const;

    Mode mode() const {
        return machine_.state().mode;
    }

  private:
    Machine &machine_;
    std::optional<uint64_t> session_; ///< Machine generation owned by this session

    /**
     * @brief Fill next_line/next_text from the program counter
     */
    void describe_pending(Report &report) const;

    static Report failure(MachineError error);
};

} // namespace mepa

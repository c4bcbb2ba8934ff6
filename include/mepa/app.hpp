/**
 * @file app.hpp
 * @brief Main application class for the MEPA interpreter
 *
 * Implements the interactive command loop: program editing (INS, DEL,
 * LIST), persistence (LOAD, SAVE), execution (RUN) and single-step
 * debugging (DEBUG, NEXT, STOP, STACK). Commands are read from the
 * terminal, from an ncurses screen, or from an EXEC script.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace mepa {

class Screen;
class Program;
class Machine;
class Debugger;

/**
 * @brief Main application class coordinating editor, machine and debugger
 */
class App {
  public:
    /**
     * @brief Command-line options
     */
    struct Options {
        bool show_help{false};                   ///< -h / --help
        bool use_screen{false};                  ///< --screen: ncurses front end
        bool trace{false};                       ///< --trace: log each instruction
        uint64_t max_steps{0};                   ///< --max-steps N (0 = unlimited)
        std::optional<std::string> program_path; ///< Program to load at startup
    };

    /**
     * @brief Construct an App bound to the standard streams
     */
    App();

    /**
     * @brief Construct an App bound to explicit streams
     * @param in Command input
     * @param out Normal output (program output, listings, reports)
     * @param err Diagnostics (errors, trace)
     */
    App(std::istream &in, std::ostream &out, std::ostream &err);

    /**
     * @brief Destroy the App object
     *
     * Ensures screen is properly shut down if initialized
     */
    ~App();

    /**
     * @brief Run the main application loop
     * @param argc Command line argument count
     * @param argv Command line argument values
     * @return int Exit code (0 for success, 2 for bad options)
     */
    int run(int argc, char **argv);

    /**
     * @brief Parse command-line options
     * @throws std::invalid_argument on unknown or malformed options
     */
    static Options parse_options(int argc, char **argv);

  private:
    using CommandHandler = std::function<void(const std::string &)>;

    void print_help() const;
    void command_loop();

    /**
     * @brief Parse and execute one command line
     * @param cmd_line Command text, e.g. "INS 10 CRCT 5"
     */
    void parse_and_execute_command(const std::string &cmd_line);

    // Editing and persistence

    void cmd_load(const std::string &args);
    void cmd_save(const std::string &args);
    void cmd_list(const std::string &args);
    void cmd_insert(const std::string &args);
    void cmd_delete(const std::string &args);

    // Execution and debugging

    void cmd_run(const std::string &args);
    void cmd_debug(const std::string &args);
    void cmd_next(const std::string &args);
    void cmd_stop(const std::string &args);
    void cmd_stack(const std::string &args);

    // Session

    /**
     * @brief Execute commands from a text file
     * @param args File name
     */
    void cmd_exec(const std::string &args);
    void cmd_help(const std::string &args);
    void cmd_exit(const std::string &args);

    // Helpers

    /**
     * @brief Read a command line from the EXEC file, the screen or input
     * @param line Receives the command
     * @return bool False at end of input
     */
    bool read_command_line(std::string &line);

    /**
     * @brief Ask a yes/no question
     * @return bool True if answered "y" or "yes"
     */
    bool confirm(const std::string &question);

    void wait_for_key(const std::string &prompt);
    void offer_save(const std::string &question);
    void end_debug_session();

    void print_line(const std::string &text);
    void print_error(const std::string &msg);
    void print_trace(const std::string &text);

    // Streams
    std::istream &in_;
    std::ostream &out_;
    std::ostream &err_;

    // Modules
    std::unique_ptr<Screen> screen_;     ///< ncurses front end (optional)
    std::unique_ptr<Program> program_;   ///< Program being edited
    std::unique_ptr<Machine> machine_;   ///< Execution engine
    std::unique_ptr<Debugger> debugger_; ///< Single-step controller

    std::unordered_map<std::string, CommandHandler> commands_; ///< Command dispatch table

    bool running_{true};

    // EXEC command state
    std::unique_ptr<std::ifstream> exec_file_;
    bool exec_mode_{false};
};

} // namespace mepa

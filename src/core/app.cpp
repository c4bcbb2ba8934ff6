/**
 * @file app.cpp
 * @brief Application main loop implementation for the MEPA interpreter
 *
 * Commands (case-insensitive):
 *   LOAD <file>            load a program file
 *   LIST [range]           list the program, 20 lines per page
 *   INS <line> <instr>     insert or replace a line
 *   DEL <line> [<line_f>]  delete a line or a range of lines
 *   SAVE [file]            save to the loaded file (or to <file>)
 *   RUN                    run the program to completion
 *   DEBUG                  start single-step debugging
 *   NEXT                   execute the next instruction (debug)
 *   STOP                   leave debug mode
 *   STACK                  show memory and stack (debug)
 *   EXEC <file>            run commands from a file
 *   HELP, ?                show this list
 *   EXIT, QUIT             leave the interpreter
 *
 * LOAD, RUN, INS, DEL and EXIT end an active debug session first.
 */

#include "mepa/app.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "mepa/editor/program.hpp"
#include "mepa/machine/debugger.hpp"
#include "mepa/machine/machine.hpp"
#include "mepa/program/integer.hpp"
#include "mepa/program/tokenizer.hpp"
#include "mepa/screen.hpp"

namespace mepa {

namespace {

constexpr size_t kListPageSize = 20;

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return text;
}

// Split "CMD rest of line" into the command word and the trimmed rest
std::pair<std::string, std::string> split_first_word(const std::string &line) {
    std::string text = Tokenizer::trim(line);
    auto pos = text.find_first_of(" \t");
    if (pos == std::string::npos) {
        return {text, ""};
    }
    return {text.substr(0, pos), Tokenizer::trim(text.substr(pos))};
}

std::string format_stack(const std::vector<Word> &stack) {
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << stack[i];
    }
    ss << ']';
    return ss.str();
}

} // namespace

App::App() : App(std::cin, std::cout, std::cerr) {}

App::App(std::istream &in, std::ostream &out, std::ostream &err)
    : in_(in), out_(out), err_(err), screen_(std::make_unique<Screen>()),
      program_(std::make_unique<Program>()), machine_(std::make_unique<Machine>(*program_)),
      debugger_(std::make_unique<Debugger>(*machine_)) {

    // Command dispatch table
    commands_["LOAD"] = [this](const auto &args) { cmd_load(args); };
    commands_["SAVE"] = [this](const auto &args) { cmd_save(args); };
    commands_["LIST"] = [this](const auto &args) { cmd_list(args); };
    commands_["INS"] = [this](const auto &args) { cmd_insert(args); };
    commands_["DEL"] = [this](const auto &args) { cmd_delete(args); };
    commands_["RUN"] = [this](const auto &args) { cmd_run(args); };
    commands_["DEBUG"] = [this](const auto &args) { cmd_debug(args); };
    commands_["NEXT"] = [this](const auto &args) { cmd_next(args); };
    commands_["STOP"] = [this](const auto &args) { cmd_stop(args); };
    commands_["STACK"] = [this](const auto &args) { cmd_stack(args); };
    commands_["EXEC"] = [this](const auto &args) { cmd_exec(args); };
    commands_["HELP"] = [this](const auto &args) { cmd_help(args); };
    commands_["?"] = [this](const auto &args) { cmd_help(args); };
    commands_["EXIT"] = [this](const auto &args) { cmd_exit(args); };
    commands_["QUIT"] = [this](const auto &args) { cmd_exit(args); };

    // IMPR output goes straight to the console as it is produced
    machine_->set_output_handler([this](Word value) { print_line(std::to_string(value)); });
}

App::~App() {
    if (screen_ && screen_->is_initialized()) {
        screen_->shutdown();
    }
}

App::Options App::parse_options(int argc, char **argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--screen") {
            opts.use_screen = true;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--max-steps") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--max-steps requires a value");
            }
            auto value = parse_integer<uint64_t>(argv[++i]);
            if (!value) {
                throw std::invalid_argument(std::string("Invalid step count: ") + argv[i]);
            }
            opts.max_steps = *value;
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        } else if (!opts.program_path) {
            opts.program_path = std::string(arg);
        } else {
            throw std::invalid_argument("Only one program file may be given");
        }
    }
    return opts;
}

int App::run(int argc, char **argv) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::invalid_argument &e) {
        print_error(e.what());
        print_help();
        return 2;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    machine_->set_step_limit(opts.max_steps);
    if (opts.trace) {
        machine_->set_trace_handler(
            [this](int line, const Instruction &instruction, const MachineState &state) {
                print_trace("TRACE " + std::to_string(line) + ": " + instruction.to_string() +
                            " | stack=" + format_stack(state.stack));
            });
    }

    if (opts.use_screen) {
        screen_->init();
    }

    print_line("MEPA interpreter - type EXIT to quit");

    if (opts.program_path) {
        parse_and_execute_command("LOAD " + *opts.program_path);
    }

    command_loop();
    screen_->shutdown();
    return 0;
}

void App::print_help() const {
    out_ << "Usage: mepa [options] [program.mepa]\n"
         << "Options:\n"
         << "  --screen         Use the full-screen (ncurses) console\n"
         << "  --trace          Trace each executed instruction\n"
         << "  --max-steps <n>  Abort RUN after n instructions (default: unlimited)\n"
         << "  -h, --help       Show this help\n";
}

void App::command_loop() {
    while (running_) {
        std::string cmd_line;
        if (!read_command_line(cmd_line)) {
            print_line("Exiting...");
            break;
        }

        if (Tokenizer::trim(cmd_line).empty()) {
            continue;
        }

        parse_and_execute_command(cmd_line);
    }
}

bool App::read_command_line(std::string &line) {
    // EXEC file first; at its end fall back to interactive input
    if (exec_mode_ && exec_file_ && exec_file_->is_open()) {
        if (std::getline(*exec_file_, line)) {
            print_line("+" + line);
            return true;
        }

        exec_file_->close();
        exec_file_.reset();
        exec_mode_ = false;
        print_line("EXEC complete");
    }

    if (screen_->is_initialized()) {
        return screen_->read_line("> ", line);
    }

    out_ << "> " << std::flush;
    return static_cast<bool>(std::getline(in_, line));
}

void App::parse_and_execute_command(const std::string &cmd_line) {
    auto [word, args] = split_first_word(cmd_line);
    std::string cmd = to_upper(word);

    // Commands that change the program or restart execution end a debug session
    static const char *const kInterrupting[] = {"LOAD", "RUN", "INS", "DEL", "EXIT", "QUIT"};
    if (debugger_->is_active() &&
        std::find(std::begin(kInterrupting), std::end(kInterrupting), cmd) !=
            std::end(kInterrupting)) {
        end_debug_session();
    }

    auto it = commands_.find(cmd);
    if (it == commands_.end()) {
        print_error("Invalid command: " + word);
        return;
    }

    try {
        it->second(args);
    } catch (const std::exception &e) {
        print_error(e.what());
    }
}

// =========================================
// Editing and persistence
// =========================================

void App::cmd_load(const std::string &args) {
    if (args.empty()) {
        print_error("LOAD requires a file name");
        return;
    }

    if (program_->is_modified()) {
        offer_save("There are unsaved changes. Save before loading another file? (y/n): ");
    }

    int skipped = program_->load_file(args);
    machine_->rebuild();
    print_line("File '" + args + "' loaded successfully.");
    if (skipped > 0) {
        print_line("Skipped " + std::to_string(skipped) + " line(s) without a line number");
    }
}

void App::cmd_save(const std::string &args) {
    if (program_->empty()) {
        print_error("No code in memory to save");
        return;
    }

    if (args.empty()) {
        program_->save_file();
    } else {
        program_->save_file(args);
    }
    print_line("File '" + program_->filename().value_or(args) + "' saved successfully");
}

void App::cmd_list(const std::string &args) {
    if (program_->empty()) {
        print_line("No code in memory");
        return;
    }

    auto lines = program_->lines_in(LineRange::parse(args));
    if (lines.empty()) {
        print_line("No lines in range");
        return;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0 && i % kListPageSize == 0) {
            wait_for_key("Press any key to continue.");
        }
        print_line(std::to_string(lines[i].first) + " " + lines[i].second);
    }
}

void App::cmd_insert(const std::string &args) {
    auto [number, text] = split_first_word(args);
    if (number.empty() || text.empty()) {
        print_error("INS requires <LINE> <INSTRUCTION>");
        return;
    }

    auto line_num = parse_integer<int>(number);
    if (!line_num) {
        print_error("Invalid line number");
        return;
    }
    if (*line_num < 0) {
        print_error("Line number cannot be negative");
        return;
    }

    bool replaced = program_->set_line(*line_num, text);
    machine_->rebuild();

    print_line(replaced ? "Line updated:" : "Line inserted:");
    print_line(std::to_string(*line_num) + " " + *program_->line(*line_num));
}

void App::cmd_delete(const std::string &args) {
    std::istringstream ss(args);
    std::vector<std::string> parts;
    for (std::string part; ss >> part;) {
        parts.push_back(part);
    }

    if (parts.size() == 1) {
        auto line_num = parse_integer<int>(parts[0]);
        if (!line_num) {
            print_error("Invalid line number");
            return;
        }
        if (!program_->delete_line(*line_num)) {
            print_error("Line " + std::to_string(*line_num) + " does not exist");
            return;
        }
        machine_->rebuild();
        print_line("Line removed:");
        print_line(std::to_string(*line_num));
        return;
    }

    if (parts.size() == 2) {
        auto range = LineRange::parse(parts[0] + "," + parts[1]);
        auto removed = program_->delete_range(range);
        if (removed.empty()) {
            print_line("No lines found in range " + parts[0] + "-" + parts[1]);
            return;
        }
        machine_->rebuild();
        print_line("Lines removed:");
        for (const auto &[line_num, text] : removed) {
            print_line(std::to_string(line_num) + " " + text);
        }
        return;
    }

    print_error("DEL requires <LINE> or <LINE_I> <LINE_F>");
}

// =========================================
// Execution and debugging
// =========================================

void App::cmd_run(const std::string &) {
    if (program_->empty()) {
        print_error("No code in memory");
        return;
    }

    RunResult result = machine_->run();
    if (!result.success && result.error) {
        print_error("Execution error: " + result.error->to_string());
    }
}

void App::cmd_debug(const std::string &) {
    if (program_->empty()) {
        print_error("No code in memory");
        return;
    }

    print_line("Starting debug mode:");
    auto report = debugger_->start();
    if (report.error) {
        print_error(report.error->to_string());
        return;
    }
    if (report.next_line) {
        print_line(std::to_string(*report.next_line) + " " + report.next_text);
    }
}

void App::cmd_next(const std::string &) {
    if (!debugger_->is_active() || debugger_->mode() != Mode::DebugPaused) {
        print_error("Not in debug mode. Use DEBUG first");
        return;
    }

    auto report = debugger_->step();
    if (report.error) {
        print_error(report.error->to_string());
        return;
    }

    if (report.finished) {
        print_line(report.halt == HaltReason::Para ? "Program finished (PARA)"
                                                   : "Program finished");
        return;
    }

    if (report.next_line) {
        print_line(std::to_string(*report.next_line) + " " + report.next_text);
    }
}

void App::cmd_stop(const std::string &) {
    if (!debugger_->is_active()) {
        print_line("Not in debug mode");
        return;
    }
    end_debug_session();
}

void App::cmd_stack(const std::string &) {
    if (!debugger_->is_active()) {
        print_line("STACK command only available in debug mode");
        return;
    }

    Snapshot snapshot = debugger_->inspect();
    if (snapshot.memory.empty() && snapshot.stack.empty()) {
        print_line("Stack empty");
        return;
    }

    // Memory cells first, then stack cells numbered on from the memory end
    print_line("Stack contents");
    size_t index = 0;
    for (Word value : snapshot.memory) {
        print_line(std::to_string(index++) + ": " + std::to_string(value));
    }
    for (Word value : snapshot.stack) {
        print_line(std::to_string(index++) + ": " + std::to_string(value));
    }
}

void App::end_debug_session() {
    auto report = debugger_->stop();
    if (report.success) {
        print_line("Debug mode ended");
    }
}

// =========================================
// Session
// =========================================

void App::cmd_exec(const std::string &args) {
    if (args.empty()) {
        print_error("EXEC requires a file name");
        return;
    }

    auto file = std::make_unique<std::ifstream>(args);
    if (!file->is_open()) {
        print_error("Cannot open file: " + args);
        return;
    }

    exec_file_ = std::move(file);
    exec_mode_ = true;
}

void App::cmd_help(const std::string &) {
    print_line("Commands:");
    print_line("  LOAD <file>            Load a program file");
    print_line("  LIST [range]           List the program");
    print_line("  INS <line> <instr>     Insert or replace a line");
    print_line("  DEL <line> [<line_f>]  Delete a line or a range");
    print_line("  SAVE [file]            Save the program");
    print_line("  RUN                    Run the program");
    print_line("  DEBUG                  Start debug mode");
    print_line("  NEXT                   Execute the next instruction");
    print_line("  STOP                   Leave debug mode");
    print_line("  STACK                  Show memory and stack");
    print_line("  EXEC <file>            Run commands from a file");
    print_line("  EXIT                   Quit");
}

void App::cmd_exit(const std::string &) {
    if (program_->is_modified()) {
        offer_save("There are unsaved changes. Save before exiting? (y/n): ");
    }
    print_line("Exiting...");
    running_ = false;
}

// =========================================
// Helpers
// =========================================

void App::offer_save(const std::string &question) {
    if (!confirm(question)) {
        return;
    }
    try {
        program_->save_file();
        print_line("File '" + *program_->filename() + "' saved successfully");
    } catch (const std::exception &e) {
        print_error(std::string("Save failed: ") + e.what());
    }
}

bool App::confirm(const std::string &question) {
    std::string answer;
    if (screen_->is_initialized()) {
        if (!screen_->read_line(question, answer)) {
            return false;
        }
    } else {
        out_ << question << std::flush;
        if (!std::getline(in_, answer)) {
            return false;
        }
    }

    answer = to_upper(Tokenizer::trim(answer));
    return answer == "Y" || answer == "YES";
}

void App::wait_for_key(const std::string &prompt) {
    if (screen_->is_initialized()) {
        screen_->write_line(prompt);
        screen_->get_key();
        return;
    }

    out_ << prompt << std::flush;
    std::string ignored;
    std::getline(in_, ignored);
    out_ << '\n';
}

void App::print_line(const std::string &text) {
    if (screen_->is_initialized()) {
        screen_->write_line(text);
    } else {
        out_ << text << std::endl;
    }
}

void App::print_error(const std::string &msg) {
    if (screen_->is_initialized()) {
        screen_->write_line("ERROR: " + msg);
    } else {
        err_ << "ERROR: " << msg << std::endl;
    }
}

void App::print_trace(const std::string &text) {
    if (screen_->is_initialized()) {
        screen_->write_line(text);
    } else {
        err_ << text << std::endl;
    }
}

} // namespace mepa

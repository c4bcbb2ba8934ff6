/**
 * @file screen.hpp
 * @brief Terminal screen management using ncurses
 *
 * Provides a scrolling console on top of ncurses for the full-screen
 * front end: lines are appended at the bottom and scroll upward, and
 * command lines are read with echo at the current position.
 */

#pragma once

#include <string>

namespace mepa {

/**
 * @brief Screen manager for terminal I/O using ncurses
 *
 * Every operation is a no-op until init() is called, so the rest of the
 * program can hold a Screen unconditionally. Non-copyable.
 */
class Screen {
  public:
    Screen();

    /**
     * @brief Destroy the Screen object and clean up ncurses
     */
    ~Screen();

    Screen(const Screen &) = delete;
    Screen &operator=(const Screen &) = delete;

    /**
     * @brief Initialize ncurses and set up a scrolling screen
     */
    void init();

    /**
     * @brief Shutdown ncurses and restore terminal
     */
    void shutdown();

    /**
     * @brief Append a line of text, scrolling if at the bottom
     * @param text Text to write
     */
    void write_line(const std::string &text);

    /**
     * @brief Show a prompt and read a line with echo
     * @param prompt Prompt text
     * @param line Receives the text entered
     * @return bool False if input is no longer available
     */
    bool read_line(const std::string &prompt, std::string &line);

    /**
     * @brief Get a single keypress from the user
     * @return int Key code (character or special key), -1 if not initialized
     */
    int get_key();

    /**
     * @brief Check if screen is initialized
     * @return bool True if ncurses is initialized
     */
    bool is_initialized() const;

  private:
    bool initialized_; ///< Screen initialization status
};

} // namespace mepa

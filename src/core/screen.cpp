/**
 * @file screen.cpp
 * @brief Terminal screen management implementation using ncurses
 */

#include "mepa/screen.hpp"

#include <curses.h>

namespace mepa {

namespace {

constexpr int kMaxInputLength = 1024;

} // namespace

Screen::Screen() : initialized_(false) {}

Screen::~Screen() {
    shutdown();
}

void Screen::init() {
    if (initialized_) {
        return;
    }
    initscr();
    cbreak();
    echo();
    keypad(stdscr, TRUE);
    scrollok(stdscr, TRUE);
    idlok(stdscr, TRUE);
    initialized_ = true;
}

void Screen::shutdown() {
    if (!initialized_) {
        return;
    }
    endwin();
    initialized_ = false;
}

void Screen::write_line(const std::string &text) {
    if (!initialized_) {
        return;
    }
    addnstr(text.c_str(), COLS > 1 ? COLS - 1 : 1);
    addch('\n');
    ::refresh();
}

bool Screen::read_line(const std::string &prompt, std::string &line) {
    if (!initialized_) {
        return false;
    }
    addstr(prompt.c_str());
    ::refresh();

    char buffer[kMaxInputLength + 1] = {};
    if (getnstr(buffer, kMaxInputLength) == ERR) {
        return false;
    }
    line = buffer;
    return true;
}

int Screen::get_key() {
    if (!initialized_) {
        return -1;
    }
    noecho();
    int key = getch();
    echo();
    return key;
}

bool Screen::is_initialized() const {
    return initialized_;
}

} // namespace mepa

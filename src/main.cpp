/**
 * @file main.cpp
 * @brief Main entry point for the MEPA interpreter
 *
 * Simple entry point that creates and runs the App instance.
 */

#include "mepa/app.hpp"

int main(int argc, char **argv) {
    mepa::App app;
    return app.run(argc, argv);
}

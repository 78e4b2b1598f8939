/**
 * @file main_native.cpp
 * @brief Main entry point for the desktop viewer.
 *
 * Creates a SimManager and runs the main loop until the window is closed.
 */

#include <exception>
#include <iostream>

#include "fountain/core/sim_manager.hpp"

int main() {
    try {
        SimManager simManager;
        simManager.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

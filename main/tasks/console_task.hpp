#ifndef CONSOLE_TASK_HPP
#define CONSOLE_TASK_HPP

#include <cstddef>

// Line-oriented JSON ingress on the serial console (stdin).
// Lines carrying a "command" member go to CommandTask, everything else is
// treated as a sensor reading for SoilHealthTask.
namespace ConsoleTask {
    void create();

    enum class Route {
        COMMAND,
        READING,
        IGNORED,
    };

    // Classify one line; IGNORED for blank lines and oversized input
    Route classify(const char* line, int length);
}

#endif // CONSOLE_TASK_HPP

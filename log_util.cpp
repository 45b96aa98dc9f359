/**
 * Console diagnostics
 *
 * [INFO] lines go to stdout next to the results, [WARN] and [ERROR] lines go
 * to stderr. Every line is flushed so progress is visible while a long
 * strategy sweep is still running.
 */

#include "log_util.h"

#include <iostream>

static bool g_quiet = false;

void set_quiet(bool quiet) {
    g_quiet = quiet;
}

void info(const std::string& msg) {
    if (g_quiet) return;
    std::cout << "[INFO] " << msg << std::endl;
    std::cout.flush();
}

void warn(const std::string& msg) {
    std::cerr << "[WARN] " << msg << std::endl;
    std::cerr.flush();
}

void error(const std::string& msg) {
    std::cerr << "[ERROR] " << msg << std::endl;
    std::cerr.flush();
}

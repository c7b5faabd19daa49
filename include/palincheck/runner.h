#pragma once

#include "settings.h"

#include <ostream>
#include <string>
#include <vector>

namespace palincheck {

enum ExitStatus {
    ExitOk = 0,
    ExitError = 1,
    ExitNotPalindrome = 2
};

// No texts, no --infile and no --demo: show the explanation and the demonstration
bool is_bare_run(const CheckerSettings& settings);

// Positional texts, then --infile lines, then the demonstration inputs
// (requested with --demo, or implied by a bare run)
std::vector<std::string> collect_texts(const CheckerSettings& settings);

// Report goes to out, diagnostics to err. Returns an ExitStatus.
// Errors propagate as exceptions.
int run(const CheckerSettings& settings, std::ostream& out, std::ostream& err);

// Parse argv, load the settings file, run. Any std::exception is printed
// as "Error: <what>" on err and gives ExitError.
int run_main(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace palincheck

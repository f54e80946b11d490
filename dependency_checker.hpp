#ifndef DEPENDENCY_CHECKER_HPP
#define DEPENDENCY_CHECKER_HPP

#include "config.hpp"
#include "console.hpp"

// Verifies every tool in the toolchain resolves to an executable.
// Throws ToolError naming the first missing tool and the package that provides it.
void check_dependencies(const Toolchain& tools, Console& console);

// Warns when not running inside Termux ($PREFIX unset). Advisory only.
void check_termux_environment(Console& console);

#endif // DEPENDENCY_CHECKER_HPP

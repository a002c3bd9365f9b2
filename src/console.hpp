#pragma once

#include "package_manager.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Owner command surface:
//   view [package=self] | install <reference> | uninstall <package>
//   verify | update-self | reload-self
// Returns 0 on success, 1 on a reported failure.
int run_command(PackageManager& manager, const std::vector<std::string>& args, std::ostream& out);

// Reads commands line by line and runs each one as its own task so a slow
// install never holds up unrelated commands. Returns after "exit", "quit" or
// end of input, once every task has finished. "reload-self" also ends the
// session and restarts the installer after the running tasks are done.
void run_console(PackageManager& manager, std::istream& in, std::ostream& out);

std::vector<std::string> split_command_line(const std::string& line);

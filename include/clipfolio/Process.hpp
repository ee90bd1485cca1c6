#pragma once
// Single Responsibility: run helper programs (wl-copy, wl-paste, hyprctl, xdg-open)

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipfolio {

using Argv = std::vector<std::string>;

// Runs argv[0] from PATH and waits; true when it exited with status 0
bool runCommand(const Argv& argv);

// stdout of a successful run; nullopt when the program failed or is missing
std::optional<std::string> captureOutput(const Argv& argv);

// Writes input to the program's stdin, then waits for it
bool feedInput(const Argv& argv, std::string_view input);

// Starts the program in its own session without waiting for it
bool spawnDetached(const Argv& argv);

} // namespace clipfolio

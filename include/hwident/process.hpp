#pragma once

/**
 * @file process.hpp
 * @brief Bounded subprocess execution
 */

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace hwident {

/// Outcome of a command invocation
struct CommandResult {
    bool started = false;    // Command was found and executed
    bool timed_out = false;  // Killed after exceeding the timeout
    int exit_code = -1;
    std::string output;      // Captured standard output
};

/// Signature of a command runner (replaceable for testing)
using CommandRunner =
    std::function<CommandResult(const std::vector<std::string>&, std::chrono::milliseconds)>;

/**
 * @brief Run a command and capture its standard output
 *
 * The command is resolved through PATH. Standard error is discarded. If the
 * command does not finish within @p timeout it is killed and reaped; no
 * descriptor or child process outlives the call.
 *
 * @param argv Program followed by its arguments
 * @param timeout Upper bound for the whole invocation
 * @return Command result; started is false if the command could not be run
 */
[[nodiscard]] CommandResult run_command(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout);

}  // namespace hwident

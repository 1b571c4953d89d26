#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "layerfs/lifecycle.hpp"

namespace layerfs {

/**
 * @brief Runs a command, looked up in `PATH`, with the environment of this process and waits for it.
 *   If \p guard catches a termination signal first, the signal is forwarded to the command.
 *   A command still running after \p grace is killed with `SIGKILL`; the function returns
 *   only after the command is reaped.
 *
 * @param argv  Command followed by its arguments.
 * @param guard Active signal guard.
 * @param grace Time the command is given to exit after the signal is forwarded.
 * @return Exit status of the command, `128 + n` if it was killed by signal `n`,
 *   or `std::nullopt` if a termination signal was received.
 *
 * @exception \ref std::system_error if the command cannot be started.
 */
std::optional<int> run_command(
    std::vector<std::string> const& argv,
    SignalGuard const&              guard,
    std::chrono::milliseconds       grace = std::chrono::seconds(5));

}  // namespace layerfs

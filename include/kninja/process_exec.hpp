#pragma once

#include "kninja/utility.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kninja {
/**
 * @brief Runs a subprocess in the foreground and waits for it.
 *
 * The child inherits stdin, stdout and stderr, so it behaves as if it had
 * replaced the current process.
 *
 * @param args The command line arguments (first argument is the executable, looked up on PATH).
 * @param working_dir Optional working directory for the subprocess.
 * @param env Optional environment variables to extend/override the parent environment.
 * @return The exit status of the process, or an error if it could not be started.
 */
Result<int> process_exec(std::vector<std::string> &&args,
                         std::optional<std::string> working_dir = std::nullopt,
                         std::optional<std::unordered_map<std::string, std::string>> env = std::nullopt);
} // namespace kninja

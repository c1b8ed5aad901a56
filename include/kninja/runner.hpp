#pragma once

#include "kninja/registry.hpp"
#include "kninja/utility.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kninja {

/** @brief A parsed `kninja-run` command line. */
struct RunnerCommand {
    Mode mode;
    std::string definition;
    /// The program (kast, run) or specification (prove).
    std::string path;
    /// Passed to the K tool after the definition's own flags.
    std::vector<std::string> args;
};

/**
 * @brief Dispatches `kast`, `run` and `prove` to the K tool of a definition.
 *
 * Usage: `{kast|run|prove} [--definition NAME] <path> [args...]`.
 * Everything after `<path>` is handed to the tool untouched; a leading
 * `--` is dropped.
 */
class Runner {
public:
    explicit Runner(DefinitionRegistry registry, std::optional<std::string> default_definition = std::nullopt);

    const DefinitionRegistry &definitions() const {
        return registry_;
    }

    /**
     * @brief Parses `args` (without the program name).
     *
     * Fails with `ErrorKind::usage` on a malformed command line and with
     * `ErrorKind::unknown_definition` when `--definition` names no
     * registered definition. Nothing is launched on failure.
     */
    Result<RunnerCommand> parse(std::span<const std::string> args) const;

    /** @brief The argument vector that carries out `cmd`. */
    Result<std::vector<std::string>> invocation(const RunnerCommand &cmd) const;

    /**
     * @brief Parses `args`, then runs the selected tool in the foreground.
     * @return The tool's exit status, 2 for command-line errors, 1 if the
     *         tool could not be launched.
     */
    int main(std::span<const char *const> args) const;

    std::string usage() const;

private:
    Result<std::string> resolve_definition(const std::optional<std::string> &requested) const;

    DefinitionRegistry registry_;
    std::optional<std::string> default_definition_;
};

} // namespace kninja

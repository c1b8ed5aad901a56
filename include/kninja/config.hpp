#pragma once

#include "kninja/graph.hpp"
#include "kninja/utility.hpp"

#include <optional>
#include <string>
#include <string_view>

#ifndef KNINJA_DATA_DIR
#define KNINJA_DATA_DIR "share/kninja"
#endif

namespace kninja {

/** @brief Name of the variable that selects a pre-installed K. */
inline constexpr std::string_view USE_SYSTEM_K_ENV = "KNINJA_USE_SYSTEM_K";
/** @brief Name of the variable that overrides the kninja data directory. */
inline constexpr std::string_view KNINJA_DIR_ENV = "KNINJA_DIR";

struct ProjectConfig {
    std::string builddir = ".build";
    std::string extdir = "ext";
    std::string manifest = "generated.ninja";
    std::string registry = "definitions.json";
    std::string ninja_required_version = "1.7";
    std::string ninja = "ninja";
    std::string kninja_dir = KNINJA_DATA_DIR;
    /// Use the K installation found on PATH instead of building ext/k.
    bool use_system_k = false;
    /// Root of the K release tree. Derived from ext/k when unset.
    std::optional<std::string> k_release_dir = std::nullopt;
    DuplicateRulePolicy duplicate_rules = DuplicateRulePolicy::require_identical;

    /**
     * @brief Defaults overridden by the process environment.
     *
     * `KNINJA_USE_SYSTEM_K` (any value) selects the K installation whose
     * `kompile` is first on `PATH`; not finding one is a configuration
     * error. `KNINJA_DIR` overrides `kninja_dir`.
     */
    static Result<ProjectConfig> from_environment();
};

/**
 * @brief Looks `name` up in the directories of `PATH`.
 * @return The full path of the first executable match.
 */
std::optional<std::string> find_program(std::string_view name);

} // namespace kninja

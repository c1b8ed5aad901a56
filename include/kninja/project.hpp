#pragma once

#include "kninja/backend.hpp"
#include "kninja/config.hpp"
#include "kninja/definition.hpp"
#include "kninja/graph.hpp"
#include "kninja/registry.hpp"
#include "kninja/rule.hpp"
#include "kninja/target.hpp"
#include "kninja/utility.hpp"

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

/**
 * @brief A K project: one ninja manifest plus the K-specific layout and
 *        infrastructure around it.
 *
 * This class acts as a facade over the `BuildGraph` and the
 * `DefinitionRegistry`. It owns both; Targets and Definitions it hands
 * out refer back to it, so a Project is never moved (see `create`).
 */
class Project {
    // Only `create` can make one, but std::make_unique needs a public constructor.
    struct Key {
        explicit Key() = default;
    };

public:
    Project(Key, ProjectConfig config);

    /**
     * @brief Creates a project and writes the manifest preamble (global
     *        variables, the `clean` edge, a `dummy` default target).
     */
    static Result<std::unique_ptr<Project>> create(ProjectConfig config);

    /** @brief `create` with `ProjectConfig::from_environment()`. */
    static Result<std::unique_ptr<Project>> create();

    Project(const Project &) = delete;
    Project &operator=(const Project &) = delete;

    BuildGraph &graph() {
        return graph_;
    }
    const BuildGraph &graph() const {
        return graph_;
    }
    const ProjectConfig &config() const {
        return config_;
    }
    const DefinitionRegistry &definitions() const {
        return registry_;
    }

    // Directory layout.
    // Each helper joins `parts` onto its base directory.

    /** @brief Directory holding the submodules kninja uses. */
    std::string extdir(std::initializer_list<std::string_view> parts = {}) const;
    /** @brief Checkout of the K framework. */
    std::string krepodir(std::initializer_list<std::string_view> parts = {}) const;
    std::string kreleasedir(std::initializer_list<std::string_view> parts = {}) const;
    /** @brief Where the K binaries live. */
    std::string kbindir(std::initializer_list<std::string_view> parts = {}) const;
    std::string klibdir(std::initializer_list<std::string_view> parts = {}) const;
    /** @brief Installed kninja data (`kprove.expected`). */
    std::string kninjadir(std::initializer_list<std::string_view> parts = {}) const;
    /** @brief The project's build directory. */
    std::string builddir(std::initializer_list<std::string_view> parts = {}) const;

    std::string manifest_path() const;
    std::string registry_path() const;

    // Graph construction.

    Target source(std::string path) {
        return graph_.source(std::move(path));
    }
    Target dot_target() {
        return graph_.dot_target();
    }
    RuleTemplate rule(std::string name, std::optional<std::string> description, std::string command) const {
        return graph_.rule(std::move(name), std::move(description), std::move(command));
    }
    Result<Target> alias(std::string name, const std::vector<Target> &targets) {
        return graph_.alias(std::move(name), targets);
    }
    void mark_default(const std::vector<Target> &targets) {
        graph_.mark_default(targets);
    }

    /**
     * @brief Applies `runner` to every input and groups the results under `name`.
     * @return The alias target.
     */
    Result<Target> suite(std::string name, const std::vector<std::string> &inputs,
                         const std::function<Result<Target>(Target)> &runner, bool default_target = true);

    // K infrastructure.

    RuleTemplate rule_git_submodule_init(std::string path, std::string timestamp_file) const;

    /** @brief The one edge that checks out ext/k. */
    Result<Target> init_k_submodule();

    Result<RuleTemplate> rule_build_k(Backend backend);

    /** @brief The one edge that builds K for `backend`. */
    Result<Target> build_k(Backend backend);

    RuleTemplate rule_kompile() const;

    /**
     * @brief Rule comparing its input with `expected`.
     *
     * Any difference fails the edge. The expected file is an implicit
     * input, so editing it re-runs the comparison.
     */
    RuleTemplate check(std::string expected) const;

    /**
     * @brief Kompiles a definition and registers it under its alias.
     *
     * Unless the system K is used, the edge depends on the K build for
     * the definition's backend.
     */
    Result<Definition> definition(DefinitionOptions opts);

    /** @brief Makes `alias` the definition `kninja-run` uses by default. */
    Result<void> set_default_definition(std::string alias) {
        return registry_.set_default_alias(std::move(alias));
    }

    // Finalization.

    /** @brief Writes the manifest and the definition registry into the build directory. */
    Result<void> write();

    /**
     * @brief Writes everything, then runs ninja on the manifest with `args`.
     * @return ninja's exit status, or 1 if writing or launching failed.
     */
    int main(std::span<const char *const> args);

private:
    Result<void> generate_ninja();

    ProjectConfig config_;
    BuildGraph graph_;
    DefinitionRegistry registry_;
    std::string k_release_dir_;
};

} // namespace kninja

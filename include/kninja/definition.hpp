#pragma once

#include "kninja/backend.hpp"
#include "kninja/registry.hpp"
#include "kninja/rule.hpp"
#include "kninja/target.hpp"
#include "kninja/utility.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

class Project;

/** @brief Options for `Project::definition`. */
struct DefinitionOptions {
    std::string alias;
    Backend backend = Backend::llvm;
    /// Main `.k` file passed to kompile.
    std::string main;
    /// Other sources of the definition; changes to them re-kompile it.
    std::vector<std::string> other = {};
    /// Script invoked as `<runner_script> {run|prove} --definition <alias> <file>`.
    std::optional<std::string> runner_script = std::nullopt;
    /// Output directory for kompile. Defaults to `<builddir>/defn/<alias>`.
    std::optional<std::string> directory = std::nullopt;
    std::string flags = "";
    std::string krun_flags = "";
    std::string krun_env = "";
    std::string kprove_flags = "";
    std::string kprove_env = "";
};

/** @brief Options shared by `Definition::tests` and `Definition::proofs`. */
struct SuiteOptions {
    std::vector<std::string> inputs = {};
    /// Extra inputs matched by a shell wildcard.
    std::optional<std::string> glob = std::nullopt;
    /// Expected output for every input. Defaults per input for tests and to
    /// `kprove.expected` for proofs.
    std::optional<std::string> expected = std::nullopt;
    std::vector<std::string> implicit_inputs = {};
    /// When set, the chains are grouped under this phony alias.
    std::optional<std::string> alias = std::nullopt;
    bool default_target = true;
    std::string flags = "";
};

/**
 * @brief A kompiled K definition and the pipelines built on it.
 *
 * The artifact target (the kompile output) is an implicit input of every
 * stage a Definition hands out, so re-kompiling invalidates all derived
 * test and proof results. Each rule accessor returns a fresh template.
 */
class Definition {
public:
    Definition(Project &proj, DefinitionInfo info, Target target, std::optional<std::string> runner_script,
               std::string krun_env, std::string kprove_env);

    Project &project() const {
        return *proj_;
    }
    const Target &target() const {
        return target_;
    }
    const DefinitionInfo &info() const {
        return info_;
    }
    const std::string &alias() const {
        return info_.alias;
    }
    Backend backend() const {
        return info_.backend;
    }

    std::string directory(std::initializer_list<std::string_view> parts = {}) const;
    std::string kompiled_dir(std::initializer_list<std::string_view> parts = {}) const;

    /**
     * @brief Builds `input -> run -> check` chains.
     *
     * Each input's output is compared with `<input>.expected` unless an
     * expected file is given. Returns the chain heads, or the alias target
     * alone when `alias` is set.
     */
    Result<std::vector<Target>> tests(const SuiteOptions &opts) const;

    /** @brief Builds `spec -> prove -> check` chains. See `tests`. */
    Result<std::vector<Target>> proofs(const SuiteOptions &opts) const;

    /**
     * @brief Rule running the definition's runner script in `mode`.
     *
     * Only `Mode::run` and `Mode::prove` are meaningful; a definition
     * without a runner script is a configuration error.
     */
    Result<RuleTemplate> runner_script(Mode mode, std::string flags = "") const;

    RuleTemplate krun(std::string krun_flags = "") const;
    RuleTemplate kast() const;

    // kprove prints its errors to stdout, so the rule shows its captured
    // output when it fails.
    RuleTemplate kprove() const;

private:
    Result<std::vector<Target>> suite(const SuiteOptions &opts, Mode mode,
                                      const std::optional<std::string> &fallback_expected) const;

    Project *proj_;
    DefinitionInfo info_;
    Target target_;
    std::optional<std::string> runner_script_;
    std::string krun_env_;
    std::string kprove_env_;
};

} // namespace kninja

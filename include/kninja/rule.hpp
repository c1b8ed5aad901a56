#pragma once

#include "kninja/domain.hpp"
#include "kninja/target.hpp"
#include "kninja/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

class BuildGraph;

/**
 * @brief Describes one class of build action: a ninja rule plus the
 *        per-edge settings used when it is applied.
 *
 * RuleTemplate is a value type. Every `with_*` call returns a modified copy
 * and leaves the original untouched, so a template can be shared by many
 * call sites and customized independently by each of them.
 */
class RuleTemplate {
public:
    RuleTemplate(std::string name, std::optional<std::string> description, std::string command);

    const std::string &name() const {
        return decl_.name;
    }
    const std::optional<std::string> &description() const {
        return decl_.description;
    }
    const std::string &command() const {
        return decl_.command;
    }
    const RuleDecl &decl() const {
        return decl_;
    }
    const std::optional<std::string> &extension() const {
        return extension_;
    }
    const std::optional<std::string> &output() const {
        return output_;
    }
    const std::vector<std::string> &implicit_inputs() const {
        return implicit_inputs_;
    }
    const std::vector<std::string> &implicit_outputs() const {
        return implicit_outputs_;
    }
    const std::optional<std::string> &pool() const {
        return pool_;
    }
    const Variables &variables() const {
        return variables_;
    }

    RuleTemplate with_extension(std::string ext) const;
    RuleTemplate with_output(std::string path) const;
    /** @brief Appends to the implicit inputs. */
    RuleTemplate with_implicit_inputs(const std::vector<std::string> &paths) const;
    RuleTemplate with_implicit_inputs(const std::vector<Target> &targets) const;
    /** @brief Appends to the implicit outputs. */
    RuleTemplate with_implicit_outputs(const std::vector<std::string> &paths) const;
    RuleTemplate with_pool(std::string pool) const;
    /** @brief Merges `vars` into the bindings; values in `vars` win. */
    RuleTemplate with_variables(const Variables &vars) const;
    RuleTemplate with_variable(std::string key, std::string value) const;

    /**
     * @brief Computes the output path of an edge applying this rule to `source`.
     *
     * An explicit output is returned verbatim. Otherwise the extension is
     * appended to the source path and the result placed under the build
     * directory of the source's graph.
     */
    Result<std::string> resolve_output_path(const Target &source) const;

    /**
     * @brief Records the edge `source -> output` in `graph`.
     *
     * Checks that `output` is relative and every placeholder of the command
     * is bound, then validates the edge before registering the rule on first
     * use. Nothing is recorded when any check fails.
     */
    Result<Target> apply(BuildGraph &graph, const Target &source, std::string output) const;

private:
    RuleDecl decl_;
    std::optional<std::string> extension_;
    std::optional<std::string> output_;
    std::vector<std::string> implicit_inputs_;
    std::vector<std::string> implicit_outputs_;
    std::optional<std::string> pool_;
    Variables variables_;
};

/**
 * @brief Lists the variables referenced by a ninja command string.
 *
 * Both `$name` and `${name}` forms are recognized. Escapes (`$$`, `$ `,
 * `$:` and `$` at end of line) are not references.
 */
std::vector<std::string> referenced_variables(std::string_view command);

} // namespace kninja

#pragma once

#include "kninja/utility.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kninja {

class BuildGraph;
class RuleTemplate;

/**
 * @brief A node of the build graph: a file path or a phony alias name.
 *
 * Targets are immutable values. They refer to (but do not own) the graph
 * that created them, which must outlive them.
 */
class Target {
public:
    Target(BuildGraph &graph, std::string path, std::optional<std::string> alias_name = std::nullopt)
        : graph_(&graph), path_(std::move(path)), alias_name_(std::move(alias_name)) {
    }

    const std::string &path() const {
        return path_;
    }

    const std::optional<std::string> &alias_name() const {
        return alias_name_;
    }

    BuildGraph &graph() const {
        return *graph_;
    }

    /**
     * @brief Applies `rule` to this target, recording a build edge.
     *
     * The output path comes from the rule (explicit output, or this path plus
     * the rule's extension placed under the build directory).
     * @return The produced target, or the configuration error raised by the rule.
     */
    Result<Target> then(const RuleTemplate &rule) const;

    /**
     * @brief Declares a phony alias `name` for this target.
     * @return A copy of this target remembering the alias.
     */
    Result<Target> alias(std::string name) const;

    /** @brief Adds this target to the default set. */
    const Target &mark_default() const;

    bool operator==(const Target &other) const {
        return graph_ == other.graph_ && path_ == other.path_ && alias_name_ == other.alias_name_;
    }

private:
    BuildGraph *graph_;
    std::string path_;
    std::optional<std::string> alias_name_;
};

/** @brief Flattens targets to their paths, keeping order. */
std::vector<std::string> to_paths(const std::vector<Target> &targets);

} // namespace kninja

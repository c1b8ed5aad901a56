#pragma once

#include "kninja/domain.hpp"
#include "kninja/rule.hpp"
#include "kninja/target.hpp"
#include "kninja/utility.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kninja {

/** @brief What to do when a rule name is registered a second time with a different body. */
enum class DuplicateRulePolicy : uint8_t {
    require_identical, ///< Report a duplicate_rule_conflict error.
    first_wins,        ///< Keep the first registration silently.
};

/**
 * @brief In-memory ninja build graph.
 *
 * Owns the rule registry, build edges, phony aliases, default targets,
 * global variables and the singleton cache for infrastructure targets.
 * Nothing is written until `flush` is called.
 *
 * Not thread-safe: rule registration and singleton creation must happen
 * from one thread.
 */
class BuildGraph {
public:
    explicit BuildGraph(std::string builddir = ".build",
                        DuplicateRulePolicy policy = DuplicateRulePolicy::require_identical);

    BuildGraph(const BuildGraph &) = delete;
    BuildGraph &operator=(const BuildGraph &) = delete;

    const std::string &builddir() const {
        return builddir_;
    }

    /**
     * @brief Nests a relative path under the build directory, unless it is already there.
     * @return The placed path, or a configuration error for absolute paths.
     */
    Result<std::string> place_in_output_dir(std::string_view path) const;

    /** @brief Reference to a source file (or an external path). */
    Target source(std::string path) {
        return Target(*this, std::move(path));
    }

    /** @brief Placeholder input for edges that have no real input. */
    Target dot_target() {
        return Target(*this, "");
    }

    /**
     * @brief Creates a rule template without registering it.
     *
     * The rule is registered the first time it is applied.
     */
    RuleTemplate rule(std::string name, std::optional<std::string> description, std::string command) const {
        return RuleTemplate(std::move(name), std::move(description), std::move(command));
    }

    /**
     * @brief Registers a rule declaration.
     *
     * Registering an existing name returns the first registration. If the
     * body differs, the duplicate policy decides between returning it anyway
     * and reporting a duplicate_rule_conflict.
     */
    Result<RuleTemplate> register_rule(std::string name, std::optional<std::string> description, std::string command);

    /** @brief Registers the declaration carried by `rule`. See `register_rule`. */
    Result<void> ensure_rule(const RuleTemplate &rule);

    /**
     * @brief Checks everything `add_edge` checks except the rule registration.
     *
     * The pool must be declared, and no other edge or alias may already
     * produce one of the outputs.
     */
    Result<void> check_edge(const BuildEdge &edge) const;

    /** @brief Adds a build edge over a registered rule. See `check_edge`. */
    Result<void> add_edge(BuildEdge edge);

    /**
     * @brief Declares a phony alias over `targets`.
     *
     * Repeating a declaration over the same set of inputs (in any order) is a
     * no-op and keeps the first order. Reusing the name for different inputs
     * is a configuration error.
     */
    Result<Target> alias(std::string name, const std::vector<Target> &targets);
    Result<Target> alias(std::string name, const std::vector<std::string> &paths);

    /** @brief Adds targets to the default set. Duplicates are ignored. */
    void mark_default(const std::vector<Target> &targets);
    void mark_default(const std::vector<std::string> &paths);

    /**
     * @brief Returns the target cached under `key`, creating it with `factory` the first time.
     *
     * A failing factory caches nothing.
     */
    Result<Target> get_or_create_singleton(const std::string &key, const std::function<Result<Target>()> &factory);

    bool has_singleton(const std::string &key) const {
        return singletons_.contains(key);
    }

    /** @brief Adds a global variable, written at the top of the manifest. */
    void add_variable(std::string name, std::string value);

    /** @brief Declares a pool. `console` is built in and needs no declaration. */
    Result<void> add_pool(std::string name, unsigned depth);

    void add_comment(std::string text) {
        comments_.push_back(std::move(text));
    }

    /** @brief True if `name` is bound globally or is one of ninja's per-edge built-ins. */
    bool is_bound_globally(std::string_view name) const;

    const RuleDecl *find_rule(std::string_view name) const;

    const std::vector<RuleDecl> &rules() const {
        return rules_;
    }
    const std::vector<BuildEdge> &edges() const {
        return edges_;
    }
    const std::vector<PhonyAlias> &aliases() const {
        return aliases_;
    }
    const std::vector<std::string> &defaults() const {
        return defaults_;
    }
    const std::vector<std::pair<std::string, std::string>> &variables() const {
        return variables_;
    }
    bool flushed() const {
        return flushed_;
    }

    /**
     * @brief Checks that no path depends on itself.
     * @return A configuration error naming a node on the cycle, if any.
     */
    Result<void> check_acyclic() const;

    /**
     * @brief Writes the manifest: comments, global variables, pools, rules,
     *        build edges, aliases and the default statement, each in
     *        registration order.
     *
     * May be called once. Later calls, and later changes to the graph, fail.
     */
    Result<void> flush(std::ostream &out);

private:
    Result<void> check_open(std::string_view what) const;
    Result<void> claim_output(const std::string &path, std::string_view producer);

    std::string builddir_;
    DuplicateRulePolicy policy_;
    bool flushed_ = false;

    std::vector<std::string> comments_;
    std::vector<std::pair<std::string, std::string>> variables_;
    std::vector<std::pair<std::string, unsigned>> pools_;
    std::vector<RuleDecl> rules_;
    std::unordered_map<std::string, size_t> rule_index_;
    std::vector<BuildEdge> edges_;
    std::vector<PhonyAlias> aliases_;
    std::unordered_map<std::string, size_t> alias_index_;
    std::vector<std::string> defaults_;
    std::unordered_set<std::string> default_index_;
    std::unordered_map<std::string, std::string> producers_;
    std::map<std::string, Target> singletons_;
};

} // namespace kninja

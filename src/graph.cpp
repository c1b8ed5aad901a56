#include "kninja/graph.hpp"

#include "kninja/ninja_writer.hpp"
#include "kninja/paths.hpp"
#include "kninja/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kninja {

namespace {

constexpr std::string_view CONSOLE_POOL = "console";

bool same_body(const RuleDecl &a, const RuleDecl &b) {
    return a.description == b.description && a.command == b.command;
}

// Order-insensitive comparison of two path lists.
bool same_members(std::vector<std::string> a, std::vector<std::string> b) {
    std::ranges::sort(a);
    std::ranges::sort(b);
    a.erase(std::unique(a.begin(), a.end()), a.end());
    b.erase(std::unique(b.begin(), b.end()), b.end());
    return a == b;
}

// Dependency view of the graph: one node per path, an arc from every input
// to every output of the edge (or alias) consuming it.
class NodeIndex {
public:
    size_t get_or_create_node(std::string_view path) {
        if (auto it = index_.find(std::string(path)); it != index_.end()) {
            return it->second;
        }

        size_t id = paths_.size();
        paths_.emplace_back(path);
        out_edges_.emplace_back();
        index_.emplace(std::string(path), id);
        return id;
    }

    void connect(const std::vector<std::string> &from, const std::vector<std::string> &to) {
        for (const auto &in : from) {
            if (in.empty())
                continue;
            size_t in_id = get_or_create_node(in);
            for (const auto &out : to) {
                out_edges_[in_id].push_back(get_or_create_node(out));
            }
        }
    }

    Result<void> find_cycle() const {
        enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

        std::vector<STATUS> status(paths_.size(), STATUS::UNSTARTED);

        std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
            status[u] = STATUS::WORKING;
            for (size_t v : out_edges_[u]) {
                if (status[v] == STATUS::UNSTARTED) {
                    if (auto res = dfs(v); !res)
                        return res;
                } else if (status[v] == STATUS::WORKING) {
                    return fail(ErrorKind::configuration, "Cycle detected in the build graph at: {}", paths_[v]);
                }
            }
            status[u] = STATUS::FINISHED;
            return {};
        };

        for (size_t i = 0; i < paths_.size(); ++i) {
            if (status[i] == STATUS::UNSTARTED) {
                if (auto res = dfs(i); !res)
                    return res;
            }
        }
        return {};
    }

private:
    std::vector<std::string> paths_;
    std::vector<std::vector<size_t>> out_edges_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace

BuildGraph::BuildGraph(std::string builddir, DuplicateRulePolicy policy)
    : builddir_(std::move(builddir)), policy_(policy) {
}

Result<std::string> BuildGraph::place_in_output_dir(std::string_view path) const {
    return place_in_dir(path, builddir_);
}

Result<void> BuildGraph::check_open(std::string_view what) const {
    if (flushed_) {
        return fail(ErrorKind::configuration, "cannot add {} after the manifest was flushed", what);
    }
    return {};
}

Result<RuleTemplate> BuildGraph::register_rule(std::string name, std::optional<std::string> description,
                                               std::string command) {
    RuleTemplate rule(std::move(name), std::move(description), std::move(command));
    if (auto res = ensure_rule(rule); !res) {
        return std::unexpected(res.error());
    }
    const RuleDecl *first = find_rule(rule.name());
    return RuleTemplate(first->name, first->description, first->command);
}

Result<void> BuildGraph::ensure_rule(const RuleTemplate &rule) {
    if (const RuleDecl *existing = find_rule(rule.name())) {
        if (policy_ == DuplicateRulePolicy::require_identical && !same_body(*existing, rule.decl())) {
            return fail(ErrorKind::duplicate_rule_conflict,
                        "rule '{}' is already declared with a different body (command '{}', new command '{}')",
                        rule.name(), existing->command, rule.command());
        }
        return {};
    }
    if (auto res = check_open("rule '" + rule.name() + "'"); !res) {
        return res;
    }
    if (rule.name().empty()) {
        return fail(ErrorKind::configuration, "rule name must not be empty");
    }

    rule_index_.emplace(rule.name(), rules_.size());
    rules_.push_back(rule.decl());
    return {};
}

const RuleDecl *BuildGraph::find_rule(std::string_view name) const {
    if (auto it = rule_index_.find(std::string(name)); it != rule_index_.end()) {
        return &rules_[it->second];
    }
    return nullptr;
}

Result<void> BuildGraph::claim_output(const std::string &path, std::string_view producer) {
    auto [it, inserted] = producers_.emplace(path, producer);
    if (!inserted) { // 2 different producers for the same path.
        return fail(ErrorKind::configuration, "Duplicate producer for output: {} (already produced by {})", path,
                    it->second);
    }
    return {};
}

Result<void> BuildGraph::check_edge(const BuildEdge &edge) const {
    if (auto res = check_open("build edge"); !res) {
        return res;
    }
    if (edge.outputs.empty() || std::ranges::any_of(edge.outputs, [](const auto &o) { return o.empty(); })) {
        return fail(ErrorKind::configuration, "build edge for rule '{}' has an empty output", edge.rule);
    }
    if (edge.pool && *edge.pool != CONSOLE_POOL &&
        std::ranges::none_of(pools_, [&](const auto &p) { return p.first == *edge.pool; })) {
        return fail(ErrorKind::configuration, "pool '{}' is not declared", *edge.pool);
    }

    for (const auto *outs : {&edge.outputs, &edge.implicit_outputs}) {
        for (const auto &out : *outs) {
            if (auto it = producers_.find(out); it != producers_.end()) {
                return fail(ErrorKind::configuration, "Duplicate producer for output: {} (already produced by {})",
                            out, it->second);
            }
        }
    }
    return {};
}

Result<void> BuildGraph::add_edge(BuildEdge edge) {
    if (!find_rule(edge.rule)) {
        return fail(ErrorKind::configuration, "build edge uses unregistered rule '{}'", edge.rule);
    }
    // Validate every output before claiming any, so a failure leaves no trace.
    if (auto res = check_edge(edge); !res) {
        return res;
    }

    std::vector<std::string> produced = edge.outputs;
    produced.insert(produced.end(), edge.implicit_outputs.begin(), edge.implicit_outputs.end());
    for (auto &out : produced) {
        producers_.emplace(std::move(out), "rule " + edge.rule);
    }

    edges_.push_back(std::move(edge));
    return {};
}

Result<Target> BuildGraph::alias(std::string name, const std::vector<Target> &targets) {
    return alias(std::move(name), to_paths(targets));
}

Result<Target> BuildGraph::alias(std::string name, const std::vector<std::string> &paths) {
    if (auto it = alias_index_.find(name); it != alias_index_.end()) {
        if (!same_members(aliases_[it->second].inputs, paths)) {
            return fail(ErrorKind::configuration, "alias '{}' is already declared with different inputs", name);
        }
        return Target(*this, name, name);
    }
    if (auto res = check_open("alias '" + name + "'"); !res) {
        return std::unexpected(res.error());
    }
    if (name.empty()) {
        return fail(ErrorKind::configuration, "alias name must not be empty");
    }
    if (auto res = claim_output(name, "alias " + name); !res) {
        return std::unexpected(res.error());
    }

    alias_index_.emplace(name, aliases_.size());
    aliases_.push_back({name, paths});
    return Target(*this, name, name);
}

void BuildGraph::mark_default(const std::vector<Target> &targets) {
    mark_default(to_paths(targets));
}

void BuildGraph::mark_default(const std::vector<std::string> &paths) {
    for (const auto &p : paths) {
        if (p.empty())
            continue;
        if (default_index_.insert(p).second) {
            defaults_.push_back(p);
        }
    }
}

Result<Target> BuildGraph::get_or_create_singleton(const std::string &key,
                                                   const std::function<Result<Target>()> &factory) {
    if (auto it = singletons_.find(key); it != singletons_.end()) {
        return it->second;
    }
    auto created = factory();
    if (!created) {
        return created;
    }
    singletons_.emplace(key, *created);
    return created;
}

void BuildGraph::add_variable(std::string name, std::string value) {
    for (auto &[key, val] : variables_) {
        if (key == name) {
            val = std::move(value);
            return;
        }
    }
    variables_.emplace_back(std::move(name), std::move(value));
}

Result<void> BuildGraph::add_pool(std::string name, unsigned depth) {
    if (name == CONSOLE_POOL) {
        return fail(ErrorKind::configuration, "pool '{}' is built in and cannot be redeclared", name);
    }
    for (const auto &[key, d] : pools_) {
        if (key == name) {
            if (d != depth) {
                return fail(ErrorKind::configuration, "pool '{}' is already declared with depth {}", name, d);
            }
            return {};
        }
    }
    pools_.emplace_back(std::move(name), depth);
    return {};
}

bool BuildGraph::is_bound_globally(std::string_view name) const {
    if (name == "in" || name == "out" || name == "in_newline") {
        return true;
    }
    return std::ranges::any_of(variables_, [&](const auto &v) { return v.first == name; });
}

Result<void> BuildGraph::check_acyclic() const {
    NodeIndex nodes;
    for (const auto &edge : edges_) {
        std::vector<std::string> outs = edge.outputs;
        outs.insert(outs.end(), edge.implicit_outputs.begin(), edge.implicit_outputs.end());
        nodes.connect(edge.inputs, outs);
        nodes.connect(edge.implicit_inputs, outs);
    }
    for (const auto &alias : aliases_) {
        nodes.connect(alias.inputs, {alias.name});
    }
    return nodes.find_cycle();
}

Result<void> BuildGraph::flush(std::ostream &out) {
    if (flushed_) {
        return fail(ErrorKind::configuration, "manifest already flushed");
    }
    if (auto res = check_acyclic(); !res) {
        return res;
    }

    NinjaWriter writer(out);
    for (const auto &c : comments_) {
        writer.comment(c);
    }
    if (!comments_.empty()) {
        writer.newline();
    }

    for (const auto &[key, value] : variables_) {
        writer.variable(key, value);
    }
    if (!variables_.empty()) {
        writer.newline();
    }

    for (const auto &[name, depth] : pools_) {
        writer.pool(name, depth);
        writer.newline();
    }

    for (const auto &rule : rules_) {
        writer.rule(rule.name, rule.command, rule.description);
        writer.newline();
    }

    for (const auto &edge : edges_) {
        writer.build(edge.outputs, edge.rule, edge.inputs, edge.implicit_inputs, {}, edge.variables,
                     edge.implicit_outputs, edge.pool);
    }
    if (!edges_.empty()) {
        writer.newline();
    }

    for (const auto &alias : aliases_) {
        writer.build({alias.name}, "phony", alias.inputs);
    }
    if (!aliases_.empty()) {
        writer.newline();
    }

    if (!defaults_.empty()) {
        writer.default_targets(defaults_);
    }

    out.flush();
    if (!out) {
        return fail(ErrorKind::io, "failed to write the manifest");
    }
    flushed_ = true;
    return {};
}

} // namespace kninja

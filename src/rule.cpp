#include "kninja/rule.hpp"

#include "kninja/graph.hpp"
#include "kninja/target.hpp"
#include "kninja/utility.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kninja {

namespace {

bool is_simple_varname_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // namespace

std::vector<std::string> referenced_variables(std::string_view command) {
    std::vector<std::string> names;
    size_t i = 0;
    while (i < command.size()) {
        if (command[i] != '$') {
            ++i;
            continue;
        }
        if (i + 1 >= command.size()) {
            break;
        }

        char next = command[i + 1];
        if (next == '{') {
            size_t close = command.find('}', i + 2);
            if (close == std::string_view::npos) {
                break;
            }
            names.emplace_back(command.substr(i + 2, close - (i + 2)));
            i = close + 1;
        } else if (is_simple_varname_char(next)) {
            size_t end = i + 1;
            while (end < command.size() && is_simple_varname_char(command[end])) {
                ++end;
            }
            names.emplace_back(command.substr(i + 1, end - (i + 1)));
            i = end;
        } else {
            // $$, "$ ", $: and line continuations
            i += 2;
        }
    }
    return names;
}

RuleTemplate::RuleTemplate(std::string name, std::optional<std::string> description, std::string command)
    : decl_{std::move(name), std::move(description), std::move(command)} {
}

RuleTemplate RuleTemplate::with_extension(std::string ext) const {
    RuleTemplate r = *this;
    r.extension_ = std::move(ext);
    return r;
}

RuleTemplate RuleTemplate::with_output(std::string path) const {
    RuleTemplate r = *this;
    r.output_ = std::move(path);
    return r;
}

RuleTemplate RuleTemplate::with_implicit_inputs(const std::vector<std::string> &paths) const {
    RuleTemplate r = *this;
    r.implicit_inputs_.insert(r.implicit_inputs_.end(), paths.begin(), paths.end());
    return r;
}

RuleTemplate RuleTemplate::with_implicit_inputs(const std::vector<Target> &targets) const {
    return with_implicit_inputs(to_paths(targets));
}

RuleTemplate RuleTemplate::with_implicit_outputs(const std::vector<std::string> &paths) const {
    RuleTemplate r = *this;
    r.implicit_outputs_.insert(r.implicit_outputs_.end(), paths.begin(), paths.end());
    return r;
}

RuleTemplate RuleTemplate::with_pool(std::string pool) const {
    RuleTemplate r = *this;
    r.pool_ = std::move(pool);
    return r;
}

RuleTemplate RuleTemplate::with_variables(const Variables &vars) const {
    RuleTemplate r = *this;
    for (const auto &[key, value] : vars) {
        r.variables_.insert_or_assign(key, value);
    }
    return r;
}

RuleTemplate RuleTemplate::with_variable(std::string key, std::string value) const {
    RuleTemplate r = *this;
    r.variables_.insert_or_assign(std::move(key), std::move(value));
    return r;
}

Result<std::string> RuleTemplate::resolve_output_path(const Target &source) const {
    if (output_) {
        if (!output_->empty() && output_->front() == '/') {
            return fail(ErrorKind::configuration, "rule '{}': output '{}' is absolute; outputs must be relative",
                        name(), *output_);
        }
        return *output_;
    }
    if (extension_) {
        auto placed = source.graph().place_in_output_dir(std::format("{}.{}", source.path(), *extension_));
        if (!placed) {
            return fail(ErrorKind::configuration, "rule '{}': extension '{}' on source '{}': {}", name(), *extension_,
                        source.path(), placed.error().message);
        }
        return *placed;
    }
    return fail(ErrorKind::configuration,
                "rule '{}' produces no derivable output: explicit output or extension required", name());
}

Result<Target> RuleTemplate::apply(BuildGraph &graph, const Target &source, std::string output) const {
    if (!output.empty() && output.front() == '/') {
        return fail(ErrorKind::configuration, "rule '{}': output '{}' is absolute; outputs must be relative", name(),
                    output);
    }
    for (const auto &var : referenced_variables(command())) {
        if (!variables_.contains(var) && !graph.is_bound_globally(var)) {
            return fail(ErrorKind::configuration, "rule '{}' command references unbound variable '${}'", name(), var);
        }
    }

    BuildEdge edge{
        .rule = name(),
        .inputs = {source.path()},
        .outputs = {output},
        .implicit_inputs = implicit_inputs_,
        .implicit_outputs = implicit_outputs_,
        .pool = pool_,
        .variables = variables_,
    };
    // A rejected edge must not leave its rule declared.
    if (auto res = graph.check_edge(edge); !res) {
        return std::unexpected(Error{res.error().kind, std::format("rule '{}': {}", name(), res.error().message)});
    }
    if (auto res = graph.ensure_rule(*this); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = graph.add_edge(std::move(edge)); !res) {
        return std::unexpected(Error{res.error().kind, std::format("rule '{}': {}", name(), res.error().message)});
    }
    return Target(graph, std::move(output));
}

} // namespace kninja

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kninja {

using Variables = std::map<std::string, std::string>;

struct RuleDecl {
    std::string name;
    std::optional<std::string> description;
    std::string command;

    bool operator==(const RuleDecl &) const = default;
};

/** @brief One `build` statement, snapshotted when a rule is applied. */
struct BuildEdge {
    std::string rule;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::vector<std::string> implicit_inputs;
    std::vector<std::string> implicit_outputs;
    std::optional<std::string> pool = std::nullopt;
    Variables variables;
};

struct PhonyAlias {
    std::string name;
    std::vector<std::string> inputs;
};

} // namespace kninja

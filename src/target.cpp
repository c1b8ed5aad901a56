#include "kninja/target.hpp"

#include "kninja/graph.hpp"
#include "kninja/rule.hpp"

#include <string>
#include <vector>

namespace kninja {

Result<Target> Target::then(const RuleTemplate &rule) const {
    return rule.resolve_output_path(*this).and_then([&](std::string output) {
        return rule.apply(*graph_, *this, std::move(output));
    });
}

Result<Target> Target::alias(std::string name) const {
    if (auto res = graph_->alias(name, std::vector<Target>{*this}); !res) {
        return std::unexpected(res.error());
    }
    return Target(*graph_, path_, std::move(name));
}

const Target &Target::mark_default() const {
    graph_->mark_default(std::vector<std::string>{path_});
    return *this;
}

std::vector<std::string> to_paths(const std::vector<Target> &targets) {
    std::vector<std::string> paths;
    paths.reserve(targets.size());
    for (const auto &t : targets) {
        paths.push_back(t.path());
    }
    return paths;
}

} // namespace kninja

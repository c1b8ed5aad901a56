#pragma once

#include "kninja/backend.hpp"
#include "kninja/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace kninja {

/** @brief What the runner does with a program: parse it, run it, or prove it. */
enum class Mode : uint8_t {
    kast,
    run,
    prove,
};

constexpr std::string_view to_string(Mode mode) {
    switch (mode) {
    case Mode::kast:
        return "kast";
    case Mode::run:
        return "run";
    case Mode::prove:
        return "prove";
    }
    return "unknown";
}

Result<Mode> parse_mode(std::string_view name);

/** @brief What the runner needs to know about a kompiled definition. */
struct DefinitionInfo {
    std::string alias;
    Backend backend = Backend::llvm;
    std::string directory;
    std::string kompiled_dir;
    std::string krun_flags;
    std::string kprove_flags;
};

/**
 * @brief The definitions of a project, keyed by alias, in declaration order.
 *
 * Persisted next to the manifest so that `kninja-run` can dispatch to a
 * definition without re-running the build description.
 */
class DefinitionRegistry {
public:
    /** @brief Adds a definition. A repeated alias is a configuration error. */
    Result<void> add(DefinitionInfo info);

    const DefinitionInfo *find(std::string_view alias) const;

    const std::vector<DefinitionInfo> &all() const {
        return definitions_;
    }

    bool empty() const {
        return definitions_.empty();
    }

    std::vector<std::string> aliases() const;

    /** @brief The configured default alias, or the first definition's alias. */
    std::optional<std::string> default_alias() const;

    /** @brief Sets the default alias. It must name a registered definition. */
    Result<void> set_default_alias(std::string alias);

    const std::string &kbindir() const {
        return kbindir_;
    }
    void set_kbindir(std::string dir) {
        kbindir_ = std::move(dir);
    }

    nlohmann::json to_json() const;
    static Result<DefinitionRegistry> from_json(const nlohmann::json &j);

    Result<void> save(const std::filesystem::path &path) const;
    static Result<DefinitionRegistry> load(const std::filesystem::path &path);

private:
    std::vector<DefinitionInfo> definitions_;
    std::optional<std::string> default_alias_;
    std::string kbindir_;
};

} // namespace kninja

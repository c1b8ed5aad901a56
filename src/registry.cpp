#include "kninja/registry.hpp"

#include "kninja/backend.hpp"
#include "kninja/utility.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace kninja {

using json = nlohmann::json;

Result<Mode> parse_mode(std::string_view name) {
    for (Mode m : {Mode::kast, Mode::run, Mode::prove}) {
        if (to_string(m) == name) {
            return m;
        }
    }
    return fail(ErrorKind::usage, "invalid choice: '{}' (choose from 'kast', 'run', 'prove')", name);
}

Result<void> DefinitionRegistry::add(DefinitionInfo info) {
    if (info.alias.empty()) {
        return fail(ErrorKind::configuration, "definition alias must not be empty");
    }
    if (find(info.alias)) {
        return fail(ErrorKind::configuration, "definition '{}' is already declared", info.alias);
    }
    definitions_.push_back(std::move(info));
    return {};
}

const DefinitionInfo *DefinitionRegistry::find(std::string_view alias) const {
    for (const auto &d : definitions_) {
        if (d.alias == alias) {
            return &d;
        }
    }
    return nullptr;
}

std::vector<std::string> DefinitionRegistry::aliases() const {
    std::vector<std::string> out;
    out.reserve(definitions_.size());
    for (const auto &d : definitions_) {
        out.push_back(d.alias);
    }
    return out;
}

std::optional<std::string> DefinitionRegistry::default_alias() const {
    if (default_alias_) {
        return default_alias_;
    }
    if (definitions_.empty()) {
        return std::nullopt;
    }
    return definitions_.front().alias;
}

Result<void> DefinitionRegistry::set_default_alias(std::string alias) {
    if (!find(alias)) {
        return fail(ErrorKind::unknown_definition, "cannot make '{}' the default: no such definition", alias);
    }
    default_alias_ = std::move(alias);
    return {};
}

json DefinitionRegistry::to_json() const {
    json defs = json::array();
    for (const auto &d : definitions_) {
        json entry;
        entry["alias"] = d.alias;
        entry["backend"] = std::string(to_string(d.backend));
        entry["directory"] = d.directory;
        entry["kompiled_dir"] = d.kompiled_dir;
        entry["krun_flags"] = d.krun_flags;
        entry["kprove_flags"] = d.kprove_flags;
        defs.push_back(entry);
    }

    json out;
    out["kbindir"] = kbindir_;
    out["definitions"] = defs;
    if (default_alias_) {
        out["default"] = *default_alias_;
    }
    return out;
}

Result<DefinitionRegistry> DefinitionRegistry::from_json(const json &j) {
    DefinitionRegistry registry;
    try {
        registry.kbindir_ = j.value("kbindir", "");
        for (const auto &entry : j.at("definitions")) {
            auto backend = parse_backend(entry.at("backend").get<std::string>());
            if (!backend) {
                return std::unexpected(backend.error());
            }

            DefinitionInfo info;
            info.alias = entry.at("alias").get<std::string>();
            info.backend = *backend;
            info.directory = entry.at("directory").get<std::string>();
            info.kompiled_dir = entry.value("kompiled_dir", "");
            info.krun_flags = entry.value("krun_flags", "");
            info.kprove_flags = entry.value("kprove_flags", "");
            if (auto res = registry.add(std::move(info)); !res) {
                return std::unexpected(res.error());
            }
        }
        if (j.contains("default")) {
            if (auto res = registry.set_default_alias(j.at("default").get<std::string>()); !res) {
                return std::unexpected(res.error());
            }
        }
    } catch (const json::exception &err) {
        return fail(ErrorKind::configuration, "Malformed definition registry: {}", err.what());
    }
    return registry;
}

Result<void> DefinitionRegistry::save(const std::filesystem::path &path) const {
    std::ofstream f(path);
    if (!f) {
        return fail(ErrorKind::io, "Failed to open {} for writing", path.string());
    }
    f << to_json().dump(4) << '\n';
    if (!f) {
        return fail(ErrorKind::io, "Failed to write {}", path.string());
    }
    return {};
}

Result<DefinitionRegistry> DefinitionRegistry::load(const std::filesystem::path &path) {
    std::ifstream f(path);
    if (!f) {
        return fail(ErrorKind::io, "Failed to open definition registry {}", path.string());
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception &err) {
        return fail(ErrorKind::configuration, "Failed to parse {}: {}", path.string(), err.what());
    }
    return from_json(j);
}

} // namespace kninja

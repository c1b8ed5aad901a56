#include "kninja/project.hpp"

#include "kninja/paths.hpp"
#include "kninja/process_exec.hpp"
#include "kninja/utility.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace kninja {

namespace {

std::string under(std::string_view base, std::initializer_list<std::string_view> parts) {
    std::string out(base);
    for (std::string_view part : parts) {
        out = join({out, part});
    }
    return out;
}

} // namespace

Project::Project(Key, ProjectConfig config)
    : config_(std::move(config)), graph_(config_.builddir, config_.duplicate_rules) {
    k_release_dir_ = config_.k_release_dir ? *config_.k_release_dir
                                           : krepodir({"k-distribution/target/release/k/"});
}

Result<std::unique_ptr<Project>> Project::create(ProjectConfig config) {
    auto proj = std::make_unique<Project>(Key{}, std::move(config));
    std::println("use_system_k {}", proj->config_.use_system_k);
    std::println("k {}", proj->kbindir({"k"}));

    if (auto res = proj->generate_ninja(); !res) {
        return std::unexpected(res.error());
    }
    proj->registry_.set_kbindir(proj->kbindir());
    return proj;
}

Result<std::unique_ptr<Project>> Project::create() {
    auto config = ProjectConfig::from_environment();
    if (!config) {
        return std::unexpected(config.error());
    }
    return create(std::move(*config));
}

std::string Project::extdir(std::initializer_list<std::string_view> parts) const {
    return under(config_.extdir, parts);
}

std::string Project::krepodir(std::initializer_list<std::string_view> parts) const {
    return under(extdir({"k"}), parts);
}

std::string Project::kreleasedir(std::initializer_list<std::string_view> parts) const {
    return under(k_release_dir_, parts);
}

std::string Project::kbindir(std::initializer_list<std::string_view> parts) const {
    return under(kreleasedir({"bin"}), parts);
}

std::string Project::klibdir(std::initializer_list<std::string_view> parts) const {
    return under(kreleasedir({"lib/kframework"}), parts);
}

std::string Project::kninjadir(std::initializer_list<std::string_view> parts) const {
    return under(config_.kninja_dir, parts);
}

std::string Project::builddir(std::initializer_list<std::string_view> parts) const {
    return under(config_.builddir, parts);
}

std::string Project::manifest_path() const {
    return builddir({config_.manifest});
}

std::string Project::registry_path() const {
    return builddir({config_.registry});
}

Result<void> Project::generate_ninja() {
    graph_.add_comment("This is a generated file");
    graph_.add_variable("ninja_required_version", config_.ninja_required_version);
    graph_.add_variable("builddir", builddir());
    graph_.add_variable("k_repository", krepodir());

    auto clean = dot_target().then(
        rule("clean", "cleaning", "ninja -t clean ; rm -rf \"$builddir\" ; git submodule update --init --recursive")
            .with_output("clean"));
    if (!clean) {
        return std::unexpected(clean.error());
    }

    // Always define at least one default target. Otherwise, all targets are
    // built (including clean).
    auto dummy = alias("dummy", {});
    if (!dummy) {
        return std::unexpected(dummy.error());
    }
    dummy->mark_default();
    return {};
}

Result<Target> Project::suite(std::string name, const std::vector<std::string> &inputs,
                              const std::function<Result<Target>(Target)> &runner, bool default_target) {
    std::vector<Target> tests;
    tests.reserve(inputs.size());
    for (const auto &input : inputs) {
        auto test = runner(source(input));
        if (!test) {
            return test;
        }
        tests.push_back(std::move(*test));
    }

    auto grouped = alias(std::move(name), tests);
    if (grouped && default_target) {
        grouped->mark_default();
    }
    return grouped;
}

RuleTemplate Project::rule_git_submodule_init(std::string path, std::string timestamp_file) const {
    return rule("git-submodule-init", std::nullopt, "git submodule update $flags --init \"$path\" && touch \"$out\"")
        .with_output(std::move(timestamp_file))
        .with_variable("path", std::move(path))
        .with_variable("flags", "");
}

Result<Target> Project::init_k_submodule() {
    return graph_.get_or_create_singleton("k-submodule", [this]() {
        return dot_target().then(
            rule_git_submodule_init(extdir({"k"}), builddir({"k.init"})).with_variable("flags", "--recursive"));
    });
}

Result<RuleTemplate> Project::rule_build_k(Backend backend) {
    auto init = init_k_submodule();
    if (!init) {
        return std::unexpected(init.error());
    }
    return rule("build-k", "build K: $backend",
                "(  cd $k_repository && mvn package -DskipTests $flags)&& touch $out")
        .with_output(std::format("$builddir/kbackend-{}", to_string(backend)))
        .with_pool("console")
        .with_implicit_inputs(std::vector<Target>{*init})
        .with_variable("flags", std::string(build_k_flags(backend)))
        .with_variable("backend", std::string(to_string(backend)));
}

Result<Target> Project::build_k(Backend backend) {
    return graph_.get_or_create_singleton(std::format("build-k:{}", to_string(backend)), [this, backend]() {
        return rule_build_k(backend).and_then([this](const RuleTemplate &r) { return dot_target().then(r); });
    });
}

RuleTemplate Project::rule_kompile() const {
    return rule("kompile", "kompile: $directory $in",
                "$env \"kompile\" --backend \"$backend\" $flags --directory \"$directory\" $in");
}

RuleTemplate Project::check(std::string expected) const {
    return rule("check-test-result", "diff: $in",
                "git diff --color=always --no-index $flags \"$expected\" \"$in\"")
        .with_extension("test")
        .with_implicit_inputs(std::vector<std::string>{expected})
        .with_variable("expected", std::move(expected))
        .with_variable("flags", "");
}

Result<Definition> Project::definition(DefinitionOptions opts) {
    const std::string directory = opts.directory ? *opts.directory : builddir({"defn", opts.alias});
    if (directory.empty() || directory.front() == '/') {
        return fail(ErrorKind::configuration, "definition '{}': directory '{}' must be a non-empty relative path",
                    opts.alias, directory);
    }
    if (opts.main.empty()) {
        return fail(ErrorKind::configuration, "definition '{}': main file is required", opts.alias);
    }

    const std::string kompiled_dir = join({directory, basename_no_ext(opts.main) + "-kompiled"});
    const std::string output = kompiled_output(opts.backend, kompiled_dir);
    if (!is_subpath(output, directory)) {
        return fail(ErrorKind::configuration, "definition '{}': kompiled output '{}' is not inside directory '{}'",
                    opts.alias, output, directory);
    }

    std::vector<std::string> implicit_inputs;
    if (!config_.use_system_k) {
        auto k = build_k(opts.backend);
        if (!k) {
            return std::unexpected(k.error());
        }
        implicit_inputs.push_back(k->path());
    }

    const std::string env;
    auto kompiled = source(opts.main)
                        .then(rule_kompile()
                                  .with_output(output)
                                  .with_implicit_inputs(opts.other)
                                  .with_implicit_inputs(implicit_inputs)
                                  .with_variable("backend", std::string(to_string(opts.backend)))
                                  .with_variable("directory", directory)
                                  .with_variable("env", env)
                                  .with_variable("flags", std::format("-I {} {}", directory, opts.flags)))
                        .and_then([&](const Target &t) { return t.alias(opts.alias); });
    if (!kompiled) {
        return std::unexpected(kompiled.error());
    }

    DefinitionInfo info{
        .alias = opts.alias,
        .backend = opts.backend,
        .directory = directory,
        .kompiled_dir = kompiled_dir,
        .krun_flags = opts.krun_flags,
        .kprove_flags = opts.kprove_flags,
    };
    if (auto res = registry_.add(info); !res) {
        return std::unexpected(res.error());
    }

    return Definition(*this, std::move(info), std::move(*kompiled), std::move(opts.runner_script),
                      std::move(opts.krun_env), std::move(opts.kprove_env));
}

Result<void> Project::write() {
    std::error_code ec;
    fs::create_directories(builddir(), ec);
    if (ec) {
        return fail(ErrorKind::io, "Failed to create {}: {}", builddir(), ec.message());
    }

    {
        std::ofstream out(manifest_path());
        if (!out) {
            return fail(ErrorKind::io, "Failed to open {} for writing", manifest_path());
        }
        if (auto res = graph_.flush(out); !res) {
            return res;
        }
    }

    return registry_.save(registry_path());
}

int Project::main(std::span<const char *const> args) {
    if (auto res = write(); !res) {
        std::println(stderr, "Failed to write {}: {}", manifest_path(), res.error());
        return 1;
    }

    std::vector<std::string> cmd{config_.ninja, "-f", manifest_path()};
    cmd.insert(cmd.end(), args.begin(), args.end());

    std::optional<std::unordered_map<std::string, std::string>> env;
    if (!config_.use_system_k) {
        const char *path = std::getenv("PATH");
        env = std::unordered_map<std::string, std::string>{
            {"PATH", path ? std::format("{}:{}", kbindir(), path) : kbindir()},
        };
    }

    auto res = process_exec(std::move(cmd), std::nullopt, std::move(env));
    if (!res) {
        std::println(stderr, "{}", res.error());
        return 1;
    }
    return *res;
}

} // namespace kninja

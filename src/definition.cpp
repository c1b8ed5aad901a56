#include "kninja/definition.hpp"

#include "kninja/paths.hpp"
#include "kninja/project.hpp"
#include "kninja/utility.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kninja {

Definition::Definition(Project &proj, DefinitionInfo info, Target target, std::optional<std::string> runner_script,
                       std::string krun_env, std::string kprove_env)
    : proj_(&proj), info_(std::move(info)), target_(std::move(target)), runner_script_(std::move(runner_script)),
      krun_env_(std::move(krun_env)), kprove_env_(std::move(kprove_env)) {
}

std::string Definition::directory(std::initializer_list<std::string_view> parts) const {
    std::string out = info_.directory;
    for (std::string_view part : parts) {
        out = join({out, part});
    }
    return out;
}

std::string Definition::kompiled_dir(std::initializer_list<std::string_view> parts) const {
    std::string out = info_.kompiled_dir;
    for (std::string_view part : parts) {
        out = join({out, part});
    }
    return out;
}

Result<std::vector<Target>> Definition::tests(const SuiteOptions &opts) const {
    return suite(opts, Mode::run, opts.expected);
}

Result<std::vector<Target>> Definition::proofs(const SuiteOptions &opts) const {
    return suite(opts, Mode::prove, opts.expected.value_or(proj_->kninjadir({"kprove.expected"})));
}

Result<std::vector<Target>> Definition::suite(const SuiteOptions &opts, Mode mode,
                                              const std::optional<std::string> &fallback_expected) const {
    std::vector<std::string> inputs = opts.inputs;
    if (opts.glob) {
        auto matched = kninja::glob(*opts.glob);
        if (!matched) {
            return std::unexpected(matched.error());
        }
        inputs.insert(inputs.end(), matched->begin(), matched->end());
    }

    auto stage = runner_script(mode, opts.flags);
    if (!stage) {
        return std::unexpected(stage.error());
    }
    const RuleTemplate run = stage->with_implicit_inputs(opts.implicit_inputs);

    std::vector<Target> ret;
    ret.reserve(inputs.size());
    for (const auto &input : inputs) {
        const std::string expected = fallback_expected ? *fallback_expected : append_extension(input, "expected");
        auto test = proj_->source(input).then(run).and_then([&](const Target &out) {
            return out.then(proj_->check(expected));
        });
        if (!test) {
            return std::unexpected(test.error());
        }
        if (opts.default_target) {
            test->mark_default();
        }
        ret.push_back(std::move(*test));
    }

    if (opts.alias) {
        auto grouped = proj_->alias(*opts.alias, ret);
        if (!grouped) {
            return std::unexpected(grouped.error());
        }
        return std::vector<Target>{std::move(*grouped)};
    }
    return ret;
}

Result<RuleTemplate> Definition::runner_script(Mode mode, std::string flags) const {
    if (!runner_script_) {
        return fail(ErrorKind::configuration, "definition '{}' has no runner script for '{}'", info_.alias,
                    to_string(mode));
    }
    if (mode == Mode::kast) {
        return fail(ErrorKind::configuration, "definition '{}': runner script supports only run and prove",
                    info_.alias);
    }

    // One rule per definition and mode: the extension belongs to the rule,
    // not to the edge.
    const std::string suffix = std::format("{}-{}", info_.alias, to_string(mode));
    return proj_
        ->rule("runner-script-" + suffix, std::format("{}: {} $in", to_string(mode), info_.alias),
               std::format("{} {} --definition \"$definition\" \"$in\" $flags > \"$out\" || (cat $out ; false)",
                           *runner_script_, to_string(mode)))
        .with_extension(suffix)
        .with_variable("definition", info_.alias)
        .with_implicit_inputs(std::vector<Target>{target_})
        .with_variable("flags", std::move(flags));
}

RuleTemplate Definition::krun(std::string krun_flags) const {
    return proj_
        ->rule("krun", "krun: $in ($directory)",
               "$env \"krun\" $flags --directory $directory $in > $out || (cat $out ; false)")
        .with_extension(info_.alias + "-krun")
        .with_variable("directory", directory())
        .with_variable("flags", std::format("{} {}", info_.krun_flags, krun_flags))
        .with_variable("env", krun_env_)
        .with_implicit_inputs(std::vector<Target>{target_});
}

RuleTemplate Definition::kast() const {
    return proj_
        ->rule("kast", "kast: $in ($directory)",
               "$env \"kast\" $flags --directory \"$directory\" \"$in\" > \"$out\" || (cat $out ; false)")
        .with_extension("kast")
        .with_variables({{"directory", directory()}, {"env", krun_env_}, {"flags", ""}})
        .with_implicit_inputs(std::vector<Target>{target_});
}

RuleTemplate Definition::kprove() const {
    return proj_
        ->rule("kprove", "kprove: $in ($directory)",
               "$env \"kprove\" $flags --directory \"$directory\" \"$in\" > \"$out\" || (cat \"$out\"; false)")
        .with_extension(info_.alias + "-kprove")
        .with_variables({{"directory", directory()}, {"env", kprove_env_}, {"flags", info_.kprove_flags}})
        .with_implicit_inputs(std::vector<Target>{target_});
}

} // namespace kninja

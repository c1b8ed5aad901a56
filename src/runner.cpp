#include "kninja/runner.hpp"

#include "kninja/paths.hpp"
#include "kninja/process_exec.hpp"
#include "kninja/utility.hpp"

#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kninja {

namespace {

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(" \t\n", pos);
        if (start == std::string_view::npos) {
            break;
        }
        size_t end = text.find_first_of(" \t\n", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        words.emplace_back(text.substr(start, end - start));
        pos = end;
    }
    return words;
}

std::string quoted_choices(const std::vector<std::string> &choices) {
    std::string out;
    for (const auto &choice : choices) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("'{}'", choice);
    }
    return out;
}

std::string_view tool_name(Mode mode) {
    switch (mode) {
    case Mode::kast:
        return "kast";
    case Mode::run:
        return "krun";
    case Mode::prove:
        return "kprove";
    }
    return "krun";
}

} // namespace

Runner::Runner(DefinitionRegistry registry, std::optional<std::string> default_definition)
    : registry_(std::move(registry)), default_definition_(std::move(default_definition)) {
}

std::string Runner::usage() const {
    std::string text = "usage: kninja-run {kast,run,prove} [--definition NAME] <path> [args...]\n";
    text += "  kast     Parse a program with a definition\n";
    text += "  run      Run a program against a definition\n";
    text += "  prove    Use kprove to check a specification\n";
    text += std::format("  --definition NAME  Alias of definition (choices: {})", quoted_choices(registry_.aliases()));
    return text;
}

Result<std::string> Runner::resolve_definition(const std::optional<std::string> &requested) const {
    if (requested) {
        if (!registry_.find(*requested)) {
            return fail(ErrorKind::unknown_definition, "argument --definition: invalid choice: '{}' (choose from {})",
                        *requested, quoted_choices(registry_.aliases()));
        }
        return *requested;
    }
    if (default_definition_) {
        if (!registry_.find(*default_definition_)) {
            return fail(ErrorKind::unknown_definition, "default definition '{}' is not registered",
                        *default_definition_);
        }
        return *default_definition_;
    }
    if (auto alias = registry_.default_alias()) {
        return *alias;
    }
    return fail(ErrorKind::unknown_definition, "no definitions are registered");
}

Result<RunnerCommand> Runner::parse(std::span<const std::string> args) const {
    if (args.empty()) {
        return fail(ErrorKind::usage, "the following arguments are required: {{kast,run,prove}}");
    }
    auto mode = parse_mode(args[0]);
    if (!mode) {
        return std::unexpected(mode.error());
    }

    std::optional<std::string> requested;
    size_t i = 1;
    for (; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (arg == "--definition") {
            if (i + 1 >= args.size()) {
                return fail(ErrorKind::usage, "argument --definition: expected one argument");
            }
            requested = args[++i];
        } else if (arg.starts_with("--definition=")) {
            requested = std::string(arg.substr(std::string_view("--definition=").size()));
        } else if (arg == "--") {
            ++i;
            break;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return fail(ErrorKind::usage, "unrecognized argument: {}", arg);
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        return fail(ErrorKind::usage, "the following arguments are required: {}",
                    *mode == Mode::prove ? "specification" : "program");
    }

    auto definition = resolve_definition(requested);
    if (!definition) {
        return std::unexpected(definition.error());
    }

    RunnerCommand cmd{
        .mode = *mode,
        .definition = std::move(*definition),
        .path = args[i],
        .args = {},
    };
    size_t rest = i + 1;
    if (rest < args.size() && args[rest] == "--") {
        ++rest;
    }
    cmd.args.assign(args.begin() + rest, args.end());
    return cmd;
}

Result<std::vector<std::string>> Runner::invocation(const RunnerCommand &cmd) const {
    const DefinitionInfo *info = registry_.find(cmd.definition);
    if (!info) {
        return fail(ErrorKind::unknown_definition, "no definition named '{}'", cmd.definition);
    }

    std::vector<std::string> argv{
        join({registry_.kbindir(), tool_name(cmd.mode)}),
        "--directory",
        info->directory,
        cmd.path,
    };
    if (cmd.mode == Mode::run) {
        for (auto &flag : split_words(info->krun_flags)) {
            argv.push_back(std::move(flag));
        }
    } else if (cmd.mode == Mode::prove) {
        for (auto &flag : split_words(info->kprove_flags)) {
            argv.push_back(std::move(flag));
        }
    }
    argv.insert(argv.end(), cmd.args.begin(), cmd.args.end());
    return argv;
}

int Runner::main(std::span<const char *const> args) const {
    std::vector<std::string> argv(args.begin(), args.end());
    if (!argv.empty() && (argv[0] == "-h" || argv[0] == "--help")) {
        std::println("{}", usage());
        return 0;
    }

    auto cmd = parse(argv);
    if (!cmd) {
        std::println(stderr, "{}", usage());
        std::println(stderr, "kninja-run: {}", cmd.error());
        return 2;
    }

    auto invoke = invocation(*cmd);
    if (!invoke) {
        std::println(stderr, "kninja-run: {}", invoke.error());
        return 2;
    }

    auto res = process_exec(std::move(*invoke));
    if (!res) {
        std::println(stderr, "kninja-run: {}", res.error());
        return 1;
    }
    return *res;
}

} // namespace kninja

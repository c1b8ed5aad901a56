#include "kninja/process_exec.hpp"
#include "kninja/registry.hpp"
#include "kninja/runner.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace kninja;

namespace {

Runner make_runner(std::optional<std::string> default_definition = std::nullopt) {
    DefinitionRegistry registry;
    registry.set_kbindir("/opt/k/bin");
    EXPECT_TRUE(registry.add({
        .alias = "imp",
        .backend = Backend::llvm,
        .directory = ".build/defn/imp",
        .kompiled_dir = ".build/defn/imp/imp-kompiled",
        .krun_flags = "--output none  --search",
        .kprove_flags = "",
    }));
    EXPECT_TRUE(registry.add({
        .alias = "imp-java",
        .backend = Backend::java,
        .directory = ".build/defn/imp-java",
        .kompiled_dir = ".build/defn/imp-java/imp-kompiled",
        .krun_flags = "",
        .kprove_flags = "--smt_prelude prelude.smt2",
    }));
    return Runner(std::move(registry), std::move(default_definition));
}

using Args = std::vector<std::string>;

} // namespace

TEST(Runner, DefaultsToFirstDefinition) {
    auto cmd = make_runner().parse(Args{"run", "prog.imp"});
    ASSERT_TRUE(cmd) << cmd.error().message;
    EXPECT_EQ(cmd->mode, Mode::run);
    EXPECT_EQ(cmd->definition, "imp");
    EXPECT_EQ(cmd->path, "prog.imp");
    EXPECT_TRUE(cmd->args.empty());
}

TEST(Runner, ConfiguredDefault) {
    auto cmd = make_runner("imp-java").parse(Args{"kast", "prog.imp"});
    ASSERT_TRUE(cmd);
    EXPECT_EQ(cmd->definition, "imp-java");
}

TEST(Runner, DefinitionOption) {
    auto spaced = make_runner().parse(Args{"prove", "--definition", "imp-java", "spec.k"});
    ASSERT_TRUE(spaced);
    EXPECT_EQ(spaced->definition, "imp-java");
    EXPECT_EQ(spaced->path, "spec.k");

    auto joined = make_runner().parse(Args{"prove", "--definition=imp-java", "spec.k"});
    ASSERT_TRUE(joined);
    EXPECT_EQ(joined->definition, "imp-java");
}

TEST(Runner, UnknownDefinition) {
    auto cmd = make_runner().parse(Args{"run", "--definition", "evm", "prog.imp"});
    ASSERT_FALSE(cmd);
    EXPECT_EQ(cmd.error().kind, ErrorKind::unknown_definition);
    EXPECT_NE(cmd.error().message.find("'evm'"), std::string::npos);
    EXPECT_NE(cmd.error().message.find("'imp', 'imp-java'"), std::string::npos);
}

TEST(Runner, UsageErrors) {
    auto runner = make_runner();
    EXPECT_EQ(runner.parse(Args{}).error().kind, ErrorKind::usage);
    EXPECT_EQ(runner.parse(Args{"exec", "prog.imp"}).error().kind, ErrorKind::usage);
    EXPECT_EQ(runner.parse(Args{"run"}).error().kind, ErrorKind::usage);
    EXPECT_EQ(runner.parse(Args{"run", "--definition"}).error().kind, ErrorKind::usage);
    EXPECT_EQ(runner.parse(Args{"run", "--verbose", "prog.imp"}).error().kind, ErrorKind::usage);
}

TEST(Runner, TrailingArgumentsPassThrough) {
    auto runner = make_runner();

    auto plain = runner.parse(Args{"run", "prog.imp", "--depth", "10"});
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain->args, (Args{"--depth", "10"}));

    auto separated = runner.parse(Args{"run", "prog.imp", "--", "--definition", "x"});
    ASSERT_TRUE(separated);
    EXPECT_EQ(separated->definition, "imp");
    EXPECT_EQ(separated->args, (Args{"--definition", "x"}));

    auto before_path = runner.parse(Args{"run", "--", "-prog.imp"});
    ASSERT_TRUE(before_path);
    EXPECT_EQ(before_path->path, "-prog.imp");
}

TEST(Runner, InvocationPerMode) {
    auto runner = make_runner();

    auto kast = runner.invocation({Mode::kast, "imp", "prog.imp", {"--output", "json"}});
    ASSERT_TRUE(kast);
    EXPECT_EQ(*kast, (Args{"/opt/k/bin/kast", "--directory", ".build/defn/imp", "prog.imp", "--output", "json"}));

    auto krun = runner.invocation({Mode::run, "imp", "prog.imp", {"--depth", "1"}});
    ASSERT_TRUE(krun);
    EXPECT_EQ(*krun, (Args{"/opt/k/bin/krun", "--directory", ".build/defn/imp", "prog.imp", "--output", "none",
                           "--search", "--depth", "1"}));

    auto kprove = runner.invocation({Mode::prove, "imp-java", "spec.k", {}});
    ASSERT_TRUE(kprove);
    EXPECT_EQ(*kprove, (Args{"/opt/k/bin/kprove", "--directory", ".build/defn/imp-java", "spec.k", "--smt_prelude",
                             "prelude.smt2"}));
}

TEST(Runner, InvocationOfUnknownDefinition) {
    auto res = make_runner().invocation({Mode::run, "evm", "prog", {}});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::unknown_definition);
}

TEST(Runner, MainRejectsBadCommandLinesWithoutLaunching) {
    auto runner = make_runner();
    const char *unknown[] = {"run", "--definition", "evm", "prog.imp"};
    EXPECT_EQ(runner.main(unknown), 2);

    const char *missing_path[] = {"prove"};
    EXPECT_EQ(runner.main(missing_path), 2);

    const char *help[] = {"--help"};
    EXPECT_EQ(runner.main(help), 0);
}

TEST(Runner, NoDefinitions) {
    Runner runner{DefinitionRegistry{}};
    auto cmd = runner.parse(Args{"run", "prog.imp"});
    ASSERT_FALSE(cmd);
    EXPECT_EQ(cmd.error().kind, ErrorKind::unknown_definition);
}

class RunnerDispatch : public kninja::test::ScratchDirTest {
protected:
    // A fake krun that records its arguments and exits with a known status.
    std::string write_fake_krun() {
        std::filesystem::create_directories("bin");
        std::ofstream("bin/krun") << "#!/bin/sh\n"
                                     "printf '%s\\n' \"$@\" > args.txt\n"
                                     "exit 7\n";
        std::filesystem::permissions("bin/krun", std::filesystem::perms::owner_all);
        return (dir_ / "bin").string();
    }

    Args recorded_args() {
        Args lines;
        std::ifstream in("args.txt");
        for (std::string line; std::getline(in, line);) {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(RunnerDispatch, MainReturnsTheToolExitStatus) {
    DefinitionRegistry registry;
    registry.set_kbindir(write_fake_krun());
    ASSERT_TRUE(registry.add({
        .alias = "imp",
        .directory = ".build/defn/imp",
        .kompiled_dir = ".build/defn/imp/imp-kompiled",
        .krun_flags = "--output none",
    }));
    Runner runner(std::move(registry));

    const char *argv[] = {"run", "p", "--depth", "2"};
    EXPECT_EQ(runner.main(argv), 7);
    EXPECT_EQ(recorded_args(), (Args{"--directory", ".build/defn/imp", "p", "--output", "none", "--depth", "2"}));
}

TEST_F(RunnerDispatch, MissingToolIsALaunchFailure) {
    DefinitionRegistry registry;
    registry.set_kbindir((dir_ / "no-such-bin").string());
    ASSERT_TRUE(registry.add({.alias = "imp", .directory = ".build/defn/imp"}));
    Runner runner(std::move(registry));

    const char *argv[] = {"run", "p"};
    EXPECT_EQ(runner.main(argv), 1);
}

TEST(ProcessExec, EmptyCommandIsAProcessError) {
    auto res = process_exec({});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::process);
}

TEST(ProcessExec, ExtraEnvironmentReachesTheChild) {
    auto res = process_exec({"/bin/sh", "-c", "test \"$KNINJA_EXEC_CHECK\" = yes"}, std::nullopt,
                            std::unordered_map<std::string, std::string>{{"KNINJA_EXEC_CHECK", "yes"}});
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(*res, 0);
}

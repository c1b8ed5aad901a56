#include "kninja/graph.hpp"
#include "kninja/rule.hpp"
#include "kninja/target.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace kninja;

TEST(RuleTemplate, ExtensionOutputIsPlacedUnderBuildDir) {
    BuildGraph graph;
    auto compile = graph.rule("compile", "compile $in", "cc $in -o $out").with_extension("out");

    auto out = graph.source("foo.src").then(compile);
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_EQ(out->path(), ".build/foo.src.out");

    ASSERT_EQ(graph.edges().size(), 1u);
    EXPECT_EQ(graph.edges()[0].inputs, std::vector<std::string>{"foo.src"});
    EXPECT_EQ(graph.edges()[0].outputs, std::vector<std::string>{".build/foo.src.out"});
}

TEST(RuleTemplate, ExplicitOutputIsUsedVerbatim) {
    BuildGraph graph;
    auto stamp = graph.rule("stamp", std::nullopt, "touch $out").with_output("stamps/ok");

    auto out = graph.dot_target().then(stamp);
    ASSERT_TRUE(out);
    EXPECT_EQ(out->path(), "stamps/ok");
}

TEST(RuleTemplate, NoOutputRuleIsConfigurationError) {
    BuildGraph graph;
    auto rule = graph.rule("nothing", std::nullopt, "true");

    auto out = graph.source("a").then(rule);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::configuration);
    EXPECT_NE(out.error().message.find("rule 'nothing'"), std::string::npos);
    EXPECT_TRUE(graph.rules().empty());
}

TEST(RuleTemplate, AbsoluteOutputFailsBeforeAnythingIsRecorded) {
    BuildGraph graph;
    auto rule = graph.rule("copy", std::nullopt, "cp $in $out").with_output("/tmp/out");

    auto out = graph.source("in.txt").then(rule);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::configuration);
    EXPECT_TRUE(graph.rules().empty());
    EXPECT_TRUE(graph.edges().empty());
    EXPECT_FALSE(graph.flushed());
}

TEST(RuleTemplate, MutatorsDoNotChangeTheOriginal) {
    BuildGraph graph;
    auto base = graph.rule("tool", std::nullopt, "tool $flags $in > $out").with_extension("x");
    auto a = base.with_variable("flags", "-a").with_implicit_inputs(std::vector<std::string>{"dep.a"});
    auto b = base.with_variable("flags", "-b").with_pool("console");

    EXPECT_TRUE(base.variables().empty());
    EXPECT_TRUE(base.implicit_inputs().empty());
    EXPECT_FALSE(base.pool());
    EXPECT_EQ(a.variables().at("flags"), "-a");
    EXPECT_FALSE(a.pool());
    EXPECT_TRUE(b.implicit_inputs().empty());

    ASSERT_TRUE(graph.source("one").then(a));
    ASSERT_TRUE(graph.source("two").then(b));

    ASSERT_EQ(graph.edges().size(), 2u);
    EXPECT_EQ(graph.edges()[0].variables.at("flags"), "-a");
    EXPECT_EQ(graph.edges()[0].implicit_inputs, std::vector<std::string>{"dep.a"});
    EXPECT_FALSE(graph.edges()[0].pool);
    EXPECT_EQ(graph.edges()[1].variables.at("flags"), "-b");
    EXPECT_TRUE(graph.edges()[1].implicit_inputs.empty());
    EXPECT_EQ(graph.edges()[1].pool, "console");
    EXPECT_EQ(graph.rules().size(), 1u);
}

TEST(RuleTemplate, ImplicitInputsAppend) {
    BuildGraph graph;
    auto rule = graph.rule("r", std::nullopt, "true")
                    .with_implicit_inputs(std::vector<std::string>{"a"})
                    .with_implicit_inputs(std::vector<Target>{graph.source("b")});
    EXPECT_EQ(rule.implicit_inputs(), (std::vector<std::string>{"a", "b"}));
}

TEST(RuleTemplate, WithVariablesMergesAndNewValuesWin) {
    BuildGraph graph;
    auto rule = graph.rule("r", std::nullopt, "true")
                    .with_variables({{"a", "1"}, {"b", "2"}})
                    .with_variables({{"b", "3"}, {"c", "4"}});
    EXPECT_EQ(rule.variables(), (Variables{{"a", "1"}, {"b", "3"}, {"c", "4"}}));
}

TEST(RuleTemplate, UnboundPlaceholderIsRejected) {
    BuildGraph graph;
    auto rule = graph.rule("kompile", std::nullopt, "kompile --backend $backend $in -o $out").with_extension("k");

    auto out = graph.source("a.k").then(rule);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::configuration);
    EXPECT_EQ(out.error().message, "rule 'kompile' command references unbound variable '$backend'");
    EXPECT_TRUE(graph.edges().empty());

    EXPECT_TRUE(graph.source("a.k").then(rule.with_variable("backend", "llvm")));
}

TEST(RuleTemplate, GlobalVariablesBindPlaceholders) {
    BuildGraph graph;
    graph.add_variable("k_repository", "ext/k");
    auto rule = graph.rule("build", std::nullopt, "cd ${k_repository} && make && touch $out").with_output("done");
    EXPECT_TRUE(graph.dot_target().then(rule));
}

TEST(RuleTemplate, ReferencedVariablesSkipsEscapes) {
    EXPECT_EQ(referenced_variables("echo $$HOME $ x$:y ${out} $in_newline $in"),
              (std::vector<std::string>{"out", "in_newline", "in"}));
    EXPECT_EQ(referenced_variables("a-$b.c"), std::vector<std::string>{"b"});
    EXPECT_TRUE(referenced_variables("no variables here $").empty());
}

TEST(RuleTemplate, DuplicateProducerNamesTheRule) {
    BuildGraph graph;
    auto a = graph.rule("a", std::nullopt, "touch $out").with_output("same");
    auto b = graph.rule("b", std::nullopt, "touch $out").with_output("same");

    ASSERT_TRUE(graph.dot_target().then(a));
    auto second = graph.dot_target().then(b);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().kind, ErrorKind::configuration);
    EXPECT_NE(second.error().message.find("rule 'b'"), std::string::npos);
    EXPECT_NE(second.error().message.find("Duplicate producer for output: same"), std::string::npos);
    EXPECT_EQ(graph.edges().size(), 1u);
}

TEST(RuleTemplate, RejectedEdgeLeavesNoRuleBehind) {
    BuildGraph graph;
    ASSERT_TRUE(graph.dot_target().then(graph.rule("first", std::nullopt, "touch $out").with_output("taken")));

    auto clash = graph.dot_target().then(graph.rule("second", std::nullopt, "touch $out").with_output("taken"));
    ASSERT_FALSE(clash);
    EXPECT_EQ(graph.find_rule("second"), nullptr);

    auto no_pool = graph.dot_target().then(
        graph.rule("pooled", std::nullopt, "touch $out").with_output("free").with_pool("missing"));
    ASSERT_FALSE(no_pool);
    EXPECT_EQ(graph.find_rule("pooled"), nullptr);

    EXPECT_EQ(graph.rules().size(), 1u);
    EXPECT_EQ(graph.edges().size(), 1u);
}

TEST(RuleTemplate, ApplyRejectsAbsoluteOutput) {
    BuildGraph graph;
    auto rule = graph.rule("copy", std::nullopt, "cp $in $out");

    auto out = rule.apply(graph, graph.source("in.txt"), "/etc/out");
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::configuration);
    EXPECT_TRUE(graph.rules().empty());
    EXPECT_TRUE(graph.edges().empty());

    auto relative = rule.apply(graph, graph.source("in.txt"), "out.txt");
    ASSERT_TRUE(relative);
    EXPECT_EQ(relative->path(), "out.txt");
}

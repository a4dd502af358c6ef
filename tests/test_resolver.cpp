#include <gtest/gtest.h>
#include <presets/document_loader.hpp>
#include <presets/resolver.hpp>

class ResolverTest : public ::testing::Test {
protected:
    PresetDocument doc;

    void load(const std::string& json) {
        auto parsed = parse_preset_document(json);
        ASSERT_TRUE(parsed.is_ok()) << parsed.error.describe();
        doc = parsed.value;
    }

    HostEnvironment host() const {
        HostEnvironment h;
        h.variables = {{"HOME", "/home/dev"}, {"CC", "gcc"}};
        h.system_name = "Linux";
        h.path_list_separator = ":";
        return h;
    }

    // select + expand, the way the CLI resolves a preset
    Result<ResolvedConfiguration> resolve(const std::string& name,
                                          PresetKind kind = PresetKind::Configure) {
        MacroExpander expander(host(), "/src/project");
        PresetResolver resolver(doc, expander);
        auto merged = resolver.select(kind, name);
        if (merged.is_err()) return Result<ResolvedConfiguration>::Err(merged.error);
        return expander.expand(merged.value);
    }
};

TEST_F(ResolverTest, NoInheritanceKeepsOwnFields) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "solo", "generator": "Unix Makefiles", "binaryDir": "/tmp/out",
         "cacheVariables": {"A": "1", "B": {"type": "BOOL", "value": "ON"}},
         "environment": {"FOO": "bar"}}
    ]})");

    auto r = resolve("solo");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.preset_name, "solo");
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Unix Makefiles"));
    EXPECT_EQ(r.value.binary_dir, std::optional<std::string>("/tmp/out"));
    EXPECT_EQ(r.value.cache_variables.size(), 2u);
    EXPECT_EQ(r.value.cache_variables.at("A"), (CacheVariable{"", "1"}));
    EXPECT_EQ(r.value.cache_variables.at("B"), (CacheVariable{"BOOL", "ON"}));
    EXPECT_EQ(r.value.environment.at("FOO"), "bar");
    EXPECT_FALSE(r.value.install_dir.has_value());
}

TEST_F(ResolverTest, DebugInheritsBase) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "base", "generator": "Ninja", "cacheVariables": {"BUILD_TYPE": "Debug"}},
        {"name": "debug", "inherits": ["base"], "cacheVariables": {"BUILD_TYPE": "RelWithDebInfo"}}
    ]})");

    auto r = resolve("debug");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Ninja"));
    EXPECT_EQ(r.value.cache_variables.at("BUILD_TYPE").value, "RelWithDebInfo");
}

TEST_F(ResolverTest, ClosestAncestorWins) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "c", "generator": "from-c", "binaryDir": "/c", "cacheVariables": {"ONLY_C": "c"}},
        {"name": "b", "inherits": "c", "binaryDir": "/b"},
        {"name": "a", "inherits": "b"}
    ]})");

    auto r = resolve("a");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("from-c"));
    EXPECT_EQ(r.value.binary_dir, std::optional<std::string>("/b"));
    EXPECT_EQ(r.value.cache_variables.at("ONLY_C").value, "c");
}

TEST_F(ResolverTest, FirstDeclaredParentWins) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "x", "hidden": true, "generator": "X-Gen", "cacheVariables": {"K": "from-x"}},
        {"name": "y", "hidden": true, "generator": "Y-Gen",
         "cacheVariables": {"K": "from-y", "ONLY_Y": "y"}},
        {"name": "child", "inherits": ["x", "y"]}
    ]})");

    auto r = resolve("child");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.at("K").value, "from-x");
    EXPECT_EQ(r.value.generator, std::optional<std::string>("X-Gen"));
    EXPECT_EQ(r.value.cache_variables.at("ONLY_Y").value, "y");
}

TEST_F(ResolverTest, FirstParentsAncestorsBeatLaterParent) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "root", "cacheVariables": {"K": "from-root"}},
        {"name": "x", "inherits": "root"},
        {"name": "y", "cacheVariables": {"K": "from-y"}},
        {"name": "child", "inherits": ["x", "y"]}
    ]})");

    auto r = resolve("child");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.at("K").value, "from-root");
}

TEST_F(ResolverTest, ChildBeatsEveryAncestor) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "x", "cacheVariables": {"K": "from-x"}},
        {"name": "y", "cacheVariables": {"K": "from-y"}},
        {"name": "child", "inherits": ["x", "y"], "cacheVariables": {"K": "mine"}}
    ]})");

    auto r = resolve("child");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.at("K").value, "mine");
}

TEST_F(ResolverTest, DiamondInheritance) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "top", "generator": "Ninja", "cacheVariables": {"T": "top"}},
        {"name": "left", "inherits": "top", "cacheVariables": {"L": "left"}},
        {"name": "right", "inherits": "top", "cacheVariables": {"R": "right", "T": "right"}},
        {"name": "bottom", "inherits": ["left", "right"]}
    ]})");

    auto r = resolve("bottom");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Ninja"));
    EXPECT_EQ(r.value.cache_variables.at("L").value, "left");
    EXPECT_EQ(r.value.cache_variables.at("R").value, "right");
    // left's inherited T (from top) outranks right's own T
    EXPECT_EQ(r.value.cache_variables.at("T").value, "top");
}

TEST_F(ResolverTest, NullRemovesInheritedKey) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "base", "generator": "Ninja", "binaryDir": "/b",
         "cacheVariables": {"DROP": "x", "KEEP": "y"},
         "environment": {"GONE": "1", "STAYS": "2"}},
        {"name": "child", "inherits": "base", "binaryDir": null,
         "cacheVariables": {"DROP": null},
         "environment": {"GONE": null}}
    ]})");

    auto r = resolve("child");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.count("DROP"), 0u);
    EXPECT_EQ(r.value.cache_variables.at("KEEP").value, "y");
    EXPECT_FALSE(r.value.binary_dir.has_value());
    EXPECT_EQ(r.value.environment.count("GONE"), 0u);
    EXPECT_EQ(r.value.unset_environment.count("GONE"), 1u);
    EXPECT_EQ(r.value.environment.at("STAYS"), "2");
}

TEST_F(ResolverTest, NullInMiddleAncestorRemovesFartherValue) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "c", "cacheVariables": {"K": "c"}},
        {"name": "b", "inherits": "c", "cacheVariables": {"K": null}},
        {"name": "a", "inherits": "b"}
    ]})");

    auto r = resolve("a");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.count("K"), 0u);
}

TEST_F(ResolverTest, TwoNodeCycle) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "a", "inherits": "b"},
        {"name": "b", "inherits": "a"}
    ]})");

    auto r = resolve("a");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::InheritanceCycle);
    EXPECT_EQ(r.error.preset, "a");
    EXPECT_NE(r.error.message.find("a -> b -> a"), std::string::npos);
}

TEST_F(ResolverTest, SelfCycle) {
    load(R"({"version": 3, "configurePresets": [{"name": "me", "inherits": "me"}]})");

    auto r = resolve("me");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::InheritanceCycle);
}

TEST_F(ResolverTest, CycleBelowRequestedPreset) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "top", "inherits": "p"},
        {"name": "p", "inherits": "q"},
        {"name": "q", "inherits": "p"}
    ]})");

    auto r = resolve("top");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::InheritanceCycle);
    EXPECT_NE(r.error.message.find("p -> q -> p"), std::string::npos);
}

TEST_F(ResolverTest, UnknownPreset) {
    load(R"({"version": 3, "configurePresets": [{"name": "a"}]})");

    auto r = resolve("missing");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::PresetNotFound);
    EXPECT_EQ(r.error.preset, "missing");
}

TEST_F(ResolverTest, UnknownParentNamesReferrer) {
    load(R"({"version": 3, "configurePresets": [{"name": "a", "inherits": "ghost"}]})");

    auto r = resolve("a");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::PresetNotFound);
    EXPECT_EQ(r.error.preset, "a");
    EXPECT_EQ(r.error.field, "inherits");
    EXPECT_EQ(r.error.token, "ghost");
}

TEST_F(ResolverTest, HiddenPresetCannotBeSelected) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "base", "hidden": true, "generator": "Ninja"},
        {"name": "dev", "inherits": "base"}
    ]})");

    auto hidden = resolve("base");
    ASSERT_TRUE(hidden.is_err());
    EXPECT_EQ(hidden.error.kind, ErrorKind::PresetNotFound);

    auto dev = resolve("dev");
    ASSERT_TRUE(dev.is_ok()) << dev.error.describe();
    EXPECT_EQ(dev.value.generator, std::optional<std::string>("Ninja"));
}

TEST_F(ResolverTest, ConditionFalseFails) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "win", "condition": {"type": "equals", "lhs": "${hostSystemName}", "rhs": "Windows"}}
    ]})");

    auto r = resolve("win");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::ConditionUnsatisfied);
    EXPECT_EQ(r.error.preset, "win");
    EXPECT_EQ(r.error.field, "condition");
}

TEST_F(ResolverTest, ConditionTrueSucceeds) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "linux", "condition": {"type": "equals", "lhs": "${hostSystemName}", "rhs": "Linux"}}
    ]})");

    EXPECT_TRUE(resolve("linux").is_ok());
}

TEST_F(ResolverTest, AncestorConditionIsNotEvaluated) {
    load(R"({"version": 3, "configurePresets": [
        {"name": "never", "hidden": true, "condition": false, "generator": "Ninja"},
        {"name": "child", "inherits": "never"}
    ]})");

    auto r = resolve("child");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Ninja"));
}

TEST_F(ResolverTest, BuildPresetsInheritWithinTheirKind) {
    load(R"({"version": 3,
        "configurePresets": [{"name": "cfg"}],
        "buildPresets": [
            {"name": "common", "hidden": true, "configurePreset": "cfg", "jobs": 4, "targets": "all"},
            {"name": "fast", "inherits": "common", "jobs": 16}
        ]})");

    auto r = resolve("fast", PresetKind::Build);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.kind, PresetKind::Build);
    EXPECT_EQ(r.value.configure_preset, std::optional<std::string>("cfg"));
    EXPECT_EQ(r.value.jobs, std::optional<int>(16));
    EXPECT_EQ(r.value.targets, std::vector<std::string>{"all"});
}

#include <gtest/gtest.h>
#include <presets/expander.hpp>

namespace {

HostEnvironment test_host() {
    HostEnvironment h;
    h.variables = {
        {"HOME", "/home/dev"},
        {"FOO", "host-foo"},
        {"TRICKY", "$env{HOME}"},
    };
    h.system_name = "Linux";
    h.path_list_separator = ":";
    return h;
}

Preset named(const std::string& name) {
    Preset p;
    p.name = name;
    return p;
}

// Turn an expanded configuration back into a preset so it can be expanded again.
Preset to_preset(const ResolvedConfiguration& rc) {
    Preset p;
    p.kind = rc.kind;
    p.name = rc.preset_name;
    p.display_name = rc.display_name;
    p.description = rc.description;

    auto put = [](Field<std::string>& f, const std::optional<std::string>& v) {
        if (v) f = Field<std::string>::of(*v);
    };
    put(p.generator, rc.generator);
    put(p.binary_dir, rc.binary_dir);
    put(p.install_dir, rc.install_dir);
    put(p.toolchain_file, rc.toolchain_file);
    put(p.target_executable, rc.target_executable);
    put(p.configure_preset, rc.configure_preset);
    put(p.configuration, rc.configuration);

    for (const auto& [k, v] : rc.cache_variables) {
        p.cache_variables[k] = Field<CacheVariable>::of(v);
    }
    for (const auto& [k, v] : rc.environment) {
        p.environment[k] = Field<std::string>::of(v);
    }
    for (const auto& k : rc.unset_environment) {
        p.environment[k] = Field<std::string>::null();
    }
    if (!rc.targets.empty()) p.targets = Field<std::vector<std::string>>::of(rc.targets);
    if (rc.jobs) p.jobs = Field<int>::of(*rc.jobs);
    return p;
}

} // namespace

class ExpanderTest : public ::testing::Test {
protected:
    MacroExpander expander{test_host(), "/src/project"};

    std::string expand(const Preset& p, const std::string& text) {
        auto r = expander.expand_string(p, text, "test");
        EXPECT_TRUE(r.is_ok()) << r.error.describe();
        return r.value;
    }
};

TEST_F(ExpanderTest, Builtins) {
    Preset p = named("dev");
    EXPECT_EQ(expand(p, "${sourceDir}/build"), "/src/project/build");
    EXPECT_EQ(expand(p, "${sourceParentDir}"), "/src");
    EXPECT_EQ(expand(p, "${sourceDirName}"), "project");
    EXPECT_EQ(expand(p, "${fileDir}"), "/src/project");
    EXPECT_EQ(expand(p, "out/${presetName}"), "out/dev");
    EXPECT_EQ(expand(p, "${hostSystemName}"), "Linux");
    EXPECT_EQ(expand(p, "a${pathListSep}b"), "a:b");
}

TEST_F(ExpanderTest, GeneratorMacro) {
    Preset p = named("dev");
    p.generator = Field<std::string>::of("Ninja");
    p.binary_dir = Field<std::string>::of("${sourceDir}/build/${generator}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.binary_dir, std::optional<std::string>("/src/project/build/Ninja"));
}

TEST_F(ExpanderTest, EnvPrefersPresetOverHost) {
    Preset p = named("dev");
    p.environment["FOO"] = Field<std::string>::of("preset-foo");

    EXPECT_EQ(expand(p, "$env{FOO}"), "preset-foo");
    EXPECT_EQ(expand(p, "$penv{FOO}"), "host-foo");
    EXPECT_EQ(expand(p, "$env{HOME}"), "/home/dev");
}

TEST_F(ExpanderTest, EnvironmentEntriesReferToEachOther) {
    Preset p = named("dev");
    // Alphabetical order makes A need two passes
    p.environment["A"] = Field<std::string>::of("a:$env{B}");
    p.environment["B"] = Field<std::string>::of("b:$env{C}");
    p.environment["C"] = Field<std::string>::of("c:${presetName}");
    p.environment["PATH"] = Field<std::string>::of("/opt/bin${pathListSep}$penv{HOME}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.environment.at("A"), "a:b:c:dev");
    EXPECT_EQ(r.value.environment.at("B"), "b:c:dev");
    EXPECT_EQ(r.value.environment.at("C"), "c:dev");
    EXPECT_EQ(r.value.environment.at("PATH"), "/opt/bin:/home/dev");
}

TEST_F(ExpanderTest, GeneratorMayUseEnvironment) {
    Preset p = named("dev");
    p.environment["GEN"] = Field<std::string>::of("Ninja Multi-Config");
    p.generator = Field<std::string>::of("$env{GEN}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Ninja Multi-Config"));
}

TEST_F(ExpanderTest, UndefinedEnvironmentVariable) {
    Preset p = named("dev");
    p.binary_dir = Field<std::string>::of("$env{NOT_SET_ANYWHERE}/build");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::UnresolvedVariable);
    EXPECT_EQ(r.error.preset, "dev");
    EXPECT_EQ(r.error.field, "binaryDir");
    EXPECT_EQ(r.error.token, "$env{NOT_SET_ANYWHERE}");
}

TEST_F(ExpanderTest, UnknownMacro) {
    Preset p = named("dev");
    p.cache_variables["X"] = Field<CacheVariable>::of(CacheVariable{"", "${nonsense}"});

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::UnresolvedVariable);
    EXPECT_EQ(r.error.field, "cacheVariables.X");
    EXPECT_EQ(r.error.token, "${nonsense}");
}

TEST_F(ExpanderTest, GeneratorMacroWithoutGenerator) {
    Preset p = named("dev");
    p.binary_dir = Field<std::string>::of("build/${generator}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::UnresolvedVariable);
    EXPECT_EQ(r.error.token, "${generator}");
}

TEST_F(ExpanderTest, ExplicitlyUnsetVariableIsUnresolved) {
    Preset p = named("dev");
    p.environment["FOO"] = Field<std::string>::null();
    p.binary_dir = Field<std::string>::of("$env{FOO}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::UnresolvedVariable);
    EXPECT_EQ(r.error.token, "$env{FOO}");
}

TEST_F(ExpanderTest, SelfReferenceIsCycle) {
    Preset p = named("dev");
    p.environment["FOO"] = Field<std::string>::of("$env{FOO}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::ExpansionCycle);
    EXPECT_EQ(r.error.preset, "dev");
    EXPECT_EQ(r.error.field, "environment.FOO");
}

TEST_F(ExpanderTest, GeneratorSelfReferenceIsCycle) {
    Preset p = named("dev");
    p.generator = Field<std::string>::of("${generator}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::ExpansionCycle);
    EXPECT_EQ(r.error.field, "generator");
}

TEST_F(ExpanderTest, MutualReferenceIsCycle) {
    Preset p = named("dev");
    p.environment["A"] = Field<std::string>::of("$env{B}");
    p.environment["B"] = Field<std::string>::of("$env{A}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::ExpansionCycle);
}

TEST_F(ExpanderTest, GrowingSelfReferenceIsCycle) {
    Preset p = named("dev");
    p.environment["PATH"] = Field<std::string>::of("/extra:$env{PATH}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::ExpansionCycle);
}

TEST_F(ExpanderTest, PenvBreaksSelfReference) {
    Preset p = named("dev");
    p.environment["HOME"] = Field<std::string>::of("/sandbox:$penv{HOME}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.environment.at("HOME"), "/sandbox:/home/dev");
}

TEST_F(ExpanderTest, HostValuesAreNotRescanned) {
    Preset p = named("dev");
    p.environment["COPY"] = Field<std::string>::of("$env{TRICKY}");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.environment.at("COPY"), "$env{HOME}");
}

TEST_F(ExpanderTest, DollarAndVendorAndStrayDollars) {
    Preset p = named("dev");
    EXPECT_EQ(expand(p, "${dollar}{sourceDir}"), "${sourceDir}");
    EXPECT_EQ(expand(p, "$vendor{acme.tool}"), "$vendor{acme.tool}");
    EXPECT_EQ(expand(p, "costs $5"), "costs $5");
    EXPECT_EQ(expand(p, "${unterminated"), "${unterminated");
}

TEST_F(ExpanderTest, ControlCharactersSurviveExpansion) {
    Preset p = named("dev");
    p.cache_variables["SEP"] = Field<CacheVariable>::of(CacheVariable{"", "x\x1fy"});
    p.environment["UNIT"] = Field<std::string>::of("a\x1f${dollar}\x1f" "d");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.cache_variables.at("SEP").value, "x\x1fy");
    EXPECT_EQ(r.value.environment.at("UNIT"), "a\x1f$\x1f" "d");
    EXPECT_EQ(expand(p, "\x1f" "e$env{UNIT}"), "\x1f" "ea\x1f$\x1f" "d");
}

TEST_F(ExpanderTest, LiteralConfigurationIsUntouched) {
    Preset p = named("plain");
    p.generator = Field<std::string>::of("Unix Makefiles");
    p.binary_dir = Field<std::string>::of("/tmp/plain");
    p.cache_variables["A"] = Field<CacheVariable>::of(CacheVariable{"STRING", "a b c"});
    p.environment["CC"] = Field<std::string>::of("clang");

    auto r = expander.expand(p);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.generator, std::optional<std::string>("Unix Makefiles"));
    EXPECT_EQ(r.value.binary_dir, std::optional<std::string>("/tmp/plain"));
    EXPECT_EQ(r.value.cache_variables.at("A"), (CacheVariable{"STRING", "a b c"}));
    EXPECT_EQ(r.value.environment.at("CC"), "clang");
}

TEST_F(ExpanderTest, ExpansionIsIdempotent) {
    Preset p = named("dev");
    p.generator = Field<std::string>::of("Ninja");
    p.binary_dir = Field<std::string>::of("${sourceDir}/out/${presetName}");
    p.install_dir = Field<std::string>::of("$env{HOME}/.local");
    p.target_executable = Field<std::string>::of("bin/${sourceDirName}");
    p.cache_variables["GEN"] = Field<CacheVariable>::of(CacheVariable{"", "${generator}"});
    p.environment["A"] = Field<std::string>::of("$env{B}/a");
    p.environment["B"] = Field<std::string>::of("${sourceParentDir}");
    p.environment["DROP"] = Field<std::string>::null();
    p.targets = Field<std::vector<std::string>>::of({"app-${presetName}"});

    auto first = expander.expand(p);
    ASSERT_TRUE(first.is_ok()) << first.error.describe();

    auto second = expander.expand(to_preset(first.value));
    ASSERT_TRUE(second.is_ok()) << second.error.describe();
    EXPECT_EQ(first.value, second.value);
    EXPECT_EQ(second.value.environment.at("A"), "/src/a");
    EXPECT_EQ(second.value.targets, std::vector<std::string>{"app-dev"});
}

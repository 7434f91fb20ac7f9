#include <gtest/gtest.h>

#include <string>
#include <typeindex>
#include <vector>

#include "argot/command.hpp"
#include "argot/errors.hpp"
#include "argot/interpreter.hpp"

using argot::CommandSpec;
using argot::InitializationError;
using argot::Interpreter;
using argot::OptionSpec;
using argot::PositionalSpec;

namespace {

struct Point {
    int x{0};
    int y{0};
};

} // namespace

TEST(CommandSpecTest, RejectsDuplicateOptionNames) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v", "--verbose"}));
    EXPECT_THROW(spec.addOption(OptionSpec::builder({"--verbose"})), InitializationError);
    EXPECT_EQ(spec.options().size(), 1u);
}

TEST(CommandSpecTest, NegatedNamesTakePartInUniqueness) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"--color"}).negatable());
    EXPECT_THROW(spec.addOption(OptionSpec::builder({"--no-color"})), InitializationError);

    const auto match = spec.findOption("--no-color");
    ASSERT_NE(match.option, nullptr);
    EXPECT_TRUE(match.negated);
}

TEST(CommandSpecTest, CaseInsensitiveLookupFailsFastOnCollisions) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v"})).addOption(OptionSpec::builder({"-V"}));
    EXPECT_THROW(spec.caseInsensitiveOptions(true), InitializationError);
    EXPECT_FALSE(spec.parser().caseInsensitiveOptions);
    EXPECT_NE(spec.findOption("-V").option, spec.findOption("-v").option);

    CommandSpec other("other");
    other.addOption(OptionSpec::builder({"--Verbose"})).caseInsensitiveOptions(true);
    EXPECT_NE(other.findOption("--VERBOSE").option, nullptr);
    EXPECT_THROW(other.addOption(OptionSpec::builder({"--verbose"})), InitializationError);
}

TEST(CommandSpecTest, PositionalIndexGapsAreRejectedWhenSealed) {
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0"));
    spec.addPositional(PositionalSpec::builder().index("2"));
    EXPECT_THROW(Interpreter interp(spec), InitializationError);

    CommandSpec covered("covered");
    covered.addPositional(PositionalSpec::builder().index("0..1").type<std::vector<std::string>>());
    covered.addPositional(PositionalSpec::builder().index("2..*").type<std::vector<std::string>>());
    EXPECT_NO_THROW(Interpreter interp(covered));

    CommandSpec late("late");
    late.addPositional(PositionalSpec::builder().index("1..*").type<std::vector<std::string>>());
    EXPECT_THROW(Interpreter interp(late), InitializationError);
}

TEST(CommandSpecTest, SealedSpecRejectsChanges) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v"}));
    Interpreter interp(spec);
    EXPECT_TRUE(spec.sealed());
    EXPECT_THROW(spec.addOption(OptionSpec::builder({"-q"})), InitializationError);
    EXPECT_THROW(spec.unmatchedArgumentsAllowed(true), InitializationError);
    EXPECT_THROW(spec.version("2.0"), InitializationError);
}

TEST(CommandSpecTest, MixinsAppendArgumentsInDeclarationOrder) {
    CommandSpec logging("logging");
    logging.addOption(OptionSpec::builder({"--log-level"}).type<std::string>());
    logging.addOption(OptionSpec::builder({"--log-file"}).type<std::string>());
    CommandSpec dryRun("dry-run");
    dryRun.addOption(OptionSpec::builder({"-n", "--dry-run"}));

    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v"}));
    spec.addMixin("logging", std::move(logging)).addMixin("dry-run", std::move(dryRun));

    ASSERT_EQ(spec.options().size(), 4u);
    EXPECT_EQ(spec.options()[0]->longestName(), "-v");
    EXPECT_EQ(spec.options()[1]->longestName(), "--log-level");
    EXPECT_EQ(spec.options()[2]->longestName(), "--log-file");
    EXPECT_EQ(spec.options()[3]->longestName(), "--dry-run");
    ASSERT_NE(spec.findMixin("logging"), nullptr);
    EXPECT_EQ(spec.findMixin("logging")->name(), "logging");
    EXPECT_NE(spec.findOption("--log-file").option, nullptr);
}

TEST(CommandSpecTest, MixinAttributesOnlyFillDefaults) {
    CommandSpec first("first");
    first.version("1.0").description("from first").separator(":");
    CommandSpec second("second");
    second.version("2.0").description("from second").header("second header").separator("#");

    CommandSpec spec("app");
    spec.description("own description");
    spec.addMixin("first", std::move(first)).addMixin("second", std::move(second));

    EXPECT_EQ(spec.description(), "own description");
    EXPECT_EQ(spec.version(), "1.0");
    EXPECT_EQ(spec.header(), "second header");
    EXPECT_EQ(spec.separator(), ":");
    EXPECT_EQ(spec.footer(), "");
}

TEST(CommandSpecTest, MixinNamesAndArgumentsMustBeUnique) {
    CommandSpec a("a");
    a.addOption(OptionSpec::builder({"-x"}));
    CommandSpec b("b");
    b.addOption(OptionSpec::builder({"-x"}));

    CommandSpec spec("app");
    spec.addMixin("a", std::move(a));
    EXPECT_THROW(spec.addMixin("b", std::move(b)), InitializationError);
    EXPECT_THROW(spec.addMixin("a", CommandSpec("again")), InitializationError);
}

TEST(CommandSpecTest, SubcommandsResolveByNameAndAlias) {
    CommandSpec commit("commit");
    commit.addAlias("ci");
    CommandSpec spec("git");
    spec.addSubcommand(std::move(commit));

    ASSERT_NE(spec.findSubcommand("commit"), nullptr);
    EXPECT_EQ(spec.findSubcommand("ci"), spec.findSubcommand("commit"));
    EXPECT_EQ(spec.findSubcommand("COMMIT"), nullptr);

    spec.caseInsensitiveSubcommands(true);
    EXPECT_EQ(spec.findSubcommand("COMMIT"), spec.findSubcommand("commit"));

    CommandSpec clash("ci");
    EXPECT_THROW(spec.addSubcommand(std::move(clash)), InitializationError);
}

TEST(CommandSpecTest, CaseInsensitiveSubcommandsDetectCollisions) {
    CommandSpec spec("app");
    spec.addSubcommand(CommandSpec("Build")).addSubcommand(CommandSpec("build"));
    EXPECT_THROW(spec.caseInsensitiveSubcommands(true), InitializationError);
    EXPECT_FALSE(spec.parser().caseInsensitiveSubcommands);
}

TEST(CommandSpecTest, SettersReachExistingSubcommands) {
    CommandSpec spec("app");
    spec.addSubcommand(CommandSpec("run"));
    spec.unmatchedArgumentsAllowed(true);
    spec.addSubcommand(CommandSpec("stop"));

    EXPECT_TRUE(spec.findSubcommand("run")->parser().unmatchedArgumentsAllowed);
    EXPECT_FALSE(spec.findSubcommand("stop")->parser().unmatchedArgumentsAllowed);
}

TEST(CommandSpecTest, RegisteredConvertersReachExistingSubcommandsOnly) {
    CommandSpec spec("app");
    spec.addSubcommand(CommandSpec("before"));
    spec.registerConverter<Point>([](const std::string& s) {
        const auto comma = s.find(',');
        return Point{std::stoi(s.substr(0, comma)), std::stoi(s.substr(comma + 1))};
    });
    spec.addSubcommand(CommandSpec("after"));

    EXPECT_NE(spec.converters().find(std::type_index(typeid(Point))), nullptr);
    EXPECT_NE(spec.findSubcommand("before")->converters().find(std::type_index(typeid(Point))), nullptr);
    EXPECT_EQ(spec.findSubcommand("after")->converters().find(std::type_index(typeid(Point))), nullptr);
}

TEST(CommandSpecTest, MissingConverterIsAnInitializationError) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"--origin"}).type<Point>());
    EXPECT_THROW(Interpreter interp(spec), InitializationError);
}

TEST(CommandSpecTest, OptionNamesIncludeNegatedForms) {
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v", "--verbose"}).negatable());
    spec.addOption(OptionSpec::builder({"-o"}).type<std::string>());
    EXPECT_EQ(spec.optionNames(), (std::vector<std::string>{"-v", "--verbose", "+v", "--no-verbose", "-o"}));
}

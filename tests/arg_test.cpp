#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "argot/arg.hpp"
#include "argot/errors.hpp"

using argot::InitializationError;
using argot::OptionSpec;
using argot::PositionalSpec;
using argot::Range;
using argot::Shape;

TEST(ArgSpecTest, UntypedOptionIsAFlag) {
    const auto opt = OptionSpec::builder({"-v", "--verbose"}).build();
    EXPECT_TRUE(opt->isOption());
    EXPECT_TRUE(opt->isBoolean());
    EXPECT_EQ(opt->arity(), Range::exactly(0));
    EXPECT_FALSE(opt->hasExplicitArity());
    EXPECT_EQ(opt->longestName(), "--verbose");
    EXPECT_EQ(opt->shortestName(), "-v");
    EXPECT_EQ(opt->paramLabel(), "<verbose>");
    EXPECT_EQ(opt->getValue<bool>(), false);
}

TEST(ArgSpecTest, TypedOptionTakesOneValue) {
    int port = 8080;
    const auto opt = OptionSpec::builder({"-p", "--port"}).bind(port).build();
    EXPECT_FALSE(opt->isBoolean());
    EXPECT_EQ(opt->arity(), Range::exactly(1));
    EXPECT_EQ(opt->shape(), Shape::Scalar);
    EXPECT_EQ(opt->displayName(), "option '--port' (<port>)");
    ASSERT_EQ(opt->auxiliaryTypes().size(), 1u);
    EXPECT_EQ(opt->auxiliaryTypes()[0], std::type_index(typeid(int)));
}

TEST(ArgSpecTest, CollectionsAndMapsReportElementTypes) {
    const auto list = OptionSpec::builder({"-f"}).type<std::vector<std::string>>().build();
    EXPECT_EQ(list->shape(), Shape::Collection);
    EXPECT_TRUE(list->isMultiValue());
    EXPECT_EQ(list->arity(), Range::exactly(1));

    const auto map = OptionSpec::builder({"-D"}).type<std::map<std::string, int>>().build();
    EXPECT_EQ(map->shape(), Shape::Map);
    ASSERT_EQ(map->auxiliaryTypes().size(), 2u);
    EXPECT_EQ(map->auxiliaryTypes()[0], std::type_index(typeid(std::string)));
    EXPECT_EQ(map->auxiliaryTypes()[1], std::type_index(typeid(int)));
}

TEST(ArgSpecTest, PositionalDefaults) {
    const auto single = PositionalSpec::builder().build();
    EXPECT_FALSE(single->isOption());
    EXPECT_EQ(single->index(), Range::atLeast(0));
    EXPECT_EQ(single->arity(), Range::exactly(1));
    EXPECT_EQ(single->paramLabel(), "<param0>");

    const auto files = PositionalSpec::builder().index("1..*").type<std::vector<std::string>>().build();
    EXPECT_EQ(files->arity(), Range(0, 1));
    EXPECT_EQ(files->paramLabel(), "<param1>");
    EXPECT_EQ(files->displayName(), "positional parameter at index 1..* (<param1>)");

    const auto labelled = PositionalSpec::builder().index("0").paramLabel("<file>").build();
    EXPECT_EQ(labelled->displayName(), "positional parameter at index 0 (<file>)");
}

TEST(ArgSpecTest, OptionalScalarsAreBooleanWhenWrappingBool) {
    const auto opt = OptionSpec::builder({"--color"}).type<std::optional<bool>>().build();
    EXPECT_TRUE(opt->isBoolean());
    EXPECT_EQ(opt->arity(), Range::exactly(0));
}

TEST(ArgSpecTest, RejectsInvalidDeclarations) {
    EXPECT_THROW(OptionSpec::builder({}).build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({""}).build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-a b"}).build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-a", "-a"}).build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-x"}).type<int>().arity("2").build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-x"}).type<std::vector<int>>().arity("2..1").build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-x"}).type<std::vector<int>>().splitRegex("[").build(), InitializationError);
    EXPECT_THROW(OptionSpec::builder({"-x"}).type<int>().negatable().build(), InitializationError);
    EXPECT_THROW(PositionalSpec::builder().index("one").build(), InitializationError);

    auto identity = [](const std::string& s) -> std::any { return s; };
    EXPECT_THROW(OptionSpec::builder({"-x"}).type<std::string>().converter(identity).converter(identity).build(),
                 InitializationError);
}

TEST(ArgSpecTest, NegatedNames) {
    EXPECT_EQ(OptionSpec::negate("--verbose"), "--no-verbose");
    EXPECT_EQ(OptionSpec::negate("--no-verbose"), "--verbose");
    EXPECT_EQ(OptionSpec::negate("-v"), "+v");
    EXPECT_EQ(OptionSpec::negate("-color"), "-no-color");

    const auto opt = OptionSpec::builder({"-v", "--verbose"}).negatable().build();
    EXPECT_EQ(opt->negatedNames(), (std::vector<std::string>{"+v", "--no-verbose"}));
    EXPECT_TRUE(OptionSpec::builder({"-q"}).build()->negatedNames().empty());
}

TEST(ArgSpecTest, BindingReadsAndWritesTarget) {
    std::vector<int> numbers{1, 2};
    const auto opt = OptionSpec::builder({"-n"}).bind(numbers).build();
    opt->slot().add(std::any(3));
    EXPECT_EQ(numbers, (std::vector<int>{1, 2, 3}));
    opt->slot().restoreDefault();
    EXPECT_EQ(numbers, (std::vector<int>{1, 2}));
    opt->slot().clear();
    EXPECT_TRUE(numbers.empty());
}

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "argot/command.hpp"
#include "argot/errors.hpp"
#include "argot/interpreter.hpp"

using argot::CommandSpec;
using argot::Interpreter;
using argot::MissingParameterError;
using argot::OptionSpec;
using argot::ParameterError;
using argot::ParseResult;
using argot::PositionalSpec;
using argot::TypeConversionError;
using argot::UnmatchedArgumentError;

namespace {

using Strings = std::vector<std::string>;

ParseResult parse(CommandSpec& spec, const Strings& args) {
    Interpreter interp(spec);
    return interp.parse(args);
}

} // namespace

TEST(PositionalTest, OverlappingRangesShareTokens) {
    std::vector<int> a;
    std::vector<std::string> b;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0..3").bind(a));
    spec.addPositional(PositionalSpec::builder().index("2..4").bind(b));
    spec.unmatchedArgumentsAllowed();

    const auto result = parse(spec, {"11", "22", "C", "D", "E", "F"});
    EXPECT_EQ(a, (std::vector<int>{11, 22}));
    EXPECT_EQ(b, (Strings{"C", "D", "E"}));
    EXPECT_EQ(result.unmatched(), Strings{"F"});
}

TEST(PositionalTest, IndexedScalars) {
    std::string source;
    std::string target;
    CommandSpec spec("cp");
    spec.addPositional(PositionalSpec::builder().index("0").bind(source).paramLabel("SRC"));
    spec.addPositional(PositionalSpec::builder().index("1").bind(target).paramLabel("DST"));
    (void)parse(spec, {"a.txt", "b.txt"});
    EXPECT_EQ(source, "a.txt");
    EXPECT_EQ(target, "b.txt");
}

TEST(PositionalTest, ScalarIsNotRefilled) {
    std::string only;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0").bind(only));
    try {
        (void)parse(spec, {"a", "b"});
        FAIL() << "expected UnmatchedArgumentError";
    } catch (const UnmatchedArgumentError& e) {
        EXPECT_STREQ(e.what(), "Unmatched argument at index 1: 'b'");
    }
    EXPECT_EQ(only, "a");
}

TEST(PositionalTest, SeveralUnmatchedArguments) {
    std::string only;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0").bind(only));
    try {
        (void)parse(spec, {"A", "B", "C"});
        FAIL() << "expected UnmatchedArgumentError";
    } catch (const UnmatchedArgumentError& e) {
        EXPECT_STREQ(e.what(), "Unmatched arguments from index 1: 'B', 'C'");
        EXPECT_EQ(e.unmatched(), (Strings{"B", "C"}));
    }
}

TEST(PositionalTest, UnmatchedIndexCountsOptionTokens) {
    bool v = false;
    std::string only;
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v"}).bind(v));
    spec.addPositional(PositionalSpec::builder().index("0").bind(only));
    try {
        (void)parse(spec, {"-v", "a", "b"});
        FAIL() << "expected UnmatchedArgumentError";
    } catch (const UnmatchedArgumentError& e) {
        EXPECT_STREQ(e.what(), "Unmatched argument at index 2: 'b'");
    }
}

TEST(PositionalTest, MissingRequiredParameter) {
    std::string file;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0").bind(file).paramLabel("FILE"));
    try {
        (void)parse(spec, {});
        FAIL() << "expected MissingParameterError";
    } catch (const MissingParameterError& e) {
        EXPECT_STREQ(e.what(), "Missing required parameter: 'FILE'");
    }
}

TEST(PositionalTest, MissingParametersAreListedTogether) {
    std::string source;
    std::string target;
    CommandSpec spec("cp");
    spec.addPositional(PositionalSpec::builder().index("0").bind(source).paramLabel("SRC"));
    spec.addPositional(PositionalSpec::builder().index("1").bind(target).paramLabel("DST"));
    try {
        (void)parse(spec, {});
        FAIL() << "expected MissingParameterError";
    } catch (const MissingParameterError& e) {
        EXPECT_STREQ(e.what(), "Missing required parameters: 'SRC', 'DST'");
    }
}

TEST(PositionalTest, OptionalMultiValuePositionalMayBeEmpty) {
    std::vector<std::string> files;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().bind(files));
    EXPECT_NO_THROW((void)parse(spec, {}));
    EXPECT_TRUE(files.empty());
}

TEST(PositionalTest, RequiredMultiValuePositional) {
    std::vector<std::string> files;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().bind(files).required().paramLabel("FILES"));
    EXPECT_THROW((void)parse(spec, {}), MissingParameterError);
    (void)parse(spec, {"x", "y"});
    EXPECT_EQ(files, (Strings{"x", "y"}));
}

TEST(PositionalTest, ArityTakesSeveralTokensAtOnce) {
    std::vector<int> point;
    std::string label;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0..1").bind(point).arity("2"));
    spec.addPositional(PositionalSpec::builder().index("2").bind(label));
    const auto result = parse(spec, {"3", "4", "origin"});
    EXPECT_EQ(point, (std::vector<int>{3, 4}));
    EXPECT_EQ(label, "origin");
    EXPECT_EQ(result.matchedPositional(1)->index().toString(), "0..1");
}

TEST(PositionalTest, MandatoryConversionFailureIsAnError) {
    int count = 0;
    CommandSpec spec("app");
    spec.addPositional(PositionalSpec::builder().index("0").bind(count).paramLabel("COUNT"));
    try {
        (void)parse(spec, {"many"});
        FAIL() << "expected TypeConversionError";
    } catch (const TypeConversionError& e) {
        EXPECT_STREQ(e.what(), "Invalid value for positional parameter at index 0 (COUNT): 'many' is not an int");
        EXPECT_EQ(e.kind(), ParameterError::Kind::TypeConversion);
    }
}

TEST(PositionalTest, NegativeNumbersAreValues) {
    bool v = false;
    std::vector<int> numbers;
    CommandSpec spec("calc");
    spec.addOption(OptionSpec::builder({"-v"}).bind(v));
    spec.addPositional(PositionalSpec::builder().bind(numbers));
    spec.unmatchedArgumentsAllowed();
    const auto result = parse(spec, {"-5", "-v", "-2.5e3", "7"});
    EXPECT_TRUE(v);
    EXPECT_EQ(numbers, (std::vector<int>{-5, 7}));
    EXPECT_EQ(result.unmatched(), Strings{"-2.5e3"});

    std::vector<double> reals;
    CommandSpec other("calc2");
    other.addOption(OptionSpec::builder({"-v"}).bind(v));
    other.addPositional(PositionalSpec::builder().bind(reals));
    (void)parse(other, {"-5", "-2.5e3", "7"});
    EXPECT_EQ(reals, (std::vector<double>{-5.0, -2500.0, 7.0}));
}

TEST(PositionalTest, OptionsMayInterleaveWithPositionals) {
    bool v = false;
    std::vector<std::string> files;
    CommandSpec spec("app");
    spec.addOption(OptionSpec::builder({"-v"}).bind(v));
    spec.addPositional(PositionalSpec::builder().bind(files));
    (void)parse(spec, {"a", "-v", "b"});
    EXPECT_TRUE(v);
    EXPECT_EQ(files, (Strings{"a", "b"}));
}

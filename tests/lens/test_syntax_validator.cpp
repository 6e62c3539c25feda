#include <gtest/gtest.h>
#include <lens/syntax_validator.hpp>

#include <string>
#include <vector>

using namespace lens;

// ============================================================================
// Quotes
// ============================================================================

TEST(SyntaxValidatorTest, BalancedQuotes) {
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo 'test'\n"));
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo \"it's fine\"\n"));
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo 'say \"hi\"'\n"));
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo don\\'t\n"));
}

TEST(SyntaxValidatorTest, UnbalancedQuotes) {
    EXPECT_FALSE(SyntaxValidator::check_quotes("echo 'test\n"));
    EXPECT_FALSE(SyntaxValidator::check_quotes("echo \"test\n"));
    EXPECT_FALSE(SyntaxValidator::check_quotes("echo \"a\\\"\n"));
}

// ============================================================================
// Brackets
// ============================================================================

TEST(SyntaxValidatorTest, BalancedBrackets) {
    EXPECT_TRUE(SyntaxValidator::check_brackets("if [ -f x ]; then f() { :; }; fi\n"));
    EXPECT_TRUE(SyntaxValidator::check_brackets("echo $(( (1 + 2) * 3 ))\n"));
}

TEST(SyntaxValidatorTest, QuotedBracketsAreIgnored) {
    EXPECT_TRUE(SyntaxValidator::check_brackets("echo ')'\n"));
    EXPECT_TRUE(SyntaxValidator::check_brackets("echo \"{[(\"\n"));
    EXPECT_TRUE(SyntaxValidator::check_brackets("echo \\(\n"));
}

TEST(SyntaxValidatorTest, UnbalancedBrackets) {
    EXPECT_FALSE(SyntaxValidator::check_brackets("if [ test {\n"));
    EXPECT_FALSE(SyntaxValidator::check_brackets("((a)\n"));
    EXPECT_FALSE(SyntaxValidator::check_brackets("a]\n"));
}

TEST(SyntaxValidatorTest, CloserBeforeOpenerFails) {
    EXPECT_FALSE(SyntaxValidator::check_brackets(")("));
    EXPECT_FALSE(SyntaxValidator::check_brackets("}{"));
}

TEST(SyntaxValidatorTest, ReferenceExamples) {
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo 'hello world'"));
    EXPECT_FALSE(SyntaxValidator::check_quotes("echo 'hello world"));
    EXPECT_TRUE(SyntaxValidator::check_quotes("echo \"it's fine\""));

    EXPECT_TRUE(SyntaxValidator::check_brackets("if [ test ]; then echo 'ok'; fi"));
    EXPECT_FALSE(SyntaxValidator::check_brackets("if [ test; then echo 'ok'; fi"));
    EXPECT_FALSE(SyntaxValidator::check_brackets("array=(one two three"));
}

// ============================================================================
// Shebang
// ============================================================================

TEST(SyntaxValidatorTest, ShebangChecks) {
    EXPECT_TRUE(SyntaxValidator::check_shebang("#!/bin/bash\n"));
    EXPECT_TRUE(SyntaxValidator::check_shebang("echo no shebang\n"));
    EXPECT_FALSE(SyntaxValidator::check_shebang("#!\necho x\n"));
    EXPECT_FALSE(SyntaxValidator::check_shebang("#!   \necho x\n"));

    const std::string with_nul("#!/bin/\0sh\n", 11);
    EXPECT_FALSE(SyntaxValidator::check_shebang(with_nul));
}

// ============================================================================
// Structure
// ============================================================================

TEST(SyntaxValidatorTest, ShellIfFiBalance) {
    EXPECT_TRUE(SyntaxValidator::check_structure(
        "if [ -f x ]; then\n  echo y\nfi\n", ScriptType::SHELL));
    EXPECT_FALSE(SyntaxValidator::check_structure(
        "if [ -f x ]; then\n  echo y\n", ScriptType::SHELL));
}

TEST(SyntaxValidatorTest, ShellForDoneBalance) {
    EXPECT_TRUE(SyntaxValidator::check_structure(
        "for i in 1 2; do\n  echo $i\ndone\n", ScriptType::SHELL));
    EXPECT_FALSE(SyntaxValidator::check_structure(
        "for i in 1 2; do\n  echo $i\n", ScriptType::SHELL));
}

TEST(SyntaxValidatorTest, ShellOneLineIfIsCountedAsOpenerOnly) {
    // Closers are only recognised on their own line
    EXPECT_FALSE(SyntaxValidator::check_structure(
        "if [ -n \"$x\" ]; then echo y; fi\n", ScriptType::SHELL));
}

TEST(SyntaxValidatorTest, PerlBraces) {
    EXPECT_TRUE(SyntaxValidator::check_structure(
        "sub f {\n  print 1;\n}\n", ScriptType::PERL));
    EXPECT_FALSE(SyntaxValidator::check_structure(
        "sub f {\n  print 1;\n", ScriptType::PERL));
    // Perl brace counting ignores quotes
    EXPECT_FALSE(SyntaxValidator::check_structure("print '}';\n", ScriptType::PERL));
}

TEST(SyntaxValidatorTest, RubyBlocks) {
    EXPECT_TRUE(SyntaxValidator::check_structure(
        "def greet\n  puts 'hi'\nend\n", ScriptType::RUBY));
    EXPECT_TRUE(SyntaxValidator::check_structure(
        "class A\n  def b\n    if c\n      d\n    end\n  end\nend\n", ScriptType::RUBY));
    EXPECT_FALSE(SyntaxValidator::check_structure(
        "def greet\n  puts 'hi'\n", ScriptType::RUBY));
}

TEST(SyntaxValidatorTest, PythonAndUnknownAlwaysPass) {
    EXPECT_TRUE(SyntaxValidator::check_structure("if x:\n", ScriptType::PYTHON));
    EXPECT_TRUE(SyntaxValidator::check_structure("if x\n{\n", ScriptType::UNKNOWN));
}

// ============================================================================
// validate / validate_as
// ============================================================================

TEST(SyntaxValidatorTest, ValidScript) {
    auto result = SyntaxValidator::validate("#!/bin/bash\necho 'test'\n");
    EXPECT_TRUE(result.ok());
}

TEST(SyntaxValidatorTest, UnclosedQuoteIsReported) {
    auto result = SyntaxValidator::validate("#!/bin/bash\necho 'test\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::UNBALANCED_QUOTES);
}

TEST(SyntaxValidatorTest, UnclosedBracketIsReported) {
    auto result = SyntaxValidator::validate("#!/bin/bash\nif [ test {\necho 'test'\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::UNBALANCED_BRACKETS);
}

TEST(SyntaxValidatorTest, EmptyShebangIsReported) {
    auto result = SyntaxValidator::validate("#!\necho hi\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::MALFORMED_SHEBANG);
}

TEST(SyntaxValidatorTest, StructureMismatchIsReported) {
    auto result = SyntaxValidator::validate("#!/bin/sh\nfor f in *; do\n  echo $f\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::STRUCTURAL_MISMATCH);
}

TEST(SyntaxValidatorTest, ValidateAsUsesCallerType) {
    const char* text = "if x\n  y\n";
    EXPECT_TRUE(SyntaxValidator::validate_as(text, ScriptType::UNKNOWN).ok());
    EXPECT_TRUE(SyntaxValidator::validate_as(text, ScriptType::PYTHON).ok());
    EXPECT_EQ(SyntaxValidator::validate_as(text, ScriptType::SHELL).error_code(),
              ErrorCode::STRUCTURAL_MISMATCH);
    EXPECT_EQ(SyntaxValidator::validate_as(text, ScriptType::RUBY).error_code(),
              ErrorCode::STRUCTURAL_MISMATCH);
}

TEST(SyntaxValidatorTest, Deterministic) {
    const char* text = "#!/bin/bash\necho 'a' ( \n";
    EXPECT_EQ(SyntaxValidator::validate(text).error_code(),
              SyntaxValidator::validate(text).error_code());
}

// ============================================================================
// report
// ============================================================================

TEST(SyntaxValidatorTest, ReportCollectsAllFailuresInOrder) {
    auto report = SyntaxValidator::report("#!\necho )\necho 'oops\n");

    EXPECT_EQ(report.type, ScriptType::SHELL);
    EXPECT_FALSE(report.valid());
    EXPECT_FALSE(report.quotes_balanced);
    EXPECT_FALSE(report.brackets_balanced);
    EXPECT_FALSE(report.shebang_well_formed);
    EXPECT_TRUE(report.structure_balanced);

    ASSERT_EQ(report.failures.size(), 3);
    EXPECT_EQ(report.failures[0].code(), ErrorCode::UNBALANCED_QUOTES);
    EXPECT_EQ(report.failures[1].code(), ErrorCode::UNBALANCED_BRACKETS);
    EXPECT_EQ(report.failures[2].code(), ErrorCode::MALFORMED_SHEBANG);
}

TEST(SyntaxValidatorTest, ReportAgreesWithValidate) {
    const std::vector<std::string> scripts = {
        "#!/bin/bash\necho 'test'\n",
        "#!/bin/bash\necho 'test\n",
        "#!/usr/bin/ruby\ndef x\n",
        "#!/usr/bin/perl\nsub a { {\n",
    };

    for (const auto& script : scripts) {
        auto report = SyntaxValidator::report(script);
        auto result = SyntaxValidator::validate(script);
        EXPECT_EQ(report.valid(), result.ok()) << script;
        if (!report.valid()) {
            EXPECT_EQ(report.failures.front().code(), result.error_code()) << script;
        }
    }
}

TEST(SyntaxValidatorTest, PythonBlockIndents) {
    auto report = SyntaxValidator::report(
        "import os\ndef main():\n    if os.name:\n        pass\n");
    EXPECT_EQ(report.type, ScriptType::PYTHON);
    EXPECT_TRUE(report.valid());
    EXPECT_EQ(report.python_block_indents, (std::vector<size_t>{0, 4}));
}

TEST(SyntaxValidatorTest, BlockIndentsSkipComments) {
    auto indents = SyntaxValidator::python_block_indents("# note:\nclass A:\n  x = 1\n");
    EXPECT_EQ(indents, (std::vector<size_t>{0}));
}

#include <gtest/gtest.h>
#include <lens/shebang_parser.hpp>

#include <string>
#include <vector>

using namespace lens;

TEST(ShebangParserTest, InterpreterOnly) {
    auto shebang = ShebangParser::parse("#!/bin/bash\necho 'test'\n");
    ASSERT_TRUE(shebang.has_value());
    EXPECT_EQ(shebang->interpreter, "/bin/bash");
    EXPECT_TRUE(shebang->args.empty());
}

TEST(ShebangParserTest, InterpreterWithArgs) {
    auto shebang = ShebangParser::parse("#!/bin/bash -e -x\necho 'test'\n", 10);
    ASSERT_TRUE(shebang.has_value());
    EXPECT_EQ(shebang->interpreter, "/bin/bash");
    ASSERT_EQ(shebang->args.size(), 2);
    EXPECT_EQ(shebang->args[0], "-e");
    EXPECT_EQ(shebang->args[1], "-x");
}

TEST(ShebangParserTest, ArgumentsAreBounded) {
    auto shebang = ShebangParser::parse("#!/bin/bash -e -x -u\n", 1);
    ASSERT_TRUE(shebang.has_value());
    ASSERT_EQ(shebang->args.size(), 1);
    EXPECT_EQ(shebang->args[0], "-e");

    auto none = ShebangParser::parse("#!/bin/bash -e -x -u\n", 0);
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->args.empty());
}

TEST(ShebangParserTest, EnvStyleKeepsEnvAsInterpreter) {
    auto shebang = ShebangParser::parse("#!/usr/bin/env python3\nprint('test')\n");
    ASSERT_TRUE(shebang.has_value());
    EXPECT_EQ(shebang->interpreter, "/usr/bin/env");
    ASSERT_EQ(shebang->args.size(), 1);
    EXPECT_EQ(shebang->args[0], "python3");
}

TEST(ShebangParserTest, QuotesAreNotInterpreted) {
    auto shebang = ShebangParser::parse("#!/bin/sh -c \"a b\"\n");
    ASSERT_TRUE(shebang.has_value());
    ASSERT_EQ(shebang->args.size(), 3);
    EXPECT_EQ(shebang->args[1], "\"a");
    EXPECT_EQ(shebang->args[2], "b\"");
}

TEST(ShebangParserTest, InterpreterIsFirstToken) {
    const std::vector<std::string> interpreters = {"/bin/sh", "/usr/bin/perl", "ruby", "/opt/x/py"};
    const std::vector<std::string> gaps = {"", " ", "\t", "  \t "};

    for (const auto& interp : interpreters) {
        for (const auto& gap : gaps) {
            std::string text = "#!" + gap + interp + " --flag value\nbody\n";
            auto shebang = ShebangParser::parse(text);
            ASSERT_TRUE(shebang.has_value()) << text;
            EXPECT_EQ(shebang->interpreter, interp) << text;
        }
    }
}

TEST(ShebangParserTest, NoShebang) {
    EXPECT_FALSE(ShebangParser::parse("echo 'no shebang'\n").has_value());
    EXPECT_FALSE(ShebangParser::parse(" #!/bin/sh\n").has_value());
    EXPECT_FALSE(ShebangParser::parse("echo\n#!/bin/sh\n").has_value());
    EXPECT_FALSE(ShebangParser::has_marker("# comment"));
}

TEST(ShebangParserTest, EmptyShebangYieldsNoInterpreter) {
    EXPECT_FALSE(ShebangParser::parse("#!\necho hi\n").has_value());
    EXPECT_FALSE(ShebangParser::parse("#!   \t\n").has_value());
    EXPECT_FALSE(ShebangParser::parse("#!").has_value());
    EXPECT_TRUE(ShebangParser::has_marker("#!"));
}

TEST(ShebangParserTest, InterpreterForFallsBackToSh) {
    EXPECT_EQ(ShebangParser::interpreter_for("#!/usr/bin/perl -w\n"), "/usr/bin/perl");
    EXPECT_EQ(ShebangParser::interpreter_for("echo hi\n"), DEFAULT_INTERPRETER);
    EXPECT_EQ(ShebangParser::interpreter_for("#!\n"), DEFAULT_INTERPRETER);
}

TEST(ShebangParserTest, PlanExecution) {
    auto plan = ShebangParser::plan_execution("#!/bin/bash -e\nmake\n");
    EXPECT_TRUE(plan.from_shebang);
    EXPECT_EQ(plan.interpreter, "/bin/bash");
    ASSERT_EQ(plan.args.size(), 1);
    EXPECT_EQ(plan.args[0], "-e");

    auto fallback = ShebangParser::plan_execution("make install\n");
    EXPECT_FALSE(fallback.from_shebang);
    EXPECT_EQ(fallback.interpreter, "/bin/sh");
    EXPECT_TRUE(fallback.args.empty());
}

TEST(ShebangParserTest, CheckBeforeExec) {
    EXPECT_TRUE(ShebangParser::check_before_exec("#!/bin/sh\nexit 0\n").ok());

    auto missing = ShebangParser::check_before_exec("exit 0\n");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), ErrorCode::MALFORMED_SHEBANG);

    auto empty = ShebangParser::check_before_exec("#!  \nexit 0\n");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error_code(), ErrorCode::MALFORMED_SHEBANG);

    std::string with_nul("#!/bin/\0sh\nexit 0\n", 18);
    auto nul = ShebangParser::check_before_exec(with_nul);
    ASSERT_FALSE(nul.ok());
    EXPECT_EQ(nul.error_code(), ErrorCode::MALFORMED_SHEBANG);

    EXPECT_EQ(ShebangParser::check_before_exec("").error_code(), ErrorCode::INVALID_INPUT);
}

TEST(ShebangParserTest, CheckRunnableRequiresKnownType) {
    const char* script = "#!/bin/sh\nexit 0\n";
    EXPECT_TRUE(ShebangParser::check_runnable(script, ScriptType::SHELL).ok());

    auto unknown = ShebangParser::check_runnable(script, ScriptType::UNKNOWN);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error_code(), ErrorCode::UNSUPPORTED_SCRIPT_TYPE);

    // A known type still needs an interpreter line
    EXPECT_EQ(ShebangParser::check_runnable("exit 0\n", ScriptType::SHELL).error_code(),
              ErrorCode::MALFORMED_SHEBANG);
}

#include <gtest/gtest.h>
#include <lens/script_classifier.hpp>

using namespace lens;

// ============================================================================
// Shebang rules
// ============================================================================

TEST(ScriptClassifierTest, ShebangTakesPriority) {
    EXPECT_EQ(ScriptClassifier::classify("#!/usr/bin/env python3\nprint('x')\n"),
              ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("#!/bin/bash\necho 'test'\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("#!/usr/bin/ruby\nputs 'hello'\nend\n"),
              ScriptType::RUBY);
    EXPECT_EQ(ScriptClassifier::classify("#!/usr/bin/perl -w\nprint \"hi\";\n"),
              ScriptType::PERL);
}

TEST(ScriptClassifierTest, ShebangOverridesContentMarkers) {
    // Python-looking body under a shell interpreter
    EXPECT_EQ(ScriptClassifier::classify("#!/bin/sh\nimport os\ndef f(): pass\n"),
              ScriptType::SHELL);
}

TEST(ScriptClassifierTest, ShebangRuleOrder) {
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!/bin/zsh"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!/bin/sh"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!/usr/bin/env bash"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!/opt/perl5/bin/perl"), ScriptType::PERL);
    EXPECT_EQ(ScriptClassifier::classify_shebang("/usr/bin/python2"), ScriptType::PYTHON);
}

TEST(ScriptClassifierTest, ShebangOnlyReturnsUnknownOnNoMatch) {
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!/usr/bin/node"), ScriptType::UNKNOWN);
    EXPECT_EQ(ScriptClassifier::classify_shebang("#!"), ScriptType::UNKNOWN);
}

TEST(ScriptClassifierTest, UnmatchedShebangFallsThroughToContent) {
    EXPECT_EQ(ScriptClassifier::classify("#!/usr/bin/node\nimport x\ndef y\n"),
              ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("#!/usr/bin/node\nconsole.log(1)\n"),
              ScriptType::SHELL);
}

// ============================================================================
// Content rules
// ============================================================================

TEST(ScriptClassifierTest, PythonMarkers) {
    EXPECT_EQ(ScriptClassifier::classify("import os\ndef main():\n    pass\n"),
              ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("print(42)\n"), ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("from os import path\n"), ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("class Foo:\n    pass\n"), ScriptType::PYTHON);
}

TEST(ScriptClassifierTest, PerlMarkers) {
    EXPECT_EQ(ScriptClassifier::classify("use strict;\nmy $x = 1;\n"), ScriptType::PERL);
    EXPECT_EQ(ScriptClassifier::classify("my $name = shift;\n"), ScriptType::PERL);
    EXPECT_EQ(ScriptClassifier::classify("print \"hi\\n\";\n"), ScriptType::PERL);
}

TEST(ScriptClassifierTest, RubyMarkers) {
    EXPECT_EQ(ScriptClassifier::classify("def greet\n  puts 'hi'\nend\n"), ScriptType::RUBY);
    EXPECT_EQ(ScriptClassifier::classify("puts 'hi'\n"), ScriptType::RUBY);
    EXPECT_EQ(ScriptClassifier::classify("require 'json'\n"), ScriptType::RUBY);
}

TEST(ScriptClassifierTest, ShellMarkers) {
    EXPECT_EQ(ScriptClassifier::classify("echo hello\nls -la\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("if [ -d /tmp ]; then :; fi\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("while true; do sleep 1; done\n"), ScriptType::SHELL);
}

TEST(ScriptClassifierTest, ContentMatchIsCaseInsensitive) {
    EXPECT_EQ(ScriptClassifier::classify("IMPORT sys\nDEF f():\n"), ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::classify("USE STRICT;\n"), ScriptType::PERL);
}

TEST(ScriptClassifierTest, ImportWithoutDefIsNotPython) {
    // "import " alone is not a Python marker; "puts " makes it Ruby
    EXPECT_EQ(ScriptClassifier::classify("import x\nputs 'y'\n"), ScriptType::RUBY);
}

TEST(ScriptClassifierTest, FallbackIsShell) {
    EXPECT_EQ(ScriptClassifier::classify("ls -la\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("make install"), ScriptType::SHELL);
    EXPECT_FALSE(ScriptClassifier::classify_content("make install").has_value());
}

TEST(ScriptClassifierTest, EmptyTextIsUnknown) {
    EXPECT_EQ(ScriptClassifier::classify(""), ScriptType::UNKNOWN);
}

TEST(ScriptClassifierTest, WhitespaceOnlyTextFallsBackToShell) {
    EXPECT_EQ(ScriptClassifier::classify("   \n\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("\n"), ScriptType::SHELL);
    EXPECT_EQ(ScriptClassifier::classify("  \n\t\n"), ScriptType::SHELL);
}

TEST(ScriptClassifierTest, Deterministic) {
    const char* script = "#!/usr/bin/env ruby\nputs 'a'\n";
    EXPECT_EQ(ScriptClassifier::classify(script), ScriptClassifier::classify(script));
}

TEST(ScriptClassifierTest, NamesRoundTrip) {
    EXPECT_STREQ(ScriptClassifier::to_string(ScriptType::PERL), "perl");
    EXPECT_EQ(ScriptClassifier::from_string("Python"), ScriptType::PYTHON);
    EXPECT_EQ(ScriptClassifier::from_string("bash"), ScriptType::SHELL);
    EXPECT_FALSE(ScriptClassifier::from_string("lua").has_value());
}

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser/CodeParser.hpp"
#include "parser/SourceHeuristics.hpp"
#include "utils/Logger.hpp"

using namespace CodeRisk;

class BraceParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Utils::getLogger().setLevel(Utils::LogLevel::ERROR);
    }

    Parser::CodeParser parser;
};

TEST_F(BraceParserTest, JavaScriptFunctionsClassesAndImports) {
    const std::string code =
        "import React from 'react';\n"
        "import { useState } from \"react\";\n"
        "\n"
        "async function load(url, retries = 3) {\n"
        "  if (retries > 0) {\n"
        "    return fetch(url);\n"
        "  }\n"
        "}\n"
        "\n"
        "const add = (a, b) => {\n"
        "  return a + b;\n"
        "};\n"
        "\n"
        "class Widget extends Base {\n"
        "  render() {}\n"
        "}\n";

    const auto result = parser.parse(code, "js");
    EXPECT_EQ(result.language, "javascript");
    EXPECT_TRUE(result.errors.empty());

    const std::vector<std::string> imports = {"react", "react"};
    EXPECT_EQ(result.imports, imports);

    ASSERT_EQ(result.functions.size(), 2u);
    const auto &load = result.functions[0];
    EXPECT_EQ(load.name, "load");
    EXPECT_TRUE(load.isAsync);
    EXPECT_EQ(load.startLine, 4);
    EXPECT_EQ(load.endLine, 8);
    ASSERT_EQ(load.parameters.size(), 2u);
    EXPECT_EQ(load.parameters[0].name, "url");
    EXPECT_EQ(load.parameters[1].name, "retries");
    EXPECT_EQ(load.parameters[1].defaultLiteral, std::string("3"));

    const auto &add = result.functions[1];
    EXPECT_EQ(add.name, "add");
    EXPECT_FALSE(add.isAsync);
    EXPECT_EQ(add.startLine, 10);
    EXPECT_EQ(add.endLine, 12);

    ASSERT_EQ(result.classes.size(), 1u);
    EXPECT_EQ(result.classes[0].name, "Widget");
    EXPECT_EQ(result.classes[0].bases, std::vector<std::string>{"Base"});
    EXPECT_EQ(result.classes[0].startLine, 14);
    EXPECT_EQ(result.classes[0].endLine, 16);

    EXPECT_GT(result.complexityScore, 0.0);
    EXPECT_LE(result.complexityScore, 100.0);
}

TEST_F(BraceParserTest, TypeScriptUsesTheScriptExtractor) {
    const auto result = parser.parse(
        "function greet(name: string, title?: string): string {\n"
        "  return name;\n"
        "}\n",
        "ts");

    EXPECT_EQ(result.language, "typescript");
    ASSERT_EQ(result.functions.size(), 1u);

    const auto &fn = result.functions[0];
    EXPECT_EQ(fn.returnType, std::string("string"));
    ASSERT_EQ(fn.parameters.size(), 2u);
    EXPECT_EQ(fn.parameters[0].name, "name");
    EXPECT_EQ(fn.parameters[0].declaredType, std::string("string"));
    EXPECT_EQ(fn.parameters[1].name, "title");
    EXPECT_EQ(fn.endLine, 3);
}

TEST_F(BraceParserTest, JavaClassesMethodsAndImports) {
    const std::string code =
        "import java.util.List;\n"
        "\n"
        "public class Service extends Base implements Runnable, Closeable {\n"
        "    public void run() {\n"
        "        if (ready) {\n"
        "            work();\n"
        "        }\n"
        "    }\n"
        "\n"
        "    private static int add(int a, int b) {\n"
        "        return a + b;\n"
        "    }\n"
        "}\n";

    const auto result = parser.parse(code, "java");
    EXPECT_EQ(result.language, "java");
    EXPECT_EQ(result.imports, std::vector<std::string>{"java.util.List"});

    ASSERT_EQ(result.classes.size(), 1u);
    const auto &cls = result.classes[0];
    EXPECT_EQ(cls.name, "Service");
    const std::vector<std::string> bases = {"Base", "Runnable", "Closeable"};
    EXPECT_EQ(cls.bases, bases);
    EXPECT_EQ(cls.startLine, 3);
    EXPECT_EQ(cls.endLine, 13);

    ASSERT_EQ(result.functions.size(), 2u);
    EXPECT_EQ(result.functions[0].name, "run");
    EXPECT_EQ(result.functions[0].returnType, std::string("void"));
    EXPECT_TRUE(result.functions[0].parameters.empty());
    EXPECT_EQ(result.functions[0].startLine, 4);
    EXPECT_EQ(result.functions[0].endLine, 8);

    const auto &add = result.functions[1];
    EXPECT_EQ(add.name, "add");
    EXPECT_EQ(add.signature, "int add(int a, int b)");
    EXPECT_EQ(add.startLine, 10);
    EXPECT_EQ(add.endLine, 12);
    ASSERT_EQ(add.parameters.size(), 2u);
    EXPECT_EQ(add.parameters[1].name, "b");
    EXPECT_EQ(add.parameters[1].declaredType, std::string("int"));
    EXPECT_FALSE(add.isMethod);
}

TEST_F(BraceParserTest, UnterminatedBlockRunsToEndOfText) {
    const auto script = parser.parse("function f() {\n  if (x) {\n  y();\n", "javascript");

    ASSERT_EQ(script.functions.size(), 1u);
    EXPECT_EQ(script.functions[0].startLine, 1);
    EXPECT_EQ(script.functions[0].endLine, 4);
    EXPECT_EQ(script.functions[0].body, "{\n  if (x) {\n  y();\n");

    const auto java = parser.parse("public class Open {\n    void run() {\n", "java");

    ASSERT_EQ(java.classes.size(), 1u);
    EXPECT_EQ(java.classes[0].endLine, 3);
    ASSERT_EQ(java.functions.size(), 1u);
    EXPECT_EQ(java.functions[0].startLine, 2);
    EXPECT_EQ(java.functions[0].endLine, 3);
}

TEST_F(BraceParserTest, DeclarationWithoutBraceEndsOnItsOwnLine) {
    const auto result = parser.parse(
        "const h = (a) => a * 2;\n"
        "const g = function (b)\n",
        "javascript");

    ASSERT_EQ(result.functions.size(), 2u);
    EXPECT_EQ(result.functions[0].name, "h");
    EXPECT_EQ(result.functions[0].startLine, 1);
    EXPECT_EQ(result.functions[0].endLine, 1);
    EXPECT_TRUE(result.functions[0].body.empty());

    EXPECT_EQ(result.functions[1].name, "g");
    EXPECT_EQ(result.functions[1].startLine, 2);
    EXPECT_EQ(result.functions[1].endLine, 2);
    EXPECT_TRUE(result.functions[1].body.empty());
}

TEST_F(BraceParserTest, OverlongLinesDoNotHideSurroundingDeclarations) {
    const std::string filler(200000, 'a');

    const auto script = parser.parse(
        "function big() {\n"
        "  const s = '" + filler + "';\n"
        "}\n"
        "function after() {\n"
        "}\n",
        "javascript");

    ASSERT_EQ(script.functions.size(), 2u);
    EXPECT_EQ(script.functions[0].name, "big");
    EXPECT_EQ(script.functions[0].endLine, 3);
    EXPECT_EQ(script.functions[1].name, "after");
    EXPECT_EQ(script.functions[1].startLine, 4);

    const auto java = parser.parse(
        "class Blob {\n"
        "    String s = \"" + filler + "\";\n"
        "    void run() {\n"
        "    }\n"
        "}\n",
        "java");

    ASSERT_EQ(java.classes.size(), 1u);
    EXPECT_EQ(java.classes[0].endLine, 5);
    ASSERT_EQ(java.functions.size(), 1u);
    EXPECT_EQ(java.functions[0].name, "run");
    EXPECT_EQ(java.functions[0].startLine, 3);
    EXPECT_EQ(java.functions[0].endLine, 4);
}

TEST_F(BraceParserTest, HeuristicComplexityCountsKeywords) {
    EXPECT_DOUBLE_EQ(Parser::heuristicComplexity("x"), 2.0);
    EXPECT_DOUBLE_EQ(Parser::heuristicComplexity("if a && b"), 6.0);

    std::string many;
    for (int i = 0; i < 80; ++i)
        many += "if ";
    EXPECT_DOUBLE_EQ(Parser::heuristicComplexity(many), 100.0);
}

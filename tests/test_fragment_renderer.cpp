#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FragmentRenderer.hpp"
#include "ErrorHandler.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sqlquote;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

class FragmentRendererTest : public ::testing::Test {
protected:
    FragmentRenderer rendererFor(FragmentKind kind) {
        RenderOptions options;
        options.kind = kind;
        return FragmentRenderer(options);
    }
};

// Single values
TEST_F(FragmentRendererTest, RenderIdentifier) {
    auto renderer = rendererFor(FragmentKind::Identifier);

    EXPECT_EQ(renderer.render("foo").output, "foo");
    EXPECT_EQ(renderer.render("foo bar").output, "\"foo bar\"");
    EXPECT_EQ(renderer.render("").output, "\"\"");
}

TEST_F(FragmentRendererTest, RenderIdentifierAlwaysQuoted) {
    RenderOptions options;
    options.quoting = IdentifierQuoting::Always;
    FragmentRenderer renderer(options);

    EXPECT_EQ(renderer.render("foo").output, "\"foo\"");
}

TEST_F(FragmentRendererTest, RenderLiteral) {
    auto renderer = rendererFor(FragmentKind::Literal);

    auto fragment = renderer.render("hello 'world' foo");
    EXPECT_EQ(fragment.input, "hello 'world' foo");
    EXPECT_EQ(fragment.output, "'hello ''world'' foo'");
}

TEST_F(FragmentRendererTest, RenderTableWithSchemaOption) {
    RenderOptions options;
    options.kind = FragmentKind::Table;
    options.schema = "foo";
    FragmentRenderer renderer(options);

    EXPECT_EQ(renderer.render("baz").output, "foo.baz");
    // The value is a table name, commas included
    EXPECT_EQ(renderer.render("a,b").output, "foo.\"a,b\"");
}

TEST_F(FragmentRendererTest, RenderTableFromPair) {
    auto renderer = rendererFor(FragmentKind::Table);

    EXPECT_EQ(renderer.render("foo,baz").output, "foo.baz");
    EXPECT_EQ(renderer.render("my schema,t").output, "\"my schema\".t");
    EXPECT_EQ(renderer.render("\"a,b\",c").output, "\"a,b\".c");
    EXPECT_EQ(renderer.render("users").output, "users");
}

TEST_F(FragmentRendererTest, RenderTableRejectsTooManyFields) {
    auto renderer = rendererFor(FragmentKind::Table);

    try {
        renderer.render("a,b,c");
        FAIL() << "expected InputException";
    } catch (const InputException& e) {
        EXPECT_EQ(e.kind(), InputException::Kind::Malformed);
        EXPECT_THAT(e.what(), HasSubstr("3 fields"));
    }
}

TEST_F(FragmentRendererTest, RenderAllAddsValueContext) {
    auto renderer = rendererFor(FragmentKind::Table);

    try {
        renderer.renderAll({"a,b", "x,y,z"});
        FAIL() << "expected InputException";
    } catch (const InputException& e) {
        EXPECT_THAT(e.what(), HasSubstr("value 2"));
    }
}

// Batch output
TEST_F(FragmentRendererTest, TextOutput) {
    auto renderer = rendererFor(FragmentKind::Identifier);
    auto fragments = renderer.renderAll({"id", "full name"});

    EXPECT_EQ(renderer.format(fragments), "id\n\"full name\"\n");
}

TEST_F(FragmentRendererTest, JsonOutput) {
    RenderOptions options;
    options.kind = FragmentKind::Literal;
    options.format = OutputFormat::JSON;
    FragmentRenderer renderer(options);

    auto out = renderer.format(renderer.renderAll({"it's", "x"}));
    auto parsed = nlohmann::json::parse(out);

    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["kind"], "literal");
    EXPECT_EQ(parsed[0]["input"], "it's");
    EXPECT_EQ(parsed[0]["output"], "'it''s'");
    EXPECT_EQ(parsed[1]["output"], "'x'");
}

TEST_F(FragmentRendererTest, JsonPrettyAndCompact) {
    RenderOptions options;
    options.format = OutputFormat::JSON;

    options.pretty = true;
    auto pretty = FragmentRenderer(options).toJSON({RenderedFragment{"a", "a"}});
    EXPECT_THAT(pretty, HasSubstr("\n  "));

    options.pretty = false;
    auto compact = FragmentRenderer(options).toJSON({RenderedFragment{"a", "a"}});
    EXPECT_THAT(compact, Not(HasSubstr("\n  ")));
}

TEST_F(FragmentRendererTest, JsonToleratesInvalidUtf8) {
    RenderOptions options;
    options.format = OutputFormat::JSON;
    FragmentRenderer renderer(options);

    auto fragments = renderer.renderAll({std::string("bad\xff")});
    EXPECT_NO_THROW(renderer.toJSON(fragments));
}

// Input reading
TEST_F(FragmentRendererTest, ReadLines) {
    std::istringstream input("first\r\n\nsecond value\nthird\n");

    EXPECT_THAT(FragmentRenderer::readLines(input),
                ElementsAre("first", "second value", "third"));
}

TEST_F(FragmentRendererTest, ReadFile) {
    auto path = std::filesystem::temp_directory_path() / "sql_quote_renderer_test.txt";
    {
        std::ofstream file(path);
        file << "users\norders\n";
    }

    EXPECT_THAT(FragmentRenderer::readFile(path), ElementsAre("users", "orders"));
    std::filesystem::remove(path);
}

TEST_F(FragmentRendererTest, ReadFileMissing) {
    try {
        FragmentRenderer::readFile("/nonexistent/sql_quote/input.txt");
        FAIL() << "expected InputException";
    } catch (const InputException& e) {
        EXPECT_EQ(e.kind(), InputException::Kind::NotFound);
        EXPECT_EQ(ErrorHandler::exitCodeFor(e), ErrorHandler::ERR_NO_INPUT);
    }
}

// CSV splitting
TEST_F(FragmentRendererTest, SplitCSVLine) {
    EXPECT_THAT(FragmentRenderer::splitCSVLine("a,b"), ElementsAre("a", "b"));
    EXPECT_THAT(FragmentRenderer::splitCSVLine("\"a,b\",c"), ElementsAre("a,b", "c"));
    EXPECT_THAT(FragmentRenderer::splitCSVLine("\"say \"\"hi\"\"\""), ElementsAre("say \"hi\""));
    EXPECT_THAT(FragmentRenderer::splitCSVLine(""), ElementsAre(""));
    EXPECT_THAT(FragmentRenderer::splitCSVLine("a;b", ';'), ElementsAre("a", "b"));
}

TEST_F(FragmentRendererTest, SplitCSVLineUnterminatedQuote) {
    EXPECT_THROW(FragmentRenderer::splitCSVLine("\"open,b"), InputException);
}

// Kind names
TEST_F(FragmentRendererTest, ParseKind) {
    EXPECT_EQ(FragmentRenderer::parseKind("identifier"), FragmentKind::Identifier);
    EXPECT_EQ(FragmentRenderer::parseKind("column"), FragmentKind::Identifier);
    EXPECT_EQ(FragmentRenderer::parseKind("literal"), FragmentKind::Literal);
    EXPECT_EQ(FragmentRenderer::parseKind("table"), FragmentKind::Table);
    EXPECT_FALSE(FragmentRenderer::parseKind("number").has_value());
}

TEST_F(FragmentRendererTest, KindToString) {
    EXPECT_EQ(FragmentRenderer::kindToString(FragmentKind::Identifier), "identifier");
    EXPECT_EQ(FragmentRenderer::kindToString(FragmentKind::Literal), "literal");
    EXPECT_EQ(FragmentRenderer::kindToString(FragmentKind::Table), "table");
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Identifier.hpp"
#include <map>
#include <sstream>
#include <type_traits>

using namespace sqlquote;

template<typename A, typename B, typename = void>
struct IsEqualityComparable : std::false_type {};

template<typename A, typename B>
struct IsEqualityComparable<A, B, std::void_t<decltype(std::declval<A>() == std::declval<B>())>>
    : std::true_type {};

class IdentifierTest : public ::testing::Test {
protected:
    std::vector<std::pair<std::string, std::string>> pairs_ = {
        {"foo", "baz"},
        {"my schema", "my table"},
        {"", ""},
        {"a\"b", "c\"d"},
        {"public", "select"},
        {"s.x", "t.y"},
    };
};

// Rendering
TEST_F(IdentifierTest, ColumnWithSpaceIsQuoted) {
    EXPECT_EQ(Column("foo bar").toString(), "\"foo bar\"");
}

TEST_F(IdentifierTest, ColumnWithQuoteIsDoubled) {
    EXPECT_EQ(Column("a\"b").toString(), "\"a\"\"b\"");
}

TEST_F(IdentifierTest, EmptyColumnIsQuoted) {
    EXPECT_EQ(Column("").toString(), "\"\"");
}

TEST_F(IdentifierTest, PlainColumnIsBare) {
    EXPECT_EQ(Column("blah").toString(), "blah");
    EXPECT_EQ(Table("users").toString(), "users");
    EXPECT_EQ(Schema("public").toString(), "public");
}

TEST_F(IdentifierTest, AlwaysQuoting) {
    EXPECT_EQ(Column("blah").toString(IdentifierQuoting::Always), "\"blah\"");
    EXPECT_EQ(SchemaTable("foo", "baz").toString(IdentifierQuoting::Always),
              "\"foo\".\"baz\"");
}

TEST_F(IdentifierTest, ConstructionFromStringTypes) {
    std::string owned = "owned name";
    std::string_view borrowed = "borrowed";

    EXPECT_EQ(Column(owned).str(), "owned name");
    EXPECT_EQ(Column(std::string("moved")).str(), "moved");
    EXPECT_EQ(Column(borrowed).str(), "borrowed");
    EXPECT_EQ(Column("literal").str(), "literal");
}

TEST_F(IdentifierTest, StrReturnsRawValue) {
    Column column("a\"b c");
    EXPECT_EQ(column.str(), "a\"b c");
}

TEST_F(IdentifierTest, ExplicitStringConversion) {
    EXPECT_EQ(static_cast<std::string>(Column("foo bar")), "\"foo bar\"");
    EXPECT_EQ(static_cast<std::string>(SchemaTable("foo", "baz")), "foo.baz");
}

TEST_F(IdentifierTest, StreamOutput) {
    std::ostringstream out;
    out << "SELECT " << Column("foo bar") << " FROM " << SchemaTable("foo", "baz");
    EXPECT_EQ(out.str(), "SELECT \"foo bar\" FROM foo.baz");
}

TEST_F(IdentifierTest, AsQuotedData) {
    EXPECT_EQ(Column("it's").asQuotedData().toString(), "'it''s'");
    EXPECT_EQ(Table("users").asQuotedData().toString(), "'users'");
}

TEST_F(IdentifierTest, EqualityUsesRawValue) {
    EXPECT_EQ(Column("foo"), Column("foo"));
    EXPECT_NE(Column("foo"), Column("Foo"));
    EXPECT_LT(Column("a"), Column("b"));

    std::map<Column, int> positions;
    positions[Column("b")] = 2;
    positions[Column("a")] = 1;
    EXPECT_EQ(positions.begin()->first.str(), "a");
}

TEST_F(IdentifierTest, NameTypesCompareOnlyWithTheirOwnType) {
    static_assert(IsEqualityComparable<Column, Column>::value);
    static_assert(IsEqualityComparable<Table, Table>::value);
    static_assert(IsEqualityComparable<Schema, Schema>::value);
    static_assert(!IsEqualityComparable<Schema, Column>::value);
    static_assert(!IsEqualityComparable<Column, Table>::value);
    static_assert(!IsEqualityComparable<Table, Schema>::value);

    EXPECT_EQ(Table("orders"), Table("orders"));
    EXPECT_NE(Schema("a"), Schema("b"));
}

// Schema-qualified tables
TEST_F(IdentifierTest, SchemaTableBare) {
    EXPECT_EQ(SchemaTable("foo", "baz").toString(), "foo.baz");
}

TEST_F(IdentifierTest, SchemaTableEscapesEachHalf) {
    EXPECT_EQ(SchemaTable("my schema", "baz").toString(), "\"my schema\".baz");
    EXPECT_EQ(SchemaTable("foo", "a\"b").toString(), "foo.\"a\"\"b\"");
    EXPECT_EQ(SchemaTable("", "").toString(), "\"\".\"\"");
}

TEST_F(IdentifierTest, SchemaTableDotInNameIsQuoted) {
    // A dot inside a name can never act as a separator
    EXPECT_EQ(SchemaTable("a.b", "c").toString(), "\"a.b\".c");
}

TEST_F(IdentifierTest, SchemaTableComposition) {
    for (const auto& [schema, table] : pairs_) {
        for (auto quoting : {IdentifierQuoting::WhenNeeded, IdentifierQuoting::Always}) {
            EXPECT_EQ(SchemaTable(schema, table).toString(quoting),
                      Identifier(schema).toString(quoting) + "." + Identifier(table).toString(quoting));
        }
    }
}

TEST_F(IdentifierTest, SchemaTableGetters) {
    SchemaTable qualified(Schema("foo"), Table("baz"));
    EXPECT_EQ(qualified.schema().str(), "foo");
    EXPECT_EQ(qualified.table().str(), "baz");
}

TEST_F(IdentifierTest, TableWithSchema) {
    EXPECT_EQ(Table("baz").withSchema("foo"), SchemaTable("foo", "baz"));
    EXPECT_EQ(Table("baz").withSchema(Schema("my schema")).toString(), "\"my schema\".baz");
}

TEST_F(IdentifierTest, TablePostfix) {
    EXPECT_EQ(Table("baz").withPostfix("_quix").toString(), "baz_quix");
    EXPECT_EQ(Table("baz").withPostfix(" tmp").toString(), "\"baz tmp\"");
    EXPECT_EQ(Table("baz").withPostfixSep("quix", "_").toString(), "baz_quix");
    EXPECT_EQ(Table("baz").withPostfixSep("quix", "-").toString(), "\"baz-quix\"");
}

TEST_F(IdentifierTest, SchemaTablePostfixAppliesToTable) {
    EXPECT_EQ(SchemaTable("foo", "baz").withPostfix("_quix").toString(), "foo.baz_quix");
    EXPECT_EQ(SchemaTable("foo", "baz").withPostfixSep("quix", "$").toString(), "foo.\"baz$quix\"");
    EXPECT_EQ(SchemaTable("foo", "baz").withPostfix("_quix").schema().str(), "foo");
}

TEST_F(IdentifierTest, SchemaTableAsQuotedData) {
    EXPECT_EQ(SchemaTable("foo", "baz").asQuotedData().toString(), "'foo.baz'");
    EXPECT_EQ(SchemaTable("o'neil", "t").asQuotedData().toString(), "'o''neil.t'");
}

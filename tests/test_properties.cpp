/**
 * @file test_properties.cpp
 * @brief Tests for property sets, the .properties and XML parsers and the structure check
 */

#include <gtest/gtest.h>
#include "stagehand/Properties.hpp"
#include "stagehand/Errors.hpp"
#include "test_support.hpp"

#include <sstream>

using namespace stagehand;

namespace {

Properties parse(const std::string& text) {
    std::istringstream in(text);
    return parse_properties(in);
}

Properties parse_xml(const std::string& text) {
    std::istringstream in(text);
    return parse_xml_properties(in);
}

} // anonymous namespace

// ============================================================================
// Properties container
// ============================================================================

TEST(Properties, KeepsInsertionOrderAndReplacesInPlace) {
    Properties props{{"b", "1"}, {"a", "2"}};
    props.set("b", "3");

    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.entries()[0].first, "b");
    EXPECT_EQ(props.entries()[0].second, "3");
    EXPECT_EQ(props.entries()[1].first, "a");
}

TEST(Properties, AtThrowsForMissingKey) {
    Properties props{{"a", "1"}};
    EXPECT_EQ(props.at("a"), "1");
    EXPECT_THROW(props.at("b"), KeyError);
    EXPECT_FALSE(props.get("b").has_value());
}

TEST(Properties, MergeOverridesExistingKeys) {
    Properties base{{"host", "localhost"}, {"port", "80"}};
    base.merge(Properties{{"port", "8080"}, {"debug", "true"}});

    EXPECT_EQ(base.at("host"), "localhost");
    EXPECT_EQ(base.at("port"), "8080");
    EXPECT_EQ(base.at("debug"), "true");
}

TEST(Properties, FromJsonStringifiesScalars) {
    auto props = Properties::from_json({{"name", "dev"}, {"port", 8080}, {"debug", true}});
    EXPECT_EQ(props.at("name"), "dev");
    EXPECT_EQ(props.at("port"), "8080");
    EXPECT_EQ(props.at("debug"), "true");
}

TEST(Properties, EqualityIgnoresOrder) {
    EXPECT_EQ((Properties{{"a", "1"}, {"b", "2"}}), (Properties{{"b", "2"}, {"a", "1"}}));
    EXPECT_NE((Properties{{"a", "1"}}), (Properties{{"a", "2"}}));
}

// ============================================================================
// .properties parser
// ============================================================================

TEST(ParseProperties, SeparatorsAndComments) {
    auto props = parse(
        "# comment\n"
        "! also a comment\n"
        "\n"
        "a=1\n"
        "b : 2\n"
        "c 3\n"
        "  d=  spaced value\n");

    ASSERT_EQ(props.size(), 4u);
    EXPECT_EQ(props.at("a"), "1");
    EXPECT_EQ(props.at("b"), "2");
    EXPECT_EQ(props.at("c"), "3");
    EXPECT_EQ(props.at("d"), "spaced value");
}

TEST(ParseProperties, LastValueWins) {
    auto props = parse("x=1\ny=2\ny=3\n");
    EXPECT_EQ(props.at("y"), "3");
    EXPECT_EQ(props.size(), 2u);
}

TEST(ParseProperties, LineContinuation) {
    auto props = parse("list=a,\\\n    b,\\\n    c\nnext=1\n");
    EXPECT_EQ(props.at("list"), "a,b,c");
    EXPECT_EQ(props.at("next"), "1");
}

TEST(ParseProperties, EscapedBackslashIsNotContinuation) {
    auto props = parse("path=C:\\\\\nnext=1\n");
    EXPECT_EQ(props.at("path"), "C:\\");
    EXPECT_EQ(props.at("next"), "1");
}

TEST(ParseProperties, Escapes) {
    auto props = parse("key\\ with\\=chars=tab\\there\nunicode=\\u00e9\n");
    EXPECT_EQ(props.at("key with=chars"), "tab\there");
    EXPECT_EQ(props.at("unicode"), "\xC3\xA9");
}

TEST(ParseProperties, MalformedUnicodeEscapeThrows) {
    EXPECT_THROW(parse("bad=\\u12\n"), StagingError);
    EXPECT_THROW(parse("bad=\\u12zz\n"), StagingError);
}

TEST(ParseProperties, WindowsLineEndings) {
    auto props = parse("a=1\r\nb=2\r\n");
    EXPECT_EQ(props.at("a"), "1");
    EXPECT_EQ(props.at("b"), "2");
}

TEST(ParseProperties, EmptyValue) {
    auto props = parse("empty=\nbare\n");
    EXPECT_EQ(props.at("empty"), "");
    EXPECT_EQ(props.at("bare"), "");
}

// ============================================================================
// XML properties
// ============================================================================

TEST(ParseXmlProperties, Entries) {
    auto props = parse_xml(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!DOCTYPE properties SYSTEM \"http://java.sun.com/dtd/properties.dtd\">\n"
        "<properties>\n"
        "  <comment>target</comment>\n"
        "  <entry key=\"a\">1</entry>\n"
        "  <entry key=\"b\"></entry>\n"
        "</properties>\n");

    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props.at("a"), "1");
    EXPECT_EQ(props.at("b"), "");
}

TEST(ParseXmlProperties, RejectsMalformedDocuments) {
    EXPECT_THROW(parse_xml("<properties><entry key=\"a\">1</properties>"), StagingError);
    EXPECT_THROW(parse_xml("<settings/>"), StagingError);
    EXPECT_THROW(parse_xml("<properties><entry>1</entry></properties>"), StagingError);
}

TEST(LoadPropertiesFile, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(load_properties_file(dir / "missing.properties"), FileNotFoundError);

    auto file = dir.create_file("ok.properties", "k=v\n");
    EXPECT_EQ(load_properties_file(file).at("k"), "v");
}

// ============================================================================
// Structure check
// ============================================================================

TEST(CheckStructure, IdenticalKeySets) {
    auto report = check_structure({
        Properties{{"a", "1"}, {"b", "2"}},
        Properties{{"b", "3"}, {"a", "4"}}
    });
    EXPECT_TRUE(report.difference.empty());
    EXPECT_EQ(report.keys, (std::set<std::string>{"a", "b"}));
}

TEST(CheckStructure, ReportsExactDifference) {
    auto report = check_structure({
        Properties{{"a", "1"}, {"b", "2"}},
        Properties{{"a", "1"}, {"c", "3"}}
    });
    EXPECT_EQ(report.difference, (std::set<std::string>{"b", "c"}));
}

TEST(CheckStructure, SupersetKeySetIsInconsistent) {
    // {a,b} and {a,b,c}: c is missing from the first set
    auto report = check_structure({
        Properties{{"a", "1"}, {"b", "2"}},
        Properties{{"a", "1"}, {"b", "2"}, {"c", "3"}}
    });
    EXPECT_EQ(report.difference, (std::set<std::string>{"c"}));
}

TEST(CheckStructure, SingleOrNoSetIsConsistent) {
    EXPECT_TRUE(check_structure({}).difference.empty());
    EXPECT_TRUE(check_structure({Properties{{"a", "1"}}}).difference.empty());
}

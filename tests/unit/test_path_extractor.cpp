#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "input/path_extractor.hpp"

namespace {

using eolfix::input::PathExtractor;
using eolfix::protocol::InputSource;
using Paths = std::vector<std::string>;

TEST(PathExtractorTest, BlankInputYieldsNothing) {
    PathExtractor extractor;
    EXPECT_TRUE(extractor.extract("").empty());
    EXPECT_TRUE(extractor.extract("   ").empty());
    EXPECT_TRUE(extractor.extract("\n\n \t\n\r\n").empty());
    EXPECT_EQ(extractor.extract_detailed("\n  \n").source, InputSource::Empty);
}

TEST(PathExtractorTest, ReadsFilePathFromToolCall) {
    PathExtractor extractor;
    auto result = extractor.extract_detailed(
        R"({"tool_name":"Write","tool_input":{"file_path":"/tmp/a.txt","content":"x"}})");
    EXPECT_EQ(result.source, InputSource::ToolCall);
    EXPECT_EQ(result.paths, Paths({"/tmp/a.txt"}));
}

TEST(PathExtractorTest, KeepsOnlyStringEntriesOfPathsArray) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract(R"({"tool_input":{"paths":["x.txt", 123, null, "y.txt"]}})"),
              Paths({"x.txt", "y.txt"}));
}

TEST(PathExtractorTest, OrdersPathThenFilePathThenPaths) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract(
                  R"({"tool_input":{"paths":["c","d"],"file_path":"b","path":"a"}})"),
              Paths({"a", "b", "c", "d"}));
}

TEST(PathExtractorTest, DropsEmptyStringsAndKeepsDuplicates) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract(
                  R"({"tool_input":{"path":"","file_path":"a","paths":["","a"]}})"),
              Paths({"a", "a"}));
}

TEST(PathExtractorTest, IgnoresNonStringSingleFields) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract(R"({"tool_input":{"path":42,"file_path":["a"],"paths":"b"}})"),
              Paths{});
}

TEST(PathExtractorTest, EmptyToolInputDoesNotFallBackToPlainText) {
    PathExtractor extractor;
    auto result = extractor.extract_detailed(R"({"tool_input":{}})");
    EXPECT_EQ(result.source, InputSource::ToolCall);
    EXPECT_TRUE(result.paths.empty());

    auto empty_paths = extractor.extract_detailed(R"({"tool_input":{"paths":[]}})");
    EXPECT_EQ(empty_paths.source, InputSource::ToolCall);
    EXPECT_TRUE(empty_paths.paths.empty());
}

TEST(PathExtractorTest, ObjectWithoutToolInputFallsBackToPlainText) {
    PathExtractor extractor;
    auto result = extractor.extract_detailed(R"({"other":1})");
    EXPECT_EQ(result.source, InputSource::PlainText);
    EXPECT_EQ(result.paths, Paths({R"({"other":1})"}));

    EXPECT_EQ(extractor.extract(R"({"tool_input":"a.txt"})"),
              Paths({R"({"tool_input":"a.txt"})"}));
}

TEST(PathExtractorTest, MultiLineJsonIsParsed) {
    PathExtractor extractor;
    const std::string raw =
        "\n{\n  \"tool_input\": {\n\n    \"file_path\": \"src/main.cpp\"\n  }\n}\n\n";
    EXPECT_EQ(extractor.extract(raw), Paths({"src/main.cpp"}));
}

TEST(PathExtractorTest, PlainTextDropsBlankLines) {
    PathExtractor extractor;
    auto result = extractor.extract_detailed("a.txt\n\nb.txt\n\n");
    EXPECT_EQ(result.source, InputSource::PlainText);
    EXPECT_EQ(result.paths, Paths({"a.txt", "b.txt"}));
}

TEST(PathExtractorTest, PlainTextTrimsLinesAndCarriageReturns) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract("  a.txt  \r\n\tdir/b.txt\r\n"),
              Paths({"a.txt", "dir/b.txt"}));
}

TEST(PathExtractorTest, InvalidJsonBecomesABarePath) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract("not json"), Paths({"not json"}));
    EXPECT_EQ(extractor.extract(R"({"tool_input":{"file_path":"a")"),
              Paths({R"({"tool_input":{"file_path":"a")"}));
}

TEST(PathExtractorTest, JsonScalarsAndArraysAreNotToolCalls) {
    PathExtractor extractor;
    EXPECT_EQ(extractor.extract("123"), Paths({"123"}));
    EXPECT_EQ(extractor.extract(R"(["a.txt"])"), Paths({R"(["a.txt"])"}));
}

TEST(PathExtractorTest, ParseToolInputRejectsNonObjects) {
    EXPECT_FALSE(PathExtractor::parse_tool_input("[]").has_value());
    EXPECT_FALSE(PathExtractor::parse_tool_input(R"({"tool_input":null})").has_value());

    auto parsed = PathExtractor::parse_tool_input(R"({"tool_input":{"path":"p"}})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->path, "p");
    EXPECT_TRUE(parsed->file_path.empty());
}

}  // namespace

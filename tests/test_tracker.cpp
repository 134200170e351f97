#include <gtest/gtest.h>

#include "partialjson/tracker.hpp"

#include <set>
#include <string>

using namespace partialjson;

class TrackerTest : public ::testing::Test {
protected:
    CompletenessTracker tracker;

    std::set<std::string> analyze(const std::string &text) {
        tracker.analyze(text);
        return tracker.get_complete_paths();
    }
};

TEST_F(TrackerTest, EmptyAndWhitespaceInputHaveNoPaths) {
    EXPECT_TRUE(analyze("").empty());
    EXPECT_FALSE(tracker.is_root_complete());

    EXPECT_TRUE(analyze("   ").empty());
    EXPECT_FALSE(tracker.is_root_complete());

    EXPECT_TRUE(analyze("\n\t\r ").empty());
    EXPECT_FALSE(tracker.is_path_complete(""));
}

TEST_F(TrackerTest, NestedTruncatedObject) {
    tracker.analyze(R"({"name": "Alice", "address": {"city": "NY)");
    EXPECT_FALSE(tracker.is_path_complete(""));
    EXPECT_TRUE(tracker.is_path_complete("name"));
    EXPECT_FALSE(tracker.is_path_complete("address"));
    EXPECT_FALSE(tracker.is_path_complete("address.city"));
    EXPECT_EQ(tracker.get_complete_paths(), std::set<std::string>({"name"}));
}

TEST_F(TrackerTest, CompletedObject) {
    tracker.analyze(R"({"name": "Alice"})");
    EXPECT_TRUE(tracker.is_path_complete(""));
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_TRUE(tracker.is_path_complete("name"));

    EXPECT_EQ(tracker.path_span(""), (Span{0, 17}));
    EXPECT_EQ(tracker.path_span("name"), (Span{9, 16}));
    EXPECT_EQ(tracker.complete_text("name"), std::string_view("\"Alice\""));
}

TEST_F(TrackerTest, ArrayIndices) {
    tracker.analyze(R"({"items": [1, 2, "thr)");
    EXPECT_FALSE(tracker.is_path_complete("items"));
    EXPECT_TRUE(tracker.is_path_complete("items[0]"));
    EXPECT_TRUE(tracker.is_path_complete("items[1]"));
    EXPECT_FALSE(tracker.is_path_complete("items[2]"));
    EXPECT_FALSE(tracker.is_root_complete());
}

TEST_F(TrackerTest, NumberBoundaries) {
    tracker.analyze(R"({"x": 12.)");
    EXPECT_FALSE(tracker.is_path_complete("x")) << "trailing dot has no fraction digit yet";

    tracker.analyze(R"({"x": 12.5})");
    EXPECT_TRUE(tracker.is_path_complete("x"));
    EXPECT_TRUE(tracker.is_root_complete());

    tracker.analyze(R"({"x": 12)");
    EXPECT_TRUE(tracker.is_path_complete("x")) << "end of input terminates a number";
    EXPECT_FALSE(tracker.is_root_complete());
}

TEST_F(TrackerTest, NumberExponentsAndSigns) {
    EXPECT_FALSE(analyze(R"({"x": -)").count("x"));
    EXPECT_FALSE(analyze(R"({"x": 1e)").count("x"));
    EXPECT_FALSE(analyze(R"({"x": 1e+)").count("x"));
    EXPECT_TRUE(analyze(R"({"x": 1e+5})").count("x"));
    EXPECT_TRUE(analyze(R"({"x": 2E10})").count("x"));
    EXPECT_TRUE(analyze("[-0.5E-3]").count("[0]"));
    EXPECT_TRUE(analyze("[0]").count("[0]"));
}

TEST_F(TrackerTest, MalformedNumbersAreIncomplete) {
    EXPECT_FALSE(analyze(R"({"x": 01})").count("x")) << "leading zero followed by a digit";
    EXPECT_FALSE(analyze(R"({"x": 12a})").count("x"));
    EXPECT_FALSE(analyze(R"({"x": -a})").count("x"));
    EXPECT_FALSE(tracker.is_root_complete());
}

TEST_F(TrackerTest, EscapedQuoteInsideString) {
    tracker.analyze(R"({"s": "a\"b"})");
    EXPECT_TRUE(tracker.is_path_complete("s"));
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_EQ(tracker.path_span("s"), (Span{6, 12}));
    EXPECT_EQ(tracker.complete_text("s"), std::string_view(R"("a\"b")"));
}

TEST_F(TrackerTest, TruncatedEscapeIsIncomplete) {
    EXPECT_FALSE(analyze(R"({"s": "abc\)").count("s"));
    EXPECT_FALSE(analyze(R"({"s": "abc\")").count("s"));
}

TEST_F(TrackerTest, EscapeLegalityIsNotChecked) {
    EXPECT_TRUE(analyze(R"({"s": "\q"})").count("s"));
}

TEST_F(TrackerTest, Literals) {
    auto paths = analyze("[true, false, null]");
    EXPECT_EQ(paths, std::set<std::string>({"", "[0]", "[1]", "[2]"}));
    EXPECT_EQ(tracker.path_kind("[0]"), ValueKind::Literal);
    EXPECT_EQ(tracker.path_span("[1]"), (Span{7, 12}));

    EXPECT_TRUE(analyze("[tru").empty());
    EXPECT_TRUE(analyze(R"({"a": nul)").empty());
    EXPECT_TRUE(analyze(R"({"a": f)").empty());
}

TEST_F(TrackerTest, LiteralCompleteEvenWhenFollowedByGarbage) {
    auto paths = analyze("[truex]");
    EXPECT_TRUE(paths.count("[0]"));
    EXPECT_FALSE(tracker.is_root_complete());
}

TEST_F(TrackerTest, MalformedTopLevelIsEmpty) {
    EXPECT_TRUE(analyze(")").empty());
    EXPECT_TRUE(analyze("  x").empty());
    EXPECT_FALSE(tracker.is_root_complete());
}

TEST_F(TrackerTest, StructuralMismatchKeepsScannedMembers) {
    EXPECT_TRUE(analyze(R"({"a" 1})").empty()) << "missing colon";

    auto paths = analyze(R"({"a": 1 x})");
    EXPECT_EQ(paths, std::set<std::string>({"a"}));

    paths = analyze(R"({"a": 1, "b": 2 "c": 3})");
    EXPECT_EQ(paths, std::set<std::string>({"a", "b"}));

    EXPECT_TRUE(analyze(R"({1: 2})").empty()) << "keys must be strings";
}

TEST_F(TrackerTest, TrailingCommasNeverClose) {
    EXPECT_EQ(analyze(R"({"a": 1,})"), std::set<std::string>({"a"}));
    EXPECT_EQ(analyze("[1,]"), std::set<std::string>({"[0]"}));
    EXPECT_EQ(analyze("[1, "), std::set<std::string>({"[0]"}));
    EXPECT_TRUE(analyze("[,1]").empty());
}

TEST_F(TrackerTest, EmptyContainers) {
    EXPECT_EQ(analyze("{}"), std::set<std::string>({""}));
    EXPECT_EQ(analyze("[ ]"), std::set<std::string>({""}));
    EXPECT_EQ(analyze(R"({"a": {}, "b": []})"), std::set<std::string>({"", "a", "b"}));
    EXPECT_EQ(tracker.path_kind("a"), ValueKind::Object);
    EXPECT_EQ(tracker.path_kind("b"), ValueKind::Array);
    EXPECT_TRUE(analyze("{").empty());
    EXPECT_TRUE(analyze("[").empty());
}

TEST_F(TrackerTest, NestedArrayPaths) {
    auto paths = analyze("[[1, 2], [3]]");
    EXPECT_EQ(paths, std::set<std::string>({"", "[0]", "[0][0]", "[0][1]", "[1]", "[1][0]"}));
}

TEST_F(TrackerTest, ObjectsInsideRootArray) {
    auto paths = analyze(R"([{"a": 1}, {"b": [true)");
    EXPECT_EQ(paths, std::set<std::string>({"[0]", "[0].a", "[1].b[0]"}));
}

TEST_F(TrackerTest, DeepDottedPath) {
    tracker.analyze(R"({"user": {"address": {"city": "NY"}}, "id": 7})");
    EXPECT_TRUE(tracker.is_path_complete("user.address.city"));
    EXPECT_TRUE(tracker.is_path_complete("user.address"));
    EXPECT_TRUE(tracker.is_path_complete("user"));
    EXPECT_TRUE(tracker.is_path_complete("id"));
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_FALSE(tracker.is_path_complete("user.city"));
    EXPECT_FALSE(tracker.is_path_complete("missing"));
}

TEST_F(TrackerTest, TopLevelScalars) {
    EXPECT_EQ(analyze(R"("hello")"), std::set<std::string>({""}));
    EXPECT_EQ(tracker.path_kind(""), ValueKind::String);
    EXPECT_EQ(analyze("  42  "), std::set<std::string>({""}));
    EXPECT_EQ(tracker.path_span(""), (Span{2, 4}));
    EXPECT_EQ(analyze("null"), std::set<std::string>({""}));
    EXPECT_TRUE(analyze(R"("hel)").empty());
}

TEST_F(TrackerTest, ContentAfterRootIsIgnored) {
    tracker.analyze(R"({"a": 1} {"b")");
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_EQ(tracker.path_span(""), (Span{0, 8}));
    EXPECT_FALSE(tracker.is_path_complete("b"));
}

TEST_F(TrackerTest, WhitespaceBetweenTokens) {
    const std::string text = "\n{\r\n\t\"a\" :\t1 ,\n \"b\"\t:\n[ 2 ]\n}\n";
    tracker.analyze(text);
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_TRUE(tracker.is_path_complete("a"));
    EXPECT_TRUE(tracker.is_path_complete("b[0]"));
    EXPECT_EQ(tracker.path_span("a")->start, text.find('1'));
    EXPECT_EQ(tracker.path_span("")->start, text.find('{'));
    EXPECT_EQ(tracker.path_span("")->end, text.find('}') + 1);
}

TEST_F(TrackerTest, AnalyzeIsIdempotent) {
    const std::string text = R"({"a": [1, {"b": "c"}], "d": tr)";
    auto first = analyze(text);
    auto second = analyze(text);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, std::set<std::string>({"a", "a[0]", "a[1]", "a[1].b"}));
}

TEST_F(TrackerTest, AnalyzeReplacesPreviousResults) {
    tracker.analyze(R"({"a": 1})");
    EXPECT_TRUE(tracker.is_path_complete("a"));

    tracker.analyze(R"({"b")");
    EXPECT_FALSE(tracker.is_path_complete("a"));
    EXPECT_FALSE(tracker.path_span("a").has_value());
    EXPECT_TRUE(tracker.get_complete_paths().empty());
    EXPECT_EQ(tracker.source(), R"({"b")");
}

TEST_F(TrackerTest, ReturnedPathSetIsACopy) {
    tracker.analyze(R"({"a": 1})");
    auto paths = tracker.get_complete_paths();
    paths.insert("injected");
    paths.erase("a");
    EXPECT_TRUE(tracker.is_path_complete("a"));
    EXPECT_FALSE(tracker.is_path_complete("injected"));
}

TEST_F(TrackerTest, DuplicateKeysKeepLastSpan) {
    tracker.analyze(R"({"a": 1, "a": 22})");
    EXPECT_TRUE(tracker.is_path_complete("a"));
    EXPECT_EQ(tracker.path_span("a"), (Span{14, 16}));
}

TEST_F(TrackerTest, KeysAreRawAndUnescaped) {
    auto paths = analyze(R"({"a\"b": 1, "x.y": 2})");
    EXPECT_TRUE(paths.count(R"(a\"b)"));
    // A dotted key renders the same as a nested path
    EXPECT_TRUE(paths.count("x.y"));
}

TEST_F(TrackerTest, SpansStableAsPrefixGrows) {
    tracker.analyze(R"({"a": [1, 2], "b": )");
    auto before = tracker.path_span("a");
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(*before, (Span{6, 12}));

    tracker.analyze(R"({"a": [1, 2], "b": 3})");
    EXPECT_EQ(tracker.path_span("a"), before);
    EXPECT_TRUE(tracker.is_root_complete());
}

TEST_F(TrackerTest, SegmentQueries) {
    tracker.analyze(R"({"items": [{"id": 1}, {"id": 2)");
    EXPECT_TRUE(tracker.is_path_complete(
        PathSegments{PathSegment::make_key("items"), PathSegment::make_index(0)}));
    EXPECT_TRUE(tracker.is_path_complete(PathSegments{PathSegment::make_key("items"),
                                                      PathSegment::make_index(1),
                                                      PathSegment::make_key("id")}));
    EXPECT_FALSE(tracker.is_path_complete(
        PathSegments{PathSegment::make_key("items"), PathSegment::make_index(1)}));
    EXPECT_FALSE(tracker.is_path_complete(PathSegments{}));
}

TEST_F(TrackerTest, RecordsCoverEveryCompletePath) {
    tracker.analyze(R"({"a": "x", "b": [1, false], "c": {"d": null}})");
    const auto &records = tracker.path_records();
    EXPECT_EQ(records.size(), tracker.get_complete_paths().size());
    EXPECT_EQ(records.at("b[1]").kind, ValueKind::Literal);
    EXPECT_EQ(records.at("b[0]").kind, ValueKind::Number);
    EXPECT_EQ(records.at("c").kind, ValueKind::Object);
    EXPECT_FALSE(tracker.path_kind("nope").has_value());
    EXPECT_FALSE(tracker.complete_text("nope").has_value());
}

TEST_F(TrackerTest, PathSpansMatchRecords) {
    tracker.analyze(R"({"a": [1, 22], "b": "x)");
    auto spans = tracker.path_spans();
    EXPECT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans.at("a"), (Span{6, 13}));
    EXPECT_EQ(spans.at("a[1]"), (Span{10, 12}));
    EXPECT_EQ(spans.count("b"), 0u);
    for (const auto &entry : tracker.path_records())
        EXPECT_EQ(spans.at(entry.first), entry.second.span) << entry.first;

    tracker.analyze("");
    EXPECT_TRUE(tracker.path_spans().empty());
}

TEST_F(TrackerTest, DeepNestingDoesNotRecurse) {
    const size_t depth = 2000;
    std::string open(depth, '[');
    std::string text = open + std::string(depth, ']');

    tracker.analyze(text);
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_EQ(tracker.get_complete_paths().size(), depth);
    EXPECT_TRUE(tracker.is_path_complete("[0][0][0]"));

    tracker.analyze(open);
    EXPECT_TRUE(tracker.get_complete_paths().empty());
}

TEST_F(TrackerTest, EveryPrefixIsHandled) {
    const std::string doc = R"({"name": "Ann", "tags": ["a\"", -1.5e3, true], "n": null})";
    for (size_t len = 0; len < doc.size(); ++len) {
        tracker.analyze(doc.substr(0, len));
        EXPECT_FALSE(tracker.is_root_complete()) << "prefix length " << len;
    }
    tracker.analyze(doc);
    EXPECT_TRUE(tracker.is_root_complete());
    EXPECT_EQ(tracker.get_complete_paths(),
              std::set<std::string>(
                  {"", "name", "tags", "tags[0]", "tags[1]", "tags[2]", "n"}));
}

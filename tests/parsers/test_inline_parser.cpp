#include "clippy/parsers/inline_parser.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace clippy {

namespace {

class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, log, (LogLevel, const std::string&), (override));
};

} // namespace

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class InlineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.logger = &logger_;
    }

    auto parse(std::string_view fragment) -> InlineSequence {
        return parse_inline(fragment, options_);
    }

    NiceMock<MockLogger> logger_;
    InlineParseOptions options_;
};

TEST_F(InlineParserTest, PlainTextIsOneSpan)
{
    auto content = parse("Hello world");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]), (TextSpan{.text = "Hello world", .formatting = {}}));
}

TEST_F(InlineParserTest, FormattingTagsApplyToSubtree)
{
    auto content = parse("Hello <b>bold <i>both</i></b> end");

    ASSERT_EQ(content.size(), 4);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "Hello ");
    EXPECT_EQ(std::get<TextSpan>(content[1]),
              (TextSpan{.text = "bold ", .formatting = {.bold = true}}));
    EXPECT_EQ(std::get<TextSpan>(content[2]),
              (TextSpan{.text = "both", .formatting = {.bold = true, .italic = true}}));
    EXPECT_EQ(std::get<TextSpan>(content[3]).text, " end");
}

TEST_F(InlineParserTest, SynonymTagsShareFormatting)
{
    EXPECT_TRUE(formatting_from_tag("strong").bold);
    EXPECT_TRUE(formatting_from_tag("em").italic);
    EXPECT_TRUE(formatting_from_tag("ins").underline);
    EXPECT_TRUE(formatting_from_tag("del").strikethrough);
    EXPECT_TRUE(formatting_from_tag("kbd").code);
    EXPECT_FALSE(formatting_from_tag("span").any());
}

TEST_F(InlineParserTest, StyleDeclarationsAddFormatting)
{
    auto content = parse("<span style=\"font-weight: 700; font-style: italic\">styled</span>");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).formatting, (Formatting{.bold = true, .italic = true}));
}

TEST_F(InlineParserTest, StyleParsing)
{
    EXPECT_EQ(formatting_from_style("text-decoration: underline line-through !important"),
              (Formatting{.underline = true, .strikethrough = true}));
    EXPECT_TRUE(formatting_from_style("FONT-WEIGHT: Bold").bold);
    EXPECT_TRUE(formatting_from_style("font-weight: 600 !important").bold);
    EXPECT_FALSE(formatting_from_style("font-weight: 400").bold);
    EXPECT_FALSE(formatting_from_style("font-weight: normal").bold);
    EXPECT_TRUE(formatting_from_style("font-style: oblique 10deg").italic);
    EXPECT_FALSE(formatting_from_style("color: red; garbage").any());
}

TEST_F(InlineParserTest, WhitespaceIsCollapsedAndTrimmed)
{
    auto content = parse("  Lots \n\n of   space  ");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "Lots of space");
}

TEST_F(InlineParserTest, PreserveWhitespaceKeepsRawText)
{
    options_.preserve_whitespace = true;

    auto content = parse("a  \n  b");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "a  \n  b");
}

TEST_F(InlineParserTest, BreakElementsBecomeLineBreaks)
{
    auto content = parse("first <br> second");

    ASSERT_EQ(content.size(), 3);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "first");
    EXPECT_TRUE(std::holds_alternative<LineBreak>(content[1]));
    EXPECT_EQ(std::get<TextSpan>(content[2]).text, "second");
}

TEST_F(InlineParserTest, BlockElementsSeparateLines)
{
    auto content = parse("<div>one</div><div>two</div>");

    ASSERT_EQ(content.size(), 3);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "one");
    EXPECT_TRUE(std::holds_alternative<LineBreak>(content[1]));
    EXPECT_EQ(std::get<TextSpan>(content[2]).text, "two");
}

TEST_F(InlineParserTest, LinksKeepUrlAndCollapsedText)
{
    auto content = parse("See <a href=\" https://example.com/docs \"> the\n docs </a>.");

    ASSERT_EQ(content.size(), 3);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "See ");
    EXPECT_EQ(std::get<LinkSpan>(content[1]),
              (LinkSpan{.url = "https://example.com/docs", .text = "the docs", .formatting = {}}));
    EXPECT_EQ(std::get<TextSpan>(content[2]).text, ".");
}

TEST_F(InlineParserTest, LinkInsideBoldCarriesFormatting)
{
    auto content = parse("<b><a href=\"#top\">Top</a></b>");

    ASSERT_EQ(content.size(), 1);
    const auto& link = std::get<LinkSpan>(content[0]);
    EXPECT_EQ(link.url, "#top");
    EXPECT_TRUE(link.formatting.bold);
}

TEST_F(InlineParserTest, EmptyLinkTextFallsBackToUrl)
{
    auto content = parse("<a href=\"https://example.com\"></a>");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<LinkSpan>(content[0]).text, "https://example.com");
}

TEST_F(InlineParserTest, ScriptLinksKeepOnlyTheirText)
{
    EXPECT_CALL(logger_, log(LogLevel::WARNING, HasSubstr("Link URL not allowed")));

    auto content = parse("<a href=\"javascript:alert(1)\">click me</a>");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "click me");
}

TEST_F(InlineParserTest, AnchorWithoutHrefIsText)
{
    EXPECT_CALL(logger_, log(_, _)).Times(0);

    auto content = parse("<a name=\"x\">anchor</a>");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "anchor");
}

TEST_F(InlineParserTest, UrlValidationCanBeDisabled)
{
    options_.validate_urls = false;

    auto content = parse("<a href=\"ftp://files.example.com\">files</a>");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<LinkSpan>(content[0]).url, "ftp://files.example.com");
}

TEST_F(InlineParserTest, ScriptAndStyleAreSkipped)
{
    auto content = parse("a<script>alert(1)</script><style>p{}</style>b<img src=\"x.png\">");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "ab");
}

TEST_F(InlineParserTest, LongSpansAreTruncatedWithWarning)
{
    options_.max_text_length = 5;
    EXPECT_CALL(logger_, log(LogLevel::WARNING, HasSubstr("truncated from 8 to 5")));

    auto content = parse("abcdefgh");

    ASSERT_EQ(content.size(), 1);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "abcde");
}

TEST_F(InlineParserTest, BlankInputIsEmpty)
{
    EXPECT_TRUE(parse("").empty());
    EXPECT_TRUE(parse("   \n ").empty());
    EXPECT_TRUE(parse("<b> </b>").empty());
}

TEST_F(InlineParserTest, OutputHasNoUnmergedSpans)
{
    auto content = parse("a<span>b</span><b>c</b><strong>d</strong>");

    ASSERT_EQ(content.size(), 2);
    EXPECT_EQ(std::get<TextSpan>(content[0]).text, "ab");
    EXPECT_EQ(std::get<TextSpan>(content[1]).text, "cd");
}

} // namespace clippy

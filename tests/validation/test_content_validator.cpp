#include "clippy/validation/content_validator.hpp"
#include "clippy/core/content_ops.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unordered_set>

namespace clippy {

using ::testing::Contains;
using ::testing::HasSubstr;

class ContentValidatorTest : public ::testing::Test {
protected:
    ClippyContent make_valid_content() {
        ListBlock list{.id = "list", .list_type = ListType::BULLETED, .items = {}};
        list.items.emplace_back("item-1", InlineSequence{TextSpan{.text = "first"}});
        list.items.emplace_back("item-2", InlineSequence{LinkSpan{.url = "https://example.com", .text = "site"}});

        ClippyContent content;
        content.blocks.emplace_back(HeadingBlock{.id = "h", .level = 1, .content = {TextSpan{.text = "Title"}}});
        content.blocks.emplace_back(ParagraphBlock{.id = "p", .content = {TextSpan{.text = "Body"}}});
        content.blocks.emplace_back(std::move(list));
        content.blocks.emplace_back(CodeBlock{.id = "c", .content = "x = 1", .language = "python"});
        content.blocks.emplace_back(DividerBlock{.id = "d"});
        content.metadata = ContentMetadata{.source_url = "https://example.com",
                                           .source_domain = "example.com",
                                           .captured_at = "2024-05-01T12:30:00.000Z",
                                           .original_format = OriginalFormat::HTML};
        return content;
    }

    ContentValidator validator_;
};

TEST_F(ContentValidatorTest, ValidContentPasses)
{
    auto result = validator_.validate(make_valid_content());

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ContentValidatorTest, WrongVersionIsAnError)
{
    auto content = make_valid_content();
    content.version = "2.0";

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Unsupported content version: \"2.0\""));
}

TEST_F(ContentValidatorTest, DuplicateBlockIdsAreErrors)
{
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{.id = "same", .content = {TextSpan{.text = "a"}}});
    content.blocks.emplace_back(ParagraphBlock{.id = "same", .content = {TextSpan{.text = "b"}}});

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 1: Duplicate id: same"));
}

TEST_F(ContentValidatorTest, ListItemIdsShareTheIdSpace)
{
    auto content = make_valid_content();
    auto& list = std::get<ListBlock>(content.blocks[2]);
    list.items[1].id = "p";

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 2: Item 1: Duplicate id: p"));
}

TEST_F(ContentValidatorTest, EmptyIdsAreErrors)
{
    ClippyContent content;
    content.blocks.emplace_back(DividerBlock{.id = ""});

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 0: Block id must not be empty"));
}

TEST_F(ContentValidatorTest, HeadingLevelOutOfRange)
{
    ClippyContent content;
    content.blocks.emplace_back(HeadingBlock{.id = "h", .level = 7, .content = {}});

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains(HasSubstr("Heading level 7")));
}

TEST_F(ContentValidatorTest, InvalidListTypeIsAnError)
{
    ClippyContent content;
    content.blocks.emplace_back(ListBlock{.id = "l", .list_type = static_cast<ListType>(9), .items = {}});

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 0: Invalid list type"));
}

TEST_F(ContentValidatorTest, EmptyLinkUrlIsAnError)
{
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{.id = "p", .content = {LinkSpan{.url = "", .text = "x"}}});

    auto result = validator_.validate(content);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 0: Inline 0: Link URL must not be empty"));
}

TEST_F(ContentValidatorTest, SuspiciousUrlsAreWarnings)
{
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{
        .id = "p",
        .content = {LinkSpan{.url = "javascript:alert(1)", .text = "x"},
                    TextSpan{.text = " "},
                    LinkSpan{.url = "https://example.com/" + std::string(3000, 'a'), .text = "y"}}});

    auto result = validator_.validate(content);

    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.warnings, Contains("Block 0: Inline 0: Link URL not allowed: javascript:alert(1)"));
    EXPECT_THAT(result.warnings, Contains("Block 0: Inline 2: Link URL exceeds 2000 characters"));
}

TEST_F(ContentValidatorTest, SizeLimitsAreWarnings)
{
    ContentValidator validator(ContentLimits{.max_blocks = 2,
                                             .max_text_length = 4,
                                             .max_nesting_level = 10,
                                             .max_list_items = 500,
                                             .max_url_length = 2000,
                                             .max_citation_length = 3});
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{.id = "p", .content = {TextSpan{.text = "too long"}}});
    content.blocks.emplace_back(QuoteBlock{.id = "q", .content = {}, .citation = "Someone"});
    content.blocks.emplace_back(CodeBlock{.id = "c", .content = "longer", .language = std::nullopt});

    auto result = validator.validate(content);

    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.warnings, Contains("Content has 3 blocks, more than 2"));
    EXPECT_THAT(result.warnings, Contains("Block 0: Inline 0: Text exceeds 4 characters"));
    EXPECT_THAT(result.warnings, Contains("Block 1: Citation exceeds 3 characters"));
    EXPECT_THAT(result.warnings, Contains("Block 2: Code exceeds 4 characters"));
}

TEST_F(ContentValidatorTest, DeepNestingIsAWarning)
{
    ContentValidator validator(ContentLimits{.max_nesting_level = 2});
    ListBlock level3{.id = "l3"};
    level3.items.emplace_back("i3", InlineSequence{TextSpan{.text = "c"}});
    ListBlock level2{.id = "l2"};
    level2.items.emplace_back("i2", InlineSequence{TextSpan{.text = "b"}}, level3);
    ListBlock level1{.id = "l1"};
    level1.items.emplace_back("i1", InlineSequence{TextSpan{.text = "a"}}, level2);

    ClippyContent content;
    content.blocks.emplace_back(std::move(level1));

    auto result = validator.validate(content);

    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.warnings, Contains(HasSubstr("List nesting depth 3 exceeds 2")));
}

TEST_F(ContentValidatorTest, UnmergedSpansAreAWarning)
{
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{
        .id = "p", .content = {TextSpan{.text = "a"}, TextSpan{.text = "b"}}});

    auto result = validator_.validate(content);

    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.warnings, Contains(HasSubstr("not merged")));
}

TEST_F(ContentValidatorTest, BadTimestampIsAWarning)
{
    auto content = make_valid_content();
    content.metadata->captured_at = "last tuesday";

    auto result = validator_.validate(content);

    EXPECT_TRUE(result.is_valid);
    EXPECT_THAT(result.warnings, Contains(HasSubstr("capturedAt is not an ISO 8601 timestamp")));
}

TEST_F(ContentValidatorTest, MergeCombinesResults)
{
    ValidationResult first;
    first.add_warning("w");
    ValidationResult second;
    second.add_error("e");

    first.merge(second);

    EXPECT_FALSE(first.is_valid);
    EXPECT_EQ(first.errors.size(), 1);
    EXPECT_EQ(first.warnings.size(), 1);
}

TEST_F(ContentValidatorTest, SanitizeTruncatesAndAssignsUniqueIds)
{
    ClippyContent content;
    content.version = "0.9";
    for (int i = 0; i < 1500; ++i) {
        content.blocks.emplace_back(ParagraphBlock{.id = "", .content = {TextSpan{.text = std::to_string(i)}}});
    }

    auto sanitized = validator_.sanitize(content);

    EXPECT_EQ(sanitized.version, "1.0");
    ASSERT_EQ(sanitized.blocks.size(), 1000);
    std::unordered_set<std::string> ids;
    for (const auto& block : sanitized.blocks) {
        EXPECT_FALSE(block_id(block).empty());
        ids.insert(block_id(block));
    }
    EXPECT_EQ(ids.size(), 1000);
    EXPECT_TRUE(validator_.validate(sanitized).is_valid);
    EXPECT_EQ(content.blocks.size(), 1500);
}

TEST_F(ContentValidatorTest, SanitizeSkipsIdsAlreadyInUse)
{
    ClippyContent content;
    content.blocks.emplace_back(ParagraphBlock{.id = "block-sanitized-0", .content = {TextSpan{.text = "a"}}});
    ListBlock list{.id = ""};
    list.items.emplace_back("", InlineSequence{TextSpan{.text = "item"}});
    content.blocks.emplace_back(std::move(list));

    auto sanitized = validator_.sanitize(content);

    const auto& sanitized_list = std::get<ListBlock>(sanitized.blocks[1]);
    EXPECT_EQ(sanitized_list.id, "block-sanitized-1");
    EXPECT_EQ(sanitized_list.items[0].id, "block-sanitized-2");
    EXPECT_TRUE(validator_.validate(sanitized).is_valid);
}

TEST_F(ContentValidatorTest, SanitizeLeavesNestingAlone)
{
    ContentValidator validator(ContentLimits{.max_nesting_level = 1});
    ListBlock inner{.id = "inner"};
    inner.items.emplace_back("b", InlineSequence{TextSpan{.text = "b"}});
    ListBlock outer{.id = "outer"};
    outer.items.emplace_back("a", InlineSequence{TextSpan{.text = "a"}}, inner);
    ClippyContent content;
    content.blocks.emplace_back(outer);

    auto sanitized = validator.sanitize(content);

    EXPECT_EQ(sanitized.blocks, content.blocks);
}

} // namespace clippy

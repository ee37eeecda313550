#include "clippy/wire/json_codec.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace clippy::wire {

using ::testing::Contains;
using ::testing::ElementsAre;

class JsonCodecTest : public ::testing::Test {
protected:
    ClippyContent make_content() {
        ListBlock nested{.id = "inner", .list_type = ListType::NUMBERED, .items = {}};
        nested.items.emplace_back("inner-1", InlineSequence{TextSpan{.text = "deep"}});

        ListBlock list{.id = "list", .list_type = ListType::BULLETED, .items = {}};
        list.items.emplace_back("item-1", InlineSequence{TextSpan{.text = "first"}});
        list.items.back().nested = std::make_unique<ListBlock>(std::move(nested));

        ClippyContent content;
        content.blocks.emplace_back(HeadingBlock{.id = "h", .level = 2, .content = {TextSpan{.text = "Title"}}});
        content.blocks.emplace_back(ParagraphBlock{
            .id = "p",
            .content = {TextSpan{.text = "Hello ", .formatting = {}},
                        TextSpan{.text = "world", .formatting = {.bold = true, .italic = true}},
                        LineBreak{},
                        LinkSpan{.url = "https://example.com", .text = "site", .formatting = {}}}});
        content.blocks.emplace_back(std::move(list));
        content.blocks.emplace_back(QuoteBlock{.id = "q", .content = {TextSpan{.text = "Said"}}, .citation = "Ada"});
        content.blocks.emplace_back(CodeBlock{.id = "c", .content = "x = 1", .language = "python"});
        content.blocks.emplace_back(DividerBlock{.id = "d"});
        content.metadata = ContentMetadata{.source_url = "https://example.com/page",
                                           .source_domain = "example.com",
                                           .captured_at = "2024-05-01T12:30:00.000Z",
                                           .original_format = OriginalFormat::HTML};
        return content;
    }
};

TEST_F(JsonCodecTest, EncodesParagraphWithFormattingOnlyWhenSet)
{
    auto json = content_to_json(make_content());

    EXPECT_EQ(json["version"], "1.0");
    const auto& paragraph = json["blocks"][1];
    EXPECT_EQ(paragraph["id"], "p");
    EXPECT_EQ(paragraph["type"], "paragraph");

    const auto& content = paragraph["content"];
    ASSERT_EQ(content.size(), 4u);
    EXPECT_EQ(content[0], Json({{"type", "text"}, {"text", "Hello "}}));
    EXPECT_EQ(content[1]["formatting"], Json({{"bold", true}, {"italic", true}}));
    EXPECT_EQ(content[2], Json({{"type", "linebreak"}}));
    EXPECT_EQ(content[3], Json({{"type", "link"}, {"url", "https://example.com"}, {"text", "site"}}));
}

TEST_F(JsonCodecTest, EncodesBlockSpecificFields)
{
    auto json = content_to_json(make_content());
    const auto& blocks = json["blocks"];

    EXPECT_EQ(blocks[0]["level"], 2);
    EXPECT_EQ(blocks[2]["listType"], "bulleted");
    EXPECT_EQ(blocks[2]["items"][0]["id"], "item-1");
    EXPECT_EQ(blocks[2]["items"][0]["nested"]["listType"], "numbered");
    EXPECT_EQ(blocks[2]["items"][0]["nested"]["items"][0]["id"], "inner-1");
    EXPECT_EQ(blocks[3]["citation"], "Ada");
    EXPECT_EQ(blocks[4]["content"], "x = 1");
    EXPECT_EQ(blocks[4]["language"], "python");
    EXPECT_EQ(blocks[5], Json({{"id", "d"}, {"type", "divider"}}));
}

TEST_F(JsonCodecTest, EncodesMetadataWithWireNames)
{
    auto json = content_to_json(make_content());

    EXPECT_EQ(json["metadata"], Json({{"sourceUrl", "https://example.com/page"},
                                      {"sourceDomain", "example.com"},
                                      {"capturedAt", "2024-05-01T12:30:00.000Z"},
                                      {"originalFormat", "html"}}));
}

TEST_F(JsonCodecTest, OmitsAbsentOptionalFields)
{
    ClippyContent content;
    content.blocks.emplace_back(CodeBlock{.id = "c", .content = "ls", .language = std::nullopt});
    content.blocks.emplace_back(QuoteBlock{.id = "q", .content = {}, .citation = std::nullopt});

    auto json = content_to_json(content);

    EXPECT_FALSE(json.contains("metadata"));
    EXPECT_FALSE(json["blocks"][0].contains("language"));
    EXPECT_FALSE(json["blocks"][1].contains("citation"));
}

TEST_F(JsonCodecTest, DecodingEncodedContentRestoresIt)
{
    auto original = make_content();

    auto decoded = content_from_json(content_to_json(original));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, original);
}

TEST_F(JsonCodecTest, DecodeSkipsUnknownBlocksAndInlineElements)
{
    auto json = Json::parse(R"({
        "version": "1.0",
        "blocks": [
            {"id": "t", "type": "table", "rows": []},
            "not a block",
            {"id": "p", "type": "paragraph", "content": [
                {"type": "image", "src": "a.png"},
                {"type": "text", "text": "kept"}
            ]}
        ]
    })");

    auto decoded = content_from_json(json);

    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->blocks.size(), 1u);
    const auto& paragraph = std::get<ParagraphBlock>(decoded->blocks[0]);
    EXPECT_EQ(paragraph.id, "p");
    ASSERT_EQ(paragraph.content.size(), 1u);
    EXPECT_EQ(std::get<TextSpan>(paragraph.content[0]).text, "kept");
}

TEST_F(JsonCodecTest, DecodeIgnoresNonBooleanFlags)
{
    auto json = Json::parse(R"({
        "version": "1.0",
        "blocks": [{"id": "p", "type": "paragraph", "content": [
            {"type": "text", "text": "x", "formatting": {"bold": "yes", "italic": true, "glow": true}}
        ]}]
    })");

    auto decoded = content_from_json(json);

    ASSERT_TRUE(decoded.has_value());
    const auto& span = std::get<TextSpan>(std::get<ParagraphBlock>(decoded->blocks[0]).content[0]);
    EXPECT_FALSE(span.formatting.bold);
    EXPECT_TRUE(span.formatting.italic);
}

TEST_F(JsonCodecTest, DecodeRejectsNonObjects)
{
    EXPECT_FALSE(content_from_json(Json::array()).has_value());
    EXPECT_FALSE(content_from_json(Json("text")).has_value());
}

TEST_F(JsonCodecTest, DecodeTextReportsSyntaxErrors)
{
    EXPECT_FALSE(content_from_json_text("{\"version\": ").has_value());

    auto decoded = content_from_json_text(R"({"version": "1.0", "blocks": [{"id": "d", "type": "divider"}]})");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->blocks.size(), 1u);
}

TEST_F(JsonCodecTest, ValidateWireAcceptsEncodedContent)
{
    auto result = validate_wire(content_to_json(make_content()));

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(JsonCodecTest, ValidateWireReportsShapeErrors)
{
    auto json = Json::parse(R"({
        "version": 1,
        "blocks": [
            {"type": "paragraph", "content": [{"type": "text", "text": "x", "formatting": {"bold": 1}}]},
            {"id": "h", "type": "heading", "content": []},
            {"id": "t", "type": "table"},
            {"id": "l", "type": "list", "listType": "dotted", "items": [{"id": "i", "content": [], "nested": 3}]}
        ],
        "metadata": {"originalFormat": "pdf"}
    })");

    auto result = validate_wire(json);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors,
                ElementsAre("Content version must be a string",
                            "Block 0: Missing \"id\"",
                            "Block 0: Inline 0: Formatting flag \"bold\" must be a boolean",
                            "Block 1: Heading level must be an integer",
                            "Block 2: Unknown block type: table",
                            "Block 3: List type must be \"bulleted\" or \"numbered\"",
                            "Block 3: Item 0: Nested list must be an object",
                            "Metadata: Unknown original format: pdf"));
}

TEST_F(JsonCodecTest, ValidateWireRunsTypedValidationOnWellShapedValues)
{
    auto json = Json::parse(R"({
        "version": "2.0",
        "blocks": [{"id": "h", "type": "heading", "level": 9, "content": []}]
    })");

    auto result = validate_wire(json);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Unsupported content version: \"2.0\""));
    EXPECT_THAT(result.errors, Contains("Block 0: Heading level 9 outside 1-6"));
}

TEST_F(JsonCodecTest, UnknownFormattingKeyIsOnlyAWarning)
{
    auto json = Json::parse(R"({
        "version": "1.0",
        "blocks": [{"id": "p", "type": "paragraph", "content": [
            {"type": "text", "text": "x", "formatting": {"bold": true, "sparkle": true}}
        ]}]
    })");

    auto result = validate_wire(json);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_THAT(result.warnings, Contains("Block 0: Inline 0: Unknown formatting key: sparkle"));
}

TEST_F(JsonCodecTest, OversizedHeadingLevelIsNotNarrowed)
{
    auto json = Json::parse(R"({
        "version": "1.0",
        "blocks": [{"id": "h", "type": "heading", "level": 4294967297, "content": []}]
    })");

    auto decoded = content_from_json(json);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<HeadingBlock>(decoded->blocks[0]).level, 0);

    auto result = validate_wire(json);
    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, ElementsAre("Block 0: Heading level 4294967297 outside 1-6"));
}

TEST_F(JsonCodecTest, NegativeHeadingLevelFailsTypedValidation)
{
    auto json = Json::parse(R"({
        "version": "1.0",
        "blocks": [{"id": "h", "type": "heading", "level": -3, "content": []}]
    })");

    auto result = validate_wire(json);

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, Contains("Block 0: Heading level -3 outside 1-6"));
}

TEST_F(JsonCodecTest, ValidateWireRejectsNonObject)
{
    auto result = validate_wire(Json::array());

    EXPECT_FALSE(result.is_valid);
    EXPECT_THAT(result.errors, ElementsAre("Content must be a JSON object"));
}

TEST_F(JsonCodecTest, EncodesDeltaOps)
{
    QuillDelta delta{.ops = {DeltaOp{.insert = "Title", .attributes = {}},
                             DeltaOp{.insert = "\n", .attributes = {{"header", 1}}},
                             DeltaOp{.insert = "bold", .attributes = {{"bold", true}, {"link", std::string("https://x.io")}}}}};

    auto json = delta_to_json(delta);

    EXPECT_EQ(json, Json::parse(R"({"ops": [
        {"insert": "Title"},
        {"insert": "\n", "attributes": {"header": 1}},
        {"insert": "bold", "attributes": {"bold": true, "link": "https://x.io"}}
    ]})"));
}

} // namespace clippy::wire

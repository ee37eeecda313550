#include "clippy/application/clippy_app.hpp"
#include "clippy/platform/platform_registry.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

namespace clippy::app {

namespace {

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_file, (const std::string&), (override));
    MOCK_METHOD(bool, file_exists, (const std::string&), (override));
};

} // namespace

using ::testing::HasSubstr;
using ::testing::Return;

class ClippyAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_filesystem_ = std::make_unique<MockFileSystem>();
        filesystem_ptr_ = mock_filesystem_.get();
    }

    auto run(const std::vector<std::string>& args) -> int {
        std::string error;
        auto config = parse_arguments(args, error);
        EXPECT_TRUE(config.has_value()) << error;
        if (!config) {
            return EXIT_USAGE;
        }
        ClippyApp app(std::move(mock_filesystem_), std::make_unique<BuiltinPlatformRegistry>(), out_, err_);
        return app.run(*config);
    }

    auto given_input(const std::string& path, const std::string& content) -> void {
        EXPECT_CALL(*filesystem_ptr_, read_file(path)).WillOnce(Return(content));
    }

    std::unique_ptr<MockFileSystem> mock_filesystem_;
    MockFileSystem* filesystem_ptr_ = nullptr;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(ClippyAppTest, HelpPrintsUsage)
{
    EXPECT_EQ(run({"--help"}), EXIT_OK);

    EXPECT_THAT(out_.str(), HasSubstr("Usage: clippy"));
}

TEST_F(ClippyAppTest, RendersHtmlByDefault)
{
    given_input("-", "<h2>Title</h2><p>Some <b>bold</b> text</p>");

    EXPECT_EQ(run({}), EXIT_OK);

    EXPECT_EQ(out_.str(), "<h2>Title</h2>\n<p>Some <strong>bold</strong> text</p>\n");
    EXPECT_EQ(err_.str(), "");
}

TEST_F(ClippyAppTest, RendersMarkdownFlavor)
{
    given_input("page.html", "<h2>Title</h2><p>x</p>");

    EXPECT_EQ(run({"-i", "page.html", "-t", "markdown", "-f", "discord"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "**Title**\n\nx\n");
}

TEST_F(ClippyAppTest, PositionalInputFile)
{
    given_input("notes.txt", "first\n\nsecond");

    EXPECT_EQ(run({"--text", "notes.txt", "-t", "text"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "first\n\nsecond\n");
}

TEST_F(ClippyAppTest, RendersForPlatform)
{
    given_input("-", "<h2>Title</h2><p>x</p>");

    EXPECT_EQ(run({"-p", "github"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "## Title\n\nx\n");
}

TEST_F(ClippyAppTest, PlatformIssuesGoToStderr)
{
    given_input("-", "<h2>Title</h2>");

    EXPECT_EQ(run({"--platform", "textarea"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "Title\n");
    EXPECT_THAT(err_.str(), HasSubstr("Warning: Unsupported on Plain Text Area: Block type: heading"));
}

TEST_F(ClippyAppTest, DeltaIsPrintedAsText)
{
    given_input("-", "<p>hello</p>");

    EXPECT_EQ(run({"-t", "delta"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "hello\n\n");
    EXPECT_THAT(err_.str(), HasSubstr("Warning: Quill Delta output printed as its plain text"));
}

TEST_F(ClippyAppTest, ParserWarningsGoToStderr)
{
    given_input("-", "<p><a href=\"javascript:alert(1)\">x</a></p>");

    EXPECT_EQ(run({}), EXIT_OK);

    EXPECT_EQ(out_.str(), "<p>x</p>\n");
    EXPECT_THAT(err_.str(), HasSubstr("Warning: Link URL not allowed"));
}

TEST_F(ClippyAppTest, ValidateReportsSummary)
{
    given_input("-", "<h2>Title</h2><p>x</p>");

    EXPECT_EQ(run({"--validate", "--source-url", "https://Example.com/a"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "Content is valid: 2 blocks, 0 warnings\n");
}

TEST_F(ClippyAppTest, DropEmptyBlocks)
{
    given_input("-", "<p></p><p>x</p>");

    EXPECT_EQ(run({"--drop-empty"}), EXIT_OK);

    EXPECT_EQ(out_.str(), "<p>x</p>\n");
}

TEST_F(ClippyAppTest, UnreadableInputFails)
{
    EXPECT_CALL(*filesystem_ptr_, read_file("missing.html")).WillOnce(Return(std::nullopt));

    EXPECT_EQ(run({"missing.html"}), EXIT_INVALID);

    EXPECT_EQ(err_.str(), "Error: Cannot read input missing.html\n");
    EXPECT_EQ(out_.str(), "");
}

class ParseArgumentsTest : public ::testing::Test {
protected:
    std::string error_;
};

TEST_F(ParseArgumentsTest, Defaults)
{
    auto config = parse_arguments({}, error_);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->input_file, "-");
    EXPECT_FALSE(config->output_format.has_value());
    EXPECT_FALSE(config->platform_id.has_value());
    EXPECT_FALSE(config->validate_only);
}

TEST_F(ParseArgumentsTest, AllOptions)
{
    auto config = parse_arguments({"--input", "a.html", "--to", "md", "--flavor", "slack", "--platform", "slack",
                                   "--source-url", "https://x.example", "--max-nesting", "4", "--drop-empty",
                                   "--validate", "--text"},
                                  error_);

    ASSERT_TRUE(config.has_value()) << error_;
    EXPECT_EQ(config->input_file, "a.html");
    EXPECT_EQ(config->output_format, OutputFormat::MARKDOWN);
    EXPECT_EQ(config->flavor, MarkdownFlavor::SLACK);
    EXPECT_EQ(config->platform_id, "slack");
    EXPECT_EQ(config->source_url, "https://x.example");
    EXPECT_EQ(config->max_nesting, 4);
    EXPECT_TRUE(config->drop_empty);
    EXPECT_TRUE(config->validate_only);
    EXPECT_TRUE(config->plain_text_input);
}

TEST_F(ParseArgumentsTest, RejectsBadValues)
{
    EXPECT_FALSE(parse_arguments({"-t", "pdf"}, error_).has_value());
    EXPECT_EQ(error_, "Unknown output format: pdf");

    EXPECT_FALSE(parse_arguments({"-t", "auto"}, error_).has_value());
    EXPECT_FALSE(parse_arguments({"-f", "reddit"}, error_).has_value());
    EXPECT_EQ(error_, "Unknown markdown flavor: reddit");

    EXPECT_FALSE(parse_arguments({"--max-nesting", "0"}, error_).has_value());
    EXPECT_FALSE(parse_arguments({"--max-nesting", "3x"}, error_).has_value());
}

TEST_F(ParseArgumentsTest, RejectsUnknownOrIncompleteOptions)
{
    EXPECT_FALSE(parse_arguments({"--verbose"}, error_).has_value());
    EXPECT_EQ(error_, "Unknown or incomplete option: --verbose");

    EXPECT_FALSE(parse_arguments({"-t"}, error_).has_value());
    EXPECT_EQ(error_, "Unknown or incomplete option: -t");
}

TEST_F(ParseArgumentsTest, OnlyOneInputFile)
{
    EXPECT_FALSE(parse_arguments({"a.html", "b.html"}, error_).has_value());
    EXPECT_EQ(error_, "Unexpected argument: b.html");

    auto config = parse_arguments({"-"}, error_);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->input_file, "-");
}

} // namespace clippy::app

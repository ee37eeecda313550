#include "clippy/application/clippy_app.hpp"
#include "clippy/core/url_policy.hpp"
#include "clippy/logging/logger.hpp"
#include "clippy/parsers/block_parser.hpp"
#include "clippy/renderers/html_renderer.hpp"
#include "clippy/renderers/plain_text_renderer.hpp"
#include "clippy/renderers/quill_delta_renderer.hpp"
#include "clippy/validation/content_validator.hpp"
#include <sstream>

namespace clippy::app {

namespace {

auto parse_count(const std::string& value) -> std::optional<size_t> {
    try {
        size_t consumed = 0;
        auto count = std::stoul(value, &consumed);
        if (consumed != value.size() || count == 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(count);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto has_value(const std::vector<std::string>& args, size_t i) -> bool {
    return i + 1 < args.size();
}

} // namespace

auto usage() -> std::string {
    std::ostringstream oss;
    oss << "Usage: clippy [options] [file]\n";
    oss << "  -i, --input <file>        Read markup from file (default stdin)\n";
    oss << "      --text                Treat input as plain text\n";
    oss << "  -t, --to <format>         html | markdown | text | delta (default html)\n";
    oss << "  -f, --flavor <flavor>     standard | github | discord | slack\n";
    oss << "  -p, --platform <id>       Check compatibility and render for a platform\n";
    oss << "      --source-url <url>    Record the source URL (domain derived)\n";
    oss << "      --validate            Print the validation report instead of rendering\n";
    oss << "      --max-nesting <n>     List nesting limit while parsing (default 10)\n";
    oss << "      --drop-empty          Drop empty blocks\n";
    oss << "  -h, --help                Show this help\n";
    oss << "\nExamples:\n";
    oss << "  clippy -i page.html -t markdown -f github\n";
    oss << "  xclip -o -t text/html | clippy -p slack\n";
    oss << "  clippy --text notes.txt -t html\n";
    return oss.str();
}

auto parse_arguments(const std::vector<std::string>& args, std::string& error) -> std::optional<Config> {
    Config config;
    bool input_set = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--text") {
            config.plain_text_input = true;
        } else if (arg == "--validate") {
            config.validate_only = true;
        } else if (arg == "--drop-empty") {
            config.drop_empty = true;
        } else if ((arg == "-i" || arg == "--input") && has_value(args, i)) {
            config.input_file = args[++i];
            input_set = true;
        } else if ((arg == "-t" || arg == "--to") && has_value(args, i)) {
            auto format = output_format_from_string(args[++i]);
            if (!format || *format == OutputFormat::AUTO) {
                error = "Unknown output format: " + args[i];
                return std::nullopt;
            }
            config.output_format = format;
        } else if ((arg == "-f" || arg == "--flavor") && has_value(args, i)) {
            config.flavor = markdown_flavor_from_string(args[++i]);
            if (!config.flavor) {
                error = "Unknown markdown flavor: " + args[i];
                return std::nullopt;
            }
        } else if ((arg == "-p" || arg == "--platform") && has_value(args, i)) {
            config.platform_id = args[++i];
        } else if (arg == "--source-url" && has_value(args, i)) {
            config.source_url = args[++i];
        } else if (arg == "--max-nesting" && has_value(args, i)) {
            config.max_nesting = parse_count(args[++i]);
            if (!config.max_nesting) {
                error = "--max-nesting expects a positive number, got: " + args[i];
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            error = "Unknown or incomplete option: " + arg;
            return std::nullopt;
        } else if (!input_set) {
            config.input_file = arg;
            input_set = true;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    return config;
}

ClippyApp::ClippyApp(std::unique_ptr<IFileSystem> filesystem,
                     std::unique_ptr<IPlatformRegistry> registry,
                     std::ostream& out,
                     std::ostream& err)
    : filesystem_(std::move(filesystem)), registry_(std::move(registry)), out_(out), err_(err) {}

auto ClippyApp::run(const Config& config) -> int {
    if (config.show_help) {
        out_ << usage();
        return EXIT_OK;
    }

    auto input = filesystem_->read_file(config.input_file);
    if (!input) {
        err_ << "Error: Cannot read input " << config.input_file << "\n";
        return EXIT_INVALID;
    }

    StreamLogger logger(err_, LogLevel::WARNING);
    auto content = load_content(config, *input, logger);

    if (config.validate_only) {
        return report_validation(content);
    }

    auto output = config.platform_id ? render_for(config, content, logger)
                                     : render_standalone(config, content, logger);
    if (!output.empty()) {
        out_ << output << "\n";
    }
    return EXIT_OK;
}

auto ClippyApp::load_content(const Config& config, const std::string& input, ILogger& logger)
    -> ClippyContent {
    BlockParseOptions options;
    options.source_url = config.source_url;
    if (config.source_url) {
        options.source_domain = url_host(*config.source_url);
    }
    if (config.max_nesting) {
        options.max_nesting_level = *config.max_nesting;
    }
    options.empty_block_policy = config.drop_empty ? EmptyBlockPolicy::DROP : EmptyBlockPolicy::KEEP;
    options.logger = &logger;

    return config.plain_text_input ? parse_text(input, options) : parse_document(input, options);
}

auto ClippyApp::report_validation(const ClippyContent& content) -> int {
    auto result = validate(content);
    for (const auto& error : result.errors) {
        err_ << "Error: " << error << "\n";
    }
    for (const auto& warning : result.warnings) {
        err_ << "Warning: " << warning << "\n";
    }

    if (!result.is_valid) {
        out_ << "Content is invalid: " << result.errors.size() << " errors, "
             << result.warnings.size() << " warnings\n";
        return EXIT_INVALID;
    }
    out_ << "Content is valid: " << content.blocks.size() << " blocks, " << result.warnings.size()
         << " warnings\n";
    return EXIT_OK;
}

auto ClippyApp::render_for(const Config& config, const ClippyContent& content, ILogger& logger)
    -> std::string {
    RenderOptions options;
    options.platform_id = *config.platform_id;
    options.format = config.output_format.value_or(OutputFormat::AUTO);
    options.logger = &logger;

    auto result = render_for_platform(content, options, *registry_);
    for (const auto& warning : result.warnings) {
        logger.warn(warning);
    }
    if (result.format == OutputFormat::DELTA) {
        logger.warn("Quill Delta output for " + result.platform_id + " printed as its plain text");
    }
    return output_text(result);
}

auto ClippyApp::render_standalone(const Config& config, const ClippyContent& content, ILogger& logger)
    -> std::string {
    switch (config.output_format.value_or(OutputFormat::HTML)) {
    case OutputFormat::MARKDOWN: {
        auto markdown_config = markdown_config_for(config.flavor.value_or(MarkdownFlavor::STANDARD));
        markdown_config.logger = &logger;
        return render_markdown(content, markdown_config);
    }
    case OutputFormat::PLAINTEXT:
        return render_plain_text(content);
    case OutputFormat::DELTA:
        logger.warn("Quill Delta output printed as its plain text");
        return delta_plain_text(render_quill_delta(content));
    case OutputFormat::AUTO:
    case OutputFormat::HTML:
        return render_html(content);
    }
    return render_html(content);
}

} // namespace clippy::app
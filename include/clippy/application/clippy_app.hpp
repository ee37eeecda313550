#pragma once

#include "clippy/core/content.hpp"
#include "clippy/interfaces.hpp"
#include "clippy/platform/content_renderer.hpp"
#include "clippy/renderers/markdown_renderer.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace clippy::app {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_INVALID = 1;  // invalid content or I/O failure
inline constexpr int EXIT_USAGE = 2;

struct Config {
    std::string input_file = "-";           // stdin by default
    bool plain_text_input = false;
    std::optional<OutputFormat> output_format;  // html unless a platform picks one
    std::optional<MarkdownFlavor> flavor;
    std::optional<std::string> platform_id;
    std::optional<std::string> source_url;
    bool validate_only = false;
    std::optional<size_t> max_nesting;
    bool drop_empty = false;
    bool show_help = false;
};

// nullopt with `error` set when the arguments are malformed
auto parse_arguments(const std::vector<std::string>& args, std::string& error) -> std::optional<Config>;

auto usage() -> std::string;

class ClippyApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IPlatformRegistry> registry_;
    std::ostream& out_;
    std::ostream& err_;

public:
    ClippyApp(std::unique_ptr<IFileSystem> filesystem,
              std::unique_ptr<IPlatformRegistry> registry,
              std::ostream& out,
              std::ostream& err);

    auto run(const Config& config) -> int;

private:
    auto load_content(const Config& config, const std::string& input, ILogger& logger) -> ClippyContent;
    auto report_validation(const ClippyContent& content) -> int;
    auto render_for(const Config& config, const ClippyContent& content, ILogger& logger) -> std::string;
    auto render_standalone(const Config& config, const ClippyContent& content, ILogger& logger)
        -> std::string;
};

} // namespace clippy::app

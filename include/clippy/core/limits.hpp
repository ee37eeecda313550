#pragma once

#include <cstddef>

namespace clippy {

// Size limits bounding the work done on untrusted captured content
struct ContentLimits {
    size_t max_blocks = 1000;
    size_t max_text_length = 50000;   // bytes per text span or code block
    size_t max_nesting_level = 10;    // outermost list is level 1
    size_t max_list_items = 500;      // soft limit, warning only
    size_t max_url_length = 2000;
    size_t max_citation_length = 500; // soft limit, warning only
};

} // namespace clippy
#pragma once

#include "clippy/interfaces.hpp"
#include <istream>
#include <optional>
#include <string>

namespace clippy {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto file_exists(const std::string& path) -> bool override;

private:
    static auto read_stream(std::istream& in) -> std::optional<std::string>;
};

} // namespace clippy

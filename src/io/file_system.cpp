#include "clippy/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace clippy {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    if (path == "-") {
        return read_stream(std::cin);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return read_stream(file);
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code error;
    return std::filesystem::exists(path, error);
}

auto FileSystem::read_stream(std::istream& in) -> std::optional<std::string> {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace clippy

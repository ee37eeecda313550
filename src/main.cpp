#include "clippy/application/clippy_app.hpp"
#include "clippy/io/file_system.hpp"
#include "clippy/platform/platform_registry.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace clippy;

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;
    auto config = app::parse_arguments(args, error);
    if (!config) {
        std::cerr << "Error: " << error << "\n\n" << app::usage();
        return app::EXIT_USAGE;
    }

    app::ClippyApp application(std::make_unique<FileSystem>(),
                               std::make_unique<BuiltinPlatformRegistry>(),
                               std::cout,
                               std::cerr);
    return application.run(*config);
}

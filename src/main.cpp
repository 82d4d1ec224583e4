#include "textnorm/application/command_line.hpp"
#include "textnorm/application/textnorm_app.hpp"
#include "textnorm/io/file_system.hpp"
#include "textnorm/vcs/git_repository.hpp"

#include <exception>
#include <iostream>
#include <memory>

auto main(int argc, char* argv[]) -> int {
    auto parsed = textnorm::parse_args(argc, argv);

    if (parsed.error) {
        std::cerr << "Error: " << *parsed.error << "\n\n" << textnorm::usage_text();
        return textnorm::kExitEnvironment;
    }
    if (parsed.show_help) {
        std::cout << textnorm::usage_text();
        return textnorm::kExitOk;
    }

    try {
        textnorm::TextnormApp app(std::make_unique<textnorm::GitRepository>(),
                                  std::make_unique<textnorm::FileSystem>());
        return app.run(parsed.config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return textnorm::kExitEnvironment;
    }
}

#include "textnorm/vcs/git_repository.hpp"
#include "textnorm/io/process.hpp"
#include <utility>

namespace textnorm {

GitRepository::GitRepository(std::string git_executable) : git_(std::move(git_executable)) {}

auto GitRepository::find_root(const std::filesystem::path& start)
    -> std::optional<std::filesystem::path> {
    auto result = run_process({git_, "-C", start.string(), "rev-parse", "--show-toplevel"});
    if (!result || result->exit_code != 0) {
        return std::nullopt;
    }

    auto root = result->standard_output;
    while (!root.empty() && (root.back() == '\n' || root.back() == '\r')) {
        root.pop_back();
    }
    if (root.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(root);
}

auto GitRepository::list_files(const std::filesystem::path& root, bool staged_only)
    -> std::optional<std::vector<std::filesystem::path>> {
    std::vector<std::string> command{git_, "-C", root.string()};
    if (staged_only) {
        // Deleted entries have nothing left to normalize
        command.insert(command.end(),
                       {"diff", "--cached", "--name-only", "--diff-filter=ACMR", "-z"});
    } else {
        command.insert(command.end(), {"ls-files", "-z"});
    }

    auto result = run_process(command);
    if (!result || result->exit_code != 0) {
        return std::nullopt;
    }
    return split_nul_separated(result->standard_output);
}

auto GitRepository::restage(const std::filesystem::path& root,
                            const std::filesystem::path& relative_path) -> bool {
    auto result = run_process({git_, "-C", root.string(), "add", "--", relative_path.string()});
    return result && result->exit_code == 0;
}

auto GitRepository::split_nul_separated(std::string_view output)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string_view::npos) {
            end = output.size();
        }
        if (end > start) {
            paths.emplace_back(std::string(output.substr(start, end - start)));
        }
        start = end + 1;
    }

    return paths;
}

} // namespace textnorm

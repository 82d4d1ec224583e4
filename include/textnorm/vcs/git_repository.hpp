#pragma once

#include "textnorm/interfaces.hpp"
#include <string>
#include <string_view>

namespace textnorm {

// IVersionControl backed by the git executable. Every command runs with
// -C <dir>, so the process working directory is never changed.
class GitRepository : public IVersionControl {
public:
    explicit GitRepository(std::string git_executable = "git");

    auto find_root(const std::filesystem::path& start)
        -> std::optional<std::filesystem::path> override;
    auto list_files(const std::filesystem::path& root, bool staged_only)
        -> std::optional<std::vector<std::filesystem::path>> override;
    auto restage(const std::filesystem::path& root, const std::filesystem::path& relative_path)
        -> bool override;

    // NUL-separated "-z" output to paths; empty entries are dropped
    static auto split_nul_separated(std::string_view output) -> std::vector<std::filesystem::path>;

private:
    std::string git_;
};

} // namespace textnorm

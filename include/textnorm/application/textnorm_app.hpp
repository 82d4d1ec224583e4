#pragma once

#include "textnorm/core/file_processor.hpp"
#include "textnorm/interfaces.hpp"
#include "textnorm/types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace textnorm {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitPending = 1;      // check found changes, or some file failed
inline constexpr int kExitEnvironment = 2;  // no repository, listing failed, bad options

struct Config {
    std::filesystem::path start_directory = ".";
    bool check = false;
    bool staged = false;
    bool restage = false;
    std::optional<std::string> recode_from;
    bool aggressive_tabs = false;
    bool keep_tabs = false;
    size_t indent_size = 4;
    bool quiet = false;
};

auto make_processor_options(const Config& config) -> ProcessorOptions;

class TextnormApp {
private:
    std::unique_ptr<IVersionControl> vcs_;
    std::unique_ptr<IFileSystem> filesystem_;

public:
    TextnormApp(std::unique_ptr<IVersionControl> vcs, std::unique_ptr<IFileSystem> filesystem);

    auto run(const Config& config) -> int;

    // Summary of the last run()
    auto summary() const -> const RunSummary& { return summary_; }

private:
    RunSummary summary_;

    auto process_all(const std::filesystem::path& root,
                     const std::vector<std::filesystem::path>& files, const Config& config) -> void;
    auto report(const std::filesystem::path& relative_path, const ProcessingOutcome& outcome,
                const Config& config) -> void;
    auto exit_code(const Config& config) const -> int;
};

// Entries under .git/ are never touched
auto is_inside_git_dir(const std::filesystem::path& relative_path) -> bool;

} // namespace textnorm

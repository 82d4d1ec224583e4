#include "textnorm/application/textnorm_app.hpp"
#include "textnorm/codec/decoder.hpp"
#include "textnorm/ui/report.hpp"
#include <cstdio>
#include <iostream>
#include <unistd.h>
#include <utility>

namespace textnorm {

auto make_processor_options(const Config& config) -> ProcessorOptions {
    return ProcessorOptions{
        .normalization = NormalizationConfig{.indent_size = config.indent_size,
                                             .convert_tabs = !config.keep_tabs,
                                             .tab_mode = config.aggressive_tabs ? TabMode::AGGRESSIVE
                                                                                : TabMode::LEADING,
                                             .keep_tabs = false},
        .legacy_encoding = config.recode_from,
        .mode = config.check ? ProcessMode::CHECK : ProcessMode::WRITE};
}

auto is_inside_git_dir(const std::filesystem::path& relative_path) -> bool {
    auto it = relative_path.begin();
    return it != relative_path.end() && *it == ".git";
}

TextnormApp::TextnormApp(std::unique_ptr<IVersionControl> vcs,
                         std::unique_ptr<IFileSystem> filesystem)
    : vcs_(std::move(vcs)), filesystem_(std::move(filesystem)) {}

auto TextnormApp::run(const Config& config) -> int {
    summary_ = RunSummary{};

    if (config.recode_from && !decoder::is_encoding_supported(*config.recode_from)) {
        std::cerr << "Error: unknown encoding '" << *config.recode_from << "'\n";
        return kExitEnvironment;
    }

    auto root = vcs_->find_root(config.start_directory);
    if (!root) {
        std::cerr << "Error: not inside a Git repository.\n";
        return kExitEnvironment;
    }

    auto files = vcs_->list_files(*root, config.staged);
    if (!files) {
        std::cerr << "Error: could not list " << (config.staged ? "staged" : "tracked")
                  << " files in " << root->string() << "\n";
        return kExitEnvironment;
    }

    if (config.restage && config.check) {
        std::cerr << "Warning: --restage has no effect with --check\n";
    }

    if (files->empty()) {
        return kExitOk;
    }

    process_all(*root, *files, config);

    if (!config.quiet) {
        const bool use_color = isatty(fileno(stdout)) != 0;
        std::cout << render_summary(summary_, config.check ? ProcessMode::CHECK : ProcessMode::WRITE,
                                    use_color)
                  << "\n";
    }

    return exit_code(config);
}

auto TextnormApp::process_all(const std::filesystem::path& root,
                              const std::vector<std::filesystem::path>& files, const Config& config)
    -> void {
    FileProcessor processor(*filesystem_, make_processor_options(config));

    for (const auto& relative_path : files) {
        if (is_inside_git_dir(relative_path)) {
            continue;
        }

        auto outcome = processor.process(root / relative_path);

        // Only files that were actually rewritten go back into the index
        const auto* changed = std::get_if<Changed>(&outcome);
        if (config.restage && changed && changed->written
            && !vcs_->restage(root, relative_path)) {
            outcome = WriteFailed{.message = "rewritten but could not be re-staged"};
        }

        summary_.record(outcome);
        report(relative_path, outcome, config);
    }
}

auto TextnormApp::report(const std::filesystem::path& relative_path,
                         const ProcessingOutcome& outcome, const Config& config) -> void {
    auto line = format_outcome(relative_path, outcome, config.recode_from);
    if (!line || (line->is_skip && config.quiet)) {
        return;
    }

    if (line->is_error) {
        std::cerr << line->text << "\n";
    } else {
        std::cout << line->text << "\n";
    }
}

auto TextnormApp::exit_code(const Config& config) const -> int {
    if (summary_.failed > 0) {
        return kExitPending;
    }
    if (config.check && summary_.changed > 0) {
        return kExitPending;
    }
    return kExitOk;
}

} // namespace textnorm

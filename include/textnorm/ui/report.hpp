#pragma once

#include "textnorm/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace textnorm {

struct StatusLine {
    std::string text;
    bool is_error{};  // goes to stderr
    bool is_skip{};   // hidden by --quiet
};

// One line per outcome other than Unchanged, e.g. "NEEDS-FIX src/a.c"
auto format_outcome(const std::filesystem::path& path, const ProcessingOutcome& outcome,
                    const std::optional<std::string>& legacy_encoding) -> std::optional<StatusLine>;

// End-of-run counters as a bordered FTXUI panel
auto render_summary(const RunSummary& summary, ProcessMode mode, bool use_color) -> std::string;

} // namespace textnorm

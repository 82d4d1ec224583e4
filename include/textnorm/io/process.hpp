#pragma once

#include <optional>
#include <string>
#include <vector>

namespace textnorm {

struct ProcessResult {
    int exit_code{};
    std::string standard_output;
};

// Runs argv[0] found on PATH, no shell involved. stderr is inherited.
// nullopt when the process could not be started or waited for.
auto run_process(const std::vector<std::string>& argv) -> std::optional<ProcessResult>;

} // namespace textnorm

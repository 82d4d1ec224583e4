#pragma once

#include "textnorm/application/textnorm_app.hpp"
#include <optional>
#include <string>

namespace textnorm {

struct ParseResult {
    Config config;
    bool show_help = false;
    std::optional<std::string> error;
};

auto parse_args(int argc, const char* const argv[]) -> ParseResult;

auto usage_text() -> std::string;

} // namespace textnorm

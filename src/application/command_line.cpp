#include "textnorm/application/command_line.hpp"
#include <charconv>
#include <system_error>
#include <string_view>

namespace textnorm {

namespace {

auto parse_positive(std::string_view value) -> std::optional<size_t> {
    size_t parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || end != value.data() + value.size() || parsed == 0) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

auto parse_args(int argc, const char* const argv[]) -> ParseResult {
    ParseResult result;
    auto& config = result.config;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Options taking a value accept both "--opt value" and "--opt=value"
        auto take_value = [&](std::string_view name) -> std::optional<std::string> {
            if (arg == name) {
                if (i + 1 >= argc) {
                    result.error = std::string(name) + " requires a value";
                    return std::nullopt;
                }
                return std::string(argv[++i]);
            }
            return std::string(arg.substr(name.size() + 1));
        };
        auto matches = [&arg](std::string_view name) {
            return arg == name || (arg.size() > name.size() && arg.substr(0, name.size()) == name
                                   && arg[name.size()] == '=');
        };

        if (arg == "--check") {
            config.check = true;
        } else if (arg == "--staged") {
            config.staged = true;
        } else if (arg == "--restage") {
            config.restage = true;
        } else if (arg == "--aggressive-tabs") {
            config.aggressive_tabs = true;
        } else if (arg == "--keep-tabs") {
            config.keep_tabs = true;
        } else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            result.show_help = true;
        } else if (matches("--recode-from")) {
            auto value = take_value("--recode-from");
            if (!value) {
                return result;
            }
            if (value->empty()) {
                result.error = "--recode-from requires an encoding name";
                return result;
            }
            config.recode_from = *value;
        } else if (matches("--indent-size")) {
            auto value = take_value("--indent-size");
            if (!value) {
                return result;
            }
            auto size = parse_positive(*value);
            if (!size) {
                result.error = "--indent-size must be a positive integer, got '" + *value + "'";
                return result;
            }
            config.indent_size = *size;
        } else if (arg == "-C") {
            if (i + 1 >= argc) {
                result.error = "-C requires a directory";
                return result;
            }
            config.start_directory = argv[++i];
        } else {
            result.error = "unrecognized argument: " + std::string(arg);
            return result;
        }
    }

    return result;
}

auto usage_text() -> std::string {
    return "Usage: textnorm [options]\n"
           "Normalize tracked text files: UTF-8, LF newlines, no trailing whitespace,\n"
           "one final newline, spaces instead of indentation tabs.\n"
           "\n"
           "      --check              Dry run; exit 1 if any file would change\n"
           "      --staged             Only process files staged for commit\n"
           "      --restage            Re-stage files that were rewritten\n"
           "      --recode-from ENC    Recode non-UTF-8 files from ENC (e.g. cp1251)\n"
           "      --aggressive-tabs    Replace every tab, not only leading ones\n"
           "      --keep-tabs          Do not convert tabs at all\n"
           "      --indent-size N      Spaces per tab (default 4)\n"
           "  -C DIR                   Start repository discovery in DIR\n"
           "  -q, --quiet              Hide skipped files and the summary\n"
           "  -h, --help               Show this help\n"
           "\n"
           "Makefile, makefile, GNUmakefile, *.mk and *.mak always keep their tabs.\n"
           "\n"
           "Examples:\n"
           "  textnorm --check                   # CI gate\n"
           "  textnorm --staged --restage        # pre-commit hook\n"
           "  textnorm --recode-from cp1251      # convert legacy files to UTF-8\n";
}

} // namespace textnorm

#include "textnorm/core/normalizer.hpp"

namespace textnorm::normalizer {

namespace {

auto expand(std::string_view segment, size_t indent_size) -> std::string {
    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (c == '\t') {
            out.append(indent_size, ' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

auto normalize(std::string_view text, const NormalizationConfig& config) -> std::string {
    // 1. Newlines first so every later step sees logical lines only
    auto unified = unify_newlines(text);
    auto lines = split_lines(unified);

    std::string result;
    result.reserve(unified.size() + 1);

    for (size_t i = 0; i < lines.size(); ++i) {
        // 2. Tabs before trimming: expansion can create new trailing spaces
        auto converted = convert_tabs(lines[i], config);

        // 3. Trailing whitespace
        auto trimmed = trim_trailing_whitespace(converted, config.keep_tabs);

        if (i > 0) {
            result.push_back('\n');
        }
        result.append(trimmed);
    }

    // 4. Exactly one final newline; blank lines before it are left alone
    if (result.empty() || result.back() != '\n') {
        result.push_back('\n');
    }

    return result;
}

auto unify_newlines(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }

    return out;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;

    size_t start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}

auto convert_tabs(std::string_view line, const NormalizationConfig& config) -> std::string {
    if (!config.convert_tabs || config.keep_tabs) {
        return std::string(line);
    }

    if (config.tab_mode == TabMode::AGGRESSIVE) {
        return expand(line, config.indent_size);
    }

    // Leading run only; a whitespace-only line is leading in its entirety
    auto first_non_space = line.find_first_not_of(" \t");
    if (first_non_space == std::string_view::npos) {
        first_non_space = line.size();
    }

    auto out = expand(line.substr(0, first_non_space), config.indent_size);
    out.append(line.substr(first_non_space));
    return out;
}

auto trim_trailing_whitespace(std::string_view line, bool keep_tabs) -> std::string_view {
    auto last = line.find_last_not_of(keep_tabs ? " " : " \t");
    if (last == std::string_view::npos) {
        return line.substr(0, 0);
    }
    return line.substr(0, last + 1);
}

} // namespace textnorm::normalizer

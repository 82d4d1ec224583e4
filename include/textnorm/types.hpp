#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace textnorm {

// Result of looking at a file name and its first bytes
struct ClassificationResult {
    bool is_text{};           // Eligible for any processing
    bool is_tab_sensitive{};  // Literal tabs carry meaning (Makefiles)

    auto operator==(const ClassificationResult& other) const -> bool = default;
};

// Which tabs the normalizer expands
enum class TabMode {
    LEADING,     // Only inside the leading whitespace run
    AGGRESSIVE   // Every tab on the line
};

struct NormalizationConfig {
    size_t indent_size = 4;
    bool convert_tabs = true;
    TabMode tab_mode = TabMode::LEADING;
    bool keep_tabs = false;  // Tab-sensitive override, wins over everything else
};

enum class ProcessMode {
    CHECK,  // Report only, never write
    WRITE
};

enum class SourceEncoding {
    CANONICAL,  // Already UTF-8 (a BOM may have been stripped)
    RECODED     // Converted from the legacy fallback encoding
};

struct DecodedText {
    std::string utf8;
    SourceEncoding encoding = SourceEncoding::CANONICAL;
};

struct DecodeFailure {
    std::string detail;
};

using DecodeResult = std::variant<DecodedText, DecodeFailure>;

enum class SkipReason {
    UNREADABLE,
    BINARY_EXTENSION,
    BINARY_CONTENT,
    UNDECODABLE
};

// Per-file outcomes. Exactly one of these is produced for every path.
struct Unchanged {};

struct Changed {
    bool written{};  // false in check mode
    bool recoded{};
};

struct Skipped {
    SkipReason reason{};
};

struct WriteFailed {
    std::string message;
};

using ProcessingOutcome = std::variant<Unchanged, Changed, Skipped, WriteFailed>;

// Aggregated counters for one run
struct RunSummary {
    size_t files_seen{};
    size_t unchanged{};
    size_t changed{};
    size_t recoded{};
    size_t skipped_unreadable{};
    size_t skipped_binary{};
    size_t skipped_undecodable{};
    size_t failed{};

    auto record(const ProcessingOutcome& outcome) -> void;
    auto skipped() const -> size_t;
};

auto skip_reason_name(SkipReason reason) -> std::string;

} // namespace textnorm

#pragma once

#include "textnorm/interfaces.hpp"
#include "textnorm/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace textnorm {

struct ProcessorOptions {
    NormalizationConfig normalization;
    std::optional<std::string> legacy_encoding;
    ProcessMode mode = ProcessMode::WRITE;
};

// Read -> classify -> decode -> normalize -> compare -> (write).
// At most one read and one write per call; nothing is written in check mode
// or when the normalized bytes equal the original.
class FileProcessor {
public:
    FileProcessor(IFileSystem& filesystem, ProcessorOptions options);

    auto process(const std::filesystem::path& path) const -> ProcessingOutcome;

    // Pure part of process(): the bytes the file should hold, or why it is skipped
    auto normalized_bytes(const std::filesystem::path& path, std::string_view raw) const
        -> std::variant<DecodedText, Skipped>;

    auto options() const -> const ProcessorOptions& { return options_; }

private:
    IFileSystem& filesystem_;
    ProcessorOptions options_;
};

} // namespace textnorm

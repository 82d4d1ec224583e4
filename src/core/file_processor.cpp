#include "textnorm/core/file_processor.hpp"
#include "textnorm/codec/decoder.hpp"
#include "textnorm/core/classifier.hpp"
#include "textnorm/core/normalizer.hpp"
#include <utility>

namespace textnorm {

FileProcessor::FileProcessor(IFileSystem& filesystem, ProcessorOptions options)
    : filesystem_(filesystem), options_(std::move(options)) {}

auto FileProcessor::process(const std::filesystem::path& path) const -> ProcessingOutcome {
    auto raw = filesystem_.read_bytes(path);
    if (!raw) {
        return Skipped{.reason = SkipReason::UNREADABLE};
    }

    auto normalized = normalized_bytes(path, *raw);
    if (auto* skipped = std::get_if<Skipped>(&normalized)) {
        return *skipped;
    }

    const auto& text = std::get<DecodedText>(normalized);
    const bool recoded = text.encoding == SourceEncoding::RECODED;

    // Output is UTF-8 already, so the encoded form is the text itself
    if (text.utf8 == *raw) {
        return Unchanged{};
    }

    if (options_.mode == ProcessMode::CHECK) {
        return Changed{.written = false, .recoded = recoded};
    }

    if (auto ec = filesystem_.write_bytes_atomic(path, text.utf8)) {
        return WriteFailed{.message = ec.message()};
    }

    return Changed{.written = true, .recoded = recoded};
}

auto FileProcessor::normalized_bytes(const std::filesystem::path& path, std::string_view raw) const
    -> std::variant<DecodedText, Skipped> {
    auto classification = classifier::classify(path, raw.substr(0, classifier::kSampleSize));
    if (!classification.is_text) {
        auto reason = classifier::has_binary_extension(path) ? SkipReason::BINARY_EXTENSION
                                                             : SkipReason::BINARY_CONTENT;
        return Skipped{.reason = reason};
    }

    auto decoded = decoder::decode(raw, options_.legacy_encoding);
    if (std::holds_alternative<DecodeFailure>(decoded)) {
        return Skipped{.reason = SkipReason::UNDECODABLE};
    }

    auto text = std::get<DecodedText>(std::move(decoded));

    // Tab-sensitive files keep their tabs whatever the run-wide settings say
    auto config = options_.normalization;
    config.keep_tabs = config.keep_tabs || classification.is_tab_sensitive;

    text.utf8 = normalizer::normalize(text.utf8, config);
    return text;
}

} // namespace textnorm

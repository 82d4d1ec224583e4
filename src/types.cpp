#include "textnorm/types.hpp"

namespace textnorm {

auto RunSummary::record(const ProcessingOutcome& outcome) -> void {
    ++files_seen;

    if (std::holds_alternative<Unchanged>(outcome)) {
        ++unchanged;
    } else if (const auto* changed_outcome = std::get_if<Changed>(&outcome)) {
        ++changed;
        if (changed_outcome->recoded) {
            ++recoded;
        }
    } else if (const auto* skipped_outcome = std::get_if<Skipped>(&outcome)) {
        switch (skipped_outcome->reason) {
        case SkipReason::UNREADABLE:
            ++skipped_unreadable;
            break;
        case SkipReason::BINARY_EXTENSION:
        case SkipReason::BINARY_CONTENT:
            ++skipped_binary;
            break;
        case SkipReason::UNDECODABLE:
            ++skipped_undecodable;
            break;
        }
    } else {
        ++failed;
    }
}

auto RunSummary::skipped() const -> size_t {
    return skipped_unreadable + skipped_binary + skipped_undecodable;
}

auto skip_reason_name(SkipReason reason) -> std::string {
    switch (reason) {
    case SkipReason::UNREADABLE:
        return "unreadable";
    case SkipReason::BINARY_EXTENSION:
        return "binary-extension";
    case SkipReason::BINARY_CONTENT:
        return "binary-content";
    case SkipReason::UNDECODABLE:
        return "undecodable";
    }
    return "unknown";
}

} // namespace textnorm

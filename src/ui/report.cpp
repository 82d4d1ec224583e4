#include "textnorm/ui/report.hpp"
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>

namespace textnorm {

auto format_outcome(const std::filesystem::path& path, const ProcessingOutcome& outcome,
                    const std::optional<std::string>& legacy_encoding) -> std::optional<StatusLine> {
    const auto shown = path.generic_string();

    if (std::holds_alternative<Unchanged>(outcome)) {
        return std::nullopt;
    }

    if (const auto* changed = std::get_if<Changed>(&outcome)) {
        std::string text = (changed->written ? "FIXED " : "NEEDS-FIX ") + shown;
        if (changed->recoded && legacy_encoding) {
            text += " (recoded from " + *legacy_encoding + ")";
        }
        return StatusLine{.text = text, .is_error = false, .is_skip = false};
    }

    if (const auto* skipped = std::get_if<Skipped>(&outcome)) {
        return StatusLine{.text = "SKIP " + skip_reason_name(skipped->reason) + " " + shown,
                          .is_error = false,
                          .is_skip = true};
    }

    const auto& failure = std::get<WriteFailed>(outcome);
    return StatusLine{.text = "ERROR " + shown + ": " + failure.message,
                      .is_error = true,
                      .is_skip = false};
}

auto render_summary(const RunSummary& summary, ProcessMode mode, bool use_color) -> std::string {
    using namespace ftxui;

    auto row = [use_color](const std::string& label, size_t value, Color highlight) {
        auto number = text(std::to_string(value));
        if (use_color && value > 0) {
            number = number | color(highlight) | bold;
        }
        return hbox({text(label), filler(), text("  "), number});
    };

    const bool check = mode == ProcessMode::CHECK;
    Element document = window(text(check ? " textnorm --check " : " textnorm "),
                              vbox({
                                  row("files", summary.files_seen, Color::Default),
                                  row("unchanged", summary.unchanged, Color::Default),
                                  row(check ? "need fixing" : "fixed", summary.changed,
                                      check ? Color::Yellow : Color::Green),
                                  row("recoded", summary.recoded, Color::Cyan),
                                  separator(),
                                  row("skipped unreadable", summary.skipped_unreadable, Color::GrayDark),
                                  row("skipped binary", summary.skipped_binary, Color::GrayDark),
                                  row("skipped undecodable", summary.skipped_undecodable, Color::Yellow),
                                  row("errors", summary.failed, Color::Red),
                              }));

    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString();
}

} // namespace textnorm

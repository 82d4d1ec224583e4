#include "textnorm/ui/report.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace textnorm {

using ::testing::HasSubstr;

TEST(ReportTest, UnchangedPrintsNothing)
{
    EXPECT_FALSE(format_outcome("a.txt", Unchanged{}, std::nullopt).has_value());
}

TEST(ReportTest, CheckModeChangeIsNeedsFix)
{
    auto line = format_outcome("src/a.c", Changed{.written = false, .recoded = false}, std::nullopt);

    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "NEEDS-FIX src/a.c");
    EXPECT_FALSE(line->is_error);
    EXPECT_FALSE(line->is_skip);
}

TEST(ReportTest, WrittenChangeIsFixed)
{
    auto line = format_outcome("src/a.c", Changed{.written = true, .recoded = false}, std::nullopt);

    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "FIXED src/a.c");
}

TEST(ReportTest, RecodedChangeNamesEncoding)
{
    auto line = format_outcome("old.txt", Changed{.written = true, .recoded = true}, "cp1251");

    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "FIXED old.txt (recoded from cp1251)");
}

TEST(ReportTest, SkipCarriesReason)
{
    auto line = format_outcome("logo.png", Skipped{.reason = SkipReason::BINARY_EXTENSION},
                               std::nullopt);

    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "SKIP binary-extension logo.png");
    EXPECT_TRUE(line->is_skip);
    EXPECT_FALSE(line->is_error);
}

TEST(ReportTest, WriteFailureIsAnError)
{
    auto line = format_outcome("ro.txt", WriteFailed{.message = "Permission denied"}, std::nullopt);

    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "ERROR ro.txt: Permission denied");
    EXPECT_TRUE(line->is_error);
}

TEST(ReportTest, SummaryShowsCounters)
{
    RunSummary summary;
    summary.record(Unchanged{});
    summary.record(Changed{.written = true, .recoded = true});
    summary.record(Skipped{.reason = SkipReason::BINARY_CONTENT});
    summary.record(WriteFailed{.message = "disk full"});

    auto rendered = render_summary(summary, ProcessMode::WRITE, false);

    EXPECT_THAT(rendered, HasSubstr("textnorm"));
    EXPECT_THAT(rendered, HasSubstr("fixed"));
    EXPECT_THAT(rendered, HasSubstr("skipped binary"));
    EXPECT_THAT(rendered, HasSubstr("errors"));
    EXPECT_THAT(rendered, HasSubstr("4"));
}

TEST(ReportTest, CheckSummaryUsesCheckWording)
{
    RunSummary summary;
    summary.record(Changed{.written = false, .recoded = false});

    auto rendered = render_summary(summary, ProcessMode::CHECK, false);

    EXPECT_THAT(rendered, HasSubstr("--check"));
    EXPECT_THAT(rendered, HasSubstr("need fixing"));
}

} // namespace textnorm

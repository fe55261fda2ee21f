#include <cli/console_reporter.h>
#include <cli/progress_bar.h>
#include <gtest/gtest.h>
#include <sstream>

using namespace upbeam;
using namespace upbeam::cli;
using namespace std::chrono_literals;

namespace {

std::size_t Count(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

core::Feedback MakeFeedback(core::FeedbackType type, nlohmann::json data) {
    return core::Feedback{.type = type, .data = std::move(data)};
}

} // namespace

TEST(ProgressBarTest, RendersLabelPercentBarAndSizes) {
    std::ostringstream out;
    ProgressBar bar(out, "Uploading", 10240, {.width = 10, .throttle = 0ms});

    EXPECT_EQ(bar.Render(0), "Uploading   0% [          ] (0 B/10.0 KB)");
    EXPECT_EQ(bar.Render(5120), "Uploading  50% [=====>    ] (5.0 KB/10.0 KB)");
    EXPECT_EQ(bar.Render(10240), "Uploading 100% [==========] (10.0 KB/10.0 KB)");
}

TEST(ProgressBarTest, ThrottlesIntermediateRepaints) {
    std::ostringstream out;
    ProgressBar bar(out, "Uploading", 1000, {.width = 10, .throttle = 65ms});
    auto start = ProgressBar::Clock::now();

    EXPECT_TRUE(bar.Update(100, start));
    EXPECT_FALSE(bar.Update(200, start + 10ms));
    EXPECT_FALSE(bar.Update(300, start + 64ms));
    EXPECT_TRUE(bar.Update(400, start + 70ms));
    EXPECT_FALSE(bar.finished());
}

TEST(ProgressBarTest, CompletionIsAlwaysPaintedOnce) {
    std::ostringstream out;
    ProgressBar bar(out, "Uploading", 1000, {.width = 10, .throttle = 1h});
    auto start = ProgressBar::Clock::now();

    EXPECT_TRUE(bar.Update(10, start));
    EXPECT_TRUE(bar.Update(1000, start + 1ms));
    EXPECT_TRUE(bar.finished());
    EXPECT_FALSE(bar.Update(1000, start + 2ms));

    EXPECT_EQ(Count(out.str(), "100%"), 1u);
    EXPECT_EQ(Count(out.str(), "\n"), 1u);
}

TEST(ProgressBarTest, AbandonTerminatesAnUnfinishedLine) {
    std::ostringstream out;
    ProgressBar bar(out, "Uploading", 1000, {});
    bar.RenderBlank();
    bar.Abandon();
    bar.Abandon();

    EXPECT_EQ(Count(out.str(), "\n"), 1u);
    EXPECT_TRUE(bar.finished());
}

TEST(ConsoleReporterTest, PrintsStatusLinesWithoutBarsInNoneStyle) {
    std::ostringstream out;
    ConsoleReporter reporter(out, core::ProgressStyle::kNone, {});

    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kTransferStarted,
                                     core::feedback::TransferStarted{
                                         .file_name = "db.tar",
                                         .file_size = 2048,
                                         .destination = "http://host/upload",
                                     }));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kUploadProgress,
                                     core::feedback::TransferProgress{
                                         .label = "Uploading db.tar",
                                         .bytes_so_far = 2048,
                                         .total_size = 2048,
                                         .percentage = 100.0,
                                     }));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kConnecting,
                                     core::feedback::Connecting{"http://host/upload"}));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kTransferCompleted,
                                     core::feedback::TransferCompleted{
                                         .status_code = 500,
                                         .success = false,
                                         .body_size = 12,
                                     }));

    std::string text = out.str();
    EXPECT_NE(text.find("File: db.tar"), std::string::npos);
    EXPECT_NE(text.find("Size: 2.0 KB"), std::string::npos);
    EXPECT_NE(text.find("Target: http://host/upload"), std::string::npos);
    EXPECT_NE(text.find("Connecting to server..."), std::string::npos);
    EXPECT_NE(text.find("Response status: 500"), std::string::npos);
    EXPECT_NE(text.find("Upload failed"), std::string::npos);
    EXPECT_EQ(text.find('%'), std::string::npos);
}

TEST(ConsoleReporterTest, DrawsUploadBarInBarStyle) {
    std::ostringstream out;
    ConsoleReporter reporter(out, core::ProgressStyle::kBar, {.width = 10, .throttle = 0ms});

    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kTransferStarted,
                                     core::feedback::TransferStarted{"a.bin", 100, "http://h/"}));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kUploadProgress,
                                     core::feedback::TransferProgress{"Uploading a.bin", 100, 100, 100.0}));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kTransferCompleted,
                                     core::feedback::TransferCompleted{200, true, 0}));

    std::string text = out.str();
    EXPECT_NE(text.find("  0% ["), std::string::npos);
    EXPECT_NE(text.find("100% [==========]"), std::string::npos);
    EXPECT_NE(text.find("Upload succeeded!"), std::string::npos);
}

TEST(ConsoleReporterTest, EmitsOneJsonObjectPerEvent) {
    std::ostringstream out;
    ConsoleReporter reporter(out, core::ProgressStyle::kJson, {});

    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kConnecting,
                                     core::feedback::Connecting{"http://h/"}));
    reporter.OnFeedback(MakeFeedback(core::FeedbackType::kTransferFailed,
                                     core::feedback::TransferFailed{core::ErrorKind::kNetwork,
                                                                    "refused"}));

    std::istringstream lines(out.str());
    std::string line;

    ASSERT_TRUE(std::getline(lines, line));
    auto first = nlohmann::json::parse(line);
    EXPECT_EQ(first["type"], "Connecting");
    EXPECT_EQ(first["data"]["destination"], "http://h/");

    ASSERT_TRUE(std::getline(lines, line));
    auto second = nlohmann::json::parse(line);
    EXPECT_EQ(second["type"], "TransferFailed");
    EXPECT_EQ(second["data"]["message"], "refused");

    EXPECT_FALSE(std::getline(lines, line));
}

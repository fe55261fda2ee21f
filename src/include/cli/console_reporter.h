#pragma once

#include <cli/progress_bar.h>
#include <core/model/feedback.h>
#include <core/util/config.h>
#include <memory>
#include <ostream>

namespace upbeam::cli {

/**
 * @brief Renders pipeline feedback on the console
 *
 * bar  - status lines plus throttled progress bars
 * json - every feedback event as one JSON object per line
 * none - status lines only
 *
 * All output goes to the stream given at construction (stderr in the CLI),
 * stdout is reserved for the response body.
 */
class ConsoleReporter {
public:
    ConsoleReporter(std::ostream& out, core::ProgressStyle style, ProgressBar::Options bar_options);

    void OnFeedback(const core::Feedback& feedback);

    // Callback bound to this reporter, which must outlive it
    core::FeedbackCallback Callback();

private:
    void onTransferStarted(const core::feedback::TransferStarted& started);
    void onProgress(const core::feedback::TransferProgress& progress,
                    std::unique_ptr<ProgressBar>& bar,
                    const char* description);
    void onResponseReceived(const core::feedback::ResponseReceived& received);
    void onTransferCompleted(const core::feedback::TransferCompleted& completed);
    void abandonBars();

    std::ostream& out_;
    core::ProgressStyle style_;
    ProgressBar::Options bar_options_;
    std::unique_ptr<ProgressBar> upload_bar_;
    std::unique_ptr<ProgressBar> download_bar_;
};

} // namespace upbeam::cli

#include <cli/console_reporter.h>
#include <core/util/format.h>

namespace upbeam::cli {

using core::Feedback;
using core::FeedbackType;
using core::ProgressStyle;
namespace feedback = core::feedback;

ConsoleReporter::ConsoleReporter(std::ostream& out,
                                 ProgressStyle style,
                                 ProgressBar::Options bar_options)
    : out_(out)
    , style_(style)
    , bar_options_(bar_options) {}

core::FeedbackCallback ConsoleReporter::Callback() {
    return [this](const Feedback& feedback) { OnFeedback(feedback); };
}

void ConsoleReporter::OnFeedback(const Feedback& fb) {
    if (style_ == ProgressStyle::kJson) {
        out_ << nlohmann::json(fb).dump() << '\n' << std::flush;
        return;
    }

    switch (fb.type) {
    case FeedbackType::kTransferStarted:
        onTransferStarted(fb.data.get<feedback::TransferStarted>());
        break;
    case FeedbackType::kUploadProgress:
        onProgress(fb.data.get<feedback::TransferProgress>(), upload_bar_, "Uploading");
        break;
    case FeedbackType::kConnecting:
        abandonBars();
        out_ << "Connecting to server..." << std::endl;
        break;
    case FeedbackType::kResponseReceived:
        onResponseReceived(fb.data.get<feedback::ResponseReceived>());
        break;
    case FeedbackType::kDownloadProgress:
        onProgress(fb.data.get<feedback::TransferProgress>(), download_bar_, "Downloading");
        break;
    case FeedbackType::kTransferCompleted:
        onTransferCompleted(fb.data.get<feedback::TransferCompleted>());
        break;
    case FeedbackType::kTransferFailed:
        // The error itself is reported through the log
        abandonBars();
        break;
    }
}

void ConsoleReporter::onTransferStarted(const feedback::TransferStarted& started) {
    out_ << "File: " << started.file_name << '\n'
         << "Size: " << core::FormatBytes(started.file_size) << '\n'
         << "Target: " << started.destination << std::endl;

    if (style_ == ProgressStyle::kBar && started.file_size > 0) {
        upload_bar_ = std::make_unique<ProgressBar>(out_,
                                                    "Uploading",
                                                    started.file_size,
                                                    bar_options_);
        upload_bar_->RenderBlank();
    }
}

void ConsoleReporter::onProgress(const feedback::TransferProgress& progress,
                                 std::unique_ptr<ProgressBar>& bar,
                                 const char* description) {
    if (style_ != ProgressStyle::kBar || progress.total_size <= 0) {
        return;
    }
    if (!bar) {
        bar = std::make_unique<ProgressBar>(out_, description, progress.total_size, bar_options_);
    }
    bar->Update(progress.bytes_so_far);
}

void ConsoleReporter::onResponseReceived(const feedback::ResponseReceived& received) {
    abandonBars();
    out_ << "Receiving server response..." << std::endl;

    if (style_ == ProgressStyle::kBar && received.metered) {
        download_bar_ = std::make_unique<ProgressBar>(out_,
                                                      "Downloading",
                                                      received.content_length,
                                                      bar_options_);
    }
}

void ConsoleReporter::onTransferCompleted(const feedback::TransferCompleted& completed) {
    abandonBars();
    out_ << "Response status: " << completed.status_code << '\n'
         << (completed.success ? "Upload succeeded!" : "Upload failed") << std::endl;
}

void ConsoleReporter::abandonBars() {
    if (upload_bar_) {
        upload_bar_->Abandon();
    }
    if (download_bar_) {
        download_bar_->Abandon();
    }
}

} // namespace upbeam::cli

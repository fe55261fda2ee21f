#include <algorithm>
#include <core/error/transfer_error.h>
#include <core/http/multipart_writer.h>
#include <core/io/copy.h>
#include <core/io/file_source.h>
#include <core/network/url.h>
#include <core/pipeline/transfer_pipeline.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace upbeam::core {

namespace {

// Upper bound for trusting Content-Length when pre-allocating the response
constexpr std::uint64_t kMaxResponsePreallocation = 64 * 1024 * 1024;

} // namespace

TransferPipeline::TransferPipeline(net::io_context& ioc,
                                   TransferRequest request,
                                   TransferOptions options,
                                   FeedbackCallback callback)
    : ioc_(ioc)
    , request_(std::move(request))
    , options_(std::move(options))
    , callback_(std::move(callback)) {}

ResponseBodyReader TransferPipeline::SelectBodyReader(ByteSource& body,
                                                      std::optional<std::uint64_t> content_length,
                                                      ProgressSink sink) {
    if (content_length && *content_length > 0) {
        return ResponseBodyReader{std::in_place_type<MeteredBodyReader>,
                                  body,
                                  static_cast<std::int64_t>(*content_length),
                                  std::move(sink)};
    }
    return ResponseBodyReader{std::in_place_type<PlainBodyReader>, body};
}

net::awaitable<TransferResult> TransferPipeline::Run() {
    request_.Validate();

    try {
        // Reject unusable destinations before spending time on the body
        Url url = ParseUrl(request_.destination_url);

        EncodedBody body = co_await encodeBody();

        HttpClient client(ioc_, options_.client);
        spdlog::info("Connecting to {}", url.ToString());
        feedback(FeedbackType::kConnecting, feedback::Connecting{request_.destination_url});
        co_await client.Connect(url);

        auto req = client.CreateRequest<http::vector_body<std::uint8_t>>(http::verb::post);
        req.set(http::field::content_type, body.content_type);
        req.body() = std::move(body.data);
        req.prepare_payload();

        spdlog::debug("POST {} ({} bytes)", url.target, req.body().size());
        auto response = co_await client.SendRequest(req);

        TransferResult result;
        result.status_code = response->status_code();
        result.response_body = co_await receiveBody(*response);

        response.reset();
        co_await client.Disconnect();

        if (result.IsSuccess()) {
            spdlog::info("Upload of {} finished with status {}",
                         request_.source_path.string(),
                         result.status_code);
        } else {
            spdlog::warn("Server rejected upload of {} with status {}",
                         request_.source_path.string(),
                         result.status_code);
        }
        feedback(FeedbackType::kTransferCompleted,
                 feedback::TransferCompleted{
                     .status_code = result.status_code,
                     .success = result.IsSuccess(),
                     .body_size = result.response_body.size(),
                 });

        co_return result;
    } catch (const TransferError& e) {
        spdlog::error("Transfer of {} failed: {}", request_.source_path.string(), e.what());
        feedback(FeedbackType::kTransferFailed,
                 feedback::TransferFailed{.error = e.kind(), .message = e.what()});
        throw;
    }
}

net::awaitable<TransferPipeline::EncodedBody> TransferPipeline::encodeBody() {
    FileSource file(request_.source_path);

    spdlog::info("Uploading {} ({} bytes) to {}",
                 file.name(),
                 file.size(),
                 request_.destination_url);
    feedback(FeedbackType::kTransferStarted,
             feedback::TransferStarted{
                 .file_name = file.name(),
                 .file_size = file.size(),
                 .destination = request_.destination_url,
             });

    MultipartWriter writer;
    writer.CreateFormFile(transfer::kFileFieldName, file.name());
    writer.Reserve(static_cast<std::size_t>(file.size()));

    ProgressReader reader(file,
                          file.size(),
                          progressSink(FeedbackType::kUploadProgress, "Uploading " + file.name()));
    std::uint64_t copied = co_await Copy(
        reader,
        [&writer](std::span<const std::uint8_t> chunk) { writer.Write(chunk); },
        options_.read_buffer_size);
    file.Close();

    spdlog::debug("Encoded {} file bytes into the multipart body", copied);

    EncodedBody body;
    body.content_type = writer.FormDataContentType();
    body.data = writer.Close();
    co_return body;
}

net::awaitable<BinaryData> TransferPipeline::receiveBody(HttpResponseStream& response) {
    auto content_length = response.content_length();
    auto body_reader = SelectBodyReader(response,
                                        content_length,
                                        progressSink(FeedbackType::kDownloadProgress,
                                                     "Downloading response"));
    bool metered = std::holds_alternative<MeteredBodyReader>(body_reader);

    feedback(FeedbackType::kResponseReceived,
             feedback::ResponseReceived{
                 .status_code = response.status_code(),
                 .content_length = content_length ? static_cast<std::int64_t>(*content_length)
                                                  : -1,
                 .metered = metered,
             });

    std::size_t size_hint = content_length
                                ? static_cast<std::size_t>(
                                    std::min(*content_length, kMaxResponsePreallocation))
                                : 0;
    ByteSource& source = std::visit([](auto& strategy) -> ByteSource& { return strategy.source(); },
                                    body_reader);
    BinaryData body = co_await ReadAll(source, options_.read_buffer_size, size_hint);

    if (auto* metered_reader = std::get_if<MeteredBodyReader>(&body_reader)) {
        spdlog::debug("Read {} of {} declared response bytes",
                      metered_reader->reader.state().bytes_so_far,
                      metered_reader->reader.state().total_size);
    } else {
        spdlog::debug("Read {} response bytes of undeclared length", body.size());
    }

    co_return body;
}

ProgressSink TransferPipeline::progressSink(FeedbackType type, std::string label) {
    if (!callback_) {
        return nullptr;
    }
    return [this, type, label = std::move(label)](const ProgressState& state) {
        feedback(type,
                 feedback::TransferProgress{
                     .label = label,
                     .bytes_so_far = state.bytes_so_far,
                     .total_size = state.total_size,
                     .percentage = state.Percentage(),
                 });
    };
}

} // namespace upbeam::core

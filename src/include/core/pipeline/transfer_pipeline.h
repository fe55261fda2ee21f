#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/constant/transfer.h>
#include <core/io/progress_reader.h>
#include <core/model/feedback.h>
#include <core/model/transfer_request.h>
#include <core/model/transfer_result.h>
#include <core/network/http_client.h>
#include <core/util/binary_data.h>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace upbeam::core {

struct TransferOptions {
    ClientOptions client;
    std::size_t read_buffer_size = transfer::kDefaultReadBufferSize;
};

// Response body read straight from the connection, length unknown
struct PlainBodyReader {
    explicit PlainBodyReader(ByteSource& body)
        : body(body) {}

    ByteSource& body;

    ByteSource& source() { return body; }
};

// Response body read through a progress reader sized by Content-Length
struct MeteredBodyReader {
    MeteredBodyReader(ByteSource& body, std::int64_t total_size, ProgressSink sink)
        : reader(body, total_size, std::move(sink)) {}

    ProgressReader reader;

    ByteSource& source() { return reader; }
};

using ResponseBodyReader = std::variant<PlainBodyReader, MeteredBodyReader>;

/**
 * @brief Uploads one file as multipart/form-data and collects the response
 *
 * Steps run strictly in order: open the source, encode it into the request
 * body, send the request, read the response body, report. Any failure is
 * thrown as a TransferError subclass after every acquired resource has been
 * released. A non-2xx response is not a failure, it is returned as data.
 */
class TransferPipeline {
public:
    TransferPipeline(boost::asio::io_context& ioc,
                     TransferRequest request,
                     TransferOptions options,
                     FeedbackCallback callback = nullptr);

    boost::asio::awaitable<TransferResult> Run();

    const TransferRequest& request() const { return request_; }

    // Picks the metered reader only when the response declared a positive length
    static ResponseBodyReader SelectBodyReader(ByteSource& body,
                                               std::optional<std::uint64_t> content_length,
                                               ProgressSink sink);

private:
    struct EncodedBody {
        std::string content_type;
        BinaryData data;
    };

    boost::asio::awaitable<EncodedBody> encodeBody();
    boost::asio::awaitable<BinaryData> receiveBody(HttpResponseStream& response);

    ProgressSink progressSink(FeedbackType type, std::string label);

    void feedback(FeedbackType type, nlohmann::json data) {
        if (callback_) {
            callback_(Feedback{.type = type, .data = std::move(data)});
        }
    }

    boost::asio::io_context& ioc_;
    const TransferRequest request_;
    const TransferOptions options_;
    FeedbackCallback callback_;
};

} // namespace upbeam::core

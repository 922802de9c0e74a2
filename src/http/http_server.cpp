#include "tidelink/http/http_server.h"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "tidelink/core/ids.h"
#include "tidelink/core/logger.h"
#include "tidelink/core/time.h"
#include "tidelink/http/responses.h"
#include "tidelink/http/tus_protocol.h"
#include "tidelink/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 65536;
constexpr const char* kDownloadPattern = "/v1/transfers/{transfer_id}/files/{file_id}";

struct RangeRequest {
    std::uint64_t start{0};
    std::uint64_t end{0};
};

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size) {
    // We only accept a single byte range; other units are rejected early.
    if (header.rfind("bytes=", 0) != 0 || size == 0) {
        return std::nullopt;
    }
    auto range = header.substr(6);
    if (range.find(',') != std::string::npos) {
        return std::nullopt;
    }
    auto dash = range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    std::string start_str = range.substr(0, dash);
    std::string end_str = range.substr(dash + 1);

    RangeRequest req;
    try {
        if (start_str.empty()) {
            // Suffix form: the last N bytes.
            if (end_str.empty()) {
                return std::nullopt;
            }
            const auto suffix = static_cast<std::uint64_t>(std::stoull(end_str));
            if (suffix == 0) {
                return std::nullopt;
            }
            req.start = suffix >= size ? 0 : size - suffix;
            req.end = size - 1;
            return req;
        }
        req.start = static_cast<std::uint64_t>(std::stoull(start_str));
        req.end = end_str.empty() ? size - 1 : static_cast<std::uint64_t>(std::stoull(end_str));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (req.end >= size) {
        req.end = size - 1;
    }
    if (req.start > req.end || req.start >= size) {
        return std::nullopt;
    }
    return req;
}

std::string ContentDisposition(const std::string& name) {
    std::string safe;
    safe.reserve(name.size());
    for (const char c : name) {
        if (c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20) {
            safe += '_';
        } else {
            safe += c;
        }
    }
    return "attachment; filename=\"" + safe + "\"";
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, tidelink::http::Router router, tidelink::core::Config config,
            std::shared_ptr<tidelink::storage::BlobWriter> blobs,
            std::shared_ptr<tidelink::metadata::MetadataStore> metadata)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          blobs_(std::move(blobs)),
          metadata_(std::move(metadata)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            tidelink::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            tidelink::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = tidelink::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();

        // Reject oversized chunks before reading them so nothing is appended.
        const auto declared = parser_->content_length();
        if (declared && declared.value() > config_.server.limits.max_body_bytes) {
            return RejectTooLarge();
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        if (beast::iequals(parser_->get()[http::field::expect], "100-continue")) {
            return SendContinue();
        }
        ReadBodyToString();
    }

    void SendContinue() {
        auto interim = std::make_shared<http::response<http::empty_body>>(
            http::status::continue_, parser_->get().version());
        auto self = this->shared_from_this();
        http::async_write(stream_, *interim,
                          [self, interim](beast::error_code ec, std::size_t) {
                              if (ec) {
                                  tidelink::core::LogError("Write 100-continue failed: " +
                                                           ec.message());
                                  return;
                              }
                              self->ReadBodyToString();
                          });
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        if (parser_->content_length()) {
            body_.reserve(static_cast<std::size_t>(parser_->content_length().value()));
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return RejectTooLarge();
        }
        if (ec && ec != http::error::need_buffer) {
            // A chunk that never finished arriving is dropped whole.
            tidelink::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void RejectTooLarge() {
        body_.clear();
        auto response = tidelink::http::JsonError(
            parser_->get().version(), "PAYLOAD_TOO_LARGE",
            "request body exceeds " + std::to_string(config_.server.limits.max_body_bytes) +
                " bytes",
            request_id_, http::status::payload_too_large);
        // The unread body makes the connection unusable for another request.
        response.keep_alive(false);
        Send(std::move(response));
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        tidelink::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.keep_alive(parser_->get().keep_alive());
        request.body() = std::move(body_);
        body_.clear();

        tidelink::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;

        const auto path = StripQuery(std::string(request.target()));
        if (request.method() == http::verb::get &&
            tidelink::http::Router::Match(kDownloadPattern, path, nullptr)) {
            return HandleDownload(request, path);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            auto response = tidelink::http::JsonError(request.version(), "INTERNAL",
                                                      result.error().message, request_id_,
                                                      http::status::internal_server_error);
            return Send(std::move(response));
        }
        result.value().keep_alive(request.keep_alive());
        Send(std::move(result.value()));
    }

    void HandleDownload(const tidelink::http::HttpRequest& request, const std::string& path) {
        tidelink::http::RouteParams params;
        tidelink::http::Router::Match(kDownloadPattern, path, &params);
        const auto transfer_id = params["transfer_id"];
        const auto file_id = params["file_id"];

        auto transfer = metadata_->GetTransfer(transfer_id);
        if (!transfer.ok()) {
            return Send(tidelink::http::ErrorResponse(request.version(), transfer.error(),
                                                      request_id_));
        }
        if (transfer.value().status == tidelink::metadata::kTransferDeleted ||
            tidelink::core::IsPastIso8601(transfer.value().expires_at)) {
            return Send(tidelink::http::JsonError(request.version(), "GONE",
                                                  "transfer has expired", request_id_,
                                                  http::status::gone));
        }
        auto file = metadata_->GetFile(file_id);
        if (!file.ok() || file.value().transfer_id != transfer_id ||
            !file.value().upload_complete) {
            return Send(tidelink::http::JsonError(request.version(), "FILE_NOT_FOUND",
                                                  "file not found", request_id_,
                                                  http::status::not_found));
        }

        auto length = blobs_->Length(file_id);
        if (!length.ok()) {
            return Send(tidelink::http::ErrorResponse(request.version(), length.error(),
                                                      request_id_));
        }
        const auto size = length.value();
        // Support HTTP Range for large reads and resumable downloads.
        auto range_header = request[http::field::range];
        if (!range_header.empty()) {
            auto range = ParseRange(std::string(range_header), size);
            if (!range) {
                auto err = tidelink::http::JsonError(request.version(), "INVALID_RANGE",
                                                     "invalid range", request_id_,
                                                     http::status::range_not_satisfiable);
                err.set(http::field::content_range, "bytes */" + std::to_string(size));
                return Send(std::move(err));
            }
            auto bytes = blobs_->ReadRange(file_id, range->start, range->end - range->start + 1);
            if (!bytes.ok()) {
                return Send(tidelink::http::ErrorResponse(request.version(), bytes.error(),
                                                          request_id_));
            }
            // Resumed downloads continue an earlier count.
            if (range->start == 0) {
                CountDownload(transfer_id);
            }
            tidelink::http::HttpResponse partial{http::status::partial_content,
                                                 request.version()};
            SetFileHeaders(partial, file.value());
            partial.set(http::field::content_range,
                        "bytes " + std::to_string(range->start) + "-" +
                            std::to_string(range->end) + "/" + std::to_string(size));
            partial.body() = std::move(bytes.value());
            partial.prepare_payload();
            partial.keep_alive(request.keep_alive());
            return Send(std::move(partial));
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(blobs_->PathFor(file_id).c_str(), beast::file_mode::scan, ec);
        if (ec) {
            return Send(tidelink::http::JsonError(request.version(), "IO_ERROR",
                                                  "failed to open file", request_id_,
                                                  http::status::internal_server_error));
        }
        SetFileHeaders(response, file.value());
        response.content_length(response.body().size());
        CountDownload(transfer_id);
        response.keep_alive(request.keep_alive());
        Send(std::move(response));
    }

    template <typename Body>
    static void SetFileHeaders(http::response<Body>& response,
                               const tidelink::metadata::FileRecord& file) {
        response.set(http::field::content_type, file.mime_type);
        response.set(http::field::content_disposition, ContentDisposition(file.original_name));
        response.set(http::field::accept_ranges, "bytes");
    }

    void CountDownload(const std::string& transfer_id) {
        auto counted = metadata_->IncrementDownloadCount(transfer_id);
        if (!counted.ok()) {
            tidelink::core::LogWarning("Download count update failed for " + transfer_id + ": " +
                                       counted.error().message);
        }
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "TideLink");
        response.set("X-Request-Id", request_id_);
        // Errors raised before routing still need CORS so browsers can read them.
        if (tidelink::http::tus::IsUploadPath(request_target_)) {
            tidelink::http::tus::ApplyProtocolHeaders(response, config_.upload.max_size_bytes);
        }
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        tidelink::core::LogRequest(request_id_, request_method_, request_target_, request_remote_,
                                   response.result_int(), latency);
        tidelink::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            tidelink::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};
    tidelink::http::Router router_;
    tidelink::core::Config config_;
    std::shared_ptr<tidelink::storage::BlobWriter> blobs_;
    std::shared_ptr<tidelink::metadata::MetadataStore> metadata_;
    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, tidelink::http::Router router,
             tidelink::core::Config config,
             std::shared_ptr<tidelink::storage::BlobWriter> blobs,
             std::shared_ptr<tidelink::metadata::MetadataStore> metadata,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          blobs_(std::move(blobs)),
          metadata_(std::move(metadata)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw std::runtime_error("failed to listen on " + endpoint.address().to_string() +
                                     ":" + std::to_string(endpoint.port()) + ": " + ec.message());
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            tidelink::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, blobs_, metadata_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             blobs_, metadata_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    tidelink::http::Router router_;
    tidelink::core::Config config_;
    std::shared_ptr<tidelink::storage::BlobWriter> blobs_;
    std::shared_ptr<tidelink::metadata::MetadataStore> metadata_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace tidelink::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<storage::BlobWriter> blobs,
                       std::shared_ptr<metadata::MetadataStore> metadata)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      blobs_(std::move(blobs)),
      metadata_(std::move(metadata)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, blobs_, metadata_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
}

}  // namespace tidelink::http

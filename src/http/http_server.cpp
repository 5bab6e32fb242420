#include "chunkshare/http/http_server.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <Poco/URI.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "chunkshare/auth/jwt_utils.h"
#include "chunkshare/core/ids.h"
#include "chunkshare/core/logger.h"
#include "chunkshare/http/responses.h"
#include "chunkshare/links/download_token.h"
#include "chunkshare/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using chunkshare::core::Error;
using chunkshare::core::ErrorCode;

constexpr std::size_t kBufferSize = 8192;

std::string ContentDisposition(const std::string& filename) {
    std::string fallback;
    for (char c : filename) {
        const auto u = static_cast<unsigned char>(c);
        fallback.push_back(u < 0x20 || u >= 0x7f || c == '"' || c == '\\' ? '_' : c);
    }
    std::string encoded;
    Poco::URI::encode(filename, "/?#@&=+;:,", encoded);
    return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + encoded;
}

// Window [offset, offset + length) of a file, exposed to Beast as a whole file so that
// basic_file_body streams exactly the requested range.
class FileRange {
public:
    FileRange() = default;
    FileRange(FileRange&&) = default;
    FileRange& operator=(FileRange&&) = default;

    void Bind(std::uint64_t offset, std::uint64_t length) {
        offset_ = offset;
        length_ = length;
    }

    bool is_open() const { return file_.is_open(); }
    void close(beast::error_code& ec) { file_.close(ec); }
    void open(char const* path, beast::file_mode mode, beast::error_code& ec) {
        file_.open(path, mode, ec);
        if (!ec) {
            file_.seek(offset_, ec);
        }
    }
    std::uint64_t size(beast::error_code& ec) const {
        ec = {};
        return length_;
    }
    std::uint64_t pos(beast::error_code& ec) const { return file_.pos(ec) - offset_; }
    void seek(std::uint64_t offset, beast::error_code& ec) { file_.seek(offset_ + offset, ec); }
    std::size_t read(void* buffer, std::size_t n, beast::error_code& ec) const {
        const auto at = pos(ec);
        if (ec) {
            return 0;
        }
        const auto remaining = at < length_ ? length_ - at : 0;
        return file_.read(buffer, static_cast<std::size_t>(std::min<std::uint64_t>(n, remaining)),
                          ec);
    }
    std::size_t write(void const* buffer, std::size_t n, beast::error_code& ec) {
        return file_.write(buffer, n, ec);
    }

private:
    beast::file file_;
    std::uint64_t offset_{0};
    std::uint64_t length_{0};
};

using RangeBody = http::basic_file_body<FileRange>;

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, std::shared_ptr<const chunkshare::http::Router> router,
            chunkshare::http::AppServices services)
        : stream_(std::move(stream)), router_(std::move(router)), services_(std::move(services)) {
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
            chunkshare::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(services_.config.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            chunkshare::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = chunkshare::core::GenerateRequestId();
        principal_.reset();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        const auto path = chunkshare::http::StripQuery(request_target_);

        // Reject before reading the body so unauthenticated chunk uploads are never buffered.
        auto auth_error = EnsureAuthorized(parser_->get(), path);
        if (auth_error) {
            return SendError(*auth_error, true);
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
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
            return SendError(Error{ErrorCode::kPayloadTooLarge, "request body too large"}, true);
        }
        if (ec && ec != http::error::need_buffer) {
            chunkshare::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        chunkshare::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.body() = std::move(body_);
        request.prepare_payload();
        request.keep_alive(parser_->get().keep_alive());

        const auto target = std::string(request.target());
        const auto path = chunkshare::http::StripQuery(target);
        if (request.method() == http::verb::get) {
            chunkshare::http::RouteParams params;
            if (chunkshare::http::Router::Match("/download/{token}", path, &params)) {
                return HandleDownload(request, params["token"], std::nullopt);
            }
            if (chunkshare::http::Router::Match("/d/{file_id}", path, &params)) {
                return HandleDownload(request, chunkshare::http::GetQueryParam(target, "token"),
                                      params["file_id"]);
            }
            if (chunkshare::http::Router::Match("/s/{code}", path, &params)) {
                return HandleShortCode(request, params["code"]);
            }
        }

        chunkshare::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = target;
        ctx.remote = request_remote_;
        ctx.principal = principal_;

        try {
            auto result = router_->Route(ctx, request);
            if (!result.ok()) {
                return SendError(result.error());
            }
            auto response = std::move(result.value());
            response.keep_alive(request.keep_alive());
            Send(std::move(response));
        } catch (const std::exception& ex) {
            chunkshare::core::LogError("Handler for " + request_method_ + " " + path +
                                       " threw: " + ex.what());
            SendError(Error{ErrorCode::kInternal, "internal error"});
        }
    }

    bool IsPublicPath(const std::string& path) const {
        // Health, metrics and download endpoints are authorised by their own tokens or not at all.
        return path == "/healthz" || path == "/readyz" || path == "/metrics" ||
               path.rfind("/download/", 0) == 0 || path.rfind("/d/", 0) == 0 ||
               path.rfind("/s/", 0) == 0;
    }

    template <typename Request>
    std::optional<std::string> ExtractBearerToken(const Request& request) {
        // Expect "Authorization: Bearer <token>".
        auto it = request.find(http::field::authorization);
        if (it == request.end()) {
            return std::nullopt;
        }
        std::string value = chunkshare::auth::Trim(std::string(it->value()));
        if (value.size() < 7) {
            return std::nullopt;
        }
        if (chunkshare::auth::ToLower(value.substr(0, 7)) != "bearer ") {
            return std::nullopt;
        }
        return chunkshare::auth::Trim(value.substr(7));
    }

    template <typename Request>
    std::optional<Error> EnsureAuthorized(const Request& request, const std::string& path) {
        if (IsPublicPath(path)) {
            return std::nullopt;
        }
        auto token = ExtractBearerToken(request);
        if (!token || token->empty()) {
            return Error{ErrorCode::kUnauthorized, "missing bearer token"};
        }
        auto claims = services_.codec->Verify(*token);
        if (!claims.ok()) {
            return Error{ErrorCode::kUnauthorized, claims.error().message};
        }
        auto window = services_.codec->CheckTimeWindow(claims.value(), true);
        if (!window.ok()) {
            return window.error();
        }
        if (claims.value().subject.empty()) {
            return Error{ErrorCode::kUnauthorized, "token has no subject"};
        }
        auto principal = services_.repository->GetPrincipal(claims.value().subject);
        if (!principal.ok()) {
            if (principal.code() == ErrorCode::kNotFound) {
                return Error{ErrorCode::kUnauthorized, "unknown principal"};
            }
            return principal.error();
        }
        if (!principal.value().is_active) {
            return Error{ErrorCode::kForbidden, "account is disabled"};
        }
        principal_ = principal.value();
        return std::nullopt;
    }

    std::optional<std::string> DownloadPassword(const chunkshare::http::HttpRequest& request) {
        const auto target = std::string(request.target());
        if (chunkshare::http::HasQueryParam(target, "password")) {
            return chunkshare::http::GetQueryParam(target, "password");
        }
        auto it = request.find("X-Download-Password");
        if (it != request.end()) {
            return std::string(it->value());
        }
        return std::nullopt;
    }

    void HandleShortCode(const chunkshare::http::HttpRequest& request, const std::string& code) {
        auto resolved = services_.links->ResolveShortCode(code);
        if (!resolved.ok()) {
            return SendError(resolved.error());
        }
        if (resolved.value().landing_target) {
            chunkshare::http::HttpResponse response{http::status::temporary_redirect,
                                                    request.version()};
            response.set(http::field::location, *resolved.value().landing_target);
            response.prepare_payload();
            return Send(std::move(response));
        }
        HandleDownload(request, resolved.value().token, resolved.value().file_id);
    }

    void HandleDownload(const chunkshare::http::HttpRequest& request, const std::string& token,
                        const std::optional<std::string>& expected_file_id) {
        if (token.empty()) {
            return SendError(Error{ErrorCode::kInvalidToken, "missing download token"});
        }
        auto claims = chunkshare::links::DecodeDownloadToken(*services_.codec, token);
        if (!claims.ok()) {
            return SendError(claims.error());
        }
        if (expected_file_id && *expected_file_id != claims.value().file_id) {
            return SendError(Error{ErrorCode::kLinkNotFound, "download link not found"});
        }

        // Validate the range before a download is counted against the link.
        const auto range_header = std::string(request[http::field::range]);
        std::optional<chunkshare::http::RangeRequest> range;
        if (!range_header.empty()) {
            auto file = services_.repository->GetStoredFile(claims.value().file_id);
            if (file.ok()) {
                range = chunkshare::http::ParseRange(range_header, file.value().size_bytes);
                if (!range) {
                    auto err = chunkshare::http::JsonError(
                        request.version(), "INVALID_RANGE", "invalid range", request_id_,
                        http::status::range_not_satisfiable);
                    err.set(http::field::content_range,
                            "bytes */" + std::to_string(file.value().size_bytes));
                    return Send(std::move(err));
                }
            }
        }

        auto handle = services_.links->ValidateAndConsume(token, DownloadPassword(request));
        if (!handle.ok()) {
            return SendError(handle.error());
        }

        const auto& file = handle.value().file;
        if (range) {
            return SendRange(request, handle.value().path, file, *range);
        }

        beast::error_code ec;
        http::response<http::file_body> response{http::status::ok, request.version()};
        response.body().open(handle.value().path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            chunkshare::core::LogError("Failed to open " + handle.value().path + ": " +
                                       ec.message());
            return SendError(Error{ErrorCode::kIoError, "failed to open file"});
        }
        SetDownloadHeaders(response, request, file);
        response.content_length(response.body().size());
        Send(std::move(response));
    }

    void SendRange(const chunkshare::http::HttpRequest& request, const std::string& path,
                   const chunkshare::metadata::StoredFile& file,
                   const chunkshare::http::RangeRequest& range) {
        const auto length = range.end - range.start + 1;
        FileRange window;
        window.Bind(range.start, length);
        beast::error_code ec;
        window.open(path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            chunkshare::core::LogError("Failed to open " + path + ": " + ec.message());
            return SendError(Error{ErrorCode::kIoError, "failed to open file"});
        }

        http::response<RangeBody> response{http::status::partial_content, request.version()};
        response.body().reset(std::move(window), ec);
        if (ec) {
            return SendError(Error{ErrorCode::kIoError, "failed to read file"});
        }
        SetDownloadHeaders(response, request, file);
        response.content_length(length);
        response.set(http::field::content_range,
                     "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) +
                         "/" + std::to_string(file.size_bytes));
        Send(std::move(response));
    }

    template <typename Body>
    void SetDownloadHeaders(http::response<Body>& response,
                            const chunkshare::http::HttpRequest& request,
                            const chunkshare::metadata::StoredFile& file) {
        response.set(http::field::content_type, file.mime_type);
        response.set(http::field::content_disposition, ContentDisposition(file.filename));
        response.set(http::field::accept_ranges, "bytes");
        response.keep_alive(request.keep_alive());
    }

    void SendError(const Error& error, bool close = false) {
        auto response =
            chunkshare::http::ErrorResponse(parser_->get().version(), error, request_id_);
        // The unread body of a rejected request cannot be skipped safely.
        response.keep_alive(!close && parser_->get().keep_alive());
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "ChunkShare");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        chunkshare::core::LogRequest(request_id_, request_method_, request_target_,
                                     request_remote_, response.result_int(), latency);
        chunkshare::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            chunkshare::core::LogError("Write failed: " + ec.message());
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

    std::shared_ptr<const chunkshare::http::Router> router_;
    chunkshare::http::AppServices services_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
    std::optional<chunkshare::metadata::Principal> principal_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, std::shared_ptr<const chunkshare::http::Router> router,
             chunkshare::http::AppServices services, net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          services_(std::move(services)),
          ssl_ctx_(ssl_ctx) {}

    bool Open(const tcp::endpoint& endpoint) {
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
            chunkshare::core::LogError("Failed to listen on " + endpoint.address().to_string() +
                                       ":" + std::to_string(endpoint.port()) + ": " +
                                       ec.message());
            return false;
        }
        return true;
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            chunkshare::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, services_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_,
                                                             services_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<const chunkshare::http::Router> router_;
    chunkshare::http::AppServices services_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace chunkshare::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, AppServices services, Router router)
    : ioc_(ioc),
      services_(std::move(services)),
      router_(std::make_shared<const Router>(std::move(router))) {
    const auto& tls = services_.config.server.tls;
    if (tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(tls.certificate);
        ssl_context_->use_private_key_file(tls.private_key, net::ssl::context::pem);
    }
}

bool HttpServer::Run() {
    beast::error_code ec;
    const auto address = net::ip::make_address(services_.config.server.host, ec);
    if (ec) {
        core::LogError("Invalid server.host " + services_.config.server.host + ": " +
                       ec.message());
        return false;
    }
    const tcp::endpoint endpoint{address,
                                 static_cast<unsigned short>(services_.config.server.port)};

    auto listener = std::make_shared<Listener>(ioc_, router_, services_,
                                               ssl_context_ ? ssl_context_.get() : nullptr);
    if (!listener->Open(endpoint)) {
        return false;
    }
    listener->Run();
    StartCleanupJob();
    core::LogInfo("Listening on " + services_.config.server.host + ":" +
                  std::to_string(services_.config.server.port));
    return true;
}

void HttpServer::StartCleanupJob() {
    if (!services_.config.cleanup.enabled) {
        return;
    }
    cleanup_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleCleanupSweep();
}

void HttpServer::ScheduleCleanupSweep() {
    if (!cleanup_timer_) {
        return;
    }
    cleanup_timer_->expires_after(
        std::chrono::seconds(services_.config.cleanup.sweep_interval_seconds));
    cleanup_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        RunCleanupSweep();
        ScheduleCleanupSweep();
    });
}

void HttpServer::RunCleanupSweep() {
    auto expired =
        services_.sessions->ExpireStaleSessions(services_.config.cleanup.max_sessions_per_sweep);
    if (!expired.ok()) {
        core::LogError("Cleanup sweep failed: " + expired.error().message);
        return;
    }
    if (expired.value() > 0) {
        core::LogInfo("Cleanup sweep expired " + std::to_string(expired.value()) +
                      " upload session(s)");
    }
}

}  // namespace chunkshare::http

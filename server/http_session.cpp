// server/http_session.cpp
#include "http_session.hpp"
#include "logger.hpp"

namespace {

// Malformed request line, headers, Content-Length or chunk framing
bool isParseError(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category();
}

std::string describeEndpoint(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

HttpSession::HttpSession(tcp::socket socket, HandlerOptions options, std::uint64_t bodyLimit)
    : socket_(std::move(socket)), options_(std::move(options)), bodyLimit_(bodyLimit) {
    remote_ = describeEndpoint(socket_);
}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);

    http::async_read(socket_, buffer_, *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    (void)bytes_transferred;

    // Client closed between requests
    if (ec == http::error::end_of_stream) {
        return do_close();
    }

    // Client went away in the middle of a request
    if (ec == http::error::partial_message) {
        Logger::error("HTTP read error from " + remote_ + ": " + ec.message());
        return do_close();
    }

    if (ec) {
        if (isParseError(ec)) {
            return reject(ec);
        }
        Logger::error("HTTP read error from " + remote_ + ": " + ec.message());
        return;
    }

    StringRequest req = parser_->release();
    StringResponse res = handleRequest(req, options_);

    Logger::http(remote_ + " \"" + std::string(req.method_string()) + " " + std::string(req.target())
                 + " HTTP/" + std::to_string(req.version() / 10) + "." + std::to_string(req.version() % 10)
                 + "\" " + std::to_string(res.result_int()));

    send(std::move(res));
}

void HttpSession::reject(beast::error_code ec) {
    http::status status = http::status::bad_request;
    if (ec == http::error::body_limit) {
        status = http::status::payload_too_large;
    }

    Logger::error("Rejecting request from " + remote_ + ": " + ec.message());

    // The stream position is unknown after a parse failure, so always close
    send(makeTextResponse(status, 11, false, options_.serverName,
                          std::string(http::obsolete_reason(status)) + ": " + ec.message()));
}

void HttpSession::send(StringResponse res) {
    response_.emplace(std::move(res));
    auto& out = *response_;
    http::async_write(socket_, out,
        beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), out.need_eof()));
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
    (void)bytes_transferred;

    if (ec) {
        Logger::error("HTTP write error to " + remote_ + ": " + ec.message());
        return;
    }

    response_.reset();

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        Logger::error("HTTP shutdown error: " + ec.message());
    }
}

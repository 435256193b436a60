// server/http_session.hpp
// One accepted connection: read request, log it, acknowledge, repeat
#ifndef SERVER_HTTP_SESSION_HPP
#define SERVER_HTTP_SESSION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "request_handler.hpp"

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, HandlerOptions options, std::uint64_t bodyLimit);

    void run();

private:
    tcp::socket socket_;
    HandlerOptions options_;
    std::uint64_t bodyLimit_;
    std::string remote_;
    beast::flat_buffer buffer_;

    // Parser is rebuilt per request so the body limit applies to each one
    std::optional<http::request_parser<http::string_body>> parser_;

    // Keeps the response alive while async_write runs
    std::optional<StringResponse> response_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void reject(beast::error_code ec);
    void send(StringResponse res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

#endif // SERVER_HTTP_SESSION_HPP

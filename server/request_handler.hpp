// server/request_handler.hpp
// Per-request logic: build the console block and the acknowledgement
#ifndef SERVER_REQUEST_HANDLER_HPP
#define SERVER_REQUEST_HANDLER_HPP

#include <functional>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

// Receives one complete request block
using RequestSink = std::function<void(const std::string&)>;

// Injected into the listener and copied into every session
struct HandlerOptions {
    std::string serverName = "ReqEcho-Server";
    RequestSink sink;  // empty means Logger::dump
};

// Builds the console block for a GET or POST request.
// The body section is only added when includeBody is set.
std::string formatRequestLog(const StringRequest& req, bool includeBody);

// Dispatches on method, emits the block through the sink and returns
// the response. Never throws for bad client input.
StringResponse handleRequest(const StringRequest& req, const HandlerOptions& options);

// Plain text response carrying the usual server headers
StringResponse makeTextResponse(http::status status, unsigned version, bool keepAlive,
                                const std::string& serverName, std::string body);

#endif // SERVER_REQUEST_HANDLER_HPP

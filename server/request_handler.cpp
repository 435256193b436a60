// server/request_handler.cpp
#include "request_handler.hpp"
#include "logger.hpp"
#include "utf8.hpp"
#include <sstream>

namespace {

void emit(const HandlerOptions& options, const std::string& block) {
    if (options.sink) {
        options.sink(block);
    } else {
        Logger::dump(block);
    }
}

} // namespace

std::string formatRequestLog(const StringRequest& req, bool includeBody) {
    std::ostringstream oss;
    oss << "\n===== " << req.method_string() << " REQUEST ======\n";
    oss << "Path: " << req.target() << "\n";
    oss << "Headers:\n";

    // http::fields iterates in arrival order and keeps repeated names
    for (auto const& field : req) {
        oss << "  " << field.name_string() << ": " << field.value() << "\n";
    }

    if (includeBody) {
        oss << "Body:\n" << req.body() << "\n";
    }

    return oss.str();
}

StringResponse makeTextResponse(http::status status, unsigned version, bool keepAlive,
                                const std::string& serverName, std::string body) {
    StringResponse res{status, version};
    res.set(http::field::server, serverName);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(keepAlive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

StringResponse handleRequest(const StringRequest& req, const HandlerOptions& options) {
    switch (req.method()) {
        case http::verb::get:
            emit(options, formatRequestLog(req, false));
            return makeTextResponse(http::status::ok, req.version(), req.keep_alive(),
                                    options.serverName, "GET request received");

        case http::verb::post:
            if (!Utf8::isValid(req.body())) {
                Logger::error("POST " + std::string(req.target()) + ": body is not valid UTF-8 ("
                              + std::to_string(req.body().size()) + " bytes)");
                return makeTextResponse(http::status::bad_request, req.version(), req.keep_alive(),
                                        options.serverName, "Request body is not valid UTF-8");
            }
            emit(options, formatRequestLog(req, true));
            return makeTextResponse(http::status::ok, req.version(), req.keep_alive(),
                                    options.serverName, "POST request received");

        default:
            break;
    }

    std::string method(req.method_string());
    Logger::http("Unsupported method " + method + " " + std::string(req.target()));
    return makeTextResponse(http::status::not_implemented, req.version(), req.keep_alive(),
                            options.serverName, "Unsupported method ('" + method + "')");
}

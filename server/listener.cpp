// server/listener.cpp
#include "listener.hpp"
#include "http_session.hpp"
#include "logger.hpp"

namespace {

void failStartup(const beast::error_code& ec, const std::string& what) {
    Logger::error("Listener " + what + " error: " + ec.message());
    throw beast::system_error{ec, "listener " + what};
}

} // namespace

Listener::Listener(net::io_context& ioc, tcp::endpoint endpoint, HandlerOptions options,
                   std::uint64_t bodyLimit)
    : acceptor_(ioc), options_(std::move(options)), bodyLimit_(bodyLimit) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) failStartup(ec, "open");

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) failStartup(ec, "set option");

    acceptor_.bind(endpoint, ec);
    if (ec) failStartup(ec, "bind");

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) failStartup(ec, "listen");
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        Logger::error("Listener close error: " + ec.message());
    }
}

unsigned short Listener::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        // Acceptor closed, shutting down
        if (ec == net::error::operation_aborted) {
            return;
        }
        Logger::error("Listener accept error: " + ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), options_, bodyLimit_)->run();
    }

    // Accept next connection
    do_accept();
}

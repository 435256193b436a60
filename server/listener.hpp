// server/listener.hpp
// Accepts incoming connections and starts a session for each
#ifndef SERVER_LISTENER_HPP
#define SERVER_LISTENER_HPP

#include <cstdint>
#include <memory>
#include <boost/beast/core.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "request_handler.hpp"

class Listener : public std::enable_shared_from_this<Listener> {
public:
    // Throws boost::system::system_error if the endpoint cannot be bound
    Listener(net::io_context& ioc, tcp::endpoint endpoint, HandlerOptions options,
             std::uint64_t bodyLimit);

    void run();
    void stop();

    // Actual bound port, useful when constructed with port 0
    unsigned short port() const;

private:
    tcp::acceptor acceptor_;
    HandlerOptions options_;
    std::uint64_t bodyLimit_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

#endif // SERVER_LISTENER_HPP

#ifndef RETAGGER_SERVER_H
#define RETAGGER_SERVER_H

#include <boost/beast.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "api.hpp"
#include "lib/progressBroadcaster.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One HTTP connection. Hands itself over to a WebSocketSession on an upgrade to /ws.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Api& api, Retagger::ProgressBroadcaster& broadcaster, std::chrono::seconds keepAlive);

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    Api& api_;
    Retagger::ProgressBroadcaster& broadcaster_;
    std::chrono::seconds keepAlive_;

    void startRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(unsigned status, const std::string& body);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void close();
};

class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, Api& api,
           Retagger::ProgressBroadcaster& broadcaster, std::chrono::seconds keepAlive);

    void start();
    void stop();

    tcp::endpoint endpoint() const;

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Api& api_;
    Retagger::ProgressBroadcaster& broadcaster_;
    std::chrono::seconds keepAlive_;

    void startAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);
};

#endif // RETAGGER_SERVER_H

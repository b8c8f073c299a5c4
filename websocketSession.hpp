#ifndef RETAGGER_WEBSOCKETSESSION_H
#define RETAGGER_WEBSOCKETSESSION_H

#include <boost/beast.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "lib/progressBroadcaster.hpp"
#include "lib/sendQueue.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One connected progress client. Subscribed from the handshake until the channel closes.
class WebSocketSession : public Retagger::ProgressObserver, public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, Retagger::ProgressBroadcaster& broadcaster, std::chrono::seconds keepAlive);
    ~WebSocketSession() override;

    void run(http::request<http::string_body> request);

    void deliver(const Retagger::ProgressEvent& event) override;

private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    Retagger::SendQueue outgoing_;
    Retagger::ProgressBroadcaster& broadcaster_;
    std::chrono::seconds keepAlive_;
    bool open_ = false;

    // Handlers
    void onAccept(beast::error_code ec);
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void onWrite(beast::error_code ec, std::size_t bytes_transferred);
    void onClose();

    // Sending
    void enqueue(std::string message);
    void writeNext();

    // Read loop
    void startReadLoop();
};

#endif // RETAGGER_WEBSOCKETSESSION_H

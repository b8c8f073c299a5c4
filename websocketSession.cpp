#include "websocketSession.hpp"

#include <stdexcept>
#include <utility>

#include "lib/logger.hpp"

using Retagger::LogLevel;
using Retagger::logMessage;

WebSocketSession::WebSocketSession(tcp::socket&& socket, Retagger::ProgressBroadcaster& broadcaster,
                                   std::chrono::seconds keepAlive)
    : ws_(std::move(socket)), broadcaster_(broadcaster), keepAlive_(keepAlive) {}

WebSocketSession::~WebSocketSession() {
    broadcaster_.unsubscribe(this);
}

void WebSocketSession::run(http::request<http::string_body> request) {
    // Beast sends a ping once half of the idle timeout has passed without traffic
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout options{};
    options.handshake_timeout = std::chrono::seconds(30);
    options.idle_timeout = keepAlive_ * 2;
    options.keep_alive_pings = true;
    ws_.set_option(options);
    ws_.text(true);

    ws_.async_accept(request, beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}

void WebSocketSession::onAccept(beast::error_code ec) {
    if (ec) {
        logMessage("WebSocket handshake failed: " + ec.message(), "websocket", LogLevel::WARN);
        return;
    }
    open_ = true;
    broadcaster_.subscribe(this);
    logMessage("WebSocket connection opened", "websocket", LogLevel::INFO);
    broadcaster_.publish("WebSocket connected", 0);
    startReadLoop();
}

void WebSocketSession::startReadLoop() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}

void WebSocketSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != websocket::error::closed) {
            logMessage("WebSocket read failed: " + ec.message(), "websocket", LogLevel::DEBUG);
        }
        onClose();
        return;
    }
    // Clients have nothing to say, inbound messages are dropped
    buffer_.consume(bytes_transferred);
    startReadLoop();
}

void WebSocketSession::onClose() {
    if (!open_) {
        return;
    }
    open_ = false;
    broadcaster_.unsubscribe(this);
    logMessage("WebSocket connection closed", "websocket", LogLevel::INFO);
    broadcaster_.publish("WebSocket disconnected", 0);
}

void WebSocketSession::deliver(const Retagger::ProgressEvent& event) {
    if (!open_) {
        throw std::runtime_error("WebSocket channel is closed");
    }
    net::post(ws_.get_executor(), [self = shared_from_this(), message = event.toJson()]() mutable {
        self->enqueue(std::move(message));
    });
}

void WebSocketSession::enqueue(std::string message) {
    if (!open_) {
        return;
    }
    const auto dropped = outgoing_.dropped();
    // Otherwise a write is already in flight and picks the message up when done
    if (outgoing_.push(std::move(message))) {
        writeNext();
    } else if (outgoing_.dropped() != dropped) {
        logMessage("Slow WebSocket client, dropped an undelivered event", "websocket", LogLevel::DEBUG);
    }
}

void WebSocketSession::writeNext() {
    ws_.async_write(net::buffer(outgoing_.front()),
                    beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}

void WebSocketSession::onWrite(beast::error_code ec, std::size_t) {
    if (ec || !open_) {
        // Undelivered messages are dropped, nothing is kept for later
        outgoing_.clear();
        if (ec) {
            logMessage("Error sending message: " + ec.message(), "websocket", LogLevel::DEBUG);
            onClose();
        }
        return;
    }
    if (outgoing_.pop()) {
        writeNext();
    }
}

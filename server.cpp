#include "server.hpp"

#include <utility>

#include "lib/logger.hpp"
#include "websocketSession.hpp"

using Retagger::LogLevel;
using Retagger::logMessage;

namespace {
    const char* const SERVER_NAME = "retagger";
    const auto READ_TIMEOUT = std::chrono::seconds(30);
}

HttpSession::HttpSession(tcp::socket&& socket, Api& api, Retagger::ProgressBroadcaster& broadcaster,
                         std::chrono::seconds keepAlive)
    : stream_(std::move(socket)), api_(api), broadcaster_(broadcaster), keepAlive_(keepAlive) {}

void HttpSession::run() {
    startRead();
}

void HttpSession::startRead() {
    request_ = {};
    stream_.expires_after(READ_TIMEOUT);
    http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            logMessage("HTTP read failed: " + ec.message(), "http", LogLevel::DEBUG);
        }
        return;
    }

    if (websocket::is_upgrade(request_)) {
        if (request_.target() != "/ws") {
            sendResponse(404, R"({"detail":"Not Found"})");
            return;
        }
        std::make_shared<WebSocketSession>(stream_.release_socket(), broadcaster_, keepAlive_)->run(std::move(request_));
        return;
    }

    stream_.expires_never();
    auto self = shared_from_this();
    const auto method = request_.method_string();
    const auto target = request_.target();
    api_.handle(std::string(method.data(), method.size()), std::string(target.data(), target.size()), request_.body(),
                [self](unsigned status, const nlohmann::json& body) {
        self->sendResponse(status, body.dump());
    });
}

void HttpSession::sendResponse(unsigned status, const std::string& body) {
    auto response = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(status), request_.version());
    response->set(http::field::server, SERVER_NAME);
    response->set(http::field::content_type, "application/json");
    response->keep_alive(request_.keep_alive());
    response->body() = body;
    response->prepare_payload();

    http::async_write(stream_, *response, [self = shared_from_this(), response](beast::error_code ec, std::size_t bytes) {
        self->onWrite(response->need_eof(), ec, bytes);
    });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        logMessage("HTTP write failed: " + ec.message(), "http", LogLevel::DEBUG);
        return;
    }
    if (close) {
        this->close();
        return;
    }
    startRead();
}

void HttpSession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != net::error::not_connected) {
        logMessage("HTTP shutdown failed: " + ec.message(), "http", LogLevel::DEBUG);
    }
}

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, Api& api,
               Retagger::ProgressBroadcaster& broadcaster, std::chrono::seconds keepAlive)
    : ioc_(ioc), acceptor_(ioc), api_(api), broadcaster_(broadcaster), keepAlive_(keepAlive) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void Server::start() {
    logMessage("Listening on " + acceptor_.local_endpoint().address().to_string() + ":" +
               std::to_string(acceptor_.local_endpoint().port()), "http", LogLevel::INFO);
    startAccept();
}

void Server::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        logMessage("Error closing acceptor: " + ec.message(), "http", LogLevel::WARN);
    }
}

tcp::endpoint Server::endpoint() const {
    return acceptor_.local_endpoint();
}

void Server::startAccept() {
    acceptor_.async_accept(ioc_, beast::bind_front_handler(&Server::onAccept, shared_from_this()));
}

void Server::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        logMessage("Accept failed: " + ec.message(), "http", LogLevel::WARN);
    } else {
        std::make_shared<HttpSession>(std::move(socket), api_, broadcaster_, keepAlive_)->run();
    }
    startAccept();
}

#include "web/HttpServer.hpp"
#include "web/ApiHandler.hpp"
#include "utils/Logger.hpp"
#include <stdexcept>

namespace Yturl {

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<ApiHandler> api,
                         std::chrono::seconds timeout)
    : stream(std::move(socket))
    , api(std::move(api))
    , timeout(timeout) {
}

void HttpSession::run() {
    net::dispatch(stream.get_executor(),
                  beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    req = {};

    stream.expires_after(timeout);

    http::async_read(stream, buffer, req,
                     beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytesTransferred) {
    boost::ignore_unused(bytesTransferred);

    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_WEB_WARN("Read error: {}", ec.message());
        }
        return;
    }

    api->handle(std::move(req), shared_from_this());
}

template <class Body>
void HttpSession::write(std::shared_ptr<http::response<Body>> response, bool timed,
                        std::function<void()> onSent) {
    res = response;

    // The deadline covers the whole composed write, so a large body must not have one
    if (timed) {
        stream.expires_after(timeout);
    } else {
        stream.expires_never();
    }

    http::async_write(stream, *response,
                      [self = shared_from_this(), close = response->need_eof(), onSent = std::move(onSent)]
                      (beast::error_code ec, std::size_t) {
                          self->onWrite(close, onSent, ec);
                      });
}

void HttpSession::sendResponse(http::response<http::string_body>&& response) {
    auto message = std::make_shared<http::response<http::string_body>>(std::move(response));
    net::dispatch(stream.get_executor(), [self = shared_from_this(), message] {
        self->write(message, true, nullptr);
    });
}

void HttpSession::sendFile(http::response<http::file_body>&& response, std::function<void()> onSent) {
    auto message = std::make_shared<http::response<http::file_body>>(std::move(response));
    net::dispatch(stream.get_executor(), [self = shared_from_this(), message, onSent] {
        self->write(message, false, onSent);
    });
}

beast::tcp_stream HttpSession::releaseStream() {
    stream.expires_never();
    return std::move(stream);
}

void HttpSession::onWrite(bool close, const std::function<void()>& onSent, beast::error_code ec) {
    if (ec) {
        LOG_WEB_WARN("Write error: {}", ec.message());
        return;
    }

    if (onSent) {
        onSent();
    }

    if (close) {
        return doClose();
    }

    res = nullptr;
    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<ApiHandler> api)
    : ioc(ioc)
    , acceptor(ioc)
    , api(std::move(api)) {

    beast::error_code ec;

    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set reuse_address: " + ec.message());
    }

    acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void HttpServer::run() {
    doAccept();
}

void HttpServer::stop() {
    net::post(acceptor.get_executor(), [this] {
        beast::error_code ec;
        acceptor.close(ec);
    });
}

void HttpServer::doAccept() {
    acceptor.async_accept(
        net::make_strand(ioc),
        beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }

    if (ec) {
        LOG_WEB_WARN("Accept error: {}", ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), api)->run();
    }

    doAccept();
}

} // namespace Yturl

#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace Yturl {

class ApiHandler;

/**
 * One client connection
 *
 * Reads requests one at a time and hands each to the API handler. The
 * send methods may be called from any thread; they hop onto the
 * connection's strand before touching the socket.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    // timeout bounds reading a request and writing a JSON reply; file bodies have none
    HttpSession(tcp::socket&& socket, std::shared_ptr<ApiHandler> api,
                std::chrono::seconds timeout = std::chrono::seconds(30));

    void run();

    void sendResponse(http::response<http::string_body>&& response);

    // onSent runs only when the whole file reached the socket
    void sendFile(http::response<http::file_body>&& response, std::function<void()> onSent);

    // Give up the connection (event streams); the session stops reading
    beast::tcp_stream releaseStream();

private:
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    std::shared_ptr<void> res;
    std::shared_ptr<ApiHandler> api;
    std::chrono::seconds timeout;

    void doRead();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void onWrite(bool close, const std::function<void()>& onSent, beast::error_code ec);
    void doClose();

    template <class Body>
    void write(std::shared_ptr<http::response<Body>> response, bool timed, std::function<void()> onSent);
};

/**
 * Accepts connections and spawns a session for each
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<ApiHandler> api);

    void run();

    // Stop accepting; open sessions finish on their own
    void stop();

private:
    net::io_context& ioc;
    tcp::acceptor acceptor;
    std::shared_ptr<ApiHandler> api;

    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);
};

} // namespace Yturl

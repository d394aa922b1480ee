#pragma once

#include "models/Media.hpp"
#include "web/HttpServer.hpp"
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace Yturl {

// "data: <json>\n\n"
std::string formatSseEvent(const ProgressEvent& event);

/**
 * Server-sent event stream over a taken-over connection
 *
 * Events go out as HTTP chunks in push order, each flushed on its own.
 * One read stays outstanding for the life of the stream so a client hangup
 * is noticed even while no event is due; a hangup or failed write fires
 * the disconnect callback exactly once. push() and close() may be called
 * from any thread.
 */
class SseStream : public std::enable_shared_from_this<SseStream> {
public:
    using DisconnectCallback = std::function<void()>;

    SseStream(beast::tcp_stream&& stream, http::response<http::empty_body>&& header);

    // Write the headers and start watching for a hangup
    void start(DisconnectCallback onDisconnect);

    void push(const ProgressEvent& event);

    // Send the final chunk and shut the connection down
    void close();

    // Status 200, event-stream content type, chunked, no caching or proxy buffering
    static http::response<http::empty_body> makeHeader(unsigned version);

private:
    struct Frame {
        std::string data;
        bool last = false;
    };

    beast::tcp_stream stream;
    http::response<http::empty_body> header;
    http::response_serializer<http::empty_body> serializer;
    std::array<char, 512> readBuffer;

    std::deque<Frame> outbox;
    bool headerSent;
    bool writing;
    bool closing;
    bool disconnected;
    DisconnectCallback onDisconnect;

    void enqueue(Frame frame);
    void doWrite();
    void onWrite(bool last, beast::error_code ec);
    void doWatch();
    void onWatch(beast::error_code ec, std::size_t bytesTransferred);
    void disconnect();
};

} // namespace Yturl

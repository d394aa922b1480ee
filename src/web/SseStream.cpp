#include "web/SseStream.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

std::string formatSseEvent(const ProgressEvent& event) {
    return "data: " + event.toJson().dump() + "\n\n";
}

SseStream::SseStream(beast::tcp_stream&& stream, http::response<http::empty_body>&& header)
    : stream(std::move(stream))
    , header(std::move(header))
    , serializer(this->header)
    , readBuffer{}
    , headerSent(false)
    , writing(false)
    , closing(false)
    , disconnected(false) {
}

http::response<http::empty_body> SseStream::makeHeader(unsigned version) {
    http::response<http::empty_body> header{http::status::ok, version};
    header.set(http::field::content_type, "text/event-stream");
    header.set(http::field::cache_control, "no-cache");
    header.set(http::field::connection, "keep-alive");
    header.set("X-Accel-Buffering", "no");
    header.chunked(true);
    return header;
}

void SseStream::start(DisconnectCallback callback) {
    net::dispatch(stream.get_executor(), [self = shared_from_this(), callback = std::move(callback)] {
        self->onDisconnect = callback;
        self->writing = true;
        http::async_write_header(self->stream, self->serializer,
                                 [self](beast::error_code ec, std::size_t) {
                                     self->writing = false;
                                     if (ec) {
                                         LOG_WEB_WARN("Event stream header write failed: {}", ec.message());
                                         self->disconnect();
                                         return;
                                     }
                                     self->headerSent = true;
                                     self->doWrite();
                                 });
        self->doWatch();
    });
}

void SseStream::push(const ProgressEvent& event) {
    Frame frame;
    frame.data = formatSseEvent(event);
    net::post(stream.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
        self->enqueue(std::move(frame));
    });
}

void SseStream::close() {
    Frame frame;
    frame.last = true;
    net::post(stream.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
        self->enqueue(std::move(frame));
    });
}

void SseStream::enqueue(Frame frame) {
    if (disconnected || closing) {
        return;
    }
    if (frame.last) {
        closing = true;
    }
    outbox.push_back(std::move(frame));
    doWrite();
}

void SseStream::doWrite() {
    if (!headerSent || writing || outbox.empty() || disconnected) {
        return;
    }
    writing = true;

    const Frame& front = outbox.front();
    auto handler = [self = shared_from_this(), last = front.last](beast::error_code ec, std::size_t) {
        self->onWrite(last, ec);
    };

    if (front.last) {
        net::async_write(stream, http::make_chunk_last(), std::move(handler));
    } else {
        net::async_write(stream, http::make_chunk(net::buffer(front.data)), std::move(handler));
    }
}

void SseStream::onWrite(bool last, beast::error_code ec) {
    writing = false;

    if (ec) {
        if (!disconnected) {
            LOG_WEB_INFO("Event stream write failed: {}", ec.message());
        }
        disconnect();
        return;
    }

    outbox.pop_front();

    if (last) {
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        stream.close();
        return;
    }

    doWrite();
}

void SseStream::doWatch() {
    stream.async_read_some(net::buffer(readBuffer),
                           beast::bind_front_handler(&SseStream::onWatch, shared_from_this()));
}

void SseStream::onWatch(beast::error_code ec, std::size_t bytesTransferred) {
    boost::ignore_unused(bytesTransferred);

    if (ec) {
        // Our own close after the final chunk also lands here
        if (!(closing && outbox.empty())) {
            LOG_WEB_INFO("Event stream client went away: {}", ec.message());
            disconnect();
        }
        return;
    }

    doWatch();
}

void SseStream::disconnect() {
    if (disconnected) {
        return;
    }
    disconnected = true;

    if (onDisconnect) {
        onDisconnect();
    }

    beast::error_code ignored;
    stream.socket().close(ignored);
}

} // namespace Yturl

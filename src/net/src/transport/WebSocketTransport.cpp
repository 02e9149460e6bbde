// /////////////////////////////////////////////////////////////////////////////
/// @file WebSocketTransport.cpp
/// @brief Boost.Beast WebSocket client implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/net/transport/WebSocketTransport.hpp>
#include <synapse/core/Constants.hpp>
#include <synapse/core/Log.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <deque>
#include <iterator>
#include <utility>

namespace synapse::net::transport {

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

struct WebSocketTransport::Impl : std::enable_shared_from_this<WebSocketTransport::Impl>
{
    tcp::resolver                        resolver;
    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer                   readBuffer;
    std::deque<std::string>              writeQueue;
    TransportEvents                      events;
    Endpoint                             endpoint;
    bool                                 open{false};
    bool                                 closing{false};
    bool                                 closeAfterWrite{false};

    explicit Impl(asio::io_context& io) : resolver{io}, ws{io} {}

    void start(const Endpoint& ep, TransportEvents ev)
    {
        endpoint = ep;
        events = std::move(ev);
        resolver.async_resolve(
            endpoint.host, std::to_string(endpoint.port),
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results)
            {
                self->onResolve(ec, std::move(results));
            });
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (closing)
            return;
        if (ec)
            return fail(core::ErrorCode::kConnectionFailed, "resolve " + endpoint.host + ": " + ec.message());

        beast::get_lowest_layer(ws).expires_after(std::chrono::milliseconds{core::kConnectTimeoutMs});
        beast::get_lowest_layer(ws).async_connect(
            results,
            [self = shared_from_this()](beast::error_code ec2, const tcp::endpoint&)
            {
                self->onConnect(ec2);
            });
    }

    void onConnect(beast::error_code ec)
    {
        if (closing)
            return;
        if (ec)
            return fail(core::ErrorCode::kConnectionFailed, "connect " + endpoint.toString() + ": " + ec.message());

        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req)
            {
                req.set(beast::http::field::user_agent, "synapse-bridge");
            }));

        const std::string hostHeader = endpoint.host + ':' + std::to_string(endpoint.port);
        ws.async_handshake(
            hostHeader, endpoint.target,
            [self = shared_from_this()](beast::error_code ec2)
            {
                self->onHandshake(ec2);
            });
    }

    void onHandshake(beast::error_code ec)
    {
        if (closing)
            return;
        if (ec)
            return fail(core::ErrorCode::kConnectionFailed, "handshake " + endpoint.toString() + ": " + ec.message());

        ws.text(true);
        open = true;
        if (events.onOpen)
            events.onOpen();
        if (!closing)
            doRead();
    }

    void doRead()
    {
        ws.async_read(
            readBuffer,
            [self = shared_from_this()](beast::error_code ec, std::size_t)
            {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec)
    {
        if (closing)
            return;
        if (ec == websocket::error::closed)
            return fail(core::ErrorCode::kConnectionClosed, "closed by peer");
        if (ec)
            return fail(core::ErrorCode::kConnectionFailed, "read: " + ec.message());

        const std::string frame = beast::buffers_to_string(readBuffer.data());
        readBuffer.consume(readBuffer.size());
        if (events.onMessage)
            events.onMessage(frame);
        if (!closing)
            doRead();
    }

    core::Expected<void> enqueue(std::string payload)
    {
        if (!open || closing)
        {
            return core::makeError(core::ErrorCode::kNotConnected, "WebSocket is not open");
        }
        writeQueue.push_back(std::move(payload));
        if (writeQueue.size() == 1)
            doWrite();
        return {};
    }

    void doWrite()
    {
        ws.async_write(
            asio::buffer(writeQueue.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t)
            {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec)
    {
        if (closing)
        {
            writeQueue.clear();
            if (closeAfterWrite)
            {
                closeAfterWrite = false;
                doClose();
            }
            return;
        }
        writeQueue.pop_front();
        if (ec)
            return fail(core::ErrorCode::kSendFailed, "write: " + ec.message());

        if (!writeQueue.empty())
            doWrite();
    }

    void doClose()
    {
        ws.async_close(
            websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code ec)
            {
                if (ec)
                    core::Log::debug("NET", "close handshake: " + ec.message());
                self->shutdownSocket();
            });
    }

    void shutdownSocket() noexcept
    {
        beast::error_code ignored;
        beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(ws).socket().close(ignored);
    }

    /// Remote or I/O failure: report once, then tear down.
    void fail(core::ErrorCode code, std::string message)
    {
        auto onClosed = std::move(events.onClosed);
        events = {};
        open = false;
        closing = true;
        // front() belongs to the in-flight write, if any; onWrite releases it.
        if (writeQueue.size() > 1)
            writeQueue.erase(std::next(writeQueue.begin()), writeQueue.end());
        resolver.cancel();
        shutdownSocket();
        if (onClosed)
            onClosed(core::Error{code, std::move(message)});
    }

    /// Local close: silent, graceful when the handshake completed.
    void close() noexcept
    {
        if (closing)
            return;
        closing = true;
        events = {};
        resolver.cancel();

        if (!open)
        {
            shutdownSocket();
            return;
        }
        open = false;

        if (!writeQueue.empty())
        {
            // A write is in flight; the close frame follows it.
            closeAfterWrite = true;
            return;
        }
        doClose();
    }
};

WebSocketTransport::WebSocketTransport(asio::io_context& io)
    : impl_{std::make_shared<Impl>(io)}
{
}

WebSocketTransport::~WebSocketTransport()
{
    close();
}

void WebSocketTransport::open(const Endpoint& endpoint, TransportEvents events)
{
    core::Log::info("NET", "WebSocketTransport: connecting to " + endpoint.toString());
    impl_->start(endpoint, std::move(events));
}

void WebSocketTransport::close() noexcept
{
    impl_->close();
}

core::Expected<void> WebSocketTransport::write(std::string payload)
{
    return impl_->enqueue(std::move(payload));
}

bool WebSocketTransport::isOpen() const noexcept
{
    return impl_->open && !impl_->closing;
}

const char* WebSocketTransport::name() const noexcept
{
    return "WebSocketTransport";
}

} // namespace synapse::net::transport

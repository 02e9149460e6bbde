// /////////////////////////////////////////////////////////////////////////////
/// @file SinkServer.cpp
/// @brief Boost.Beast WebSocket server implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/sink/SinkServer.hpp>
#include <synapse/protocol/Envelope.hpp>
#include <synapse/core/Log.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <list>
#include <string>
#include <utility>

namespace synapse::sink {

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

namespace {

/// Counters and observer shared between the server and its sessions.
struct Shared
{
    SinkStats                 stats;
    SinkServer::FrameListener listener;
};

class Session : public std::enable_shared_from_this<Session>
{
public:
    Session(tcp::socket socket, std::shared_ptr<Shared> shared)
        : ws_{std::move(socket)}
        , shared_{std::move(shared)}
    {
    }

    ~Session()
    {
        if (counted_)
            --shared_->stats.activeSessions;
    }

    void run()
    {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res)
            {
                res.set(beast::http::field::server, "synapse-sink");
            }));
        ws_.read_message_max(core::kMaxFrameBytes);

        ws_.async_accept(
            [self = shared_from_this()](beast::error_code ec)
            {
                self->onAccept(ec);
            });
    }

    void close() noexcept
    {
        if (closing_)
            return;
        closing_ = true;
        if (!accepted_ || !writeQueue_.empty())
        {
            shutdownSocket();
            return;
        }
        ws_.async_close(
            websocket::close_code::going_away,
            [self = shared_from_this()](beast::error_code)
            {
                self->shutdownSocket();
            });
    }

private:
    void onAccept(beast::error_code ec)
    {
        if (ec)
        {
            core::Log::warn("SINK", "handshake failed: " + ec.message());
            return;
        }
        accepted_ = true;
        counted_  = true;
        ++shared_->stats.connectionsAccepted;
        ++shared_->stats.activeSessions;
        core::Log::info("SINK", "client connected");

        if (closing_)
            return;
        ws_.text(true);
        doRead();
    }

    void doRead()
    {
        ws_.async_read(
            buffer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t)
            {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec)
    {
        if (ec == websocket::error::closed)
        {
            core::Log::info("SINK", "client disconnected");
            return;
        }
        if (ec)
        {
            if (!closing_)
                core::Log::warn("SINK", "read: " + ec.message());
            return;
        }

        const std::string frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        handleFrame(frame);

        if (!closing_)
            doRead();
    }

    void handleFrame(const std::string& frame)
    {
        auto message = protocol::parse(frame);
        if (!message)
        {
            ++shared_->stats.framesRejected;
            core::Log::warn("SINK", "rejected frame: " + message.error().describe());
            reply("ERROR: " + message.error().message());
            return;
        }

        ++shared_->stats.framesReceived;
        shared_->stats.samplesReceived += message->size();
        core::Log::info("SINK", "received " + message->type() + " with "
                        + std::to_string(message->size()) + " samples");
        if (shared_->listener)
        {
            const auto listener = shared_->listener;
            listener(*message);
        }
        reply(std::string{core::kAckReply});
    }

    void reply(std::string text)
    {
        if (closing_)
            return;
        writeQueue_.push_back(std::move(text));
        if (writeQueue_.size() == 1)
            doWrite();
    }

    void doWrite()
    {
        ws_.async_write(
            asio::buffer(writeQueue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t)
            {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec)
    {
        if (ec)
        {
            writeQueue_.clear();
            if (!closing_)
                core::Log::warn("SINK", "write: " + ec.message());
            return;
        }
        writeQueue_.pop_front();
        if (closing_)
        {
            writeQueue_.clear();
            shutdownSocket();
            return;
        }
        if (!writeQueue_.empty())
            doWrite();
    }

    void shutdownSocket() noexcept
    {
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    websocket::stream<beast::tcp_stream> ws_;
    std::shared_ptr<Shared>              shared_;
    beast::flat_buffer                   buffer_;
    std::deque<std::string>              writeQueue_;
    bool                                 accepted_{false};
    bool                                 counted_{false};
    bool                                 closing_{false};
};

} // namespace

struct SinkServer::Impl : std::enable_shared_from_this<SinkServer::Impl>
{
    SinkConfig                         config;
    tcp::acceptor                      acceptor;
    std::shared_ptr<Shared>            shared{std::make_shared<Shared>()};
    std::list<std::weak_ptr<Session>>  sessions;
    core::u16                          boundPort{0};
    bool                               running{false};

    Impl(asio::io_context& ctx, SinkConfig cfg)
        : config{std::move(cfg)}
        , acceptor{ctx}
    {
    }

    core::Expected<void> listen()
    {
        beast::error_code ec;
        const auto address = asio::ip::make_address(config.address, ec);
        if (ec)
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "invalid listen address '" + config.address + "'");

        const tcp::endpoint endpoint{address, config.port};
        acceptor.open(endpoint.protocol(), ec);
        if (!ec)
            acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor.bind(endpoint, ec);
        if (!ec)
            acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec)
        {
            beast::error_code ignored;
            acceptor.close(ignored);
            return core::makeError(core::ErrorCode::kConnectionFailed,
                                   "listen on " + config.address + ":" + std::to_string(config.port)
                                   + ": " + ec.message());
        }

        boundPort = acceptor.local_endpoint(ec).port();
        running   = true;
        return {};
    }

    void doAccept()
    {
        acceptor.async_accept(
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket)
            {
                self->onAccept(ec, std::move(socket));
            });
    }

    void onAccept(beast::error_code ec, tcp::socket socket)
    {
        if (!running)
            return;
        if (ec)
        {
            core::Log::warn("SINK", "accept: " + ec.message());
        }
        else
        {
            auto session = std::make_shared<Session>(std::move(socket), shared);
            sessions.remove_if([](const std::weak_ptr<Session>& s) { return s.expired(); });
            sessions.push_back(session);
            session->run();
        }
        doAccept();
    }

    void stop() noexcept
    {
        if (!running)
            return;
        running = false;

        beast::error_code ignored;
        acceptor.close(ignored);
        for (auto& weak : sessions)
        {
            if (auto session = weak.lock())
                session->close();
        }
        sessions.clear();
    }
};

SinkServer::SinkServer(asio::io_context& io, SinkConfig config)
    : impl_{std::make_shared<Impl>(io, std::move(config))}
{
}

SinkServer::~SinkServer()
{
    stop();
}

core::Expected<void> SinkServer::start()
{
    if (impl_->running)
        return core::makeError(core::ErrorCode::kAlreadyRunning, "sink server already running");

    SYNAPSE_TRY_VOID(impl_->listen());
    impl_->doAccept();
    core::Log::info("SINK", "listening on ws://" + impl_->config.address + ":"
                    + std::to_string(impl_->boundPort));
    return {};
}

void SinkServer::stop() noexcept
{
    impl_->stop();
}

bool SinkServer::running() const noexcept
{
    return impl_->running;
}

core::u16 SinkServer::port() const noexcept
{
    return impl_->boundPort;
}

SinkStats SinkServer::stats() const noexcept
{
    return impl_->shared->stats;
}

void SinkServer::setFrameListener(FrameListener listener)
{
    impl_->shared->listener = std::move(listener);
}

} // namespace synapse::sink

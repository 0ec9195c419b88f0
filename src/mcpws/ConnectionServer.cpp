//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpws/ConnectionServer.cpp
// Purpose: WebSocket server using Boost.Beast coroutines (TLS 1.3 only for wss). One strand, one reader,
//          one writer and one dispatch worker thread per connection.
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <list>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpws/ConnectionServer.hpp"
#include "mcpws/errors/Errors.h"
#include "mcpws/version.h"

namespace mcpws {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

std::int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Strict port check: numeric and within [0, 65535]
unsigned short parsePort(const std::string& port) {
    if (port.empty()) {
        throw std::runtime_error("invalid port: empty");
    }
    bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!allDigits || port.size() > 5) {
        throw std::runtime_error("invalid port: " + port);
    }
    unsigned long portNum = std::stoul(port);
    if (portNum > 65535ul) {
        throw std::runtime_error("invalid port (out of range): " + port);
    }
    return static_cast<unsigned short>(portNum);
}

//==========================================================================================================
// ServerConnection
// Purpose: Type-erased view of a live connection held by the server (plain or TLS).
//==========================================================================================================
class ServerConnection : public IConnection {
public:
    virtual std::uint64_t ConnectionId() const = 0;
    virtual void Launch() = 0;
    // Hard close of the underlying socket when the closing handshake did not finish.
    virtual void Abort() = 0;
};

struct WorkerThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

//==========================================================================================================
// ServerState
// Purpose: State shared between the server and its connections.
//==========================================================================================================
struct ServerState {
    ConnectionServer::Options opts;
    SessionManager& sessions;
    ToolRegistry& tools;
    ProtocolHandler& protocol;

    std::atomic<bool> running{false};
    std::atomic<std::uint64_t> accepted{0};
    std::atomic<std::uint64_t> messagesHandled{0};
    std::atomic<std::uint64_t> nextConnectionId{1};

    std::mutex connMutex;
    std::condition_variable connCv;
    std::unordered_map<std::uint64_t, std::shared_ptr<ServerConnection>> live;
    std::list<WorkerThread> workers;

    ServerState(const ConnectionServer::Options& o, SessionManager& s, ToolRegistry& t, ProtocolHandler& p)
        : opts(o), sessions(s), tools(t), protocol(p) {}

    void registerConnection(const std::shared_ptr<ServerConnection>& conn) {
        std::lock_guard<std::mutex> lk(connMutex);
        live[conn->ConnectionId()] = conn;
    }

    void onConnectionFinished(std::uint64_t id) {
        {
            std::lock_guard<std::mutex> lk(connMutex);
            live.erase(id);
        }
        connCv.notify_all();
    }

    void registerWorker(std::thread t, std::shared_ptr<std::atomic<bool>> done) {
        std::lock_guard<std::mutex> lk(connMutex);
        workers.push_back(WorkerThread{std::move(t), std::move(done)});
    }

    // Joins finished workers (all workers when all is true).
    void reapWorkers(bool all) {
        std::list<WorkerThread> toJoin;
        {
            std::lock_guard<std::mutex> lk(connMutex);
            for (auto it = workers.begin(); it != workers.end();) {
                if (all || it->done->load()) {
                    toJoin.push_back(std::move(*it));
                    it = workers.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& w : toJoin) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
    }

    std::vector<std::shared_ptr<ServerConnection>> liveSnapshot() {
        std::lock_guard<std::mutex> lk(connMutex);
        std::vector<std::shared_ptr<ServerConnection>> out;
        out.reserve(live.size());
        for (const auto& [id, conn] : live) {
            out.push_back(conn);
        }
        return out;
    }
};

enum class OutboundKind { Text, Ping, Close };

struct Outbound {
    OutboundKind kind{OutboundKind::Text};
    std::string payload;
    std::shared_ptr<std::promise<void>> done;
};

//==========================================================================================================
// WsConnection
// Purpose: One accepted WebSocket connection. Everything except the dispatch worker runs on the
//          connection's strand; strand-only members carry no lock.
//==========================================================================================================
template <class WsStream>
class WsConnection : public ServerConnection, public std::enable_shared_from_this<WsConnection<WsStream>> {
public:
    template <class... StreamArgs>
    WsConnection(ServerState& state, std::uint64_t id, std::string remoteAddress, StreamArgs&&... streamArgs)
        : state(state),
          id(id),
          remoteAddress(std::move(remoteAddress)),
          ws(std::forward<StreamArgs>(streamArgs)...),
          heartbeatTimer(ws.get_executor()) {
        touch();
    }

    ////////////////////////////////////////// IConnection //////////////////////////////////////////

    std::future<void> Send(const std::string& frame) override {
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        if (!open.load()) {
            done->set_exception(std::make_exception_ptr(errors::ConnectionClosedError("Connection is closed")));
            return fut;
        }
        enqueue(Outbound{OutboundKind::Text, frame, done});
        return fut;
    }

    bool IsOpen() const override { return open.load(); }

    std::future<void> Close() override {
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        open.store(false);
        enqueue(Outbound{OutboundKind::Close, std::string(), done});
        return fut;
    }

    std::string GetRemoteAddress() const override { return remoteAddress; }

    ////////////////////////////////////////// ServerConnection //////////////////////////////////////////

    std::uint64_t ConnectionId() const override { return id; }

    void Launch() override {
        auto self = this->shared_from_this();
        net::co_spawn(ws.get_executor(), [self]() -> net::awaitable<void> { co_await self->run(); }, net::detached);
    }

    void Abort() override {
        auto self = this->shared_from_this();
        net::post(ws.get_executor(), [self]() {
            LOG_WARN("Connection {} did not close in time; closing socket", self->remoteAddress);
            beast::get_lowest_layer(self->ws).close();
        });
    }

private:
    ServerState& state;
    const std::uint64_t id;
    const std::string remoteAddress;
    WsStream ws;
    net::steady_timer heartbeatTimer;

    std::atomic<bool> open{true};
    std::atomic<std::int64_t> lastActivityMs{0};
    std::shared_ptr<Session> session;

    // Strand-only
    bool handshakeDone{false};
    bool finished{false};
    bool writing{false};
    bool closeQueued{false};
    std::deque<Outbound> outbox;

    // Inbox shared with the dispatch worker
    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    std::deque<std::string> inbox;
    bool inboxClosed{false};

    void touch() { lastActivityMs.store(steadyNowMs()); }

    ////////////////////////////////////////// Reader //////////////////////////////////////////

    net::awaitable<void> handshake() {
        if constexpr (std::is_same_v<WsStream, TlsWs>) {
            beast::get_lowest_layer(ws).expires_after(state.opts.closeTimeout);
            co_await ws.next_layer().async_handshake(ssl::stream_base::server, net::use_awaitable);
        }
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout{
            state.opts.closeTimeout, websocket::stream_base::none(), false});
        ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, std::string("mcpws/") + getVersionString());
        }));
        ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong) {
                touch();
            }
        });
        co_await ws.async_accept(net::use_awaitable);
        co_return;
    }

    net::awaitable<void> run() {
        auto self = this->shared_from_this();
        try {
            co_await handshake();
        } catch (const std::exception& e) {
            LOG_WARN("WebSocket handshake with {} failed: {}", remoteAddress, e.what());
            finish();
            co_return;
        }
        handshakeDone = true;
        if (closeQueued || !open.load()) {
            // Server began stopping during the handshake
            finish();
            co_return;
        }

        session = state.sessions.CreateSession(self);
        startWorker();
        if (state.opts.pingInterval.count() > 0) {
            net::co_spawn(ws.get_executor(), [self]() -> net::awaitable<void> { co_await self->heartbeat(); }, net::detached);
        }

        beast::flat_buffer buffer;
        try {
            for (;;) {
                co_await ws.async_read(buffer, net::use_awaitable);
                std::string frame = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                touch();
                if (!ws.got_text()) {
                    LOG_DEBUG("Binary frame from {} treated as text", remoteAddress);
                }
                auto oob = state.protocol.HandleOutOfBand(self, frame);
                if (oob.consumed) {
                    if (oob.reply.has_value()) {
                        state.messagesHandled.fetch_add(1);
                        onEnqueue(Outbound{OutboundKind::Text, std::move(oob.reply.value()), nullptr});
                    }
                    continue;
                }
                {
                    std::lock_guard<std::mutex> lk(inboxMutex);
                    inbox.push_back(std::move(frame));
                }
                inboxCv.notify_one();
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("Connection {} closed", remoteAddress);
            } else if (!state.running.load() || closeQueued) {
                LOG_DEBUG("Connection {} ended during close: {}", remoteAddress, e.what());
            } else {
                LOG_WARN("Connection {} ended: {}", remoteAddress, e.what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Connection {} reader failed: {}", remoteAddress, e.what());
        }
        finish();
        co_return;
    }

    // Runs on the strand once the reader is done
    void finish() {
        if (finished) {
            return;
        }
        finished = true;
        open.store(false);
        boost::system::error_code ec;
        heartbeatTimer.cancel(ec);
        failOutbox("Connection is closed");
        if (session) {
            state.sessions.RemoveSession(this);
        }
        {
            std::lock_guard<std::mutex> lk(inboxMutex);
            inboxClosed = true;
        }
        inboxCv.notify_all();
        state.onConnectionFinished(id);
    }

    ////////////////////////////////////////// Dispatch worker //////////////////////////////////////////

    void startWorker() {
        auto self = this->shared_from_this();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([self, done]() {
            self->workerLoop();
            done->store(true);
            // Joined from an I/O thread once this one returns
            ServerState& st = self->state;
            net::post(self->ws.get_executor(), [&st]() { st.reapWorkers(false); });
        });
        state.registerWorker(std::move(t), done);
    }

    // One message at a time, in arrival order
    void workerLoop() {
        std::shared_ptr<IConnection> self = this->shared_from_this();
        for (;;) {
            std::string frame;
            {
                std::unique_lock<std::mutex> lk(inboxMutex);
                inboxCv.wait(lk, [this]() { return !inbox.empty() || inboxClosed; });
                if (inbox.empty()) {
                    break;
                }
                frame = std::move(inbox.front());
                inbox.pop_front();
            }
            if (!open.load()) {
                LOG_DEBUG("Dropping frame from closed connection {}", remoteAddress);
                continue;
            }

            std::optional<std::string> reply;
            try {
                reply = state.protocol.HandleMessage(self, frame);
            } catch (const std::exception& e) {
                LOG_ERROR("Unhandled error on connection {}: {}", remoteAddress, e.what());
                reply = ProtocolHandler::CreateError(nullptr, JSONRPCErrorCodes::InternalError, "Internal server error");
            } catch (...) {
                LOG_ERROR("Unhandled non-standard exception on connection {}", remoteAddress);
                reply = ProtocolHandler::CreateError(nullptr, JSONRPCErrorCodes::InternalError, "Internal server error");
            }
            state.messagesHandled.fetch_add(1);
            if (!reply.has_value()) {
                continue;
            }
            auto fut = Send(reply.value());
            if (fut.wait_for(state.opts.closeTimeout) != std::future_status::ready) {
                LOG_WARN("Response to {} not written within {} ms", remoteAddress, state.opts.closeTimeout.count());
                continue;
            }
            try {
                fut.get();
            } catch (const std::exception& e) {
                LOG_WARN("Could not deliver response to {}: {}", remoteAddress, e.what());
            }
        }
        LOG_DEBUG("Dispatch worker for {} finished", remoteAddress);
    }

    ////////////////////////////////////////// Writer //////////////////////////////////////////

    void enqueue(Outbound item) {
        auto self = this->shared_from_this();
        net::post(ws.get_executor(), [self, item = std::move(item)]() mutable { self->onEnqueue(std::move(item)); });
    }

    static void refuse(Outbound& item, const std::string& why) {
        if (!item.done) {
            return;
        }
        if (item.kind == OutboundKind::Close) {
            item.done->set_value();
        } else {
            item.done->set_exception(std::make_exception_ptr(errors::ConnectionClosedError(why)));
        }
    }

    void onEnqueue(Outbound item) {
        if (finished || closeQueued) {
            refuse(item, "Connection is closed");
            return;
        }
        if (item.kind == OutboundKind::Close) {
            closeQueued = true;
            if (!handshakeDone) {
                beast::get_lowest_layer(ws).close();
                refuse(item, "Connection is closed");
                return;
            }
        }
        outbox.push_back(std::move(item));
        if (!writing) {
            writing = true;
            auto self = this->shared_from_this();
            net::co_spawn(ws.get_executor(), [self]() -> net::awaitable<void> { co_await self->writeLoop(); }, net::detached);
        }
    }

    // Single outstanding write; drains the FIFO
    net::awaitable<void> writeLoop() {
        while (!outbox.empty()) {
            Outbound item = std::move(outbox.front());
            outbox.pop_front();
            try {
                switch (item.kind) {
                    case OutboundKind::Text:
                        ws.text(true);
                        co_await ws.async_write(net::buffer(item.payload), net::use_awaitable);
                        break;
                    case OutboundKind::Ping:
                        co_await ws.async_ping(websocket::ping_data{}, net::use_awaitable);
                        break;
                    case OutboundKind::Close:
                        co_await ws.async_close(websocket::close_code::normal, net::use_awaitable);
                        break;
                }
                if (item.done) {
                    item.done->set_value();
                }
            } catch (const boost::system::system_error& e) {
                if (item.done) {
                    if (item.kind == OutboundKind::Close) {
                        item.done->set_value();
                    } else {
                        item.done->set_exception(std::make_exception_ptr(
                            errors::ConnectionClosedError(std::string("Write failed: ") + e.what())));
                    }
                }
                LOG_DEBUG("Write to {} failed: {}", remoteAddress, e.what());
                open.store(false);
                failOutbox("Connection is closed");
                break;
            }
        }
        writing = false;
        co_return;
    }

    void failOutbox(const std::string& why) {
        while (!outbox.empty()) {
            Outbound item = std::move(outbox.front());
            outbox.pop_front();
            refuse(item, why);
        }
    }

    ////////////////////////////////////////// Heartbeat //////////////////////////////////////////

    net::awaitable<void> heartbeat() {
        try {
            for (;;) {
                heartbeatTimer.expires_after(state.opts.pingInterval);
                co_await heartbeatTimer.async_wait(net::use_awaitable);
                if (finished || closeQueued) {
                    break;
                }
                const std::int64_t sentAt = steadyNowMs();
                onEnqueue(Outbound{OutboundKind::Ping, std::string(), nullptr});

                heartbeatTimer.expires_after(state.opts.pingTimeout);
                co_await heartbeatTimer.async_wait(net::use_awaitable);
                if (finished || closeQueued) {
                    break;
                }
                if (lastActivityMs.load() < sentAt) {
                    LOG_WARN("Heartbeat timeout on {}: no traffic for {} ms after ping", remoteAddress,
                             state.opts.pingTimeout.count());
                    open.store(false);
                    onEnqueue(Outbound{OutboundKind::Close, std::string(), nullptr});
                    break;
                }
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() != net::error::operation_aborted) {
                LOG_DEBUG("Heartbeat for {} stopped: {}", remoteAddress, e.what());
            }
        }
        co_return;
    }
};

} // namespace

class ConnectionServer::Impl {
public:
    ServerState state;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when TLS files are configured
    std::vector<std::thread> ioThreads;
    std::atomic<unsigned short> boundPort{0};
    std::atomic<bool> started{false};
    std::mutex stopMutex;

    std::function<void(const std::string&)> errorHandler;

    Impl(const ConnectionServer::Options& o, SessionManager& s, ToolRegistry& t, ProtocolHandler& p)
        : state(o, s, t, p), ioc(static_cast<int>(std::max(1u, o.ioThreads))) {}

    ~Impl() {
        if (workGuard) {
            workGuard.reset();
        }
        ioc.stop();
        for (auto& th : ioThreads) {
            if (th.joinable()) {
                th.join();
            }
        }
        state.reapWorkers(true);
    }

    bool useTls() const { return !state.opts.certFile.empty() || !state.opts.keyFile.empty(); }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void buildTlsContext() {
        if (state.opts.certFile.empty() || state.opts.keyFile.empty()) {
            throw std::runtime_error("TLS requires both a certificate and a key file");
        }
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        try {
            sslCtx->use_certificate_chain_file(state.opts.certFile);
            sslCtx->use_private_key_file(state.opts.keyFile, ssl::context::file_format::pem);
        } catch (const std::exception& e) {
            LOG_ERROR("ConnectionServer: failed to load certificate/key: {}", e.what());
            throw;
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    void bindAndListen() {
        const unsigned short port = parsePort(state.opts.port);
        if (useTls()) {
            buildTlsContext();
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(state.opts.host, std::to_string(port));
        if (results.empty()) {
            throw std::runtime_error("cannot resolve host " + state.opts.host);
        }
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen(net::socket_base::max_listen_connections);
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        while (state.running.load()) {
            try {
                tcp::socket socket(net::make_strand(ioc));
                co_await acceptor->async_accept(socket, net::use_awaitable);
                if (!state.running.load()) {
                    break;
                }
                boost::system::error_code ec;
                socket.set_option(tcp::no_delay(true), ec);
                std::string remote = "unknown";
                auto rep = socket.remote_endpoint(ec);
                if (!ec) {
                    remote = rep.address().to_string() + ":" + std::to_string(rep.port());
                }
                state.accepted.fetch_add(1);
                state.reapWorkers(false);

                const std::uint64_t id = state.nextConnectionId.fetch_add(1);
                std::shared_ptr<ServerConnection> conn;
                if (sslCtx) {
                    conn = std::make_shared<WsConnection<TlsWs>>(state, id, remote, std::move(socket), *sslCtx);
                } else {
                    conn = std::make_shared<WsConnection<PlainWs>>(state, id, remote, std::move(socket));
                }
                LOG_DEBUG("Accepted connection {} from {}", id, remote);
                state.registerConnection(conn);
                conn->Launch();
            } catch (const boost::system::system_error& e) {
                if (!state.running.load() || e.code() == net::error::operation_aborted) {
                    // Acceptor closed by Stop
                    break;
                }
                setError(std::string("ConnectionServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    void runIo() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            setError(std::string("ConnectionServer I/O thread error: ") + e.what());
        }
    }
};

ConnectionServer::ConnectionServer(const Options& opts, SessionManager& sessions, ToolRegistry& tools,
                                   ProtocolHandler& protocol)
    : pImpl(std::make_unique<Impl>(opts, sessions, tools, protocol)) {}

ConnectionServer::~ConnectionServer() {
    try {
        Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("ConnectionServer shutdown error: {}", e.what());
    }
}

std::future<void> ConnectionServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    std::lock_guard<std::mutex> lk(pImpl->stopMutex);
    if (pImpl->started.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->bindAndListen();
    } catch (const std::exception& e) {
        pImpl->acceptor.reset();
        LOG_ERROR("ConnectionServer failed to listen on {}:{}: {}", pImpl->state.opts.host, pImpl->state.opts.port, e.what());
        ready.set_exception(std::make_exception_ptr(std::runtime_error(e.what())));
        return fut;
    }

    pImpl->ioc.restart();
    pImpl->state.running.store(true);
    pImpl->started.store(true);
    pImpl->workGuard.emplace(pImpl->ioc.get_executor());
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    const unsigned int threads = std::max(1u, pImpl->state.opts.ioThreads);
    for (unsigned int i = 0; i < threads; ++i) {
        pImpl->ioThreads.emplace_back([this]() { pImpl->runIo(); });
    }

    LOG_INFO("Listening on {}://{}:{} ({} I/O threads)", pImpl->sslCtx ? "wss" : "ws", pImpl->state.opts.host,
             pImpl->boundPort.load(), threads);
    for (const auto& tool : pImpl->state.tools.ListTools()) {
        LOG_INFO("Registered tool: {}", tool.name);
    }
    ready.set_value();
    return fut;
}

std::future<void> ConnectionServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    std::lock_guard<std::mutex> lk(pImpl->stopMutex);
    if (!pImpl->started.exchange(false)) {
        done.set_value();
        return fut;
    }
    pImpl->state.running.store(false);

    // Refuse new connections
    {
        auto closed = std::make_shared<std::promise<void>>();
        auto closedFut = closed->get_future();
        net::post(pImpl->ioc, [this, closed]() {
            boost::system::error_code ec;
            if (pImpl->acceptor) {
                pImpl->acceptor->close(ec);
            }
            closed->set_value();
        });
        if (closedFut.wait_for(pImpl->state.opts.closeTimeout) != std::future_status::ready) {
            LOG_WARN("Timed out closing the acceptor");
        }
    }

    const std::size_t cancelled = pImpl->state.protocol.CancelAll();
    if (cancelled > 0) {
        LOG_INFO("Cancelled {} in-flight tool invocations", cancelled);
    }

    // Closing handshake on every connection, bounded by closeTimeout
    auto connections = pImpl->state.liveSnapshot();
    std::vector<std::future<void>> closing;
    closing.reserve(connections.size());
    for (const auto& conn : connections) {
        closing.push_back(conn->Close());
    }
    const auto grace = pImpl->state.opts.closeTimeout + std::chrono::milliseconds(1000);
    {
        std::unique_lock<std::mutex> connLk(pImpl->state.connMutex);
        if (!pImpl->state.connCv.wait_for(connLk, grace, [this]() { return pImpl->state.live.empty(); })) {
            connLk.unlock();
            for (const auto& conn : pImpl->state.liveSnapshot()) {
                conn->Abort();
            }
            connLk.lock();
            (void)pImpl->state.connCv.wait_for(connLk, grace, [this]() { return pImpl->state.live.empty(); });
        }
    }
    for (auto& f : closing) {
        if (f.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            try {
                f.get();
            } catch (const std::exception& e) {
                LOG_DEBUG("Close completed with error: {}", e.what());
            }
        }
    }

    pImpl->state.reapWorkers(true);

    pImpl->workGuard.reset();
    pImpl->ioc.stop();
    for (auto& th : pImpl->ioThreads) {
        if (th.joinable()) {
            th.join();
        }
    }
    pImpl->ioThreads.clear();
    pImpl->acceptor.reset();

    LOG_INFO("Server stopped: {} connections accepted, {} messages handled, {} sessions remaining",
             pImpl->state.accepted.load(), pImpl->state.messagesHandled.load(), pImpl->state.sessions.SessionCount());
    done.set_value();
    return fut;
}

bool ConnectionServer::IsRunning() const {
    return pImpl->state.running.load();
}

unsigned short ConnectionServer::GetBoundPort() const {
    return pImpl->boundPort.load();
}

ConnectionServer::Stats ConnectionServer::GetStats() const {
    Stats s;
    s.connectionsAccepted = pImpl->state.accepted.load();
    s.messagesHandled = pImpl->state.messagesHandled.load();
    std::lock_guard<std::mutex> lk(pImpl->state.connMutex);
    s.activeConnections = pImpl->state.live.size();
    s.dispatchWorkers = pImpl->state.workers.size();
    return s;
}

JSONValue ConnectionServer::GetServerInfo() const {
    std::int64_t port = pImpl->boundPort.load();
    if (port == 0) {
        try {
            port = parsePort(pImpl->state.opts.port);
        } catch (const std::runtime_error&) {
            port = 0;
        }
    }
    JSONValue::Object info;
    info["host"] = std::make_shared<JSONValue>(pImpl->state.opts.host);
    info["port"] = std::make_shared<JSONValue>(port);
    info["running"] = std::make_shared<JSONValue>(pImpl->state.running.load());
    info["activeSessions"] = std::make_shared<JSONValue>(static_cast<std::int64_t>(pImpl->state.sessions.SessionCount()));
    info["registeredTools"] = std::make_shared<JSONValue>(static_cast<std::int64_t>(pImpl->state.tools.Size()));
    info["llmType"] = std::make_shared<JSONValue>(pImpl->state.opts.llmType);
    return JSONValue{info};
}

void ConnectionServer::SetErrorHandler(std::function<void(const std::string&)> handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpws

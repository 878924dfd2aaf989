#include "envelope.hpp"
#include "frame.hpp"
#include "sessionState.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <boost/asio.hpp>

#ifndef HOSTENGINE_HPP
#define HOSTENGINE_HPP

using boost::asio::ip::tcp;

class HostEngine;

/*
 * ============================================================================
 * ONE ACCEPTED CLIENT, FROM CONNECT TO CLOSE
 * ============================================================================
 *
 *   ┌────────────┐  frame ok,      ┌──────────────┐  ok=true   ┌────────────┐
 *   │ Await-Auth │ ──────────────▶ │ Authenticate │ ─────────▶ │ Relay Loop │
 *   └────────────┘  auth_request   └──────────────┘            └────────────┘
 *         │                               │ ok=false                 │
 *         │ anything else                 │ (response sent first)    │ read error,
 *         ▼                               ▼                          │ shutdown
 *   ┌──────────────────────────────────────────────────────────────────────┐
 *   │                               Closed                                 │
 *   └──────────────────────────────────────────────────────────────────────┘
 *
 * In the relay loop, reading and writing are independent: async_read keeps
 * chaining header -> body -> header, and async_write drains outgoing_ whenever
 * it is non-empty. Both run on the I/O thread, so outgoing_ needs no lock;
 * deliver() from other threads posts onto that thread first.
 *
 * Every handler captures `self` so the connection lives as long as some
 * operation is still pending on it.
 */
class HostConnection : public FrameSink, public std::enable_shared_from_this<HostConnection> {
    public:
    HostConnection(tcp::socket socket, std::shared_ptr<HostEngine> engine, SessionContext& context);

        void start();

    void deliver(FramePtr frame) override;

        // I/O thread only. Closes the socket; pending reads finish with
        // operation_aborted and run the normal teardown.
        void shutdown();

    private:
        void readAuthHeader();
        void readAuthBody();
        void authenticate(const Envelope& request);
        void register_peer();

        void async_read();
        void readFrameBody();
        void relayItem(const ClipboardItem& item);

    void async_write();
        void teardown(const std::string& reason);

        tcp::socket clientSocket;
        std::shared_ptr<HostEngine> engine_;
        SessionContext& context_;
        Frame incomingFrame;
    std::deque<FramePtr> outgoingFrames;

        std::string clientId_;
        std::optional<std::string> clientName_;
        std::optional<std::string> remoteAddr_;
        bool registered_ = false;
        bool closed_ = false;
        bool shuttingDown_ = false;
};

typedef std::shared_ptr<HostConnection> HostConnectionPtr;

/*
 * ============================================================================
 * THE HOST - LISTENER PLUS EVERY LIVE CONNECTION
 * ============================================================================
 *
 * The constructor binds synchronously so a busy port is reported to whoever
 * called startHost(). start() begins the accept loop on the I/O thread.
 *
 * Connections register here as soon as they are accepted (before auth), so
 * stop() can close every one of them, including connections still sitting
 * in Await-Auth. The peer table in SessionState only holds authenticated
 * clients.
 */
class HostEngine : public std::enable_shared_from_this<HostEngine> {
    public:
    HostEngine(SessionContext& context, uint16_t port);

        void start();

        // Synchronous: listener and all connections are closed on return.
        void stop();

        uint16_t port() const {
            return port_;
        }

        bool stopped() const {
            return stopped_;
        }

        void join(HostConnectionPtr connection);
        void leave(HostConnectionPtr connection);

    private:
        void start_accept();

        SessionContext& context_;
        tcp::acceptor acceptor_;
        uint16_t port_;
        std::set<HostConnectionPtr> connections_;
        bool stopped_ = false;
};

std::string formatEndpoint(const tcp::endpoint& endpoint);

#endif // HOSTENGINE_HPP

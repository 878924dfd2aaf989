#include "envelope.hpp"
#include "frame.hpp"
#include "sessionState.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>

#ifndef CLIENTENGINE_HPP
#define CLIENTENGINE_HPP

using boost::asio::ip::tcp;

/*
 * ============================================================================
 * JOINING A HOST
 * ============================================================================
 *
 * Two halves:
 *
 *   connectAndAuthenticate()   runs on the command thread and blocks. Every
 *                              step is an asio async op waited on through a
 *                              future with a deadline, so a silent host costs
 *                              at most connectTimeout + 2 * handshakeTimeout.
 *
 *   ClientConnection           takes over the authenticated socket and lives
 *                              on the I/O thread: a read loop feeding the
 *                              observer and a write queue toward the Host.
 *
 * The Client never reconnects. When the read loop ends, the session drops
 * back to Off and observers see an empty membership.
 */

// Throws LanQueueError (Connect, Timeout, AuthRejected or Protocol).
tcp::socket connectAndAuthenticate(SessionContext& context,
                                   const std::string& host,
                                   uint16_t port,
                                   const std::string& password,
                                   const std::string& clientId,
                                   const std::optional<std::string>& clientName);

class ClientConnection : public FrameSink, public std::enable_shared_from_this<ClientConnection> {
public:
    ClientConnection(tcp::socket socket, SessionContext& context);

    void start();

    void deliver(FramePtr frame) override;

    // Synchronous. After it returns the socket is closed and the connection
    // no longer touches session state.
    void stop();

private:
    void startReceiving();
    void readBodyData();
    void handleEnvelope(const Envelope& envelope);
    void async_write();
    void closeConnection(const std::string& reason);

    tcp::socket socket;
    SessionContext& context_;
    Frame readFrame;
    std::deque<FramePtr> outgoingFrames;
    bool closed_ = false;
    bool stopped_ = false;
};

std::string describeTimeout(std::chrono::milliseconds timeout);

#endif // CLIENTENGINE_HPP

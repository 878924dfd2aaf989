#include "clientEngine.hpp"
#include "lanQueueError.hpp"
#include "logger.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <utility>
#include <vector>
#include <boost/asio/use_future.hpp>

std::string describeTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + "s";
    }
    return std::to_string(timeout.count()) + "ms";
}

namespace {

typedef std::chrono::steady_clock Clock;

/*
 * Waits for one handshake step. On timeout the operation is cancelled on the
 * I/O thread and we wait for it to actually finish, so nothing still refers
 * to the socket or resolver once we throw.
 */
template <typename T>
T awaitStep(SessionContext& context,
            std::future<T>& pending,
            Clock::time_point deadline,
            const std::function<void()>& cancel,
            const std::string& failurePrefix,
            const std::string& timeoutMessage) {
    if (pending.wait_until(deadline) == std::future_status::timeout) {
        context.runOnIo(cancel);
        pending.wait();
        throw LanQueueError(LanQueueErrorKind::Timeout, timeoutMessage);
    }

    try {
        return pending.get();
    } catch (const boost::system::system_error& e) {
        throw LanQueueError(LanQueueErrorKind::Connect, failurePrefix + e.code().message());
    }
}

} // namespace

tcp::socket connectAndAuthenticate(SessionContext& context,
                                   const std::string& host,
                                   uint16_t port,
                                   const std::string& password,
                                   const std::string& clientId,
                                   const std::optional<std::string>& clientName) {
    tcp::resolver resolver(context.io);
    tcp::socket socket(context.io);

    auto closeSocket = [&socket]() {
        boost::system::error_code ec;
        socket.close(ec);
    };

    // Resolve + connect share one deadline.
    Clock::time_point deadline = Clock::now() + context.config.connectTimeout;
    std::string timeoutMessage = "Connection timeout (" + describeTimeout(context.config.connectTimeout) + ")";

    std::future<tcp::resolver::results_type> resolving =
        resolver.async_resolve(host, std::to_string(port), boost::asio::use_future);
    tcp::resolver::results_type endpoints = awaitStep(context, resolving, deadline,
        [&resolver]() { resolver.cancel(); },
        "Failed to connect: ", timeoutMessage);

    std::future<tcp::endpoint> connecting =
        boost::asio::async_connect(socket, endpoints, boost::asio::use_future);
    tcp::endpoint remote = awaitStep(context, connecting, deadline, closeSocket,
        "Failed to connect: ", timeoutMessage);

    LOG_INFO("Connected to host " + remote.address().to_string() + ":" + std::to_string(remote.port())
             + ", authenticating");

    timeoutMessage = "Connection timeout (" + describeTimeout(context.config.handshakeTimeout) + ")";

    std::string request;
    try {
        request = encodeFrame(Envelope::authRequest(password, clientId, clientName).serialize());
    } catch (const FrameError& e) {
        throw LanQueueError(LanQueueErrorKind::Protocol, e.what());
    }

    deadline = Clock::now() + context.config.handshakeTimeout;
    std::future<std::size_t> writing =
        boost::asio::async_write(socket, boost::asio::buffer(request), boost::asio::use_future);
    awaitStep(context, writing, deadline, closeSocket,
        "Failed to send auth request: ", timeoutMessage);

    deadline = Clock::now() + context.config.handshakeTimeout;
    Frame response;
    std::future<std::size_t> readingHeader = boost::asio::async_read(socket,
        boost::asio::buffer(response.headerData, Frame::header), boost::asio::use_future);
    awaitStep(context, readingHeader, deadline, closeSocket,
        "Failed to read auth response: ", timeoutMessage);

    if (!response.decodeHeader()) {
        throw LanQueueError(LanQueueErrorKind::Protocol, "Invalid frame size");
    }

    std::future<std::size_t> readingBody = boost::asio::async_read(socket,
        boost::asio::buffer(response.body.data(), response.getBodyLength()), boost::asio::use_future);
    awaitStep(context, readingBody, deadline, closeSocket,
        "Failed to read auth response: ", timeoutMessage);

    Envelope envelope;
    try {
        envelope = Envelope::parse(response.getBody());
    } catch (const EnvelopeError& e) {
        throw LanQueueError(LanQueueErrorKind::Protocol, e.what());
    }

    if (envelope.type != EnvelopeType::AuthResponse) {
        throw LanQueueError(LanQueueErrorKind::Protocol, "Invalid auth response");
    }
    if (!envelope.ok) {
        throw LanQueueError(LanQueueErrorKind::AuthRejected,
                            envelope.reason.value_or("Authentication failed"));
    }

    return socket;
}

ClientConnection::ClientConnection(tcp::socket socket, SessionContext& context)
    : socket(std::move(socket)), context_(context) {
}

void ClientConnection::start() {
    auto self = shared_from_this();
    boost::asio::post(context_.io, [self]() {
        self->startReceiving();
    });
}

void ClientConnection::stop() {
    auto self = shared_from_this();
    context_.runOnIo([this, self]() {
        stopped_ = true;
        closeConnection("leaving queue");
    });
}

void ClientConnection::deliver(FramePtr frame) {
    auto self = shared_from_this();
    boost::asio::post(context_.io, [this, self, frame]() {
        if (closed_) {
            return;
        }
        outgoingFrames.push_back(frame);

        if (outgoingFrames.size() == 1) {
            async_write();
        }
    });
}

void ClientConnection::startReceiving() {
    if (closed_) {
        return;
    }

    auto self = shared_from_this();

    boost::asio::async_read(socket,
        boost::asio::buffer(readFrame.headerData, Frame::header),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    closeConnection("host closed the connection");
                } else {
                    closeConnection("connection lost: " + ec.message());
                }
                return;
            }
            if (!readFrame.decodeHeader()) {
                closeConnection("invalid frame size from host");
                return;
            }
            readBodyData();
        });
}

void ClientConnection::readBodyData() {
    auto self = shared_from_this();

    boost::asio::async_read(socket,
        boost::asio::buffer(readFrame.body.data(), readFrame.getBodyLength()),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                closeConnection("error reading frame body: " + ec.message());
                return;
            }

            try {
                handleEnvelope(Envelope::parse(readFrame.getBody()));
            } catch (const EnvelopeError& e) {
                LOG_WARN(std::string("Discarding malformed frame from host: ") + e.what());
            }

            startReceiving();
        });
}

void ClientConnection::handleEnvelope(const Envelope& envelope) {
    if (closed_) {
        return;
    }

    switch (envelope.type) {
        case EnvelopeType::ClipboardItem: {
            {
                std::lock_guard<std::mutex> lock(context_.mutex);
                if (!context_.state.dedup.insert(envelope.item.id)) {
                    LOG_DEBUG("Dropping duplicate item " + envelope.item.id);
                    return;
                }
            }
            context_.publishItem(envelope.item);
            break;
        }
        case EnvelopeType::MemberUpdate: {
            {
                std::lock_guard<std::mutex> lock(context_.mutex);
                if (context_.state.clientSender.get() != static_cast<FrameSink*>(this)) {
                    return;
                }
                context_.state.relayedMembers = envelope.members;
            }
            context_.publishMembers(envelope.members);
            break;
        }
        default:
            LOG_DEBUG(std::string("Ignoring ") + envelopeTypeName(envelope.type) + " from host");
            break;
    }
}

void ClientConnection::async_write() {
    if (outgoingFrames.empty()) {
        return;
    }

    auto self = shared_from_this();
    FramePtr frame = outgoingFrames.front();

    boost::asio::async_write(socket,
        boost::asio::buffer(*frame),
        [this, self, frame](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (!ec) {
                if (closed_) {
                    return;
                }
                outgoingFrames.pop_front();

                if (!outgoingFrames.empty()) {
                    async_write();
                }
            } else {
                closeConnection("write error: " + ec.message());
            }
        });
}

void ClientConnection::closeConnection(const std::string& reason) {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    outgoingFrames.clear();

    if (stopped_) {
        LOG_INFO("Client connection closed: " + reason);
        return;
    }

    QueueStatus status;
    bool current = false;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        if (context_.state.clientSender.get() == static_cast<FrameSink*>(this)) {
            current = true;
            context_.state.clientSender.reset();
            context_.state.clientConnection.reset();
            context_.state.relayedMembers.clear();
            context_.state.role = Role::Off;
            status = context_.state.status();
        }
    }

    if (!current) {
        LOG_DEBUG("Stale client connection closed: " + reason);
        return;
    }

    LOG_WARN("Disconnected from host: " + reason);
    context_.publishStatus(status);
    context_.publishMembers(std::vector<QueueMember>());
}

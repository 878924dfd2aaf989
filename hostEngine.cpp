#include "hostEngine.hpp"
#include "logger.hpp"
#include "passwordHash.hpp"

#include <mutex>
#include <utility>
#include <vector>

std::string formatEndpoint(const tcp::endpoint& endpoint) {
    std::string address = endpoint.address().to_string();
    if (endpoint.address().is_v6()) {
        address = "[" + address + "]";
    }
    return address + ":" + std::to_string(endpoint.port());
}

/*
 * ============================================================================
 * HostEngine
 * ============================================================================
 */

HostEngine::HostEngine(SessionContext& context, uint16_t port)
    : context_(context), acceptor_(context.io), port_(port) {
    tcp::endpoint endpoint(boost::asio::ip::make_address(context_.config.bindAddress), port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    // Port 0 asks the OS to choose; report what we actually got.
    port_ = acceptor_.local_endpoint().port();
}

void HostEngine::start() {
    auto self = shared_from_this();
    boost::asio::post(context_.io, [self]() {
        self->start_accept();
    });
    LOG_INFO("Host listening on " + context_.config.bindAddress + ":" + std::to_string(port_));
}

void HostEngine::stop() {
    auto self = shared_from_this();
    context_.runOnIo([this, self]() {
        if (stopped_) {
            return;
        }
        stopped_ = true;

        boost::system::error_code ec;
        acceptor_.close(ec);

        std::set<HostConnectionPtr> closing;
        closing.swap(connections_);
        for (const auto& connection : closing) {
            connection->shutdown();
        }
        LOG_INFO("Host on port " + std::to_string(port_) + " stopped, closed "
                 + std::to_string(closing.size()) + " connection(s)");
    });
}

void HostEngine::join(HostConnectionPtr connection) {
    connections_.insert(connection);
}

void HostEngine::leave(HostConnectionPtr connection) {
    connections_.erase(connection);
}

void HostEngine::start_accept() {
    if (stopped_) {
        return;
    }

    auto self = shared_from_this();

    acceptor_.async_accept(
        [this, self](boost::system::error_code ec, tcp::socket socket) {
            if (stopped_) {
                return;
            }
            if (ec) {
                // The listener is gone for good; existing peers keep running.
                LOG_ERROR("Accept error, host stops accepting: " + ec.message());
                return;
            }

            auto connection = std::make_shared<HostConnection>(std::move(socket), self, context_);
            connection->start();

            start_accept();
        });
}

/*
 * ============================================================================
 * HostConnection
 * ============================================================================
 */

HostConnection::HostConnection(tcp::socket socket, std::shared_ptr<HostEngine> engine, SessionContext& context)
    : clientSocket(std::move(socket)), engine_(std::move(engine)), context_(context) {
}

void HostConnection::start() {
    boost::system::error_code ec;
    tcp::endpoint remote = clientSocket.remote_endpoint(ec);
    if (!ec) {
        remoteAddr_ = formatEndpoint(remote);
    }
    LOG_INFO("New connection from " + remoteAddr_.value_or("unknown address"));

    engine_->join(shared_from_this());
    readAuthHeader();
}

void HostConnection::deliver(FramePtr frame) {
    auto self = shared_from_this();
    boost::asio::post(clientSocket.get_executor(), [this, self, frame]() {
        if (closed_) {
            return;
        }
        outgoingFrames.push_back(frame);

        if (outgoingFrames.size() == 1) {
            async_write();
        }
    });
}

void HostConnection::shutdown() {
    shuttingDown_ = true;
    boost::system::error_code ec;
    clientSocket.shutdown(tcp::socket::shutdown_both, ec);
    clientSocket.close(ec);
}

void HostConnection::readAuthHeader() {
    auto self = shared_from_this();

    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingFrame.headerData, Frame::header),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                teardown("closed before authenticating: " + ec.message());
                return;
            }
            if (!incomingFrame.decodeHeader()) {
                teardown("invalid auth frame size");
                return;
            }
            readAuthBody();
        });
}

void HostConnection::readAuthBody() {
    auto self = shared_from_this();

    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingFrame.body.data(), incomingFrame.getBodyLength()),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                teardown("closed before authenticating: " + ec.message());
                return;
            }
            if (shuttingDown_) {
                teardown("host stopping");
                return;
            }

            Envelope request;
            try {
                request = Envelope::parse(incomingFrame.getBody());
            } catch (const EnvelopeError& e) {
                teardown(std::string("malformed auth request: ") + e.what());
                return;
            }

            if (request.type != EnvelopeType::AuthRequest) {
                teardown(std::string("expected auth_request, got ") + envelopeTypeName(request.type));
                return;
            }
            if (trimCopy(request.clientId).empty()) {
                teardown("auth_request without client_id");
                return;
            }

            authenticate(request);
        });
}

void HostConnection::authenticate(const Envelope& request) {
    bool ok = false;
    try {
        std::string supplied = hashPassword(request.password);
        std::lock_guard<std::mutex> lock(context_.mutex);
        ok = context_.state.passwordHash
            && passwordHashesMatch(*context_.state.passwordHash, supplied);
    } catch (const std::runtime_error& e) {
        teardown(std::string("password check failed: ") + e.what());
        return;
    }

    clientId_ = request.clientId;
    clientName_ = normalizeName(request.clientName);

    std::optional<std::string> reason;
    if (!ok) {
        reason = std::string("Invalid password");
    }
    auto response = std::make_shared<std::string>(
        encodeFrame(Envelope::authResponse(ok, reason).serialize()));

    auto self = shared_from_this();
    boost::asio::async_write(clientSocket, boost::asio::buffer(*response),
        [this, self, response, ok](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                teardown("auth response not delivered: " + ec.message());
                return;
            }
            if (!ok) {
                LOG_WARN("Rejected client " + clientId_ + " from "
                         + remoteAddr_.value_or("unknown address") + ": invalid password");
                teardown("authentication rejected");
                return;
            }
            register_peer();
        });
}

void HostConnection::register_peer() {
    if (shuttingDown_ || engine_->stopped()) {
        teardown("host stopping");
        return;
    }

    std::vector<QueueMember> members;
    bool current = false;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        if (context_.state.hostEngine == engine_) {
            current = true;
            context_.state.peers[clientId_] = PeerHandle{shared_from_this(), clientName_, remoteAddr_};
            registered_ = true;
            context_.state.broadcastToPeers(context_.state.memberUpdateFrame());
            members = context_.state.members();
        }
    }

    if (!current) {
        teardown("host replaced");
        return;
    }

    LOG_INFO("Client " + clientId_ + " (" + clientName_.value_or("unnamed") + ") joined from "
             + remoteAddr_.value_or("unknown address"));
    context_.publishMembers(members);

    async_read();
}

void HostConnection::async_read() {
    auto self = shared_from_this();

    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingFrame.headerData, Frame::header),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    teardown("client disconnected");
                } else {
                    teardown("read error: " + ec.message());
                }
                return;
            }
            if (shuttingDown_) {
                teardown("host stopping");
                return;
            }
            if (!incomingFrame.decodeHeader()) {
                teardown("invalid frame size");
                return;
            }
            readFrameBody();
        });
}

void HostConnection::readFrameBody() {
    auto self = shared_from_this();

    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingFrame.body.data(), incomingFrame.getBodyLength()),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                teardown("read body error: " + ec.message());
                return;
            }
            if (shuttingDown_) {
                teardown("host stopping");
                return;
            }

            try {
                Envelope envelope = Envelope::parse(incomingFrame.getBody());
                if (envelope.type == EnvelopeType::ClipboardItem) {
                    relayItem(envelope.item);
                } else {
                    LOG_DEBUG(std::string("Ignoring ") + envelopeTypeName(envelope.type)
                              + " from client " + clientId_);
                }
            } catch (const EnvelopeError& e) {
                LOG_WARN("Discarding malformed frame from client " + clientId_ + ": " + e.what());
            }

            async_read();
        });
}

/*
 * Fan-out rule: an item from client X goes to every other peer, never back
 * to X. The dedup cache on top of that drops repeats of the same id.
 */
void HostConnection::relayItem(const ClipboardItem& item) {
    std::vector<FrameSinkPtr> targets;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        if (!context_.state.dedup.insert(item.id)) {
            LOG_DEBUG("Dropping duplicate item " + item.id);
            return;
        }
        for (const auto& entry : context_.state.peers) {
            if (entry.first != clientId_) {
                targets.push_back(entry.second.sender);
            }
        }
    }

    context_.publishItem(item);

    if (targets.empty()) {
        return;
    }

    FramePtr frame;
    try {
        frame = makeFrame(Envelope::clipboardItem(item).serialize());
    } catch (const FrameError& e) {
        LOG_WARN("Item " + item.id + " not relayed: " + e.what());
        return;
    }
    for (const auto& target : targets) {
        target->deliver(frame);
    }
}

void HostConnection::async_write() {
    if (outgoingFrames.empty()) {
        return;
    }

    auto self = shared_from_this();
    FramePtr frame = outgoingFrames.front();

    boost::asio::async_write(clientSocket,
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
                teardown("write error: " + ec.message());
            }
        });
}

void HostConnection::teardown(const std::string& reason) {
    if (closed_) {
        return;
    }
    closed_ = true;

    LOG_INFO("Connection " + remoteAddr_.value_or("unknown address")
             + (clientId_.empty() ? std::string() : " (client " + clientId_ + ")")
             + " closed: " + reason);

    boost::system::error_code ec;
    clientSocket.shutdown(tcp::socket::shutdown_both, ec);
    clientSocket.close(ec);
    outgoingFrames.clear();

    engine_->leave(shared_from_this());

    if (!registered_) {
        return;
    }

    std::vector<QueueMember> members;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        auto it = context_.state.peers.find(clientId_);
        if (it != context_.state.peers.end() && it->second.sender.get() == static_cast<FrameSink*>(this)) {
            context_.state.peers.erase(it);
            removed = true;
            context_.state.broadcastToPeers(context_.state.memberUpdateFrame());
            members = context_.state.members();
        }
    }

    if (removed) {
        context_.publishMembers(members);
    }
}

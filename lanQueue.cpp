#include "lanQueue.hpp"
#include "clientEngine.hpp"
#include "hostEngine.hpp"
#include "logger.hpp"
#include "passwordHash.hpp"

#include <exception>
#include <utility>

LanQueue::LanQueue(QueueObserver& observer, const LanQueueConfig& config)
    : work_(boost::asio::make_work_guard(io_)), context_(io_, observer, config) {

    ioThread_ = std::thread([this]() {
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Unhandled error on I/O thread: ") + e.what());
            }
        }
    });

    LOG_DEBUG("LAN queue ready, self id " + context_.state.selfId);
}

LanQueue::~LanQueue() {
    try {
        leave();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error while shutting down LAN queue: ") + e.what());
    }

    // Everything is closed now; run() returns once the aborted handlers drain.
    work_.reset();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

void LanQueue::stopEngines() {
    std::shared_ptr<HostEngine> host;
    std::shared_ptr<ClientConnection> client;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        host = std::move(context_.state.hostEngine);
        client = std::move(context_.state.clientConnection);
        context_.state.clientSender.reset();
        context_.state.peers.clear();
    }

    if (host) {
        host->stop();
    }
    if (client) {
        client->stop();
    }
}

QueueStatus LanQueue::startHost(uint16_t port,
                                const std::string& password,
                                const std::optional<std::string>& queueName,
                                const std::optional<std::string>& memberName) {
    std::string passwordHash = hashPassword(password);

    std::lock_guard<std::mutex> command(commandMutex_);
    stopEngines();

    std::shared_ptr<HostEngine> engine;
    try {
        engine = std::make_shared<HostEngine>(context_, port);
    } catch (const boost::system::system_error& e) {
        QueueStatus status;
        {
            std::lock_guard<std::mutex> lock(context_.mutex);
            context_.state.role = Role::Off;
            context_.state.host.reset();
            context_.state.port.reset();
            context_.state.passwordHash.reset();
            context_.state.relayedMembers.clear();
            status = context_.state.status();
        }
        LOG_ERROR("Failed to bind host port " + std::to_string(port) + ": " + e.code().message());
        context_.publishStatus(status);
        context_.publishMembers(std::vector<QueueMember>());
        throw LanQueueError(LanQueueErrorKind::Bind,
                            "Failed to bind host port: " + e.code().message());
    }

    QueueStatus status;
    std::vector<QueueMember> members;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        context_.state.role = Role::Host;
        context_.state.host = context_.config.bindAddress;
        context_.state.port = engine->port();
        context_.state.selfName = normalizeName(memberName);
        if (!context_.state.selfName) {
            context_.state.selfName = normalizeName(queueName);
        }
        context_.state.passwordHash = passwordHash;
        context_.state.relayedMembers.clear();
        context_.state.hostEngine = engine;
        status = context_.state.status();
        members = context_.state.members();
    }

    engine->start();

    context_.publishStatus(status);
    context_.publishMembers(members);
    return status;
}

QueueStatus LanQueue::join(const std::string& host,
                           uint16_t port,
                           const std::string& password,
                           const std::optional<std::string>& memberName) {
    std::lock_guard<std::mutex> command(commandMutex_);
    stopEngines();

    std::string selfId;
    std::optional<std::string> selfName;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        context_.state.role = Role::Client;
        context_.state.host = host;
        context_.state.port = port;
        context_.state.selfName = normalizeName(memberName);
        context_.state.passwordHash.reset();
        context_.state.relayedMembers.clear();
        selfId = context_.state.selfId;
        selfName = context_.state.selfName;
    }

    LOG_INFO("Joining LAN queue at " + host + ":" + std::to_string(port));

    std::shared_ptr<ClientConnection> connection;
    try {
        connection = std::make_shared<ClientConnection>(
            connectAndAuthenticate(context_, host, port, password, selfId, selfName), context_);
    } catch (const LanQueueError& e) {
        QueueStatus status;
        {
            std::lock_guard<std::mutex> lock(context_.mutex);
            status = context_.state.status();
        }
        LOG_WARN(std::string("Join failed: ") + e.what());
        context_.publishStatus(status);
        throw;
    }

    QueueStatus status;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        context_.state.clientSender = connection;
        context_.state.clientConnection = connection;
        status = context_.state.status();
    }

    // Start reading only once the connection is the live send handle, so an
    // immediate disconnect still resets the session.
    connection->start();

    LOG_INFO("Joined LAN queue at " + host + ":" + std::to_string(port));
    context_.publishStatus(status);
    return status;
}

void LanQueue::leave() {
    std::lock_guard<std::mutex> command(commandMutex_);
    stopEngines();

    QueueStatus status;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        context_.state.role = Role::Off;
        context_.state.host.reset();
        context_.state.port.reset();
        context_.state.passwordHash.reset();
        context_.state.relayedMembers.clear();
        status = context_.state.status();
    }

    LOG_DEBUG("Left LAN queue");
    context_.publishStatus(status);
    context_.publishMembers(std::vector<QueueMember>());
}

void LanQueue::send(ClipboardItem item) {
    std::vector<FrameSinkPtr> targets;
    QueueStatus status;
    bool fresh = false;
    {
        std::lock_guard<std::mutex> lock(context_.mutex);
        if (trimCopy(item.id).empty()) {
            item.id = generateId();
        }
        if (trimCopy(item.origin).empty()) {
            item.origin = context_.state.selfId;
        }
        if (!item.senderName) {
            item.senderName = context_.state.selfName;
        }

        // Marked seen before it leaves, so an echo of our own item is dropped.
        fresh = context_.state.dedup.insert(item.id);
        if (fresh) {
            if (context_.state.role == Role::Host) {
                for (const auto& entry : context_.state.peers) {
                    targets.push_back(entry.second.sender);
                }
            } else if (context_.state.role == Role::Client && context_.state.clientSender) {
                targets.push_back(context_.state.clientSender);
            }
        }
        status = context_.state.status();
    }

    if (!fresh) {
        LOG_DEBUG("Item " + item.id + " already sent, suppressed");
    }

    if (!targets.empty()) {
        FramePtr frame;
        try {
            frame = makeFrame(Envelope::clipboardItem(item).serialize());
        } catch (const FrameError& e) {
            context_.publishStatus(status);
            throw LanQueueError(LanQueueErrorKind::Protocol, e.what());
        }
        for (const auto& target : targets) {
            target->deliver(frame);
        }
    }

    context_.publishStatus(status);
}

QueueStatus LanQueue::status() const {
    std::lock_guard<std::mutex> lock(context_.mutex);
    return context_.state.status();
}

std::vector<QueueMember> LanQueue::members() const {
    std::lock_guard<std::mutex> lock(context_.mutex);
    return context_.state.members();
}

#include "dedupCache.hpp"
#include "envelope.hpp"
#include "frame.hpp"
#include "queueObserver.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>

#ifndef SESSIONSTATE_HPP
#define SESSIONSTATE_HPP

struct LanQueueConfig {
    std::chrono::milliseconds connectTimeout{3000};
    std::chrono::milliseconds handshakeTimeout{3000};
    size_t dedupCapacity = DedupCache::defaultCapacity;
    std::string bindAddress = "0.0.0.0";
};

/*
 * Anything that accepts outbound frames: a Host-side connection to one
 * client, or the Client's single connection to its Host.
 *
 * deliver() may be called from any thread. It only queues; the write
 * happens later on the I/O thread.
 */
class FrameSink {
    public:
        virtual void deliver(FramePtr frame) = 0;

    virtual ~FrameSink() = default;
};

typedef std::shared_ptr<FrameSink> FrameSinkPtr;

// Host only: one per authenticated client, keyed by client id.
struct PeerHandle {
    FrameSinkPtr sender;
    std::optional<std::string> name;
    std::optional<std::string> addr;
};

class HostEngine;
class ClientConnection;

/*
 * ============================================================================
 * SESSION STATE
 * ============================================================================
 *
 * The one mutable record the whole queue revolves around. It is plain data:
 * SessionContext owns it together with the mutex that guards it, and every
 * read or write happens inside that mutex.
 *
 *   role            Off / Host / Client
 *   host, port      bind address + bound port (Host) or target (Client)
 *   selfId          random, fixed for the lifetime of the process
 *   passwordHash    Host only
 *   peers           Host only, client id -> PeerHandle
 *   clientSender    Client only, the live connection to the Host
 *   hostEngine / clientConnection
 *                   the running engine, at most one of them is set
 */
class SessionState {

public:

    explicit SessionState(size_t dedupCapacity = DedupCache::defaultCapacity);

    QueueStatus status() const;

    // Off: empty. Host: self + peers. Client: last snapshot from the Host.
    std::vector<QueueMember> members() const;

    FramePtr memberUpdateFrame() const;

    // Queues frame on every peer except the one registered under exceptId.
    void broadcastToPeers(const FramePtr& frame, const std::string& exceptId = std::string()) const;

    Role role = Role::Off;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::string selfId;
    std::optional<std::string> selfName;
    std::optional<std::string> passwordHash;

    std::map<std::string, PeerHandle> peers;
    std::vector<QueueMember> relayedMembers;
    DedupCache dedup;

    FrameSinkPtr clientSender;
    std::shared_ptr<HostEngine> hostEngine;
    std::shared_ptr<ClientConnection> clientConnection;
};

// Trimmed; empty or whitespace-only becomes absent.
std::optional<std::string> normalizeName(const std::optional<std::string>& name);

// Random RFC 4122 v4 id in canonical text form.
std::string generateId();

std::string trimCopy(const std::string& text);

/*
 * What the engines share: the I/O context they run on, the locked state and
 * the observer. Owned by LanQueue, outlives every engine it hands out.
 */
class SessionContext {

public:

    SessionContext(boost::asio::io_context& io, QueueObserver& observer, const LanQueueConfig& config);

    boost::asio::io_context& io;
    const LanQueueConfig config;

    mutable std::mutex mutex;
    SessionState state;

    void publishStatus(const QueueStatus& status);
    void publishMembers(const std::vector<QueueMember>& members);
    void publishItem(const ClipboardItem& item);

    // Runs fn on the I/O thread and waits for it to finish. Runs inline when
    // already on the I/O thread.
    void runOnIo(const std::function<void()>& fn);

private:

    QueueObserver& observer_;
};

#endif // SESSIONSTATE_HPP

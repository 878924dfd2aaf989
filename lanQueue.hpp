#include "envelope.hpp"
#include "lanQueueError.hpp"
#include "queueObserver.hpp"
#include "sessionState.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

#ifndef LANQUEUE_HPP
#define LANQUEUE_HPP

/*
 * ============================================================================
 * LanQueue - THE COMMAND SURFACE
 * ============================================================================
 *
 *   startHost(port, password, queueName?, memberName?)   -> QueueStatus
 *   join(host, port, password, memberName?)              -> QueueStatus
 *   leave()
 *   send(item)
 *   status()                                             -> QueueStatus
 *   members()                                            -> vector<QueueMember>
 *
 * startHost/join/leave are serialized by commandMutex_ and always stop the
 * running engine (if any) before installing anything new, so there is never
 * more than one listener or Host connection alive. The session mutex is only
 * taken for bookkeeping; connect and handshake waits happen outside it.
 *
 * Each LanQueue runs its own io_context on one background thread. Commands
 * must not be called from an observer callback.
 */
class LanQueue {

public:

    explicit LanQueue(QueueObserver& observer, const LanQueueConfig& config = LanQueueConfig());
    ~LanQueue();

    LanQueue(const LanQueue&) = delete;
    LanQueue& operator=(const LanQueue&) = delete;

    // Throws LanQueueError(Bind) if the port cannot be bound.
    QueueStatus startHost(uint16_t port,
                          const std::string& password,
                          const std::optional<std::string>& queueName = std::nullopt,
                          const std::optional<std::string>& memberName = std::nullopt);

    // Throws LanQueueError (Connect, Timeout, AuthRejected, Protocol).
    QueueStatus join(const std::string& host,
                     uint16_t port,
                     const std::string& password,
                     const std::optional<std::string>& memberName = std::nullopt);

    void leave();

    // Fills in id/origin/sender name when missing. No-op while Off.
    void send(ClipboardItem item);

    QueueStatus status() const;
    std::vector<QueueMember> members() const;

private:

    void stopEngines();

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    SessionContext context_;
    std::mutex commandMutex_;
    std::thread ioThread_;
};

#endif // LANQUEUE_HPP

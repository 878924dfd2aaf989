#include "envelope.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#ifndef QUEUEOBSERVER_HPP
#define QUEUEOBSERVER_HPP

enum class Role {
    Off,
    Host,
    Client
};

const char* roleName(Role role);

struct QueueStatus {
    Role role = Role::Off;
    bool connected = false;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::string selfId;
    std::optional<std::string> selfName;
};

void to_json(nlohmann::json& j, const QueueStatus& status);

/*
 * ============================================================================
 * THE UI SIDE OF THE QUEUE
 * ============================================================================
 *
 * The queue never talks to a window, tray or event bus directly. Whoever owns
 * the LanQueue hands it one of these, and gets three kinds of news:
 *
 *   notifyStatus   role / connectivity changed (or might have)
 *   notifyMembers  full membership snapshot, always a replacement
 *   notifyItem     one clipboard item arrived from somebody else
 *
 * Calls come from the queue's I/O thread as well as from whichever thread ran
 * a command, never while the session lock is held. Implementations have to
 * be thread-safe and should return quickly.
 */
class QueueObserver {
    public:
        virtual void notifyStatus(const QueueStatus& status) = 0;
        virtual void notifyMembers(const std::vector<QueueMember>& members) = 0;
        virtual void notifyItem(const ClipboardItem& item) = 0;

    virtual ~QueueObserver() = default;
};

#endif // QUEUEOBSERVER_HPP

#include "queueObserver.hpp"
#include "sessionState.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

class LanQueue;

class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
 * The LAN queue part of the application settings file. Key names match what
 * the desktop app already stores:
 *
 *   {
 *     "lan_queue_role": "host",          "off" | "host" | "client"
 *     "lan_queue_host": "",
 *     "lan_queue_port": 21991,
 *     "lan_queue_password": "secret",
 *     "lan_queue_name": "LAN Queue",
 *     "lan_queue_member_name": "",
 *     "log_level": "info",
 *     "connect_timeout_ms": 3000,
 *     "handshake_timeout_ms": 3000
 *   }
 *
 * Missing keys keep their defaults. Other keys in the file are ignored.
 */
struct LanQueueSettings {
    Role role = Role::Off;
    std::string host;
    uint16_t port = 21991;
    std::string password;
    std::string queueName = "LAN Queue";
    std::string memberName;
    std::string logLevel = "info";
    int connectTimeoutMs = 3000;
    int handshakeTimeoutMs = 3000;
};

void from_json(const nlohmann::json& j, LanQueueSettings& settings);

Role parseRole(const std::string& text);

// Both throw SettingsError.
LanQueueSettings parseSettings(const std::string& text);
LanQueueSettings loadSettings(const std::string& path);

LanQueueConfig toConfig(const LanQueueSettings& settings);

// Puts the queue into the configured role. Errors from startHost/join propagate.
QueueStatus applySettings(LanQueue& queue, const LanQueueSettings& settings);

#endif // SETTINGS_HPP

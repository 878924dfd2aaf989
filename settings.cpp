#include "settings.hpp"
#include "lanQueue.hpp"
#include "logger.hpp"

#include <fstream>
#include <sstream>

using nlohmann::json;

Role parseRole(const std::string& text) {
    if (text == "off")    return Role::Off;
    if (text == "host")   return Role::Host;
    if (text == "client") return Role::Client;
    throw SettingsError("Unknown lan_queue_role: " + text);
}

void from_json(const json& j, LanQueueSettings& settings) {
    if (j.contains("lan_queue_role")) {
        settings.role = parseRole(j.at("lan_queue_role").get<std::string>());
    }
    if (j.contains("lan_queue_host")) {
        j.at("lan_queue_host").get_to(settings.host);
    }
    if (j.contains("lan_queue_port")) {
        int port = j.at("lan_queue_port").get<int>();
        if (port < 0 || port > 65535) {
            throw SettingsError("lan_queue_port out of range: " + std::to_string(port));
        }
        settings.port = static_cast<uint16_t>(port);
    }
    if (j.contains("lan_queue_password")) {
        j.at("lan_queue_password").get_to(settings.password);
    }
    if (j.contains("lan_queue_name")) {
        j.at("lan_queue_name").get_to(settings.queueName);
    }
    if (j.contains("lan_queue_member_name")) {
        j.at("lan_queue_member_name").get_to(settings.memberName);
    }
    if (j.contains("log_level")) {
        j.at("log_level").get_to(settings.logLevel);
        LogLevel level;
        if (!parseLogLevel(settings.logLevel, level)) {
            throw SettingsError("Unknown log_level: " + settings.logLevel);
        }
    }
    if (j.contains("connect_timeout_ms")) {
        j.at("connect_timeout_ms").get_to(settings.connectTimeoutMs);
    }
    if (j.contains("handshake_timeout_ms")) {
        j.at("handshake_timeout_ms").get_to(settings.handshakeTimeoutMs);
    }
    if (settings.connectTimeoutMs <= 0 || settings.handshakeTimeoutMs <= 0) {
        throw SettingsError("Timeouts must be positive");
    }
}

LanQueueSettings parseSettings(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw SettingsError("Settings must be a JSON object");
        }
        return j.get<LanQueueSettings>();
    } catch (const json::exception& e) {
        throw SettingsError(std::string("Invalid settings: ") + e.what());
    }
}

LanQueueSettings loadSettings(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SettingsError("Cannot open settings file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseSettings(buffer.str());
}

LanQueueConfig toConfig(const LanQueueSettings& settings) {
    LanQueueConfig config;
    config.connectTimeout = std::chrono::milliseconds(settings.connectTimeoutMs);
    config.handshakeTimeout = std::chrono::milliseconds(settings.handshakeTimeoutMs);
    return config;
}

QueueStatus applySettings(LanQueue& queue, const LanQueueSettings& settings) {
    switch (settings.role) {
        case Role::Host:
            LOG_INFO("Resuming as host on port " + std::to_string(settings.port));
            return queue.startHost(settings.port, settings.password,
                                   settings.queueName, settings.memberName);
        case Role::Client:
            LOG_INFO("Resuming as client of " + settings.host + ":" + std::to_string(settings.port));
            return queue.join(settings.host, settings.port, settings.password, settings.memberName);
        case Role::Off:
            break;
    }
    queue.leave();
    return queue.status();
}

#include "lanQueue.hpp"
#include "logger.hpp"
#include "settings.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/*
 * Small terminal front end for the LAN queue. Lines typed on stdin are shared
 * as text items; whatever the other members share is printed.
 *
 *   lanqueue_node host <port> <password> [member_name]
 *   lanqueue_node join <host> <port> <password> [member_name]
 *   lanqueue_node --settings <file.json>
 *
 * Commands while running: "status", "members", "quit" / "exit".
 */

namespace {

class ConsoleObserver : public QueueObserver {
public:
    void notifyStatus(const QueueStatus& status) override {
        std::lock_guard<std::mutex> lock(mu_);
        if (lastRole_ == status.role && lastConnected_ == status.connected) {
            return;
        }
        lastRole_ = status.role;
        lastConnected_ = status.connected;
        std::cout << "[status] " << roleName(status.role)
                  << (status.connected ? " (connected)" : " (not connected)") << std::endl;
    }

    void notifyMembers(const std::vector<QueueMember>& members) override {
        std::lock_guard<std::mutex> lock(mu_);
        std::cout << "[members] " << members.size() << " member(s)" << std::endl;
        for (const auto& member : members) {
            std::cout << "  - " << member.name.value_or(member.id)
                      << (member.addr ? " @ " + *member.addr : std::string())
                      << (member.isSelf ? " (host)" : "") << std::endl;
        }
    }

    void notifyItem(const ClipboardItem& item) override {
        std::lock_guard<std::mutex> lock(mu_);
        std::cout << "[" << item.senderName.value_or(item.origin) << "] ";
        if (item.kind == "text") {
            std::cout << item.payload;
        } else {
            std::cout << "<" << item.kind << ", " << item.payload.size() << " bytes>";
        }
        std::cout << std::endl;
    }

private:
    std::mutex mu_;
    Role lastRole_ = Role::Off;
    bool lastConnected_ = false;
};

std::string utcTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

bool parsePort(const std::string& text, uint16_t& port) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 0 || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " host <port> <password> [member_name]\n"
              << "       " << program << " join <host> <port> <password> [member_name]\n"
              << "       " << program << " --settings <file.json>" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    LanQueueSettings settings;
    std::string mode = argv[1];

    try {
        if (mode == "--settings" && argc == 3) {
            settings = loadSettings(argv[2]);
        } else if (mode == "host" && (argc == 4 || argc == 5)) {
            settings.role = Role::Host;
            if (!parsePort(argv[2], settings.port)) {
                std::cerr << "Invalid port: " << argv[2] << std::endl;
                return 1;
            }
            settings.password = argv[3];
            if (argc == 5) {
                settings.memberName = argv[4];
            }
        } else if (mode == "join" && (argc == 5 || argc == 6)) {
            settings.role = Role::Client;
            settings.host = argv[2];
            if (!parsePort(argv[3], settings.port)) {
                std::cerr << "Invalid port: " << argv[3] << std::endl;
                return 1;
            }
            settings.password = argv[4];
            if (argc == 6) {
                settings.memberName = argv[5];
            }
        } else {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const SettingsError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    LogLevel level;
    if (parseLogLevel(settings.logLevel, level)) {
        Logger::get().setLevel(level);
    }

    ConsoleObserver observer;

    try {
        LanQueue queue(observer, toConfig(settings));
        QueueStatus status = applySettings(queue, settings);

        std::cout << "Self id " << status.selfId << ". Type text and press Enter to share it. "
                  << "Type 'quit' to exit.\n" << std::endl;

        std::string input;
        while (std::getline(std::cin, input)) {
            if (input == "quit" || input == "exit") {
                std::cout << "Leaving queue..." << std::endl;
                break;
            }
            if (input == "status") {
                std::cout << nlohmann::json(queue.status()).dump(2) << std::endl;
                continue;
            }
            if (input == "members") {
                std::cout << nlohmann::json(queue.members()).dump(2) << std::endl;
                continue;
            }
            if (input.empty()) {
                continue;
            }

            ClipboardItem item;
            item.kind = "text";
            item.payload = input;
            item.timestamp = utcTimestamp();
            queue.send(item);
        }

        queue.leave();

    } catch (const LanQueueError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

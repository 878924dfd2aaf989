#include "sessionState.hpp"
#include "logger.hpp"

#include <exception>
#include <future>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

const char* roleName(Role role) {
    switch (role) {
        case Role::Off:    return "off";
        case Role::Host:   return "host";
        case Role::Client: return "client";
    }
    return "off";
}

void to_json(nlohmann::json& j, const QueueStatus& status) {
    j = nlohmann::json{
        {"role", roleName(status.role)},
        {"connected", status.connected},
        {"host", status.host ? nlohmann::json(*status.host) : nlohmann::json(nullptr)},
        {"port", status.port ? nlohmann::json(*status.port) : nlohmann::json(nullptr)},
        {"self_id", status.selfId},
        {"self_name", status.selfName ? nlohmann::json(*status.selfName) : nlohmann::json(nullptr)}
    };
}

std::string trimCopy(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::optional<std::string> normalizeName(const std::optional<std::string>& name) {
    if (!name) {
        return std::nullopt;
    }
    std::string trimmed = trimCopy(*name);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::string generateId() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

SessionState::SessionState(size_t dedupCapacity)
    : selfId(generateId()), dedup(dedupCapacity) {
}

QueueStatus SessionState::status() const {
    QueueStatus snapshot;
    snapshot.role = role;
    switch (role) {
        case Role::Host:   snapshot.connected = true; break;
        case Role::Client: snapshot.connected = clientSender != nullptr; break;
        case Role::Off:    snapshot.connected = false; break;
    }
    snapshot.host = host;
    snapshot.port = port;
    snapshot.selfId = selfId;
    snapshot.selfName = selfName;
    return snapshot;
}

std::vector<QueueMember> SessionState::members() const {
    std::vector<QueueMember> result;

    if (role == Role::Client) {
        return relayedMembers;
    }
    if (role == Role::Off) {
        return result;
    }

    QueueMember self;
    self.id = selfId;
    self.name = selfName;
    self.isSelf = true;
    result.push_back(self);

    for (const auto& entry : peers) {
        QueueMember member;
        member.id = entry.first;
        member.name = entry.second.name;
        member.addr = entry.second.addr;
        member.isSelf = false;
        result.push_back(member);
    }
    return result;
}

FramePtr SessionState::memberUpdateFrame() const {
    return makeFrame(Envelope::memberUpdate(members()).serialize());
}

void SessionState::broadcastToPeers(const FramePtr& frame, const std::string& exceptId) const {
    for (const auto& entry : peers) {
        if (!exceptId.empty() && entry.first == exceptId) {
            continue;
        }
        entry.second.sender->deliver(frame);
    }
}

SessionContext::SessionContext(boost::asio::io_context& io, QueueObserver& observer, const LanQueueConfig& config)
    : io(io), config(config), state(config.dedupCapacity), observer_(observer) {
}

void SessionContext::publishStatus(const QueueStatus& status) {
    try {
        observer_.notifyStatus(status);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Status observer failed: ") + e.what());
    }
}

void SessionContext::publishMembers(const std::vector<QueueMember>& members) {
    try {
        observer_.notifyMembers(members);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Membership observer failed: ") + e.what());
    }
}

void SessionContext::publishItem(const ClipboardItem& item) {
    try {
        observer_.notifyItem(item);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Item observer failed: ") + e.what());
    }
}

void SessionContext::runOnIo(const std::function<void()>& fn) {
    if (io.get_executor().running_in_this_thread()) {
        fn();
        return;
    }

    std::promise<void> done;
    std::future<void> finished = done.get_future();

    boost::asio::post(io, [&fn, &done]() {
        try {
            fn();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });

    finished.get();
}

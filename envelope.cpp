#include "envelope.hpp"

using nlohmann::json;

namespace {

json optionalToJson(const std::optional<std::string>& value) {
    if (value) {
        return json(*value);
    }
    return json(nullptr);
}

// Missing key and explicit null both mean "absent".
std::optional<std::string> optionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

void to_json(json& j, const ClipboardItem& item) {
    j = json{
        {"id", item.id},
        {"kind", item.kind},
        {"payload", item.payload},
        {"timestamp", item.timestamp},
        {"origin", item.origin},
        {"sender_name", optionalToJson(item.senderName)}
    };
}

void from_json(const json& j, ClipboardItem& item) {
    j.at("id").get_to(item.id);
    j.at("kind").get_to(item.kind);
    j.at("payload").get_to(item.payload);
    j.at("timestamp").get_to(item.timestamp);
    j.at("origin").get_to(item.origin);
    item.senderName = optionalFromJson(j, "sender_name");
}

void to_json(json& j, const QueueMember& member) {
    j = json{
        {"id", member.id},
        {"name", optionalToJson(member.name)},
        {"addr", optionalToJson(member.addr)},
        {"is_self", member.isSelf}
    };
}

void from_json(const json& j, QueueMember& member) {
    j.at("id").get_to(member.id);
    member.name = optionalFromJson(j, "name");
    member.addr = optionalFromJson(j, "addr");
    j.at("is_self").get_to(member.isSelf);
}

const char* envelopeTypeName(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::AuthRequest:   return "auth_request";
        case EnvelopeType::AuthResponse:  return "auth_response";
        case EnvelopeType::ClipboardItem: return "clipboard_item";
        case EnvelopeType::MemberUpdate:  return "member_update";
    }
    return "unknown";
}

Envelope Envelope::authRequest(const std::string& password,
                               const std::string& clientId,
                               const std::optional<std::string>& clientName) {
    Envelope envelope;
    envelope.type = EnvelopeType::AuthRequest;
    envelope.password = password;
    envelope.clientId = clientId;
    envelope.clientName = clientName;
    return envelope;
}

Envelope Envelope::authResponse(bool ok, const std::optional<std::string>& reason) {
    Envelope envelope;
    envelope.type = EnvelopeType::AuthResponse;
    envelope.ok = ok;
    envelope.reason = reason;
    return envelope;
}

Envelope Envelope::clipboardItem(const ClipboardItem& item) {
    Envelope envelope;
    envelope.type = EnvelopeType::ClipboardItem;
    envelope.item = item;
    return envelope;
}

Envelope Envelope::memberUpdate(const std::vector<QueueMember>& members) {
    Envelope envelope;
    envelope.type = EnvelopeType::MemberUpdate;
    envelope.members = members;
    return envelope;
}

std::string Envelope::serialize() const {
    json j;
    j["type"] = envelopeTypeName(type);

    switch (type) {
        case EnvelopeType::AuthRequest:
            j["password"] = password;
            j["client_id"] = clientId;
            j["client_name"] = optionalToJson(clientName);
            break;
        case EnvelopeType::AuthResponse:
            j["ok"] = ok;
            j["reason"] = optionalToJson(reason);
            break;
        case EnvelopeType::ClipboardItem:
            j["item"] = item;
            break;
        case EnvelopeType::MemberUpdate:
            j["members"] = members;
            break;
    }

    // Clipboard text is not guaranteed to be valid UTF-8.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Envelope Envelope::parse(const std::string& payload) {
    try {
        json j = json::parse(payload);
        if (!j.is_object()) {
            throw EnvelopeError("Envelope is not a JSON object");
        }

        std::string typeName = j.at("type").get<std::string>();
        Envelope envelope;

        if (typeName == "auth_request") {
            envelope.type = EnvelopeType::AuthRequest;
            j.at("password").get_to(envelope.password);
            j.at("client_id").get_to(envelope.clientId);
            envelope.clientName = optionalFromJson(j, "client_name");
        } else if (typeName == "auth_response") {
            envelope.type = EnvelopeType::AuthResponse;
            j.at("ok").get_to(envelope.ok);
            envelope.reason = optionalFromJson(j, "reason");
        } else if (typeName == "clipboard_item") {
            envelope.type = EnvelopeType::ClipboardItem;
            j.at("item").get_to(envelope.item);
        } else if (typeName == "member_update") {
            envelope.type = EnvelopeType::MemberUpdate;
            j.at("members").get_to(envelope.members);
        } else {
            throw EnvelopeError("Unknown envelope type: " + typeName);
        }

        return envelope;
    } catch (const json::exception& e) {
        throw EnvelopeError(std::string("Malformed envelope: ") + e.what());
    }
}

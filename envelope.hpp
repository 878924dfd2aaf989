#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#ifndef ENVELOPE_HPP
#define ENVELOPE_HPP

class EnvelopeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One shared clipboard entry. Produced by clipboard capture, consumed by observers.
struct ClipboardItem {
    std::string id;
    std::string kind;
    std::string payload;
    std::string timestamp;
    std::string origin;
    std::optional<std::string> senderName;
};

struct QueueMember {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> addr;
    bool isSelf = false;
};

void to_json(nlohmann::json& j, const ClipboardItem& item);
void from_json(const nlohmann::json& j, ClipboardItem& item);
void to_json(nlohmann::json& j, const QueueMember& member);
void from_json(const nlohmann::json& j, QueueMember& member);

enum class EnvelopeType {
    AuthRequest,
    AuthResponse,
    ClipboardItem,
    MemberUpdate
};

/*
 * ============================================================================
 * ENVELOPE - WHAT RIDES INSIDE A FRAME
 * ============================================================================
 *
 *   auth_request    Client -> Host, first frame after connect
 *   auth_response   Host -> Client, answer to auth_request
 *   clipboard_item  both ways once authenticated
 *   member_update   Host -> Clients, full membership snapshot
 *
 * The "type" field picks the variant. Only the fields of that variant are
 * meaningful; the rest keep their defaults.
 */
class Envelope {

public:

    static Envelope authRequest(const std::string& password,
                                const std::string& clientId,
                                const std::optional<std::string>& clientName);
    static Envelope authResponse(bool ok, const std::optional<std::string>& reason);
    static Envelope clipboardItem(const ClipboardItem& item);
    static Envelope memberUpdate(const std::vector<QueueMember>& members);

    // Throws EnvelopeError on malformed JSON, unknown type or bad fields.
    static Envelope parse(const std::string& payload);

    std::string serialize() const;

    EnvelopeType type = EnvelopeType::AuthRequest;

    std::string password;
    std::string clientId;
    std::optional<std::string> clientName;

    bool ok = false;
    std::optional<std::string> reason;

    ClipboardItem item;

    std::vector<QueueMember> members;
};

const char* envelopeTypeName(EnvelopeType type);

#endif // ENVELOPE_HPP

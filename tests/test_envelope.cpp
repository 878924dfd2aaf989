#include "envelope.hpp"

#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

TEST(EnvelopeTest, AuthRequestUsesWireFieldNames) {
    json j = json::parse(Envelope::authRequest("secret", "client-1", std::nullopt).serialize());

    EXPECT_EQ(j.at("type").get<std::string>(), "auth_request");
    EXPECT_EQ(j.at("password").get<std::string>(), "secret");
    EXPECT_EQ(j.at("client_id").get<std::string>(), "client-1");
    EXPECT_TRUE(j.at("client_name").is_null());
}

TEST(EnvelopeTest, AuthResponseCarriesReason) {
    Envelope parsed = Envelope::parse(Envelope::authResponse(false, std::string("Invalid password")).serialize());

    EXPECT_EQ(parsed.type, EnvelopeType::AuthResponse);
    EXPECT_FALSE(parsed.ok);
    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "Invalid password");
}

TEST(EnvelopeTest, ParsesClipboardItemFromWire) {
    const std::string wire =
        "{\"type\":\"clipboard_item\",\"item\":{\"id\":\"i-1\",\"kind\":\"text\",\"payload\":\"hi\","
        "\"timestamp\":\"2024-01-01T00:00:00Z\",\"origin\":\"peer-a\",\"sender_name\":\"Alice\"}}";

    Envelope envelope = Envelope::parse(wire);

    ASSERT_EQ(envelope.type, EnvelopeType::ClipboardItem);
    EXPECT_EQ(envelope.item.id, "i-1");
    EXPECT_EQ(envelope.item.kind, "text");
    EXPECT_EQ(envelope.item.payload, "hi");
    EXPECT_EQ(envelope.item.timestamp, "2024-01-01T00:00:00Z");
    EXPECT_EQ(envelope.item.origin, "peer-a");
    ASSERT_TRUE(envelope.item.senderName.has_value());
    EXPECT_EQ(*envelope.item.senderName, "Alice");
}

TEST(EnvelopeTest, MissingOptionalFieldsAreAbsent) {
    Envelope request = Envelope::parse(
        "{\"type\":\"auth_request\",\"password\":\"p\",\"client_id\":\"c\"}");
    EXPECT_FALSE(request.clientName.has_value());

    Envelope item = Envelope::parse(
        "{\"type\":\"clipboard_item\",\"item\":{\"id\":\"i\",\"kind\":\"text\",\"payload\":\"x\","
        "\"timestamp\":\"t\",\"origin\":\"o\",\"sender_name\":null}}");
    EXPECT_FALSE(item.item.senderName.has_value());
}

TEST(EnvelopeTest, MemberUpdateKeepsEveryMember) {
    QueueMember host;
    host.id = "host";
    host.name = std::string("Desk");
    host.isSelf = true;

    QueueMember laptop;
    laptop.id = "laptop";
    laptop.addr = std::string("192.168.1.20:50000");

    Envelope parsed = Envelope::parse(Envelope::memberUpdate({host, laptop}).serialize());

    ASSERT_EQ(parsed.type, EnvelopeType::MemberUpdate);
    ASSERT_EQ(parsed.members.size(), 2u);
    EXPECT_EQ(parsed.members[0].id, "host");
    EXPECT_EQ(parsed.members[0].name.value_or(""), "Desk");
    EXPECT_TRUE(parsed.members[0].isSelf);
    EXPECT_FALSE(parsed.members[0].addr.has_value());
    EXPECT_EQ(parsed.members[1].id, "laptop");
    EXPECT_FALSE(parsed.members[1].name.has_value());
    EXPECT_EQ(parsed.members[1].addr.value_or(""), "192.168.1.20:50000");
    EXPECT_FALSE(parsed.members[1].isSelf);
}

TEST(EnvelopeTest, RejectsGarbage) {
    EXPECT_THROW(Envelope::parse("not json"), EnvelopeError);
    EXPECT_THROW(Envelope::parse("[1,2,3]"), EnvelopeError);
    EXPECT_THROW(Envelope::parse("{\"password\":\"p\"}"), EnvelopeError);
    EXPECT_THROW(Envelope::parse("{\"type\":\"hello\"}"), EnvelopeError);
    EXPECT_THROW(Envelope::parse("{\"type\":\"auth_response\",\"ok\":\"yes\"}"), EnvelopeError);
    EXPECT_THROW(Envelope::parse("{\"type\":\"clipboard_item\",\"item\":{\"id\":\"i\"}}"), EnvelopeError);
}

TEST(EnvelopeTest, InvalidUtf8PayloadStillSerializes) {
    ClipboardItem item;
    item.id = "i";
    item.kind = "text";
    item.payload = std::string("\xff\xfe", 2);
    item.timestamp = "t";
    item.origin = "o";

    std::string wire;
    ASSERT_NO_THROW(wire = Envelope::clipboardItem(item).serialize());
    EXPECT_NO_THROW(Envelope::parse(wire));
}

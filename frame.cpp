#include "frame.hpp"

Frame::Frame(const std::string& payload) : bodyLength_(0) {
    setBody(payload);
}

void Frame::encodeHeader() {
    uint32_t length = static_cast<uint32_t>(bodyLength_);
    headerData[0] = static_cast<char>((length >> 24) & 0xFF);
    headerData[1] = static_cast<char>((length >> 16) & 0xFF);
    headerData[2] = static_cast<char>((length >> 8) & 0xFF);
    headerData[3] = static_cast<char>(length & 0xFF);
}

bool Frame::decodeHeader() {
    uint32_t length = (static_cast<uint32_t>(static_cast<unsigned char>(headerData[0])) << 24)
                    | (static_cast<uint32_t>(static_cast<unsigned char>(headerData[1])) << 16)
                    | (static_cast<uint32_t>(static_cast<unsigned char>(headerData[2])) << 8)
                    |  static_cast<uint32_t>(static_cast<unsigned char>(headerData[3]));

    if (length == 0 || length > maxBytes) {
        bodyLength_ = 0;
        body.clear();
        return false;
    }

    bodyLength_ = length;
    body.resize(bodyLength_);
    return true;
}

std::string Frame::getData() const {
    std::string data;
    data.reserve(header + bodyLength_);
    data.append(headerData, header);
    data.append(body.data(), bodyLength_);
    return data;
}

std::string Frame::getBody() const {
    return std::string(body.data(), bodyLength_);
}

size_t Frame::setBodyLength(size_t newLength) {
    if (newLength == 0) {
        throw FrameError("Frame payload must not be empty");
    }
    if (newLength > maxBytes) {
        throw FrameError("Frame payload exceeds maximum allowed size of "
                         + std::to_string(maxBytes) + " bytes");
    }
    bodyLength_ = newLength;
    return bodyLength_;
}

void Frame::setBody(const std::string& payload) {
    setBodyLength(payload.size());
    encodeHeader();
    body.assign(payload.begin(), payload.end());
}

std::string encodeFrame(const std::string& payload) {
    return Frame(payload).getData();
}

FramePtr makeFrame(const std::string& payload) {
    return std::make_shared<const std::string>(encodeFrame(payload));
}

#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef FRAME_HPP
#define FRAME_HPP

/*
 * ============================================================================
 * FRAME LAYOUT
 * ============================================================================
 *
 * Every message on the wire is one frame:
 *
 *   ┌──────────────────────────┬──────────────────────────────────┐
 *   │ 4 bytes, big-endian u32  │ N bytes of UTF-8 JSON envelope    │
 *   │ payload length N         │                                  │
 *   └──────────────────────────┴──────────────────────────────────┘
 *
 * Reading is two async_read calls: one for the fixed header, then one for
 * exactly getBodyLength() bytes. decodeHeader() is the gate between them.
 * A zero length or anything above maxBytes is refused there, so a hostile
 * header can never make us allocate more than the ceiling.
 *
 * The ceiling is 6 MiB: images are capped at 5 MB before they get here,
 * plus JSON/base64 overhead.
 */

class FrameError : public std::length_error {
public:
    using std::length_error::length_error;
};

class Frame {

public:

    static constexpr size_t maxBytes = 6 * 1024 * 1024;
    static constexpr size_t header = 4;

    Frame() : bodyLength_(0) {
        std::memset(headerData, 0, header);
    }

    explicit Frame(const std::string& payload);

    void encodeHeader();

    // false if the declared length is zero or above maxBytes
    bool decodeHeader();

    std::string getData() const;
    std::string getBody() const;

    size_t setBodyLength(size_t newLength);
    size_t getBodyLength() const {
        return bodyLength_;
    }

    void setBody(const std::string& payload);

    char headerData[header];
    std::vector<char> body;

private:

    size_t bodyLength_;
};

/*
 * One encoded frame can be queued on many connections at once (the Host
 * fans out the same item to every peer), so outbound queues hold shared
 * immutable buffers instead of copies.
 */
typedef std::shared_ptr<const std::string> FramePtr;

std::string encodeFrame(const std::string& payload);
FramePtr makeFrame(const std::string& payload);

#endif // FRAME_HPP

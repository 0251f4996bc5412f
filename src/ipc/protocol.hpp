/**
 * execbox Wire Protocol
 *
 * Binary framing for clients of the local execution socket.
 * Header: 17 bytes (magic + request_tag + opcode + payload_size), followed
 * by a JSON payload. Responses echo the opcode and tag of their request.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace execbox::ipc {

// Magic bytes for protocol validation
constexpr uint32_t MAGIC_BYTES = 0x45584258; // "EXBX" in hex
constexpr size_t HEADER_SIZE = 17;
constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1MB max

enum class Opcode : uint8_t {
    PING    = 0x00,  // Liveness / echo
    EXECUTE = 0x01,  // {"code": "..."} -> outcome
    HISTORY = 0x02,  // {"limit": N, "since_id": M} -> recent execution records
    STATS   = 0x03,  // {} -> dispatcher counters
    EXECUTE_PROJECT = 0x04   // {"files": [{"path": "...", "content": "..."}]} -> outcome
};

// Wire protocol header (17 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint32_t request_tag;   // Chosen by the client, echoed in the response
    Opcode opcode;          // What operation to perform
    uint64_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

// Application-level message
struct Message {
    uint32_t request_tag;
    Opcode opcode;
    std::vector<uint8_t> payload;

    Message() : request_tag(0), opcode(Opcode::PING) {}

    Message(uint32_t tag, Opcode op, const std::string& data)
        : request_tag(tag), opcode(op), payload(data.begin(), data.end()) {}

    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    // Serialize message to wire format
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.request_tag = request_tag;
        header.opcode = opcode;
        header.payload_size = payload.size();

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }

        return buffer;
    }

    // Total frame size announced by a header; nullopt if the header is
    // incomplete or invalid (bad magic, oversized payload)
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        if (header.magic != MAGIC_BYTES) {
            return std::nullopt;
        }

        if (header.payload_size > MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }

        return HEADER_SIZE + header.payload_size;
    }

    // Deserialize one complete frame
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto size = get_message_size(data, len);
        if (!size || len < *size) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.request_tag = header.request_tag;
        msg.opcode = header.opcode;

        if (header.payload_size > 0) {
            msg.payload.resize(header.payload_size);
            std::memcpy(msg.payload.data(), data + HEADER_SIZE, header.payload_size);
        }

        return msg;
    }
};

// Convert opcode to string for logging
inline const char* opcode_to_string(Opcode op) {
    switch (op) {
        case Opcode::PING:    return "PING";
        case Opcode::EXECUTE: return "EXECUTE";
        case Opcode::HISTORY: return "HISTORY";
        case Opcode::STATS:   return "STATS";
        case Opcode::EXECUTE_PROJECT: return "EXECUTE_PROJECT";
        default: return "UNKNOWN";
    }
}

} // namespace execbox::ipc

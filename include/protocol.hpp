#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tftpc {

constexpr size_t kOpcodeSize = 2;
constexpr size_t kHeaderSize = 4;       // opcode + block / error code
constexpr size_t kBlockSize = 512;
constexpr size_t kMaxDatagram = kHeaderSize + kBlockSize;
constexpr uint16_t kDefaultServerPort = 69;
constexpr char kModeNetascii[] = "netascii";

enum class Opcode : uint16_t {
    ReadRequest = 1,
    WriteRequest = 2,
    Data = 3,
    Acknowledgment = 4,
    Error = 5
};

struct RequestPacket {
    Opcode opcode{Opcode::ReadRequest};
    std::string filename;
    std::string mode;
};

struct DataPacket {
    uint16_t block{0};
    std::vector<uint8_t> payload;
};

struct AckPacket {
    uint16_t block{0};
};

struct ErrorPacket {
    uint16_t code{0};
    std::vector<uint8_t> message;
};

const char* opcode_name(Opcode op);

// Encoders return an empty buffer when the arguments cannot be framed
// (NUL inside a filename, payload over kBlockSize, non-request opcode).
std::vector<uint8_t> encode_request(Opcode op, const std::string& filename);
std::vector<uint8_t> encode_data(uint16_t block, const uint8_t* payload, size_t len);
std::vector<uint8_t> encode_data(uint16_t block, const std::vector<uint8_t>& payload);
std::vector<uint8_t> encode_ack(uint16_t block);
std::vector<uint8_t> encode_error(uint16_t code, const std::string& message);

std::optional<Opcode> decode_opcode(const uint8_t* data, size_t len);
std::optional<RequestPacket> decode_request(const uint8_t* data, size_t len);
std::optional<DataPacket> decode_data(const uint8_t* data, size_t len);
std::optional<AckPacket> decode_ack(const uint8_t* data, size_t len);
std::optional<ErrorPacket> decode_error(const uint8_t* data, size_t len);

inline uint16_t read_u16(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

inline void write_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v >> 8));
    out.push_back((uint8_t)(v & 0xFF));
}

} // namespace tftpc

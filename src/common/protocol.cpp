#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace tftpc {

const char *opcode_name(Opcode op) {
  switch (op) {
  case Opcode::ReadRequest:
    return "RRQ";
  case Opcode::WriteRequest:
    return "WRQ";
  case Opcode::Data:
    return "DATA";
  case Opcode::Acknowledgment:
    return "ACK";
  default:
    return "ERROR";
  }
}

std::vector<uint8_t> encode_request(Opcode op, const std::string &filename) {
  std::vector<uint8_t> out;
  if (op != Opcode::ReadRequest && op != Opcode::WriteRequest)
    return out;
  if (filename.find('\0') != std::string::npos)
    return out;
  size_t mode_len = sizeof(kModeNetascii) - 1;
  out.reserve(kOpcodeSize + filename.size() + 1 + mode_len + 1);
  write_u16(out, (uint16_t)op);
  out.insert(out.end(), filename.begin(), filename.end());
  out.push_back(0);
  out.insert(out.end(), kModeNetascii, kModeNetascii + mode_len);
  out.push_back(0);
  return out;
}

std::vector<uint8_t> encode_data(uint16_t block, const uint8_t *payload,
                                 size_t len) {
  std::vector<uint8_t> out;
  if (len > kBlockSize)
    return out;
  out.reserve(kHeaderSize + len);
  write_u16(out, (uint16_t)Opcode::Data);
  write_u16(out, block);
  if (len)
    out.insert(out.end(), payload, payload + len);
  return out;
}

std::vector<uint8_t> encode_data(uint16_t block,
                                 const std::vector<uint8_t> &payload) {
  return encode_data(block, payload.data(), payload.size());
}

std::vector<uint8_t> encode_ack(uint16_t block) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize);
  write_u16(out, (uint16_t)Opcode::Acknowledgment);
  write_u16(out, block);
  return out;
}

std::vector<uint8_t> encode_error(uint16_t code, const std::string &message) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + message.size() + 1);
  write_u16(out, (uint16_t)Opcode::Error);
  write_u16(out, code);
  // the message is a NUL terminated string on the wire
  size_t n = std::min(message.find('\0'), message.size());
  out.insert(out.end(), message.begin(), message.begin() + n);
  out.push_back(0);
  return out;
}

std::optional<Opcode> decode_opcode(const uint8_t *data, size_t len) {
  if (len < kOpcodeSize)
    return std::nullopt;
  uint16_t v = read_u16(data);
  if (v < (uint16_t)Opcode::ReadRequest || v > (uint16_t)Opcode::Error)
    return std::nullopt;
  return (Opcode)v;
}

static bool read_cstring(const uint8_t *data, size_t len, size_t &off,
                         std::string &out) {
  const void *nul = off < len ? std::memchr(data + off, 0, len - off) : nullptr;
  if (!nul)
    return false;
  size_t end = (size_t)((const uint8_t *)nul - data);
  out.assign((const char *)data + off, end - off);
  off = end + 1;
  return true;
}

std::optional<RequestPacket> decode_request(const uint8_t *data, size_t len) {
  auto op = decode_opcode(data, len);
  if (!op || (*op != Opcode::ReadRequest && *op != Opcode::WriteRequest))
    return std::nullopt;
  RequestPacket pkt;
  pkt.opcode = *op;
  size_t off = kOpcodeSize;
  if (!read_cstring(data, len, off, pkt.filename))
    return std::nullopt;
  if (!read_cstring(data, len, off, pkt.mode))
    return std::nullopt;
  return pkt;
}

std::optional<DataPacket> decode_data(const uint8_t *data, size_t len) {
  auto op = decode_opcode(data, len);
  if (!op || *op != Opcode::Data || len < kHeaderSize ||
      len > kMaxDatagram)
    return std::nullopt;
  DataPacket pkt;
  pkt.block = read_u16(data + 2);
  pkt.payload.assign(data + kHeaderSize, data + len);
  return pkt;
}

std::optional<AckPacket> decode_ack(const uint8_t *data, size_t len) {
  auto op = decode_opcode(data, len);
  if (!op || *op != Opcode::Acknowledgment || len < kHeaderSize)
    return std::nullopt;
  return AckPacket{read_u16(data + 2)};
}

std::optional<ErrorPacket> decode_error(const uint8_t *data, size_t len) {
  auto op = decode_opcode(data, len);
  if (!op || *op != Opcode::Error || len < kHeaderSize)
    return std::nullopt;
  ErrorPacket pkt;
  pkt.code = read_u16(data + 2);
  const uint8_t *msg = data + kHeaderSize;
  const uint8_t *end = data + len;
  const void *nul = std::memchr(msg, 0, (size_t)(end - msg));
  if (nul)
    end = (const uint8_t *)nul;
  pkt.message.assign(msg, end);
  return pkt;
}

} // namespace tftpc

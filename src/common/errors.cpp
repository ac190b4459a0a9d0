#include "errors.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <algorithm>

namespace tftpc {

TransferError TransferError::from_kind(TransferErrorKind kind,
                                       std::string message) {
  TransferError e;
  e.kind = kind;
  e.message = std::move(message);
  return e;
}

TransferError TransferError::invalid_response(const uint8_t *data,
                                              size_t len) {
  TransferError e;
  e.kind = TransferErrorKind::InvalidResponse;
  if (len)
    e.raw.assign(data, data + len);
  return e;
}

TransferError TransferError::transport(std::error_code ec) {
  TransferError e;
  e.kind = TransferErrorKind::Transport;
  e.ec = ec;
  e.message = ec.message();
  return e;
}

std::string TransferError::describe() const {
  std::string s = to_string(kind);
  switch (kind) {
  case TransferErrorKind::InvalidResponse:
    s += " (" + std::to_string(raw.size()) + " bytes: " +
         bytes_to_hex(raw.data(), std::min<size_t>(raw.size(), 16)) +
         (raw.size() > 16 ? "...)" : ")");
    break;
  default:
    if (!message.empty())
      s += ": " + message;
    break;
  }
  return s;
}

const char *to_string(TransferErrorKind kind) {
  switch (kind) {
  case TransferErrorKind::NotDefined:
    return "not defined";
  case TransferErrorKind::FileNotFound:
    return "file not found";
  case TransferErrorKind::AccessViolation:
    return "access violation";
  case TransferErrorKind::DiskFull:
    return "disk full or allocation exceeded";
  case TransferErrorKind::IllegalOperation:
    return "illegal TFTP operation";
  case TransferErrorKind::UnknownTransferID:
    return "unknown transfer ID";
  case TransferErrorKind::FileAlreadyExists:
    return "file already exists";
  case TransferErrorKind::NoSuchUser:
    return "no such user";
  case TransferErrorKind::InvalidResponse:
    return "invalid response";
  case TransferErrorKind::Transport:
    return "transport failure";
  case TransferErrorKind::Timeout:
    return "timed out";
  default:
    return "file too large";
  }
}

uint16_t rfc_error_code(TransferErrorKind kind) {
  if (kind <= TransferErrorKind::NoSuchUser)
    return (uint16_t)kind;
  return 0;
}

TransferError error_from_packet(uint16_t code,
                                const std::vector<uint8_t> &message) {
  if (code >= 1 && code <= 7)
    return TransferError::from_kind((TransferErrorKind)code);
  return TransferError::from_kind(
      TransferErrorKind::NotDefined,
      utf8_lossy(message.data(), message.size()));
}

TransferError error_from_datagram(const uint8_t *data, size_t len) {
  auto pkt = decode_error(data, len);
  if (!pkt)
    return TransferError::invalid_response(data, len);
  return error_from_packet(pkt->code, pkt->message);
}

} // namespace tftpc

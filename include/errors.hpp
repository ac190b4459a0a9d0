#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace tftpc {

enum class TransferErrorKind : uint8_t {
    // reported by the peer, RFC 1350 codes 0..7
    NotDefined = 0,
    FileNotFound,
    AccessViolation,
    DiskFull,
    IllegalOperation,
    UnknownTransferID,
    FileAlreadyExists,
    NoSuchUser,
    // detected locally
    InvalidResponse,
    Transport,
    Timeout,
    FileTooLarge
};

struct TransferError {
    TransferErrorKind kind{TransferErrorKind::NotDefined};
    std::string message;            // NotDefined text, or local detail
    std::vector<uint8_t> raw;       // InvalidResponse: datagram as received
    std::error_code ec;             // Transport

    static TransferError from_kind(TransferErrorKind kind, std::string message = {});
    static TransferError invalid_response(const uint8_t* data, size_t len);
    static TransferError transport(std::error_code ec);

    std::string describe() const;
};

const char* to_string(TransferErrorKind kind);

// RFC code to put on the wire for a kind; locally detected kinds map to 0.
uint16_t rfc_error_code(TransferErrorKind kind);

// Total mapping of an ERROR body (code + message bytes) to a TransferError.
TransferError error_from_packet(uint16_t code, const std::vector<uint8_t>& message);

// Same mapping applied to a whole ERROR datagram, opcode included.
TransferError error_from_datagram(const uint8_t* data, size_t len);

} // namespace tftpc

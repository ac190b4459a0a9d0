#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace tftpc {

// Connectionless datagram channel the transfers run over. Errors are
// reported through `ec`, never thrown.
class Transport {
public:
    using endpoint = asio::ip::udp::endpoint;

    virtual ~Transport() = default;
    virtual void send_to(const uint8_t* data, size_t len, const endpoint& to,
                         std::error_code& ec) = 0;
    // Blocks until a datagram arrives; a non-zero timeout fails with
    // asio::error::timed_out once it expires.
    virtual size_t recv_from(uint8_t* buf, size_t cap, endpoint& from,
                             std::chrono::milliseconds timeout,
                             std::error_code& ec) = 0;
};

} // namespace tftpc

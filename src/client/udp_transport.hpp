#pragma once
#include <asio.hpp>
#include "transport.hpp"

namespace tftpc {

class UdpTransport : public Transport {
public:
    using udp = asio::ip::udp;
    explicit UdpTransport(asio::io_context& io);

    bool open(const endpoint& local, std::error_code& ec);
    void close();
    bool is_open() const { return sock_.is_open(); }
    endpoint local_endpoint(std::error_code& ec) const { return sock_.local_endpoint(ec); }

    void send_to(const uint8_t* data, size_t len, const endpoint& to,
                 std::error_code& ec) override;
    size_t recv_from(uint8_t* buf, size_t cap, endpoint& from,
                     std::chrono::milliseconds timeout,
                     std::error_code& ec) override;
private:
    asio::io_context& io_;
    udp::socket sock_;
};

} // namespace tftpc

#include "udp_transport.hpp"
#include "logging.hpp"

namespace tftpc {

UdpTransport::UdpTransport(asio::io_context &io) : io_(io), sock_(io) {}

bool UdpTransport::open(const endpoint &local, std::error_code &ec) {
  sock_.open(local.protocol(), ec);
  if (ec)
    return false;
  sock_.bind(local, ec);
  if (ec) {
    std::error_code ec2;
    sock_.close(ec2);
    return false;
  }
  std::error_code ec2;
  auto bound = sock_.local_endpoint(ec2);
  Logger::instance().log(LogLevel::DEBUG, "bound %s:%u",
                         bound.address().to_string().c_str(),
                         (unsigned)bound.port());
  return true;
}

// Runs on the io_context, so another thread may use it to abort a blocked
// recv_from.
void UdpTransport::close() {
  asio::post(io_, [this]() {
    std::error_code ec;
    sock_.close(ec);
  });
}

void UdpTransport::send_to(const uint8_t *data, size_t len, const endpoint &to,
                           std::error_code &ec) {
  sock_.send_to(asio::buffer(data, len), to, 0, ec);
}

size_t UdpTransport::recv_from(uint8_t *buf, size_t cap, endpoint &from,
                               std::chrono::milliseconds timeout,
                               std::error_code &ec) {
  std::error_code result = asio::error::would_block;
  size_t n = 0;
  bool expired = false;
  sock_.async_receive_from(asio::buffer(buf, cap), from,
                           [&](std::error_code e, std::size_t len) {
                             result = e;
                             n = len;
                           });
  io_.restart();
  if (timeout.count() > 0) {
    io_.run_for(timeout);
    if (!io_.stopped()) {
      expired = true;
      std::error_code ignored;
      sock_.cancel(ignored);
      io_.run();
    }
  } else {
    io_.run();
  }
  if (expired && result == asio::error::operation_aborted)
    ec = asio::error::timed_out;
  else
    ec = result;
  return ec ? 0 : n;
}

} // namespace tftpc

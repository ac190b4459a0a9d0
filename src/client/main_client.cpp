#include "client_config.hpp"
#include "logging.hpp"
#include "transfer.hpp"
#include "udp_transport.hpp"
#include <asio.hpp>
#include <cstdio>
#include <iostream>
#include <iterator>

using namespace tftpc;

int main(int argc, char **argv) {
  Invocation inv;
  std::string error;
  if (!parse_args(argc, argv, inv, error)) {
    std::cerr << "tftpc: " << error << "\n" << usage();
    return 1;
  }
  const ClientConfig &cfg = inv.cfg;
  Logger::instance().set_level(cfg.log_level);

  asio::io_context io;
  std::error_code ec;
  asio::ip::udp::resolver res(io);
  auto results = res.resolve(cfg.server_host, std::to_string(cfg.server_port),
                             ec);
  if (ec || results.empty()) {
    std::cerr << "tftpc: cannot resolve " << cfg.server_host << ": "
              << ec.message() << "\n";
    return 1;
  }
  asio::ip::udp::endpoint server = results.begin()->endpoint();

  auto bind_addr = asio::ip::make_address(cfg.bind_host, ec);
  if (ec) {
    std::cerr << "tftpc: bad bind address " << cfg.bind_host << "\n";
    return 1;
  }
  if (server.address().is_v6() && bind_addr.is_v4() &&
      bind_addr.to_v4() == asio::ip::address_v4::any())
    bind_addr = asio::ip::address_v6::any();

  UdpTransport transport(io);
  if (!transport.open(asio::ip::udp::endpoint(bind_addr, cfg.bind_port), ec)) {
    std::cerr << "tftpc: bind failed: " << ec.message() << "\n";
    return 1;
  }

  TransferOptions opts;
  opts.server = server;
  opts.timeout = std::chrono::milliseconds(cfg.timeout_ms);
  opts.retries = cfg.retries;
  opts.strict_blocks = cfg.strict_blocks;

  if (inv.command == Command::Get) {
    std::vector<uint8_t> data;
    if (auto err = get_file(inv.remote_path, transport, data, opts)) {
      std::cerr << "tftpc: get " << inv.remote_path << ": " << err->describe()
                << "\n";
      return 2;
    }
    std::fwrite(data.data(), 1, data.size(), stdout);
    std::fflush(stdout);
    return 0;
  }

  std::vector<uint8_t> data((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
  if (auto err = put_file(inv.remote_path, data, transport, opts)) {
    std::cerr << "tftpc: put " << inv.remote_path << ": " << err->describe()
              << "\n";
    return 2;
  }
  return 0;
}

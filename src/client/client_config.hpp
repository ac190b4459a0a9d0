#pragma once
#include <cstdint>
#include <string>
#include "logging.hpp"
#include "protocol.hpp"

namespace tftpc {

struct ClientConfig {
    std::string server_host{"127.0.0.1"}; uint16_t server_port{kDefaultServerPort};
    std::string bind_host{"0.0.0.0"}; uint16_t bind_port{0};
    int timeout_ms{0}; int retries{5};
    bool strict_blocks{false};
    LogLevel log_level{LogLevel::INFO};
};

enum class Command { Get, Put };

struct Invocation {
    ClientConfig cfg;
    Command command{Command::Get};
    std::string remote_path;
};

// Fills `inv` from argv; on failure `error` says what was wrong.
bool parse_args(int argc, const char* const* argv, Invocation& inv, std::string& error);

const char* usage();

} // namespace tftpc

#include "client_config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <vector>

namespace tftpc {

const char *usage() {
  return "usage: tftpc [--server host:port] [--bind host:port] "
         "[--timeout ms] [--retries n] [--strict] [--log-level lvl] "
         "get|put <remote path>\n"
         "  get writes the file to stdout, put uploads stdin\n";
}

static bool parse_int(const std::string &s, int lo, int hi, int &out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    int v = std::stoi(s);
    if (v < lo || v > hi)
      return false;
    out = v;
    return true;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool parse_args(int argc, const char *const *argv, Invocation &inv,
                std::string &error) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](std::string &v) -> bool {
      if (i + 1 < argc) {
        v = argv[++i];
        return true;
      }
      error = "missing value for " + a;
      return false;
    };
    std::string v;
    if (a == "--server") {
      if (!next(v))
        return false;
      if (!parse_host_port(v, inv.cfg.server_host, inv.cfg.server_port)) {
        error = "bad server " + v;
        return false;
      }
    } else if (a == "--bind") {
      if (!next(v))
        return false;
      if (!parse_host_port(v, inv.cfg.bind_host, inv.cfg.bind_port)) {
        error = "bad bind address " + v;
        return false;
      }
    } else if (a == "--timeout") {
      if (!next(v))
        return false;
      if (!parse_int(v, 0, 3600 * 1000, inv.cfg.timeout_ms)) {
        error = "bad timeout " + v;
        return false;
      }
    } else if (a == "--retries") {
      if (!next(v))
        return false;
      if (!parse_int(v, 0, 1000, inv.cfg.retries)) {
        error = "bad retry count " + v;
        return false;
      }
    } else if (a == "--strict") {
      inv.cfg.strict_blocks = true;
    } else if (a == "--log-level") {
      if (!next(v))
        return false;
      if (!parse_log_level(v, inv.cfg.log_level)) {
        error = "bad log level " + v;
        return false;
      }
    } else if (a.size() > 1 && a[0] == '-') {
      error = "unknown option " + a;
      return false;
    } else {
      positional.push_back(a);
    }
  }

  if (positional.size() != 2) {
    error = "expected a command and a remote path";
    return false;
  }
  if (positional[0] == "get")
    inv.command = Command::Get;
  else if (positional[0] == "put")
    inv.command = Command::Put;
  else {
    error = "unknown command " + positional[0];
    return false;
  }
  inv.remote_path = positional[1];
  return true;
}

} // namespace tftpc

// adbshell: send a key event or shell command to the local device's daemon.
//
//   adbshell [-v] [-d DIR] [-H HOST] [-p PORT] key <code>
//   adbshell [-v] [-d DIR] [-H HOST] [-p PORT] shell <words...>
//
// Exit status: 0 success, 1 command failed, 2 usage error.
#include "client.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [-v] [-d key_dir] [-H host] [-p port] key <code>\n"
            << "       " << argv0 << " [-v] [-d key_dir] [-H host] [-p port] shell <command...>\n";
}

static std::string default_key_dir() {
  if (const char* dir = std::getenv("ADBLINK_KEY_DIR")) {
    if (*dir)
      return dir;
  }
  const char* home = std::getenv("HOME");
  return std::string(home && *home ? home : ".") + "/.adblink";
}

static bool parse_int(const std::string& s, long min_value, long max_value, long& out) {
  if (s.empty())
    return false;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (*end != '\0' || v < min_value || v > max_value)
    return false;
  out = v;
  return true;
}

int main(int argc, char** argv) {
  ClientConfig config = ClientConfig::from_env();
  // One-shot tool: connect on demand rather than racing a pre-connect.
  config.preconnect = false;
  std::string key_dir = default_key_dir();

  int opt;
  while ((opt = getopt(argc, argv, "+vd:H:p:h")) != -1) {
    switch (opt) {
      case 'v':
        Logger::set_level(Logger::DEBUG);
        break;
      case 'd':
        key_dir = optarg;
        break;
      case 'H':
        config.host = optarg;
        break;
      case 'p': {
        long port = 0;
        if (!parse_int(optarg, 1, 65535, port)) {
          std::cerr << "invalid port: " << optarg << "\n";
          return 2;
        }
        config.port = static_cast<uint16_t>(port);
        break;
      }
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return 2;
    }
  }

  if (optind + 2 > argc) {
    usage(argv[0]);
    return 2;
  }

  std::string verb = argv[optind];
  Client client(config);
  if (!client.init(key_dir)) {
    return 1;
  }

  bool ok = false;
  if (verb == "key") {
    long code = 0;
    if (optind + 2 != argc || !parse_int(argv[optind + 1], 0, 100000, code)) {
      usage(argv[0]);
      return 2;
    }
    ok = client.send_key_event(static_cast<int>(code));
  } else if (verb == "shell") {
    std::string command;
    for (int i = optind + 1; i < argc; ++i) {
      if (!command.empty())
        command += ' ';
      command += argv[i];
    }
    ok = client.send_shell_command(command);
  } else {
    usage(argv[0]);
    return 2;
  }

  Logger::log(ok ? Logger::INFO : Logger::WARN, std::string(ok ? "Command accepted: " : "Command failed: ") + verb);
  return ok ? 0 : 1;
}

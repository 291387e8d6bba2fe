#include "driver.hpp"
#include "logging.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace zwlink;

static void usage() {
  std::cerr << "usage: zwlink --port <device|tcp://host:port> [--baud N]\n"
               "              [--attempts N] [--ack-timeout MS]\n"
               "              [--response-timeout MS] [--callback-timeout MS]\n"
               "              [--retry-delay MS] [--node-ids 8|16]\n"
               "              [--log-level trace|debug|info|warn|error]\n"
               "              [--no-identify]\n";
}

static void print_summary(Driver &d) {
  ControllerInfo c = d.controller().snapshot();
  std::printf("home ID:      0x%08x\n", (unsigned)c.home_id);
  std::printf("own node ID:  %u\n", (unsigned)c.own_node_id);
  std::printf("role:         %s%s%s\n", to_string(c.role),
              c.is_suc ? ", SUC" : "", c.is_sis ? ", SIS" : "");
  std::printf("SUC node:     %s\n",
              c.suc_node_id ? std::to_string(*c.suc_node_id).c_str() : "none");
  std::printf("library:      %s, %s\n", c.library_version.c_str(),
              to_string(c.library_type));
  std::printf("firmware:     %u.%u, manufacturer 0x%04x, product 0x%04x/0x%04x\n",
              (unsigned)c.firmware_major, (unsigned)c.firmware_minor,
              (unsigned)c.manufacturer_id, (unsigned)c.product_type,
              (unsigned)c.product_id);
  std::printf("API version:  %u, chip 0x%02x/0x%02x, %s node ids\n",
              (unsigned)c.api_version, (unsigned)c.chip_type,
              (unsigned)c.chip_version,
              to_string(d.controller().encoding_context().node_id_type));
  for (NodeId id : d.nodes().ids()) {
    auto node = d.nodes().get(id);
    if (!node)
      continue;
    auto info = node->protocol_info();
    if (info)
      std::printf("node %3u:     %s, %s, generic class 0x%02x, stage %s\n",
                  (unsigned)id, to_string(info->node_type),
                  info->listening ? "listening" : "sleeping",
                  (unsigned)info->generic_device_class,
                  to_string(node->interview_stage()));
    else
      std::printf("node %3u:     (no protocol info)\n", (unsigned)id);
  }
  std::fflush(stdout);
}

int main(int argc, char **argv) {
  DriverConfig cfg;
  bool identify = true;
  std::string level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--port")
        cfg.port = next(i);
      else if (a == "--baud")
        cfg.baud = (unsigned)std::stoul(next(i));
      else if (a == "--attempts")
        cfg.exec.max_attempts = (unsigned)std::stoul(next(i));
      else if (a == "--ack-timeout")
        cfg.exec.ack_timeout = std::chrono::milliseconds(std::stol(next(i)));
      else if (a == "--response-timeout")
        cfg.exec.response_timeout =
            std::chrono::milliseconds(std::stol(next(i)));
      else if (a == "--callback-timeout")
        cfg.exec.callback_timeout =
            std::chrono::milliseconds(std::stol(next(i)));
      else if (a == "--retry-delay")
        cfg.exec.retry_delay = std::chrono::milliseconds(std::stol(next(i)));
      else if (a == "--node-ids") {
        std::string w = next(i);
        if (w == "16")
          cfg.node_id_type = NodeIdType::NodeId16Bit;
        else if (w != "8")
          throw std::invalid_argument(w);
      } else if (a == "--log-level")
        level = next(i);
      else if (a == "--no-identify")
        identify = false;
      else if (a == "-h" || a == "--help") {
        usage();
        return 0;
      } else {
        std::cerr << "unknown option " << a << "\n";
        usage();
        return 1;
      }
    } catch (const std::exception &) {
      std::cerr << "bad value for " << a << "\n";
      return 1;
    }
  }

  if (!parse_log_level(level, cfg.log_level)) {
    std::cerr << "bad log level " << level << std::endl;
    return 1;
  }
  Logger::instance().set_level(cfg.log_level);

  Driver driver(cfg);
  try {
    driver.start();
  } catch (const std::system_error &e) {
    Logger::instance().log_tagged(LogLevel::ERROR, kLogDriver,
                                  "cannot open %s: %s", cfg.port.c_str(),
                                  e.what());
    return 1;
  }

  if (identify) {
    std::error_code ec = driver.identify_controller();
    if (ec) {
      Logger::instance().log_tagged(LogLevel::ERROR, kLogDriver,
                                    "controller identification failed: %s",
                                    ec.message().c_str());
      driver.stop();
      return 1;
    }
    print_summary(driver);
  }

  driver.on_unsolicited([](CommandPtr cmd) {
    Logger::instance().log_tagged(LogLevel::INFO, kLogController,
                                  "unsolicited: %s", cmd->describe().c_str());
  });

  asio::io_context io;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int sig) {
    Logger::instance().log_tagged(LogLevel::INFO, kLogDriver,
                                  "signal %d, shutting down", sig);
  });
  io.run();
  driver.stop();
  return 0;
}

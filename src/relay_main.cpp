#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <rtc/rtc.hpp>

#include <csignal>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "relay_server.hpp"
#include "rtc_transport.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv) {
  try {
    SettingsManager settings(RELAY_SETTINGS_SPECIFICATION);
    CommandLineParser parser("tightrope-relay", "signaling relay",
                             RELAY_SETTINGS_SPECIFICATION,
                             nlohmann::json::array({{{"index",0},{"key","listen_port"}}}));
    try {
      parser.parse(argc, argv, settings);
    } catch(const ConfigError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    bool verbose = settings.get<bool>("verbose");
    init(verbose);
    init_rtc_logging(verbose);
    rtc::Preload();

    auto port = settings.get<int>("listen_port");
    if(port <= 0 || port > 65535) {
      throw ConfigError("invalid listen_port " + std::to_string(port));
    }

    RelayServer::Options options;
    options.listen_ip = settings.get<std::string>("listen_ip");
    options.listen_port = static_cast<std::uint16_t>(port);
    RelayServer server(options);
    server.start();

    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_for("relay")->info("Signal {} received, shutting down", signal_number);
      server.stop();
    });
    io.run();
    return 0;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("tightrope-relay");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

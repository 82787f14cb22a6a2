#include <cpptrace/cpptrace.hpp>
#include <rtc/rtc.hpp>

#include <filesystem>

#include "command_line_parser.hpp"
#include "console_editor_bridge.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rtc_transport.hpp"
#include "session.hpp"
#include "session_cli.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".tightrope" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string()
                                                           : "tightrope");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const ConfigError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested() || settings->get<std::string>("role").empty()) {
      parser.usage();
      return settings->help_requested() ? 0 : 2;
    }

    bool verbose = settings->get<bool>("verbose");
    init(verbose);
    init_rtc_logging(verbose);
    rtc::Preload();
    auto logger = logger_for("session");
    if(verbose) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto options = Session::options_from(*settings);
    options.socket_factory = make_rtc_signaling_socket_factory();
    options.link_factory = make_rtc_peer_link_factory(settings->get<std::string>("stun_server"));
    options.editor = std::make_shared<ConsoleEditorBridge>(
      options.role == Role::Initiator ? options.workspace : std::filesystem::path());

    Session session(options);
    session.start_background();
    logger->print("Session id: {}", session.local_id());

    SessionCLI cli(session, settings);
    cli.run_loop();

    session.disconnect();
    session.stop();
    return 0;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("tightrope-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

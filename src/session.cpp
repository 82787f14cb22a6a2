#include "session.hpp"

#include <future>

#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::chrono::milliseconds millis_setting(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<long long>(key));
}

} // namespace

Session::Options Session::options_from(const SettingsManager& settings) {
  Options options;
  auto role_text = settings.get<std::string>("role");
  auto role = parse_role(role_text);
  if(!role) {
    throw ConfigError("role must be 'create' or 'join' (got '" + role_text + "')");
  }
  options.role = *role;
  options.target_id = settings.get<std::string>("peer");
  if(options.role == Role::Responder && options.target_id.empty()) {
    throw ConfigError("joining needs the session id of the participant to connect to");
  }
  options.username = settings.get<std::string>("username");
  options.relay_url = settings.get<std::string>("relay_url");
  if(options.relay_url.empty()) {
    throw ConfigError("relay_url must not be empty");
  }
  auto workspace = settings.get<std::string>("workspace");
  options.workspace = workspace.empty() ? std::filesystem::current_path() : std::filesystem::path(workspace);
  options.exclude = settings.get<std::vector<std::string>>("exclude");
  options.history_cache_bytes = static_cast<std::size_t>(settings.get<long long>("history_cache_bytes"));
  options.negotiation_timeout = millis_setting(settings, "negotiation_timeout_ms");
  options.transfer_timeout = millis_setting(settings, "transfer_timeout_ms");
  options.router.poll_interval = millis_setting(settings, "poll_interval_ms");
  auto scratch = settings.get<std::string>("scratch_dir");
  if(!scratch.empty()) options.router.scratch_dir = scratch;
  return options;
}

Session::Session(Options options)
  : options_(std::move(options)),
    logger_(logger_for("session")) {
  if(options_.local_id.empty()) options_.local_id = random_id();
  if(options_.username.empty()) options_.username = "user" + random_id(6);
  if(!options_.socket_factory || !options_.link_factory) {
    throw ConfigError("session needs relay and peer transports");
  }
  if(!options_.editor) {
    throw ConfigError("session needs an editor bridge");
  }
}

Session::~Session() {
  stop();
}

void Session::start() {
  if(started_) return;

  state_ = std::make_unique<SessionState>(options_.local_id, options_.role,
                                          options_.username, options_.transfer_timeout);
  if(options_.role == Role::Initiator) {
    WorkspaceSnapshot::Options snapshot_options;
    snapshot_options.exclude = options_.exclude;
    snapshot_options.content_cache_bytes = options_.history_cache_bytes;
    state_->set_workspace(std::make_unique<WorkspaceSnapshot>(options_.workspace, snapshot_options));
    logger_->info("Sharing {} ({} files)", options_.workspace.string(),
                  state_->workspace()->structure().file_count());
  }

  signaling_ = std::make_shared<SignalingClient>(io_, options_.socket_factory(),
                                                 options_.local_id, logger_for("signaling"));

  SessionNegotiator::Options negotiation;
  negotiation.local_id = options_.local_id;
  negotiation.target_id = options_.target_id;
  negotiation.negotiation_timeout = options_.negotiation_timeout;
  negotiator_ = std::make_shared<SessionNegotiator>(io_, signaling_, options_.link_factory,
                                                    negotiation, logger_for("negotiator"));

  router_ = std::make_shared<MessageRouter>(io_, *state_, options_.editor, options_.router,
                                            logger_for("router"));

  negotiator_->on_channel_open([this](std::shared_ptr<MessageChannel> channel){
    handle_channel_open(std::move(channel));
  });
  negotiator_->on_state([this](SessionNegotiator::State state, const std::string& detail){
    handle_negotiation_state(state, detail);
  });

  work_.emplace(asio::make_work_guard(io_));
  started_ = true;

  negotiator_->start();
  logger_->info("Session id {} ({} as {})", options_.local_id, to_string(options_.role), options_.username);
  signaling_->connect(options_.relay_url);
}

void Session::run() {
  if(!started_) start();
  io_.run();
}

void Session::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void Session::stop() {
  if(!started_) return;
  started_ = false;

  // Local teardown runs on the loop when it is still spinning, inline
  // otherwise.
  if(io_thread_.joinable()) {
    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    asio::post(io_, [this, done](){
      teardown("session stopped");
      done->set_value();
    });
    finished.wait_for(std::chrono::seconds(2));
  } else {
    teardown("session stopped");
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

void Session::teardown(const std::string& reason) {
  if(router_) router_->detach();
  if(negotiator_) negotiator_->close();
  if(signaling_) signaling_->close();
  if(state_) state_->peers().clear();
  logger_->debug("Teardown: {}", reason);
}

void Session::handle_channel_open(std::shared_ptr<MessageChannel> channel) {
  router_->attach(std::move(channel));
  try {
    router_->send_greeting();
  } catch(const TransportError& e) {
    logger_->error("Greeting failed: {}", e.what());
  }
}

void Session::handle_negotiation_state(SessionNegotiator::State state, const std::string& detail) {
  negotiation_state_ = state;
  switch(state) {
    case SessionNegotiator::State::AwaitingRelay:
      set_status(options_.target_id.empty() ? "Waiting for a peer to join " + options_.local_id
                                            : "Connecting to relay");
      break;
    case SessionNegotiator::State::Negotiating:
      set_status("Negotiating peer connection");
      break;
    case SessionNegotiator::State::Open:
      set_status(detail.rfind("relay lost", 0) == 0 ? "Connected (relay lost)" : "Channel open");
      break;
    case SessionNegotiator::State::Closed:
      router_->detach();
      state_->peers().clear();
      options_.editor->peers_changed({});
      set_status("Closed: " + detail);
      break;
    case SessionNegotiator::State::Idle:
      break;
  }
}

void Session::set_status(const std::string& status) {
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if(status_ == status) return;
    status_ = status;
  }
  logger_->info("{}", status);
  options_.editor->status_changed(status);
}

template<typename Fn>
void Session::post_guarded(const char* what, Fn fn) {
  if(!started_) {
    throw TransportError(std::string("session is not running, cannot ") + what);
  }
  asio::post(io_, [this, what, fn = std::move(fn)](){
    try {
      fn();
    } catch(const std::exception& e) {
      logger_->error("{} failed: {}", what, e.what());
    }
  });
}

void Session::request_file(const std::string& path) {
  post_guarded("request file", [this, path](){ router_->request_file(path); });
}

void Session::ping() {
  post_guarded("ping", [this](){ router_->send_ping(); });
}

void Session::send_edit(const std::string& path, const EditDescriptor& edit) {
  post_guarded("send edit", [this, path, edit](){ router_->send_edit(path, edit); });
}

void Session::send_selection(const SelectionInfo& selection) {
  post_guarded("send selection", [this, selection](){ router_->send_selection(selection); });
}

void Session::rollback() {
  post_guarded("rollback", [this](){
    auto* workspace = state_->workspace();
    if(!workspace) {
      throw ConfigError("only the workspace owner can roll back");
    }
    if(!workspace->rollback()) {
      logger_->warn("Nothing to roll back");
      return;
    }
    logger_->info("Rolled back the latest change");
    options_.editor->workspace_changed(workspace->structure());
    router_->workspace_updated();
  });
}

void Session::disconnect() {
  post_guarded("disconnect", [this](){
    if(router_->attached()) {
      try {
        router_->send_disconnect();
      } catch(const TransportError& e) {
        logger_->warn("Disconnect notice not delivered: {}", e.what());
      }
    }
    teardown("disconnected locally");
    options_.editor->peers_changed({});
    set_status("Disconnected");
  });
}

std::string Session::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

std::vector<PeerInfo> Session::peers() const {
  if(!state_) return {};
  return state_->peers().list();
}

std::optional<DirectoryNode> Session::mirror() const {
  if(!state_ || !state_->has_mirror()) return std::nullopt;
  return state_->mirror();
}

std::optional<DirectoryNode> Session::workspace_structure() const {
  if(!state_ || !state_->workspace()) return std::nullopt;
  return state_->workspace()->structure();
}

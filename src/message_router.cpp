#include "message_router.hpp"

#include <system_error>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

MessageRouter::MessageRouter(asio::io_context& io,
                             SessionState& state,
                             std::shared_ptr<EditorBridge> editor,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : io_(io),
    state_(state),
    editor_(std::move(editor)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : logger_for("router")),
    tick_timer_(io) {
  if(!editor_) {
    throw ConfigError("message router needs an editor bridge");
  }
  if(options_.snapshot_fragment_size == 0 || options_.file_fragment_size == 0 ||
     options_.edit_fragment_size == 0) {
    throw ConfigError("fragment sizes must be greater than zero");
  }
  if(options_.poll_interval.count() <= 0) {
    throw ConfigError("poll interval must be positive");
  }
  if(options_.scratch_dir.empty()) {
    options_.scratch_dir = fs::temp_directory_path() / "tightrope-code";
  }
}

MessageRouter::~MessageRouter() {
  std::error_code ec;
  tick_timer_.cancel(ec);
  if(channel_) channel_->on_message(nullptr);
}

void MessageRouter::attach(std::shared_ptr<MessageChannel> channel) {
  if(!channel) return;
  detach();
  channel_ = std::move(channel);
  std::weak_ptr<MessageRouter> weak = shared_from_this();
  asio::io_context* io = &io_;
  channel_->on_message([io, weak](const std::string& line){
    asio::post(*io, [weak, line](){
      if(auto self = weak.lock()) self->handle_line(line);
    });
  });
  schedule_tick();
}

void MessageRouter::detach() {
  std::error_code ec;
  tick_timer_.cancel(ec);
  if(channel_) {
    channel_->on_message(nullptr);
    channel_.reset();
  }
  pushing_ = false;
  state_.transfers().clear();
}

void MessageRouter::handle_line(const std::string& line) {
  try {
    ChannelMessage message = decode_message(line);
    logger_->debug("<- {} ({} bytes)", message_type(message), line.size());
    std::visit([this](const auto& m){ handle(m); }, message);
  } catch(const AuthorizationError& e) {
    logger_->warn("Rejected: {}", e.what());
  } catch(const ProtocolError& e) {
    logger_->warn("Dropping message: {}", e.what());
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Dropping message with a bad payload: {}", e.what());
  } catch(const TransportError& e) {
    logger_->error("Reply failed: {}", e.what());
  } catch(const std::exception& e) {
    logger_->error("Failed to handle message: {}", e.what());
  }
}

// ---- outbound -------------------------------------------------------------

void MessageRouter::send(const ChannelMessage& message) {
  if(!channel_ || !channel_->is_open()) {
    throw TransportError(std::string("channel is not open, cannot send ") + message_type(message));
  }
  if(!channel_->send(encode_message(message))) {
    throw TransportError(std::string("channel refused ") + message_type(message));
  }
}

void MessageRouter::send_chunked(TransferKind kind,
                                 const std::string& target,
                                 const std::string& payload,
                                 std::size_t fragment_size) {
  auto fragments = split_payload(payload, fragment_size);
  const std::size_t total = fragments.size();
  for(std::size_t i = 0; i < total; ++i) {
    switch(kind) {
      case TransferKind::WorkspaceSnapshot:
        send(msg::NfsUpdate{i, total, std::move(fragments[i])});
        break;
      case TransferKind::FileContent:
        send(msg::FileData{target, i, total, std::move(fragments[i])});
        break;
      case TransferKind::Edit:
        send(msg::ApplyEdit{target, i, total, std::move(fragments[i])});
        break;
    }
  }
  logger_->debug("-> {} {} in {} chunks", to_string(kind), target, total);
}

void MessageRouter::send_greeting() {
  send(msg::Greeting{state_.local_id(), state_.username()});
}

void MessageRouter::send_ping() {
  send(msg::Ping{});
}

void MessageRouter::request_file(const std::string& path) {
  if(path.empty()) {
    throw ConfigError("cannot request an empty path");
  }
  send(msg::RequestFile{path});
  logger_->info("Requested {}", path);
}

void MessageRouter::send_edit(const std::string& path, const EditDescriptor& edit) {
  json j = edit;
  send_chunked(TransferKind::Edit, path, encode_base64(j.dump()), options_.edit_fragment_size);
}

void MessageRouter::send_selection(const SelectionInfo& selection) {
  send(msg::SelectionChange{selection});
}

void MessageRouter::push_snapshot() {
  auto* workspace = state_.workspace();
  if(!workspace) {
    throw ConfigError("only the workspace owner can push snapshots");
  }
  send_chunked(TransferKind::WorkspaceSnapshot, "",
               encode_base64(workspace->structure_json().dump()),
               options_.snapshot_fragment_size);
}

void MessageRouter::send_disconnect() {
  send(msg::Disconnect{state_.local_id()});
}

// ---- inbound --------------------------------------------------------------

void MessageRouter::handle(const msg::Ping&) {
  send(msg::Pong{});
}

void MessageRouter::handle(const msg::Pong&) {
  logger_->info("Pong!");
  editor_->pong_received(last_greeting_from_);
}

void MessageRouter::handle(const msg::Greeting& m) {
  last_greeting_from_ = m.id;
  if(state_.peers().add(PeerInfo{m.id, m.username, "connected"})) {
    logger_->info("Peer connected: {} ({})", m.username, m.id);
  } else {
    logger_->debug("Repeated greeting from {}", m.id);
  }
  editor_->peers_changed(state_.peers().list());
  editor_->status_changed("Connected!");

  if(state_.role() == Role::Initiator && state_.workspace()) {
    pushing_ = true;
    push_snapshot();
  }
}

void MessageRouter::handle(const msg::Disconnect& m) {
  if(state_.peers().remove(m.id)) {
    logger_->info("Peer {} disconnected", m.id);
  }
  state_.transfers().clear();
  if(state_.peers().size() == 0) pushing_ = false;
  editor_->peers_changed(state_.peers().list());
  editor_->status_changed("Peer disconnected");
}

void MessageRouter::handle(const msg::NfsUpdate& m) {
  auto payload = state_.transfers().add_fragment(TransferKind::WorkspaceSnapshot, "",
                                                 m.index, m.total, m.fragment);
  if(!payload) return;
  auto node = json::parse(decode_base64(*payload)).get<DirectoryNode>();
  logger_->info("Workspace snapshot received ({} files)", node.file_count());
  state_.set_mirror(node);
  editor_->workspace_changed(node);
}

void MessageRouter::handle(const msg::RequestFile& m) {
  auto* workspace = state_.workspace();
  if(state_.role() != Role::Initiator || !workspace) {
    logger_->debug("Ignoring request for {}: not sharing a workspace", m.path);
    return;
  }
  auto resolved = shared_path(*workspace, m.path, "request");
  std::error_code ec;
  if(!fs::is_regular_file(resolved, ec)) {
    throw ProtocolError("requested '" + m.path + "' is not a file");
  }
  auto bytes = read_file_bytes(resolved);
  if(!bytes) {
    throw TightropeError("cannot read '" + resolved.string() + "'");
  }
  send_chunked(TransferKind::FileContent, m.path, encode_base64(*bytes), options_.file_fragment_size);
  logger_->info("Sent {} ({} bytes)", resolved.lexically_relative(workspace->root()).generic_string(),
                bytes->size());
}

void MessageRouter::handle(const msg::FileData& m) {
  auto payload = state_.transfers().add_fragment(TransferKind::FileContent, m.path,
                                                 m.index, m.total, m.fragment);
  if(!payload) return;
  auto bytes = decode_base64(*payload);
  auto local = scratch_path_for(m.path);
  if(!write_file_bytes(local, bytes)) {
    throw TightropeError("cannot write '" + local.string() + "'");
  }
  logger_->info("Received {} ({} bytes)", m.path, bytes.size());
  editor_->open_document(local, m.path);
}

void MessageRouter::handle(const msg::ApplyEdit& m) {
  auto payload = state_.transfers().add_fragment(TransferKind::Edit, m.path,
                                                 m.index, m.total, m.fragment);
  if(!payload) return;
  auto edit = json::parse(decode_base64(*payload)).get<EditDescriptor>();

  auto* workspace = state_.workspace();
  if(state_.role() != Role::Initiator || !workspace) {
    editor_->apply_edit(m.path, edit);
    return;
  }

  // On the sharing side the edit changes a workspace file; record it so it
  // can be rolled back.
  auto resolved = shared_path(*workspace, m.path, "edit");
  editor_->apply_edit(m.path, edit);
  std::error_code ec;
  if(!fs::is_regular_file(resolved, ec)) return;
  auto relative = resolved.lexically_relative(workspace->root()).generic_string();
  auto before = workspace->record(relative);
  workspace->update(resolved);
  auto after = workspace->record(relative);
  if(before != after) workspace_updated();
}

void MessageRouter::workspace_updated() {
  if(!channel_ || !pushing_ || !state_.workspace()) return;
  try {
    push_snapshot();
  } catch(const std::exception& e) {
    logger_->warn("Snapshot push failed: {}", e.what());
  }
}

void MessageRouter::handle(const msg::SelectionChange& m) {
  editor_->highlight_selection(m.selection);
}

fs::path MessageRouter::shared_path(const WorkspaceSnapshot& workspace,
                                    const std::string& path,
                                    const char* what) const {
  auto resolved = workspace.resolve_inside(path);
  if(!resolved) {
    throw AuthorizationError(std::string(what) + " for '" + path + "' outside " + workspace.root().string());
  }
  auto relative = resolved->lexically_relative(workspace.root()).generic_string();
  if(relative != "." && workspace.rules().ignores(relative, false)) {
    throw AuthorizationError(std::string(what) + " for '" + path + "' is excluded from sharing");
  }
  return *resolved;
}

fs::path MessageRouter::scratch_path_for(const std::string& remote_path) const {
  fs::path relative = fs::path(remote_path).relative_path().lexically_normal();
  if(relative.empty() || relative == ".") {
    throw ProtocolError("file data without a usable path");
  }
  for(const auto& part : relative) {
    if(part == "..") {
      throw ProtocolError("file path '" + remote_path + "' escapes the scratch directory");
    }
  }
  return options_.scratch_dir / relative;
}

// ---- housekeeping ---------------------------------------------------------

void MessageRouter::schedule_tick() {
  tick_timer_.expires_after(options_.poll_interval);
  std::weak_ptr<MessageRouter> weak = shared_from_this();
  tick_timer_.async_wait([weak](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) self->tick();
  });
}

void MessageRouter::tick() {
  if(!channel_) return;
  if(auto dropped = state_.transfers().expire()) {
    logger_->warn("Dropped {} stalled transfers", dropped);
  }
  if(pushing_) {
    if(auto* workspace = state_.workspace()) {
      try {
        if(workspace->detect_changes()) {
          editor_->workspace_changed(workspace->structure());
          push_snapshot();
        }
      } catch(const TransportError& e) {
        logger_->warn("Snapshot push failed: {}", e.what());
      } catch(const std::exception& e) {
        logger_->warn("Change detection failed: {}", e.what());
      }
    }
  }
  schedule_tick();
}

#include "console_editor_bridge.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "session.hpp"
#include "session_negotiator.hpp"
#include "signaling_client.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using tightrope::test::FakeNetwork;
using tightrope::test::FakeRelay;
using tightrope::test::RecordingEditorBridge;
using tightrope::test::TestCase;
using tightrope::test::TestContext;
using tightrope::test::fresh_directory;
using tightrope::test::read_text;
using tightrope::test::wait_for_condition;
using tightrope::test::write_text;

namespace {

const std::string kHelloSha256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
constexpr auto kWait = 5s;

// One in-memory relay and network shared by every participant of a test.
struct Harness {
  std::shared_ptr<FakeRelay> relay = std::make_shared<FakeRelay>();
  std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>();

  Session::Options options(const std::string& name,
                           Role role,
                           std::shared_ptr<EditorBridge> editor,
                           const std::string& target = std::string()) {
    Session::Options options;
    options.role = role;
    options.target_id = target;
    options.username = name;
    options.relay_url = "ws://relay.test:6789";
    options.negotiation_timeout = kWait;
    options.router.scratch_dir = fresh_directory(name + "_scratch");
    options.router.file_fragment_size = 32;
    options.router.snapshot_fragment_size = 128;
    options.socket_factory = relay->socket_factory();
    options.link_factory = network->link_factory();
    options.editor = std::move(editor);
    return options;
  }

  // Starts a sharing session and waits until the relay knows its id.
  std::unique_ptr<Session> start_sharer(const fs::path& workspace,
                                        std::shared_ptr<EditorBridge> editor,
                                        const std::string& name = "ann") {
    auto opts = options(name, Role::Initiator, std::move(editor));
    opts.workspace = workspace;
    auto session = std::make_unique<Session>(opts);
    session->start_background();
    const std::string id = session->local_id();
    wait_for_condition([&]{ return relay->router().is_registered(id); }, kWait);
    return session;
  }

  std::unique_ptr<Session> start_joiner(const std::string& target,
                                        std::shared_ptr<EditorBridge> editor,
                                        const std::string& name = "bob",
                                        std::chrono::milliseconds negotiation_timeout = kWait) {
    auto opts = options(name, Role::Responder, std::move(editor), target);
    opts.negotiation_timeout = negotiation_timeout;
    auto session = std::make_unique<Session>(opts);
    session->start_background();
    return session;
  }
};

bool both_open(const Session& a, const Session& b) {
  return a.negotiation_state() == SessionNegotiator::State::Open &&
         b.negotiation_state() == SessionNegotiator::State::Open;
}

fs::path sample_workspace(const std::string& name) {
  auto root = fresh_directory(name);
  write_text(root / "a.txt", "hello");
  write_text(root / "src" / "lib.cpp", "int answer() { return 42; }\n");
  return root;
}

bool test_full_session(TestContext& ctx) {
  Harness net;
  auto ann_editor = std::make_shared<RecordingEditorBridge>();
  auto bob_editor = std::make_shared<RecordingEditorBridge>();
  auto ann = net.start_sharer(sample_workspace("full_session_ws"), ann_editor);
  if(ann->status().find("Waiting for a peer to join " + ann->local_id()) == std::string::npos) {
    return ctx.fail("sharer status: " + ann->status());
  }
  auto bob = net.start_joiner(ann->local_id(), bob_editor);

  if(!wait_for_condition([&]{ return both_open(*ann, *bob); }, kWait)) return ctx.fail("channel never opened");
  if(!wait_for_condition([&]{ return bob->mirror().has_value(); }, kWait)) return ctx.fail("no snapshot received");
  if(!wait_for_condition([&]{ return ann->peers().size() == 1 && bob->peers().size() == 1; }, kWait)) {
    return ctx.fail("greetings not exchanged");
  }
  if(ann->peers()[0].id != bob->local_id() || ann->peers()[0].username != "bob") return ctx.fail("sharer peer entry");
  if(bob->peers()[0].id != ann->local_id()) return ctx.fail("joiner peer entry");
  if(net.network->labels() != std::vector<std::string>{"dataChannel"}) return ctx.fail("channel label");
  if(net.network->links_created() != 2) return ctx.fail("unexpected number of peer links");
  if(bob->status() != "Channel open") return ctx.fail("joiner status: " + bob->status());

  auto mirror = *bob->mirror();
  const FileRecord* a = mirror.find_file("a.txt");
  if(!a || a->hash != kHelloSha256) return ctx.fail("mirror fingerprint");
  if(mirror != *ann->workspace_structure()) return ctx.fail("mirror differs from the shared tree");

  const FileRecord* lib = mirror.find_file("src/lib.cpp");
  bob->request_file(lib->full_path);
  if(!wait_for_condition([&]{ return bob_editor->opened().size() == 1; }, kWait)) return ctx.fail("file never opened");
  if(read_text(bob_editor->opened()[0].local_copy) != "int answer() { return 42; }\n") return ctx.fail("file content");

  EditDescriptor edit{Range{{0, 4}, {0, 10}}, "question"};
  bob->send_edit("src/lib.cpp", edit);
  if(!wait_for_condition([&]{ return ann_editor->edits().size() == 1; }, kWait)) return ctx.fail("edit never arrived");
  if(!(ann_editor->edits()[0].second == edit)) return ctx.fail("edit changed in transit");

  SelectionInfo selection{lib->full_path, "lib.cpp", "src", Range{{0, 0}, {0, 3}}};
  bob->send_selection(selection);
  if(!wait_for_condition([&]{ return ann_editor->selections().size() == 1; }, kWait)) return ctx.fail("selection lost");

  bob->ping();
  if(!wait_for_condition([&]{ return !bob_editor->pongs().empty(); }, kWait)) return ctx.fail("no pong");
  if(bob_editor->pongs()[0] != ann->local_id()) return ctx.fail("pong attributed to the wrong peer");

  bob->disconnect();
  if(!wait_for_condition([&]{ return ann->peers().empty(); }, kWait)) return ctx.fail("sharer still lists the peer");
  if(!wait_for_condition([&]{ return bob->status() == "Disconnected"; }, kWait)) return ctx.fail("joiner status: " + bob->status());
  if(!wait_for_condition([&]{ return ann->negotiation_state() == SessionNegotiator::State::Closed; }, kWait)) {
    return ctx.fail("sharer channel not closed");
  }
  return true;
}

bool test_relay_loss_after_open(TestContext& ctx) {
  Harness net;
  auto bob_editor = std::make_shared<RecordingEditorBridge>();
  auto ann = net.start_sharer(sample_workspace("relay_loss_ws"), std::make_shared<RecordingEditorBridge>());
  auto bob = net.start_joiner(ann->local_id(), bob_editor);
  if(!wait_for_condition([&]{ return both_open(*ann, *bob); }, kWait)) return ctx.fail("channel never opened");

  net.relay->shutdown();
  if(!wait_for_condition([&]{ return bob->status() == "Connected (relay lost)" &&
                                    ann->status() == "Connected (relay lost)"; }, kWait)) {
    return ctx.fail("relay loss not reported: " + bob->status());
  }
  if(!both_open(*ann, *bob)) return ctx.fail("relay loss closed the session");
  bob->ping();
  if(!wait_for_condition([&]{ return !bob_editor->pongs().empty(); }, kWait)) return ctx.fail("channel stopped working");
  return true;
}

bool test_negotiation_timeout(TestContext& ctx) {
  Harness net;
  net.network->set_connectable(false);
  auto ann = net.start_sharer(sample_workspace("timeout_ws"), std::make_shared<RecordingEditorBridge>());
  auto bob = net.start_joiner(ann->local_id(), std::make_shared<RecordingEditorBridge>(), "bob", 150ms);
  if(!wait_for_condition([&]{ return bob->negotiation_state() == SessionNegotiator::State::Closed; }, kWait)) {
    return ctx.fail("negotiation never gave up");
  }
  if(bob->status().find("no data channel") == std::string::npos) return ctx.fail("status: " + bob->status());
  if(bob->mirror()) return ctx.fail("mirror without a channel");
  return true;
}

bool test_join_unknown_peer(TestContext& ctx) {
  Harness net;
  auto bob = net.start_joiner("NOSUCHPEERAAAAAA", std::make_shared<RecordingEditorBridge>(), "bob", 150ms);
  if(!wait_for_condition([&]{ return bob->negotiation_state() == SessionNegotiator::State::Closed; }, kWait)) {
    return ctx.fail("join to an unknown id never failed");
  }
  if(!ctx.logs.contains("unknown target")) return ctx.fail("relay did not report the unknown target");
  return true;
}

bool test_relay_unreachable(TestContext& ctx) {
  Harness net;
  net.relay->set_accepting(false);
  auto ann_options = net.options("ann", Role::Initiator, std::make_shared<RecordingEditorBridge>());
  ann_options.workspace = sample_workspace("unreachable_ws");
  Session ann(ann_options);
  ann.start_background();
  if(!wait_for_condition([&]{ return ann.negotiation_state() == SessionNegotiator::State::Closed; }, kWait)) {
    return ctx.fail("refused relay not reported");
  }
  if(ann.status().find("connection refused") == std::string::npos) return ctx.fail("status: " + ann.status());
  return true;
}

bool test_second_joiner_turned_away(TestContext& ctx) {
  Harness net;
  auto ann = net.start_sharer(sample_workspace("second_joiner_ws"), std::make_shared<RecordingEditorBridge>());
  auto bob = net.start_joiner(ann->local_id(), std::make_shared<RecordingEditorBridge>());
  if(!wait_for_condition([&]{ return both_open(*ann, *bob); }, kWait)) return ctx.fail("first join failed");

  auto carol = net.start_joiner(ann->local_id(), std::make_shared<RecordingEditorBridge>(), "carol", 200ms);
  if(!wait_for_condition([&]{ return carol->negotiation_state() == SessionNegotiator::State::Closed; }, kWait)) {
    return ctx.fail("second joiner was not refused");
  }
  if(!ctx.logs.contains("Ignoring offer")) return ctx.fail("extra offer not logged");
  if(!both_open(*ann, *bob)) return ctx.fail("second joiner disturbed the first session");
  if(ann->peers().size() != 1) return ctx.fail("sharer gained a peer");
  return true;
}

bool test_rollback_reaches_mirror(TestContext& ctx) {
  Harness net;
  auto root = sample_workspace("rollback_ws");
  auto ann = net.start_sharer(root, std::make_shared<ConsoleEditorBridge>(root));
  auto bob = net.start_joiner(ann->local_id(), std::make_shared<RecordingEditorBridge>());
  if(!wait_for_condition([&]{ return bob->mirror().has_value(); }, kWait)) return ctx.fail("no snapshot");

  auto mirrored_hash = [&]() -> std::string {
    auto mirror = bob->mirror();
    if(!mirror) return {};
    const FileRecord* a = mirror->find_file("a.txt");
    return a ? a->hash : std::string();
  };

  bob->send_edit("a.txt", EditDescriptor{Range{{0, 0}, {0, 5}}, "howdy"});
  if(!wait_for_condition([&]{ return mirrored_hash() == sha256_hex("howdy"); }, kWait)) {
    return ctx.fail("edited file not reflected in the mirror");
  }
  if(read_text(root / "a.txt") != "howdy") return ctx.fail("edit not written");

  ann->rollback();
  if(!wait_for_condition([&]{ return mirrored_hash() == kHelloSha256; }, kWait)) {
    return ctx.fail("rollback not reflected in the mirror");
  }
  if(read_text(root / "a.txt") != "hello") return ctx.fail("rollback did not restore the file");

  bob->rollback();
  if(!wait_for_condition([&]{ return ctx.logs.contains("only the workspace owner can roll back"); }, kWait)) {
    return ctx.fail("joiner rollback not refused");
  }
  return true;
}

bool test_relay_noise_is_dropped(TestContext& ctx) {
  Harness net;
  auto ann = net.start_sharer(sample_workspace("relay_noise_ws"), std::make_shared<RecordingEditorBridge>());
  const std::string noisy_id = "NOISYPEERCCCCCCC";
  auto raw = net.relay->socket_factory()();
  raw->open("ws://relay.test:6789");
  raw->send(make_register(noisy_id).dump());

  if(!net.relay->inject(ann->local_id(), "this is not json")) return ctx.fail("sharer socket not found");
  net.relay->inject(ann->local_id(), R"({"type":"hello","from":")" + noisy_id + R"("})");
  raw->send(R"({"type":"offer","offer":{"sdp":"v=0","type":5},"from":")" + noisy_id +
            R"(","to":")" + ann->local_id() + R"("})");
  raw->send(R"({"type":"candidate","candidate":{"candidate":7},"from":")" + noisy_id +
            R"(","to":")" + ann->local_id() + R"("})");

  if(!wait_for_condition([&]{ return ctx.logs.contains("Dropping relay message") &&
                                    ctx.logs.contains("Ignoring unknown signal 'hello'") &&
                                    ctx.logs.contains("non-string description type") &&
                                    ctx.logs.contains("Dropping candidate"); }, kWait)) {
    return ctx.fail("bad relay input not logged");
  }
  if(ann->negotiation_state() != SessionNegotiator::State::AwaitingRelay) return ctx.fail("bad input changed state");
  if(net.network->links_created() != 0) return ctx.fail("bad offer built a peer link");

  auto bob = net.start_joiner(ann->local_id(), std::make_shared<RecordingEditorBridge>());
  if(!wait_for_condition([&]{ return both_open(*ann, *bob); }, kWait)) return ctx.fail("session did not negotiate afterwards");
  if(!wait_for_condition([&]{ return bob->mirror().has_value(); }, kWait)) return ctx.fail("no snapshot afterwards");
  raw->close();
  return true;
}

bool test_peer_connection_failure_closes(TestContext& ctx) {
  Harness net;
  auto ann = net.start_sharer(sample_workspace("link_failure_ws"), std::make_shared<RecordingEditorBridge>());
  auto opts = net.options("bob", Role::Responder, std::make_shared<RecordingEditorBridge>(), ann->local_id());
  opts.link_factory = [](PeerLink::Callbacks) -> std::unique_ptr<PeerLink> {
    throw std::invalid_argument("invalid ICE server URL");
  };
  Session bob(opts);
  bob.start_background();
  if(!wait_for_condition([&]{ return bob.negotiation_state() == SessionNegotiator::State::Closed &&
                                    bob.status().find("cannot create peer connection") != std::string::npos; },
                         kWait)) {
    return ctx.fail("failed peer connection not reported: " + bob.status());
  }
  bob.stop();
  return true;
}

bool test_candidates_before_offer_are_queued(TestContext& ctx) {
  asio::io_context io;
  auto drain = [&io]{
    for(int round = 0; round < 1000; ++round) {
      io.restart();
      if(io.poll() == 0) return;
    }
  };
  Harness net;
  const std::string answerer_id = "ANSWERERAAAAAAAA";
  const std::string manual_id = "MANUALPEERBBBBBB";

  std::shared_ptr<MessageChannel> opened;
  std::vector<SessionDescription> manual_descriptions;
  std::vector<IceCandidate> manual_candidates;
  std::shared_ptr<MessageChannel> manual_channel;
  std::vector<std::string> manual_inbox;

  auto signaling = std::make_shared<SignalingClient>(io, net.relay->socket_factory()(), answerer_id);
  SessionNegotiator::Options options;
  options.local_id = answerer_id;
  options.negotiation_timeout = kWait;
  auto negotiator = std::make_shared<SessionNegotiator>(io, signaling, net.network->link_factory(), options);
  negotiator->on_channel_open([&](std::shared_ptr<MessageChannel> channel){ opened = std::move(channel); });
  negotiator->start();
  signaling->connect("ws://relay.test:6789");
  drain();
  if(signaling->status() != SignalingClient::Status::Registered) return ctx.fail("answerer not registered");

  // A hand-driven offerer whose candidate overtakes its offer.
  PeerLink::Callbacks callbacks;
  callbacks.local_description = [&](const SessionDescription& d){ manual_descriptions.push_back(d); };
  callbacks.local_candidate = [&](const IceCandidate& c){ manual_candidates.push_back(c); };
  callbacks.channel = [&](std::shared_ptr<MessageChannel> channel){ manual_channel = std::move(channel); };
  auto manual = net.network->link_factory()(callbacks);
  manual->create_offer("dataChannel");
  if(manual_descriptions.size() != 1 || manual_candidates.size() != 1) return ctx.fail("manual offer not produced");

  auto raw = net.relay->socket_factory()();
  raw->on_message([&](const std::string& text){ manual_inbox.push_back(text); });
  raw->open("ws://relay.test:6789");
  raw->send(make_register(manual_id).dump());

  raw->send(make_candidate(manual_candidates[0], answerer_id, manual_id).dump());
  drain();
  if(negotiator->queued_candidates() != 1) return ctx.fail("early candidate not queued");
  if(negotiator->state() != SessionNegotiator::State::AwaitingRelay) return ctx.fail("candidate started negotiation");

  raw->send(make_offer(manual_descriptions[0], answerer_id, manual_id).dump());
  drain();
  if(negotiator->queued_candidates() != 0) return ctx.fail("queue not flushed after the offer");
  if(net.network->candidates_applied_total() != 1) return ctx.fail("queued candidate not applied");
  if(negotiator->remote_id() != manual_id) return ctx.fail("remote id not taken from the offer");

  for(const auto& text : manual_inbox) {
    auto envelope = parse_envelope(text);
    if(envelope.type == "answer") manual->accept_answer(description_from(envelope));
  }
  for(const auto& text : manual_inbox) {
    auto envelope = parse_envelope(text);
    if(envelope.type == "candidate") manual->add_remote_candidate(candidate_from(envelope));
  }
  drain();
  if(negotiator->state() != SessionNegotiator::State::Open) return ctx.fail("channel did not open");
  if(!opened || !opened->is_open()) return ctx.fail("open channel not handed out");
  if(!manual_channel || !manual_channel->is_open()) return ctx.fail("offerer channel not open");

  // Once connected, candidates from anyone else are dropped rather than queued.
  const auto applied = net.network->candidates_applied_total();
  auto stranger = net.relay->socket_factory()();
  stranger->open("ws://relay.test:6789");
  stranger->send(make_register("STRANGERDDDDDDDD").dump());
  for(int i = 0; i < 3; ++i) {
    stranger->send(make_candidate(manual_candidates[0], answerer_id, "STRANGERDDDDDDDD").dump());
  }
  drain();
  if(negotiator->queued_candidates() != 0) return ctx.fail("stranger candidates queued while open");
  if(net.network->candidates_applied_total() != applied) return ctx.fail("stranger candidate applied");
  stranger->close();

  negotiator->close();
  signaling->close();
  drain();
  return true;
}

bool test_configuration_errors(TestContext& ctx) {
  Harness net;
  auto opts = net.options("ann", Role::Initiator, std::make_shared<RecordingEditorBridge>());
  opts.workspace = fresh_directory("config_errors") / "missing";
  Session ann(opts);
  try {
    ann.start();
    return ctx.fail("missing workspace accepted");
  } catch(const ConfigError&) {
  }
  try {
    ann.ping();
    return ctx.fail("ping on a stopped session accepted");
  } catch(const TransportError&) {
  }

  auto no_editor = net.options("bob", Role::Responder, nullptr, "SOMEONE");
  try {
    Session bob(no_editor);
    return ctx.fail("session without an editor accepted");
  } catch(const ConfigError&) {
  }

  auto defaults = net.options("", Role::Responder, std::make_shared<RecordingEditorBridge>(), "SOMEONE");
  Session carol(defaults);
  if(carol.local_id().size() != 16) return ctx.fail("generated id length");
  if(carol.username().rfind("user", 0) != 0 || carol.username().size() != 10) return ctx.fail("generated username");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"full_session", test_full_session},
    {"relay_loss_after_open", test_relay_loss_after_open},
    {"negotiation_timeout", test_negotiation_timeout},
    {"join_unknown_peer", test_join_unknown_peer},
    {"relay_unreachable", test_relay_unreachable},
    {"second_joiner_turned_away", test_second_joiner_turned_away},
    {"rollback_reaches_mirror", test_rollback_reaches_mirror},
    {"relay_noise_is_dropped", test_relay_noise_is_dropped},
    {"peer_connection_failure_closes", test_peer_connection_failure_closes},
    {"candidates_before_offer_are_queued", test_candidates_before_offer_are_queued},
    {"configuration_errors", test_configuration_errors},
  };
  return tightrope::test::run_tests("session", std::move(tests), argc, argv,
                                    {"session", "signaling", "negotiator", "router", "relay", "workspace"});
}

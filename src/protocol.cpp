#include "protocol.hpp"

#include <cctype>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {

// Splits on single spaces and keeps empty fields, so "nfsupdate 0 1 " carries
// an empty fragment.
std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while(true) {
    auto pos = line.find(' ', start);
    if(pos == std::string::npos) {
      out.push_back(line.substr(start));
      break;
    }
    out.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::size_t parse_count(const std::string& field, const char* what) {
  if(field.empty() || field.size() > 9) {
    throw ProtocolError(std::string("bad ") + what + " '" + field + "'");
  }
  for(unsigned char c : field) {
    if(!std::isdigit(c)) throw ProtocolError(std::string("bad ") + what + " '" + field + "'");
  }
  return static_cast<std::size_t>(std::stoul(field));
}

int parse_coordinate(const std::string& field) {
  return static_cast<int>(parse_count(field, "coordinate"));
}

void require_fields(const std::vector<std::string>& fields, std::size_t count) {
  if(fields.size() < count) {
    throw ProtocolError("'" + fields[0] + "' needs " + std::to_string(count - 1) +
                        " fields, got " + std::to_string(fields.size() - 1));
  }
}

// Fields past `from` are rejoined; a fragment never contains spaces but an
// older peer could send one.
std::string rest_of(const std::vector<std::string>& fields, std::size_t from) {
  std::string out;
  for(std::size_t i = from; i < fields.size(); ++i) {
    if(i > from) out.push_back(' ');
    out += fields[i];
  }
  return out;
}

std::string chunk_suffix(std::size_t index, std::size_t total, const std::string& fragment) {
  return " " + std::to_string(index) + " " + std::to_string(total) + " " + fragment;
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

void to_json(json& j, const Position& p) {
  j = json{{"line", p.line}, {"character", p.character}};
}

void from_json(const json& j, Position& p) {
  p.line = j.at("line").get<int>();
  p.character = j.at("character").get<int>();
}

void to_json(json& j, const Range& r) {
  j = json{{"start", r.start}, {"end", r.end}};
}

void from_json(const json& j, Range& r) {
  r.start = j.at("start").get<Position>();
  r.end = j.at("end").get<Position>();
}

void to_json(json& j, const EditDescriptor& e) {
  j = json{{"range", e.range}, {"text", e.text}};
}

void from_json(const json& j, EditDescriptor& e) {
  e.range = j.at("range").get<Range>();
  e.text = j.at("text").get<std::string>();
}

std::string encode_message(const ChannelMessage& message) {
  return std::visit(overloaded{
    [](const msg::Ping&) -> std::string { return "ping"; },
    [](const msg::Pong&) -> std::string { return "pong"; },
    [](const msg::Greeting& m) -> std::string {
      return "greeting " + m.id + " " + encode_base64(m.username);
    },
    [](const msg::Disconnect& m) -> std::string { return "disconnect " + m.id; },
    [](const msg::NfsUpdate& m) -> std::string {
      return "nfsupdate" + chunk_suffix(m.index, m.total, m.fragment);
    },
    [](const msg::RequestFile& m) -> std::string {
      return "requestFile " + encode_base64(m.path);
    },
    [](const msg::FileData& m) -> std::string {
      return "fileData " + encode_base64(m.path) + chunk_suffix(m.index, m.total, m.fragment);
    },
    [](const msg::ApplyEdit& m) -> std::string {
      return "applyEdit " + encode_base64(m.path) + chunk_suffix(m.index, m.total, m.fragment);
    },
    [](const msg::SelectionChange& m) -> std::string {
      const auto& s = m.selection;
      return "selectionChange " + encode_base64(s.path) + " " +
             encode_base64(s.file_name) + " " + encode_base64(s.parent_folder) + " " +
             std::to_string(s.range.start.line) + " " + std::to_string(s.range.start.character) + " " +
             std::to_string(s.range.end.line) + " " + std::to_string(s.range.end.character);
    }
  }, message);
}

ChannelMessage decode_message(const std::string& raw) {
  std::string line = raw;
  while(!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
  if(line.empty()) throw ProtocolError("empty message");

  auto fields = split_fields(line);
  const std::string& type = fields[0];

  if(type == "ping") return msg::Ping{};
  if(type == "pong") return msg::Pong{};
  if(type == "greeting") {
    require_fields(fields, 3);
    if(fields[1].empty()) throw ProtocolError("greeting without id");
    return msg::Greeting{fields[1], decode_base64(fields[2])};
  }
  if(type == "disconnect") {
    require_fields(fields, 2);
    return msg::Disconnect{fields[1]};
  }
  if(type == "nfsupdate") {
    require_fields(fields, 3);
    msg::NfsUpdate m;
    m.index = parse_count(fields[1], "chunk index");
    m.total = parse_count(fields[2], "chunk total");
    m.fragment = rest_of(fields, 3);
    return m;
  }
  if(type == "requestFile") {
    require_fields(fields, 2);
    return msg::RequestFile{decode_base64(fields[1])};
  }
  if(type == "fileData" || type == "applyEdit") {
    require_fields(fields, 4);
    std::string path = decode_base64(fields[1]);
    std::size_t index = parse_count(fields[2], "chunk index");
    std::size_t total = parse_count(fields[3], "chunk total");
    std::string fragment = rest_of(fields, 4);
    if(type == "fileData") return msg::FileData{path, index, total, fragment};
    return msg::ApplyEdit{path, index, total, fragment};
  }
  if(type == "selectionChange") {
    require_fields(fields, 8);
    msg::SelectionChange m;
    m.selection.path = decode_base64(fields[1]);
    m.selection.file_name = decode_base64(fields[2]);
    m.selection.parent_folder = decode_base64(fields[3]);
    m.selection.range.start = {parse_coordinate(fields[4]), parse_coordinate(fields[5])};
    m.selection.range.end = {parse_coordinate(fields[6]), parse_coordinate(fields[7])};
    return m;
  }
  throw ProtocolError("unknown message type '" + type + "'");
}

const char* message_type(const ChannelMessage& message) {
  static const char* const names[] = {
    "ping", "pong", "greeting", "disconnect", "nfsupdate",
    "requestFile", "fileData", "applyEdit", "selectionChange"
  };
  return names[message.index()];
}

json make_register(const std::string& id) {
  return json{{"type", "register"}, {"id", id}};
}

json make_offer(const SessionDescription& offer, const std::string& to, const std::string& from) {
  return json{
    {"type", "offer"},
    {"offer", {{"type", "offer"}, {"sdp", offer.sdp}}},
    {"to", to},
    {"from", from}
  };
}

json make_answer(const SessionDescription& answer, const std::string& to, const std::string& from) {
  return json{
    {"type", "answer"},
    {"answer", {{"type", "answer"}, {"sdp", answer.sdp}}},
    {"to", to},
    {"from", from}
  };
}

json make_candidate(const IceCandidate& candidate, const std::string& to, const std::string& from) {
  return json{
    {"type", "candidate"},
    {"candidate", {{"candidate", candidate.candidate}, {"sdpMid", candidate.mid}}},
    {"to", to},
    {"from", from}
  };
}

SignalingEnvelope parse_envelope(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch(const json::parse_error& e) {
    throw ProtocolError(std::string("signaling message is not JSON: ") + e.what());
  }
  if(!j.is_object() || !j.contains("type") || !j.at("type").is_string()) {
    throw ProtocolError("signaling message without a type");
  }
  SignalingEnvelope envelope;
  envelope.type = j.at("type").get<std::string>();
  if(j.contains("to") && j.at("to").is_string()) envelope.to = j.at("to").get<std::string>();
  if(j.contains("from") && j.at("from").is_string()) envelope.from = j.at("from").get<std::string>();
  if(envelope.type == "register") {
    if(j.contains("id") && !j.at("id").is_string()) {
      throw ProtocolError("register with a non-string id");
    }
    envelope.from = j.value("id", std::string());
  } else if(j.contains(envelope.type)) {
    envelope.payload = j.at(envelope.type);
  }
  return envelope;
}

SessionDescription description_from(const SignalingEnvelope& envelope) {
  const json& p = envelope.payload;
  if(!p.is_object() || !p.contains("sdp") || !p.at("sdp").is_string()) {
    throw ProtocolError(envelope.type + " without an sdp");
  }
  SessionDescription desc;
  desc.type = envelope.type;
  if(p.contains("type")) {
    if(!p.at("type").is_string()) {
      throw ProtocolError(envelope.type + " with a non-string description type");
    }
    desc.type = p.at("type").get<std::string>();
  }
  desc.sdp = p.at("sdp").get<std::string>();
  return desc;
}

IceCandidate candidate_from(const SignalingEnvelope& envelope) {
  const json& p = envelope.payload;
  if(!p.is_object() || !p.contains("candidate") || !p.at("candidate").is_string()) {
    throw ProtocolError("candidate envelope without a candidate");
  }
  IceCandidate candidate;
  candidate.candidate = p.at("candidate").get<std::string>();
  if(p.contains("sdpMid") && p.at("sdpMid").is_string()) {
    candidate.mid = p.at("sdpMid").get<std::string>();
  } else if(p.contains("mid") && p.at("mid").is_string()) {
    candidate.mid = p.at("mid").get<std::string>();
  }
  return candidate;
}

#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <variant>

using json = nlohmann::json;

// ---- editor payloads ------------------------------------------------------

struct Position {
  int line = 0;
  int character = 0;
  bool operator==(const Position& o) const { return line == o.line && character == o.character; }
};

struct Range {
  Position start;
  Position end;
  bool operator==(const Range& o) const { return start == o.start && end == o.end; }
};

struct EditDescriptor {
  Range range;
  std::string text;
  bool operator==(const EditDescriptor& o) const { return range == o.range && text == o.text; }
};

struct SelectionInfo {
  std::string path;
  std::string file_name;
  std::string parent_folder;
  Range range;
  bool operator==(const SelectionInfo& o) const {
    return path == o.path && file_name == o.file_name &&
           parent_folder == o.parent_folder && range == o.range;
  }
};

void to_json(json& j, const Position& p);
void from_json(const json& j, Position& p);
void to_json(json& j, const Range& r);
void from_json(const json& j, Range& r);
void to_json(json& j, const EditDescriptor& e);
void from_json(const json& j, EditDescriptor& e);

// ---- data channel messages ------------------------------------------------
//
// One text line per message: "<type> <field> <field> ...". Free-form text
// (usernames, paths, chunk payloads) always travels base64-encoded so that a
// single space is a safe separator.

namespace msg {
struct Ping {};
struct Pong {};
struct Greeting { std::string id; std::string username; };
struct Disconnect { std::string id; };
struct NfsUpdate { std::size_t index = 0; std::size_t total = 0; std::string fragment; };
struct RequestFile { std::string path; };
struct FileData { std::string path; std::size_t index = 0; std::size_t total = 0; std::string fragment; };
struct ApplyEdit { std::string path; std::size_t index = 0; std::size_t total = 0; std::string fragment; };
struct SelectionChange { SelectionInfo selection; };
} // namespace msg

using ChannelMessage = std::variant<msg::Ping,
                                    msg::Pong,
                                    msg::Greeting,
                                    msg::Disconnect,
                                    msg::NfsUpdate,
                                    msg::RequestFile,
                                    msg::FileData,
                                    msg::ApplyEdit,
                                    msg::SelectionChange>;

std::string encode_message(const ChannelMessage& message);
// Throws ProtocolError on unknown types, missing fields or bad encodings.
ChannelMessage decode_message(const std::string& line);
const char* message_type(const ChannelMessage& message);

// ---- relay envelopes ------------------------------------------------------

struct SessionDescription {
  std::string type;  // "offer" or "answer"
  std::string sdp;
};

struct IceCandidate {
  std::string candidate;
  std::string mid;
};

struct SignalingEnvelope {
  std::string type;     // register, offer, answer, candidate, or anything else
  json payload;         // description or candidate object, null for register
  std::string to;
  std::string from;     // for register: the id being registered
};

json make_register(const std::string& id);
json make_offer(const SessionDescription& offer, const std::string& to, const std::string& from);
json make_answer(const SessionDescription& answer, const std::string& to, const std::string& from);
json make_candidate(const IceCandidate& candidate, const std::string& to, const std::string& from);

// Throws ProtocolError for text that is not a JSON object with a type.
SignalingEnvelope parse_envelope(const std::string& text);
SessionDescription description_from(const SignalingEnvelope& envelope);
IceCandidate candidate_from(const SignalingEnvelope& envelope);

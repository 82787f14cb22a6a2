#pragma once

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

#include "errors.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "workspace_snapshot.hpp"

// Interactive command loop for one Session.
class SessionCLI {
public:
  SessionCLI(Session& session, std::shared_ptr<SettingsManager> settings)
    : session_(session), settings_(std::move(settings)) {}

  // Reads commands from stdin until quit or end of input.
  void run_loop() {
    print_help();
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      execute_command(*input);
    }
  }

  void execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return;

    std::string args;
    std::getline(iss, args);
    args = SettingsManager::trim_copy(args);

    try {
      if(cmd == "peers") {
        list_peers();
      } else if(cmd == "tree" || cmd == "ls") {
        print_tree();
      } else if(cmd == "open") {
        open_file(args);
      } else if(cmd == "ping") {
        session_.ping();
      } else if(cmd == "status") {
        std::cout << session_.status() << "\n";
      } else if(cmd == "id") {
        std::cout << session_.local_id() << "\n";
      } else if(cmd == "settings" || cmd == "s") {
        handle_settings_command(args.empty() ? "list" : args);
      } else if(cmd == "set") {
        handle_settings_command(args.empty() ? "list" : "set " + args);
      } else if(cmd == "edit") {
        send_edit(args);
      } else if(cmd == "select") {
        send_selection(args);
      } else if(cmd == "rollback") {
        session_.rollback();
      } else if(cmd == "disconnect") {
        session_.disconnect();
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        std::cout << "Quitting...\n";
        running_ = false;
      } else {
        print_help();
        std::cout << "Unknown command: " << cmd << "\n";
      }
    } catch(const TightropeError& e) {
      std::cout << e.what() << "\n";
    }
  }

  bool running() const { return running_; }

private:
  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    std::free(line);
    return result;
  }

  void list_peers() {
    std::cout << session_.local_id() << " (" << session_.username() << ") [you]\n";
    for(const auto& peer : session_.peers()) {
      std::cout << peer.id << " (" << peer.username << ") " << peer.status << "\n";
    }
  }

  std::optional<DirectoryNode> shared_tree() const {
    if(session_.role() == Role::Initiator) return session_.workspace_structure();
    return session_.mirror();
  }

  void print_tree() {
    auto tree = shared_tree();
    if(!tree) {
      std::cout << "No workspace received yet.\n";
      return;
    }
    std::cout << tree->full_path << "\n";
    print_node(*tree, "  ");
  }

  void print_node(const DirectoryNode& node, const std::string& indent) {
    for(const auto& folder : node.folders) {
      std::cout << indent << folder.first << "/\n";
      print_node(folder.second, indent + "  ");
    }
    for(const auto& file : node.files) {
      std::cout << indent << file.first << "  " << file.second.size << " bytes  "
                << file.second.hash.substr(0, 12) << "\n";
    }
  }

  // Accepts a path relative to the shared tree or the sharer's full path.
  void open_file(const std::string& path) {
    if(path.empty()) {
      std::cout << "Usage: open <path>\n";
      return;
    }
    std::string requested = path;
    if(auto tree = shared_tree()) {
      if(const auto* record = tree->find_file(path)) requested = record->full_path;
    }
    session_.request_file(requested);
  }

  static bool read_range(std::istringstream& iss, Range& range) {
    return static_cast<bool>(iss >> range.start.line >> range.start.character
                                 >> range.end.line >> range.end.character);
  }

  void send_edit(const std::string& args) {
    std::istringstream iss(args);
    std::string path;
    EditDescriptor edit;
    if(!(iss >> path) || !read_range(iss, edit.range)) {
      std::cout << "Usage: edit <path> <start line> <start char> <end line> <end char> <text>\n";
      return;
    }
    std::getline(iss, edit.text);
    if(!edit.text.empty() && edit.text[0] == ' ') edit.text.erase(0, 1);
    session_.send_edit(path, edit);
  }

  void send_selection(const std::string& args) {
    std::istringstream iss(args);
    SelectionInfo selection;
    if(!(iss >> selection.path) || !read_range(iss, selection.range)) {
      std::cout << "Usage: select <path> <start line> <start char> <end line> <end char>\n";
      return;
    }
    std::filesystem::path p(selection.path);
    selection.file_name = p.filename().string();
    selection.parent_folder = p.parent_path().filename().string();
    session_.send_selection(selection);
  }

  void list_settings() {
    for(const auto& key : settings_->keys()) {
      std::cout << "  " << key << " = " << settings_->value_as_string(key) << "\n";
    }
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = SettingsManager::trim_copy(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(!settings_->set_from_string(*resolved, value, error)) {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved)
                << " (applies to the next session)\n";
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        std::cout << "Saved settings to " << settings_->settings_path().string() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    std::cout << "Usage: settings [list|get <key>|set <key> <value>|save]\n";
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                          Show this help message\n";
    std::cout << "  quit|exit                         Leave the session and exit\n";
    std::cout << "  id                                Show this session's id\n";
    std::cout << "  status                            Show the connection status\n";
    std::cout << "  peers                             List connected participants\n";
    std::cout << "  tree|ls                           Show the shared workspace\n";
    std::cout << "  open <path>                       Fetch a file from the sharer\n";
    std::cout << "  edit <path> sl sc el ec <text>    Send an edit for a range\n";
    std::cout << "  select <path> sl sc el ec         Share a selection\n";
    std::cout << "  ping                              Ping the other participant\n";
    std::cout << "  rollback                          Undo the latest workspace change\n";
    std::cout << "  disconnect                        Leave the session\n";
    std::cout << "  settings [list|get|set|save]      Manage settings\n";
    std::cout << "  set <key> <value>                 Shortcut for settings set\n";
  }

  Session& session_;
  std::shared_ptr<SettingsManager> settings_;
  std::atomic<bool> running_{true};
};

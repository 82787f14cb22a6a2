#include "ignore_rules.hpp"

#include <fstream>
#include <sstream>

namespace {

// Returns the index just past the class, or npos when the class is not
// terminated (the '[' is then taken literally).
std::size_t match_class(const std::string& pattern, std::size_t p, char c, bool& matched) {
  std::size_t i = p + 1;
  bool negate = false;
  if(i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }
  bool hit = false;
  bool first = true;
  while(i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    char lo = pattern[i];
    if(i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      char hi = pattern[i + 2];
      if(c >= lo && c <= hi) hit = true;
      i += 3;
    } else {
      if(c == lo) hit = true;
      ++i;
    }
  }
  if(i >= pattern.size()) return std::string::npos;
  matched = (hit != negate);
  return i + 1;
}

bool match_from(const std::string& pattern, std::size_t p,
                const std::string& text, std::size_t t) {
  while(p < pattern.size()) {
    char pc = pattern[p];
    if(pc == '*') {
      if(p + 1 < pattern.size() && pattern[p + 1] == '*') {
        std::size_t rest = p + 2;
        if(rest < pattern.size() && pattern[rest] == '/') {
          // "**/" matches zero or more whole directories.
          if(match_from(pattern, rest + 1, text, t)) return true;
          for(std::size_t i = t; i < text.size(); ++i) {
            if(text[i] == '/' && match_from(pattern, rest + 1, text, i + 1)) return true;
          }
          return false;
        }
        for(std::size_t i = t; i <= text.size(); ++i) {
          if(match_from(pattern, rest, text, i)) return true;
        }
        return false;
      }
      for(std::size_t i = t; i <= text.size(); ++i) {
        if(match_from(pattern, p + 1, text, i)) return true;
        if(i < text.size() && text[i] == '/') break;
      }
      return false;
    }
    if(t >= text.size()) return false;
    if(pc == '?') {
      if(text[t] == '/') return false;
      ++p;
      ++t;
      continue;
    }
    if(pc == '[') {
      bool matched = false;
      std::size_t next = match_class(pattern, p, text[t], matched);
      if(next != std::string::npos) {
        if(!matched || text[t] == '/') return false;
        p = next;
        ++t;
        continue;
      }
    }
    if(pc == '\\' && p + 1 < pattern.size()) {
      ++p;
      pc = pattern[p];
    }
    if(pc != text[t]) return false;
    ++p;
    ++t;
  }
  return t == text.size();
}

std::string basename_of(const std::string& path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& text) {
  return match_from(pattern, 0, text, 0);
}

IgnoreRules IgnoreRules::with_defaults() {
  IgnoreRules rules;
  rules.add_line("node_modules");
  rules.add_line("/.tightrope/");
  return rules;
}

void IgnoreRules::add_line(const std::string& raw) {
  std::string line = raw;
  if(!line.empty() && line.back() == '\r') line.pop_back();
  // Trailing blanks are dropped unless escaped.
  while(!line.empty() && line.back() == ' ' &&
        !(line.size() >= 2 && line[line.size() - 2] == '\\')) {
    line.pop_back();
  }
  if(line.empty() || line[0] == '#') return;

  Rule rule;
  if(line[0] == '!') {
    rule.negate = true;
    line.erase(0, 1);
  } else if(line.size() > 1 && line[0] == '\\' && (line[1] == '!' || line[1] == '#')) {
    line.erase(0, 1);
  }
  if(!line.empty() && line.back() == '/') {
    rule.directory_only = true;
    while(!line.empty() && line.back() == '/') line.pop_back();
  }
  if(line.find('/') != std::string::npos) {
    rule.anchored = true;
    if(line[0] == '/') line.erase(0, 1);
  }
  if(line.empty()) return;
  rule.pattern = std::move(line);
  rules_.push_back(std::move(rule));
}

void IgnoreRules::add_lines(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while(std::getline(in, line)) add_line(line);
}

bool IgnoreRules::load_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  add_lines(buffer.str());
  return true;
}

int IgnoreRules::evaluate(const std::string& relative_path, bool is_directory) const {
  int decision = -1;
  const std::string base = basename_of(relative_path);
  for(const auto& rule : rules_) {
    if(rule.directory_only && !is_directory) continue;
    const std::string& subject = rule.anchored ? relative_path : base;
    if(glob_match(rule.pattern, subject)) {
      decision = rule.negate ? 0 : 1;
    }
  }
  return decision;
}

bool IgnoreRules::ignores(const std::string& relative_path, bool is_directory) const {
  if(relative_path.empty() || rules_.empty()) return false;
  for(std::size_t pos = relative_path.find('/'); pos != std::string::npos;
      pos = relative_path.find('/', pos + 1)) {
    if(evaluate(relative_path.substr(0, pos), true) == 1) return true;
  }
  return evaluate(relative_path, is_directory) == 1;
}

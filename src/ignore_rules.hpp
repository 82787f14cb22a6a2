#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// gitignore-style exclusion list.
//
// Paths are workspace-relative with '/' separators. The last rule that
// matches decides; a path whose parent directory is excluded stays excluded
// no matter what later rules say, just like git.
class IgnoreRules {
public:
  IgnoreRules() = default;

  // node_modules plus the session's own state directory.
  static IgnoreRules with_defaults();

  void add_line(const std::string& line);
  void add_lines(const std::string& text);
  // Appends the rules of a .gitignore file. False when it cannot be read.
  bool load_file(const std::filesystem::path& path);

  bool ignores(const std::string& relative_path, bool is_directory) const;

  std::size_t size() const { return rules_.size(); }

private:
  struct Rule {
    std::string pattern;
    bool negate = false;
    bool directory_only = false;
    bool anchored = false;
  };

  // Decision for this exact path, ignoring its ancestors. -1 means no rule
  // matched, 0 included, 1 excluded.
  int evaluate(const std::string& relative_path, bool is_directory) const;

  std::vector<Rule> rules_;
};

// Glob match where '*' and '?' stop at '/', "**" crosses directories and
// "[a-z]" / "[!a-z]" are character classes.
bool glob_match(const std::string& pattern, const std::string& text);

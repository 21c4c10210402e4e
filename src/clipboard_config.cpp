#include "clipboard_config.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

ClipboardConfig default_clipboard_config() {
  ClipboardConfig cfg;
#if defined(__APPLE__)
  cfg.copy_cmd = {"pbcopy"};
  cfg.paste_cmd = {"pbpaste"};
#else
  const char* wl = std::getenv("WAYLAND_DISPLAY");
  if (wl && *wl) {
    cfg.copy_cmd = {"wl-copy"};
    cfg.paste_cmd = {"wl-paste", "-n"};
  } else {
    cfg.copy_cmd = {"xclip", "-selection", "clipboard", "-i"};
    cfg.paste_cmd = {"xclip", "-selection", "clipboard", "-o"};
  }
#endif
  return cfg;
}

std::vector<std::string> split_command(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
    size_t j = i;
    while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j]))) j++;
    if (j > i) out.emplace_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool apply_rc_line(ClipboardConfig& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::vector<std::string> words = split_command(s);
  if (words.size() < 2 || words[0] != "set") { msg = "unknown command: " + s; return false; }
  const std::string& key = words[1];
  std::vector<std::string> rest(words.begin() + 2, words.end());
  if (key == "copy" || key == "paste") {
    if (rest.empty()) { msg = "set " + key + ": use :set " + key + " <command>"; return false; }
    (key == "copy" ? cfg.copy_cmd : cfg.paste_cmd) = std::move(rest);
    return true;
  }
  if (key == "pastelimit") {
    if (rest.size() != 1) { msg = "set pastelimit: use :set pastelimit <bytes>"; return false; }
    const std::string& v = rest[0];
    bool ok = std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { msg = "set pastelimit: limit must be a number"; return false; }
    unsigned long long n = 0;
    try { n = std::stoull(v); } catch (const std::out_of_range&) { msg = "set pastelimit: invalid number"; return false; }
    if (n == 0) { msg = "set pastelimit: limit must be >= 1"; return false; }
    cfg.paste_limit = static_cast<size_t>(n);
    return true;
  }
  msg = "unknown option: " + key;
  return false;
}

void load_rc_file(ClipboardConfig& cfg, const std::filesystem::path& path, std::vector<std::string>& messages) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_read_lines(path, lines, msg)) { messages.push_back(msg); return; }
  for (const std::string& s : lines) {
    std::string m;
    if (!apply_rc_line(cfg, s, m)) messages.push_back(path.filename().string() + ": " + m);
  }
}

void apply_env_overrides(ClipboardConfig& cfg) {
  if (const char* c = std::getenv("SNAPEDIT_COPY_CMD")) {
    auto argv = split_command(c);
    if (!argv.empty()) cfg.copy_cmd = std::move(argv);
  }
  if (const char* p = std::getenv("SNAPEDIT_PASTE_CMD")) {
    auto argv = split_command(p);
    if (!argv.empty()) cfg.paste_cmd = std::move(argv);
  }
}

ClipboardConfig load_clipboard_config(std::vector<std::string>& messages) {
  ClipboardConfig cfg = default_clipboard_config();
  if (const char* home = std::getenv("HOME")) {
    load_rc_file(cfg, std::filesystem::path(home) / SE_RC_NAME, messages);
  }
  apply_env_overrides(cfg);
  return cfg;
}

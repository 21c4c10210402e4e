#pragma once
/*
 * ClipboardConfig
 *
 * Purpose: choose the external copy/paste utilities and the paste bound.
 * Order: platform defaults -> $HOME/.snapeditrc -> SNAPEDIT_COPY_CMD /
 *        SNAPEDIT_PASTE_CMD environment variables (later wins).
 * Rc lines: "set copy <argv...>", "set paste <argv...>", "set pastelimit <bytes>";
 *           blank lines and #, ", // comments skipped, leading ':' allowed.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"

struct ClipboardConfig {
  std::vector<std::string> copy_cmd;
  std::vector<std::string> paste_cmd;
  size_t paste_limit = SE_PASTE_LIMIT;
};

ClipboardConfig default_clipboard_config();
std::vector<std::string> split_command(const std::string& s);

/* returns false and sets msg for unknown or malformed lines; cfg untouched then */
bool apply_rc_line(ClipboardConfig& cfg, const std::string& line, std::string& msg);
void load_rc_file(ClipboardConfig& cfg, const std::filesystem::path& path, std::vector<std::string>& messages);
void apply_env_overrides(ClipboardConfig& cfg);

/* full resolution; messages collects rc diagnostics */
ClipboardConfig load_clipboard_config(std::vector<std::string>& messages);

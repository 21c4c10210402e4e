#pragma once
/*
 * IClipboard
 *
 * Purpose: abstract clipboard bridge; Editor only sees byte streams.
 * Copy: spawned child reads the selection on its stdin.
 * Paste: spawned child writes the clipboard bytes on its stdout.
 */
#include <string>
#include "clipboard_config.hpp"
#include "process.hpp"

class IClipboard {
public:
  virtual ~IClipboard() = default;
  virtual bool spawn_copy(Process& out, std::string& msg) const = 0;
  virtual bool spawn_paste(Process& out, std::string& msg) const = 0;
  virtual size_t paste_limit() const = 0;
};

class ProcessClipboard : public IClipboard {
public:
  explicit ProcessClipboard(ClipboardConfig cfg) : cfg_(std::move(cfg)) {}

  bool spawn_copy(Process& out, std::string& msg) const override {
    return spawn_process(cfg_.copy_cmd, PipeMode::Stdin, out, msg);
  }
  bool spawn_paste(Process& out, std::string& msg) const override {
    return spawn_process(cfg_.paste_cmd, PipeMode::Stdout, out, msg);
  }
  size_t paste_limit() const override { return cfg_.paste_limit; }

  const ClipboardConfig& config() const { return cfg_; }

private:
  ClipboardConfig cfg_;
};

#pragma once

#include <atomic>
#include <string>

struct RunOptions {
  std::string config_path;
  std::string input_dir;
  std::string runs_dir;
  std::string run_id_override;
  bool dry_run = false;
  int max_frames = 0;
  bool config_from_stdin = false;
  const std::atomic<bool> *stop_flag = nullptr;
};

int run_clip_command(const RunOptions &opts);

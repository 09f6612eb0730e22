#include "runner_pipeline.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) { g_stop_requested.store(true); }

void print_usage() {
  std::cout << "Usage: stack_clip_runner <command> [options]\n\n"
            << "Commands:\n"
            << "  run      Clip and combine a directory of frames\n\n"
            << "Options for 'run':\n"
            << "  --config <path>      Path to config.yaml (or - with --stdin)\n"
            << "  --input-dir <path>   Directory with input FITS frames\n"
            << "  --runs-dir <path>    Directory for run outputs\n"
            << "  --run-id <id>        Use this run id instead of a timestamp\n"
            << "  --max-frames <n>     Limit number of frames (0 = no limit)\n"
            << "  --dry-run            Scan inputs only\n"
            << "  --stdin              Read config YAML from stdin\n"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Stack-Clip Runner (C++)"};

  RunOptions opts;

  auto run_cmd = app.add_subcommand("run", "Clip and combine a frame stack");
  run_cmd->add_option("--config", opts.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--input-dir", opts.input_dir, "Input directory")
      ->required();
  run_cmd->add_option("--runs-dir", opts.runs_dir, "Runs directory")
      ->required();
  run_cmd->add_option("--run-id", opts.run_id_override,
                      "Run id (default: timestamp based)");
  run_cmd->add_option("--max-frames", opts.max_frames,
                      "Limit number of frames (0 = no limit)");
  run_cmd->add_flag("--dry-run", opts.dry_run, "Dry run");
  run_cmd->add_flag("--stdin", opts.config_from_stdin,
                    "Read config YAML from stdin (use with --config -)");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
    opts.stop_flag = &g_stop_requested;
    return run_clip_command(opts);
  }

  print_usage();
  return 1;
}

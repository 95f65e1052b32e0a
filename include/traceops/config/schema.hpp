#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace traceops::config {

/// Dollar rates per million tokens for every model whose identifier contains
/// one of the match substrings (case-insensitive).
struct PricingTier {
  std::string name;
  std::vector<std::string> match;
  double input_per_million = 3.0;
  double output_per_million = 15.0;
};

struct PricingConfig {
  PricingTier premium{.name = "premium",
                      .match = {"opus"},
                      .input_per_million = 15.0,
                      .output_per_million = 75.0};
  PricingTier low{.name = "low",
                  .match = {"haiku"},
                  .input_per_million = 0.25,
                  .output_per_million = 1.25};
  PricingTier standard{.name = "default",
                       .match = {"sonnet"},
                       .input_per_million = 3.0,
                       .output_per_million = 15.0};
};

struct TimelineConfig {
  std::size_t read_size_threshold = 3000;
  std::int64_t reasoning_idle_gap_seconds = 60;
  std::int64_t max_elapsed_seconds = 3600;
  std::size_t user_message_max_chars = 100;
  std::vector<std::string> hidden_tools = {"Glob",        "Grep",      "TodoWrite",
                                           "ExitPlanMode", "Skill",     "SlashCommand",
                                           "BashOutput",   "KillShell", "NotebookEdit"};
};

struct BatchConfig {
  std::size_t parse_group_size = 50;
  std::size_t concurrency = 0; // 0 = derive from hardware
  std::size_t max_workers = 16;
  std::uint64_t unit_timeout_seconds = 0; // 0 = wait indefinitely
  std::string failure_policy = "abort_group";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct ReportConfig {
  std::string output_dir = "~/.traceops/projects";
  std::string projects_root = "~/.claude/projects";
};

struct Config {
  PricingConfig pricing;
  TimelineConfig timeline;
  BatchConfig batch;
  ObservabilityConfig observability;
  ReportConfig report;
};

} // namespace traceops::config

#include "traceops/cli/commands.hpp"

#include "traceops/batch/orchestrator.hpp"
#include "traceops/common/fs.hpp"
#include "traceops/common/time.hpp"
#include "traceops/config/config.hpp"
#include "traceops/observability/factory.hpp"
#include "traceops/observability/global.hpp"
#include "traceops/report/discovery.hpp"
#include "traceops/report/report.hpp"
#include "traceops/report/store.hpp"
#include "traceops/timeline/compiler.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace traceops::cli {

namespace {

std::string version_string() {
#ifdef TRACEOPS_VERSION
  std::string version = TRACEOPS_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TRACEOPS_GIT_COMMIT
  const std::string commit = TRACEOPS_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "traceops " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Accepts "--name value" and "--name=value".
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  const std::string inline_prefix = long_name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (common::starts_with(args[i], inline_prefix)) {
      out_value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::size_t> parse_count(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::size_t parsed = 0;
  const auto *first = trimmed.data();
  const auto *last = first + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (trimmed.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

common::Result<config::Config> load_checked_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] config: " << warning << "\n";
  }
  return loaded;
}

int run_analyze(std::vector<std::string> args) {
  std::string project_path = ".";
  std::optional<std::size_t> recent;
  std::optional<std::size_t> concurrency;

  std::string value;
  if (take_option(args, "--project-path", "", value)) {
    project_path = value;
  }
  if (take_option(args, "--recent", "-r", value)) {
    recent = parse_count(value);
    if (!recent.has_value()) {
      std::cerr << "invalid value for --recent: " << value << "\n";
      return 1;
    }
  }
  if (take_option(args, "--concurrency", "-c", value)) {
    concurrency = parse_count(value);
    if (!concurrency.has_value() || *concurrency == 0) {
      std::cerr << "invalid value for --concurrency: " << value << "\n";
      return 1;
    }
  }
  // Both spellings are consumed so a repeated flag is not left as an unknown option.
  const bool print_long = take_flag(args, "--print");
  const bool print_short = take_flag(args, "-p");
  const bool print = print_long || print_short;
  const bool verbose_long = take_flag(args, "--verbose");
  const bool verbose_short = take_flag(args, "-v");
  const bool verbose = verbose_long || verbose_short;
  if (!args.empty()) {
    std::cerr << "Unknown option for analyze: " << args.front() << "\n";
    return 1;
  }

  auto loaded = load_checked_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  config::Config config = std::move(loaded.value());
  if (concurrency.has_value()) {
    config.batch.concurrency = *concurrency;
  }
  observability::set_global_observer(observability::create_observer(config, verbose));

  const auto dirs = report::resolve_project_dirs(project_path, config.report.projects_root);
  if (!dirs.ok()) {
    observability::record_error("discovery", dirs.error());
    std::cerr << dirs.error() << "\n";
    return 1;
  }

  const auto files = report::collect_conversation_files(dirs.value(), recent);
  std::cerr << "Found " << files.size() << " conversation file(s)\n";
  if (files.empty()) {
    std::cerr << "No valid conversation data found\n";
    return 1;
  }

  const auto options = batch::BatchOptions::from_config(config.batch);
  if (!options.ok()) {
    std::cerr << options.error() << "\n";
    return 1;
  }
  const timeline::CostEstimator costs(config.pricing);
  const batch::BatchOrchestrator orchestrator(options.value(),
                                              timeline::TimelineCompiler(config.timeline, costs));

  const auto started = common::now_epoch_ms();
  auto result = orchestrator.run(files);
  if (result.files_skipped == result.files_total) {
    std::cerr << "No valid conversation data found\n";
    return 1;
  }
  if (!result.failures.empty()) {
    std::cerr << result.failures.size() << " conversation(s) failed to compile";
    if (result.groups_aborted > 0) {
      std::cerr << "; " << result.groups_aborted << " worker group(s) discarded";
    }
    std::cerr << "\n";
  }
  std::cerr << "Analysis complete (" << result.timelines.size() << " conversations in "
            << (common::now_epoch_ms() - started) / 1000 << "s)\n";

  batch::sort_by_earliest_timestamp(result.timelines, true);
  const std::string document = report::generate_report(result.timelines, costs);

  const report::ReportStore store(config.report.output_dir);
  const auto saved = store.write(project_path, document, common::now_epoch_ms());
  if (!saved.ok()) {
    observability::record_error("report", saved.error());
    std::cerr << saved.error() << "\n";
    return 1;
  }

  if (print) {
    std::cout << document;
  }
  std::cerr << "Report saved at: " << saved.value().string() << "\n";
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_list(std::vector<std::string> args) {
  std::string project_path = ".";
  std::string value;
  if (take_option(args, "--project-path", "", value)) {
    project_path = value;
  }

  auto loaded = load_checked_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }

  const report::ReportStore store(loaded.value().report.output_dir);
  const auto reports = store.list(project_path);
  if (!reports.ok()) {
    std::cerr << reports.error() << "\n";
    return 1;
  }
  if (reports.value().empty()) {
    std::cout << "No reports found in " << store.project_dir(project_path).string() << "\n";
    return 0;
  }

  const auto now = common::now_epoch_ms();
  std::cout << "Reports in " << store.project_dir(project_path).string() << ":\n";
  for (const auto &info : reports.value()) {
    std::cout << "  " << info.filename << "  " << report::format_bytes(info.size_bytes) << "  "
              << report::format_time_ago(now - info.modified_ms) << "\n";
  }
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  traceops" << RESET << DIM
            << " - compact timelines and cost reports from agent session logs" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "traceops [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "analyze" << RESET << DIM
            << "        Compile session logs into a report (default)" << RESET << "\n";
  std::cout << "  " << GREEN << "list" << RESET << DIM << "           List saved reports (also --list, -l)"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Show the config file path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";

  std::cout << BOLD << "  ANALYZE OPTIONS" << RESET << "\n";
  std::cout << "  --project-path P   Project directory or a directory of .jsonl logs\n";
  std::cout << "  --recent N         Only the N most recently modified logs\n";
  std::cout << "  --concurrency N    Worker count (default: cores - 1, 2..16)\n";
  std::cout << "  --print, -p        Also write the report to stdout\n";
  std::cout << "  --verbose, -v      Debug logging\n";
  std::cout << "\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  const bool list_long = take_flag(args, "--list");
  const bool list_short = take_flag(args, "-l");
  if (list_long || list_short) {
    return run_list(std::move(args));
  }
  const bool implicit_analyze =
      args.empty() || (common::starts_with(args[0], "-") && args[0] != "-h" &&
                       args[0] != "--help" && args[0] != "-V" && args[0] != "--version");
  if (implicit_analyze) {
    return run_analyze(std::move(args));
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "analyze") {
    return run_analyze(std::move(args));
  }
  if (subcommand == "list") {
    return run_list(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace traceops::cli

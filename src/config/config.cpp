#include "traceops/config/config.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>

namespace traceops::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".traceops";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TRACEOPS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::size_t> parse_size_env(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::size_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

void load_tier(const common::TomlDocument &doc, const std::string &section, PricingTier &tier) {
  tier.match = doc.get_string_array(section + ".match", tier.match);
  tier.input_per_million = doc.get_double(section + ".input", tier.input_per_million);
  tier.output_per_million = doc.get_double(section + ".output", tier.output_per_million);
}

common::Status validate_tier(const PricingTier &tier) {
  if (tier.input_per_million < 0.0 || tier.output_per_million < 0.0) {
    return common::Status::error("pricing." + tier.name + " rates must not be negative");
  }
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const auto concurrency = parse_size_env("TRACEOPS_CONCURRENCY"); concurrency.has_value()) {
    config.batch.concurrency = *concurrency;
  }
  if (const auto group = parse_size_env("TRACEOPS_PARSE_GROUP_SIZE"); group.has_value()) {
    config.batch.parse_group_size = *group;
  }
  if (const char *backend = std::getenv("TRACEOPS_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  load_tier(doc, "pricing.premium", config.pricing.premium);
  load_tier(doc, "pricing.low", config.pricing.low);
  load_tier(doc, "pricing.default", config.pricing.standard);

  auto &timeline = config.timeline;
  timeline.read_size_threshold = static_cast<std::size_t>(
      doc.get_u64("timeline.read_size_threshold", timeline.read_size_threshold));
  timeline.reasoning_idle_gap_seconds = static_cast<std::int64_t>(doc.get_u64(
      "timeline.reasoning_idle_gap_seconds",
      static_cast<std::uint64_t>(timeline.reasoning_idle_gap_seconds)));
  timeline.max_elapsed_seconds = static_cast<std::int64_t>(
      doc.get_u64("timeline.max_elapsed_seconds",
                  static_cast<std::uint64_t>(timeline.max_elapsed_seconds)));
  timeline.user_message_max_chars = static_cast<std::size_t>(
      doc.get_u64("timeline.user_message_max_chars", timeline.user_message_max_chars));
  timeline.hidden_tools = doc.get_string_array("timeline.hidden_tools", timeline.hidden_tools);

  auto &batch = config.batch;
  batch.parse_group_size =
      static_cast<std::size_t>(doc.get_u64("batch.parse_group_size", batch.parse_group_size));
  batch.concurrency = static_cast<std::size_t>(doc.get_u64("batch.concurrency", batch.concurrency));
  batch.max_workers = static_cast<std::size_t>(doc.get_u64("batch.max_workers", batch.max_workers));
  batch.unit_timeout_seconds = doc.get_u64("batch.unit_timeout_seconds", batch.unit_timeout_seconds);
  batch.failure_policy =
      common::to_lower(doc.get_string("batch.failure_policy", batch.failure_policy));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  config.report.output_dir =
      expand_config_value(doc.get_string("report.output_dir", config.report.output_dir));
  config.report.projects_root =
      expand_config_value(doc.get_string("report.projects_root", config.report.projects_root));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  for (const auto *tier : {&config.pricing.premium, &config.pricing.low, &config.pricing.standard}) {
    if (const auto status = validate_tier(*tier); !status.ok()) {
      return common::Result<std::vector<std::string>>::failure(status.error());
    }
  }

  if (config.batch.parse_group_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "batch.parse_group_size must be positive");
  }
  if (config.batch.max_workers == 0) {
    return common::Result<std::vector<std::string>>::failure("batch.max_workers must be positive");
  }

  const std::string policy = common::to_lower(common::trim(config.batch.failure_policy));
  if (policy != "abort_group" && policy != "isolate") {
    return common::Result<std::vector<std::string>>::failure("Invalid batch.failure_policy: " +
                                                              config.batch.failure_policy);
  }

  if (config.batch.concurrency > config.batch.max_workers) {
    warnings.push_back("batch.concurrency exceeds batch.max_workers; explicit value wins");
  }

  if (config.timeline.user_message_max_chars < 4) {
    warnings.push_back("timeline.user_message_max_chars below 4 leaves only the ellipsis");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty()) {
    std::size_t start = 0;
    while (start <= backend.size()) {
      const auto comma = backend.find(',', start);
      const std::string part =
          common::trim(backend.substr(start, comma == std::string::npos ? std::string::npos
                                                                         : comma - start));
      if (part != "log" && part != "none" && part != "noop") {
        return common::Result<std::vector<std::string>>::failure(
            "Invalid observability.backend: " + config.observability.backend);
      }
      if (comma == std::string::npos) {
        break;
      }
      start = comma + 1;
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace traceops::config

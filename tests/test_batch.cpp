#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"

#include "traceops/batch/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

namespace th = traceops::testing;
namespace tl = traceops::timeline;
namespace batch = traceops::batch;

std::filesystem::path write_conversation(const th::TempWorkspace &workspace,
                                         const std::string &name, const int seconds) {
  workspace.create_file(
      name, th::join_lines({
                th::user_text_line(th::timestamp_at(seconds), "run the build"),
                th::assistant_tools_line(th::timestamp_at(seconds + 1),
                                         {{.id = "b" + std::to_string(seconds),
                                           .name = "Bash",
                                           .input_json = R"({"command":"make"})"}},
                                         2'000, 200),
            }));
  return workspace.path() / name;
}

tl::CompiledTimeline stub_timeline(traceops::transcript::Conversation conversation) {
  tl::CompiledTimeline timeline;
  timeline.file_path = std::move(conversation.file_path);
  timeline.records = std::move(conversation.records);
  timeline.entries.push_back(
      tl::TimelineEntry{.kind = tl::EntryKind::Action, .sequence = 1, .text = "Bash: make"});
  timeline.action_count = 1;
  return timeline;
}

batch::BatchOrchestrator::CompileFn failing_on(const std::string &marker) {
  return [marker](traceops::transcript::Conversation conversation)
             -> std::optional<tl::CompiledTimeline> {
    if (conversation.file_path.find(marker) != std::string::npos) {
      throw std::runtime_error("compile exploded");
    }
    return stub_timeline(std::move(conversation));
  };
}

batch::BatchOptions options_with(const std::size_t concurrency, const std::size_t group_size,
                                 const batch::FailurePolicy policy) {
  batch::BatchOptions options;
  options.concurrency = concurrency;
  options.parse_group_size = group_size;
  options.failure_policy = policy;
  return options;
}

tl::CompiledTimeline timeline_at(const std::string &path, const std::vector<std::string> &stamps) {
  tl::CompiledTimeline timeline;
  timeline.file_path = path;
  for (const auto &stamp : stamps) {
    traceops::transcript::ConversationRecord record;
    record.role = traceops::transcript::RecordRole::User;
    record.timestamp = stamp;
    timeline.records.push_back(std::move(record));
  }
  return timeline;
}

} // namespace

void register_batch_tests(std::vector<traceops::tests::TestCase> &tests) {
  using traceops::tests::require;

  tests.push_back({"batch_compiles_every_file_across_groups", [] {
                     th::TempWorkspace workspace;
                     std::vector<std::filesystem::path> files;
                     for (int i = 0; i < 5; ++i) {
                       files.push_back(
                           write_conversation(workspace, "c" + std::to_string(i) + ".jsonl", i * 10));
                     }
                     const batch::BatchOrchestrator orchestrator(
                         options_with(2, 2, batch::FailurePolicy::AbortGroup), th::default_compiler());
                     const auto result = orchestrator.run(files);
                     require(result.files_total == 5, "all files counted");
                     require(result.timelines.size() == 5, "one timeline per file");
                     require(result.failures.empty(), "no failures expected");
                     require(result.files_skipped == 0, "nothing skipped");
                     for (const auto &timeline : result.timelines) {
                       require(timeline.action_count == 1, "each fixture has one action");
                       require(timeline.records.size() == 2, "records travel with the timeline");
                     }
                   }});

  tests.push_back({"batch_skips_unreadable_and_empty_files", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("empty.jsonl", "");
                     workspace.create_file("garbage.jsonl", "not json\n{broken\n");
                     workspace.create_file("quiet.jsonl",
                                           th::join_lines({th::user_text_line(th::timestamp_at(0), "hi")}));
                     const std::vector<std::filesystem::path> files = {
                         workspace.path() / "missing.jsonl",
                         workspace.path() / "empty.jsonl",
                         workspace.path() / "garbage.jsonl",
                         workspace.path() / "quiet.jsonl",
                         write_conversation(workspace, "ok.jsonl", 0),
                     };
                     const batch::BatchOrchestrator orchestrator(batch::BatchOptions{},
                                                                 th::default_compiler());
                     const auto result = orchestrator.run(files);
                     require(result.files_skipped == 3, "missing, empty and garbage files skipped");
                     require(result.empty_conversations == 1, "user-only conversation compiles to nothing");
                     require(result.timelines.size() == 1, "only the real conversation remains");
                     require(result.failures.empty(), "skips are not failures");
                   }});

  tests.push_back({"batch_empty_input_is_a_no_op", [] {
                     const batch::BatchOrchestrator orchestrator(batch::BatchOptions{},
                                                                 th::default_compiler());
                     const auto result = orchestrator.run({});
                     require(result.files_total == 0 && result.timelines.empty(), "nothing to do");
                   }});

  tests.push_back({"batch_resolves_worker_count", [] {
                     require(batch::resolve_worker_count(3, 16, 8) == 3, "explicit wins");
                     require(batch::resolve_worker_count(40, 16, 8) == 40, "explicit ignores the cap");
                     require(batch::resolve_worker_count(0, 16, 8) == 7, "hardware minus one");
                     require(batch::resolve_worker_count(0, 16, 1) == 2, "at least two workers");
                     require(batch::resolve_worker_count(0, 16, 0) == 2, "unknown hardware");
                     require(batch::resolve_worker_count(0, 4, 32) == 4, "capped at max workers");
                     require(batch::resolve_worker_count(0, 1, 8) == 1, "cap below two");
                     require(batch::resolve_worker_count(0, 0, 8) == 1, "never zero");
                   }});

  tests.push_back({"batch_abort_group_discards_the_failing_group", [] {
                     th::TempWorkspace workspace;
                     const std::vector<std::filesystem::path> files = {
                         write_conversation(workspace, "a.jsonl", 0),
                         write_conversation(workspace, "bad.jsonl", 10),
                         write_conversation(workspace, "c.jsonl", 20),
                     };

                     const batch::BatchOrchestrator together(
                         options_with(3, 10, batch::FailurePolicy::AbortGroup), failing_on("bad"));
                     const auto aborted = together.run(files);
                     require(aborted.failures.size() == 1, "one failure recorded");
                     require(aborted.failures[0].message == "compile exploded", "message kept");
                     require(!aborted.failures[0].timed_out, "not a timeout");
                     require(aborted.groups_aborted == 1, "group counted as aborted");
                     require(aborted.timelines.empty(), "siblings discarded with the group");

                     const batch::BatchOrchestrator one_by_one(
                         options_with(1, 10, batch::FailurePolicy::AbortGroup), failing_on("bad"));
                     const auto separated = one_by_one.run(files);
                     require(separated.groups_aborted == 1, "only the failing group aborted");
                     require(separated.timelines.size() == 2, "other groups continue");
                   }});

  tests.push_back({"batch_isolate_keeps_partial_results", [] {
                     th::TempWorkspace workspace;
                     const std::vector<std::filesystem::path> files = {
                         write_conversation(workspace, "a.jsonl", 0),
                         write_conversation(workspace, "bad.jsonl", 10),
                         write_conversation(workspace, "c.jsonl", 20),
                     };
                     const batch::BatchOrchestrator orchestrator(
                         options_with(3, 10, batch::FailurePolicy::Isolate), failing_on("bad"));
                     const auto result = orchestrator.run(files);
                     require(result.failures.size() == 1, "failure still reported");
                     require(result.failures[0].file_path.find("bad.jsonl") != std::string::npos,
                             "failure names its file");
                     require(result.groups_aborted == 0, "isolate never aborts");
                     require(result.timelines.size() == 2, "successful units kept");
                   }});

  tests.push_back({"batch_unit_timeout_reports_slow_units", [] {
                     th::TempWorkspace workspace;
                     const std::vector<std::filesystem::path> files = {
                         write_conversation(workspace, "fast.jsonl", 0),
                         write_conversation(workspace, "slow.jsonl", 10),
                     };
                     auto options = options_with(2, 10, batch::FailurePolicy::Isolate);
                     options.unit_timeout = std::chrono::milliseconds(150);
                     const batch::BatchOrchestrator orchestrator(
                         options, [](traceops::transcript::Conversation conversation)
                                      -> std::optional<tl::CompiledTimeline> {
                           if (conversation.file_path.find("slow") != std::string::npos) {
                             std::this_thread::sleep_for(std::chrono::milliseconds(1500));
                           }
                           return stub_timeline(std::move(conversation));
                         });

                     const auto start = std::chrono::steady_clock::now();
                     const auto result = orchestrator.run(files);
                     const auto waited = std::chrono::steady_clock::now() - start;
                     require(waited < std::chrono::milliseconds(1200), "group must not wait for the slow unit");
                     require(result.failures.size() == 1, "slow unit reported");
                     require(result.failures[0].timed_out, "flagged as a timeout");
                     require(result.timelines.size() == 1, "fast unit kept");
                   }});

  tests.push_back({"batch_timeouts_keep_worker_bound", [] {
                     th::TempWorkspace workspace;
                     std::vector<std::filesystem::path> files;
                     for (int i = 0; i < 12; ++i) {
                       files.push_back(
                           write_conversation(workspace, "unit-" + std::to_string(i) + ".jsonl", i));
                     }
                     struct Tracker {
                       std::atomic<int> in_flight{0};
                       std::atomic<int> peak{0};
                     };
                     auto tracker = std::make_shared<Tracker>();
                     auto options = options_with(2, 50, batch::FailurePolicy::Isolate);
                     options.unit_timeout = std::chrono::milliseconds(50);
                     std::size_t workers = 0;
                     {
                       const batch::BatchOrchestrator orchestrator(
                           options, [tracker](traceops::transcript::Conversation conversation)
                                        -> std::optional<tl::CompiledTimeline> {
                             const int now = ++tracker->in_flight;
                             int seen = tracker->peak.load();
                             while (now > seen && !tracker->peak.compare_exchange_weak(seen, now)) {
                             }
                             std::this_thread::sleep_for(std::chrono::milliseconds(150));
                             --tracker->in_flight;
                             return stub_timeline(std::move(conversation));
                           });
                       workers = orchestrator.worker_count();
                       const auto result = orchestrator.run(files);
                       require(result.failures.size() == 12, "every unit misses its deadline");
                       require(std::all_of(result.failures.begin(), result.failures.end(),
                                           [](const batch::UnitFailure &f) { return f.timed_out; }),
                               "all failures are timeouts");
                       require(result.timelines.empty(), "no unit finished in time");
                     }
                     require(tracker->peak.load() <= static_cast<int>(workers),
                             "peak concurrency " + std::to_string(tracker->peak.load()) +
                                 " exceeds worker count");
                     require(tracker->in_flight.load() == 0, "abandoned units finish before teardown");
                   }});

  tests.push_back({"batch_timeout_path_still_reports_exceptions", [] {
                     th::TempWorkspace workspace;
                     const std::vector<std::filesystem::path> files = {
                         write_conversation(workspace, "bad.jsonl", 0),
                     };
                     auto options = options_with(1, 10, batch::FailurePolicy::AbortGroup);
                     options.unit_timeout = std::chrono::milliseconds(2000);
                     const batch::BatchOrchestrator orchestrator(options, failing_on("bad"));
                     const auto result = orchestrator.run(files);
                     require(result.failures.size() == 1 && !result.failures[0].timed_out,
                             "exception surfaces as a plain failure");
                     require(result.failures[0].message == "compile exploded", "message kept");
                   }});

  tests.push_back({"batch_options_from_config", [] {
                     traceops::config::BatchConfig config;
                     config.failure_policy = "Isolate";
                     config.unit_timeout_seconds = 3;
                     config.concurrency = 5;
                     const auto options = batch::BatchOptions::from_config(config);
                     require(options.ok(), "valid config");
                     require(options.value().failure_policy == batch::FailurePolicy::Isolate, "policy");
                     require(options.value().unit_timeout == std::chrono::milliseconds(3000), "timeout");
                     require(options.value().concurrency == 5, "concurrency");

                     config.failure_policy = "retry";
                     const auto bad = batch::BatchOptions::from_config(config);
                     require(!bad.ok(), "unknown policy rejected");
                     require(bad.error().find("retry") != std::string::npos, "error names the policy");

                     require(batch::failure_policy_to_string(batch::FailurePolicy::AbortGroup) ==
                                 "abort_group",
                             "policy name");
                     require(batch::failure_policy_from_string("").value() ==
                                 batch::FailurePolicy::AbortGroup,
                             "empty means default");
                   }});

  tests.push_back({"batch_sorts_by_earliest_timestamp", [] {
                     std::vector<tl::CompiledTimeline> timelines;
                     timelines.push_back(timeline_at("z.jsonl", {th::timestamp_at(30)}));
                     timelines.push_back(timeline_at("none.jsonl", {"", "garbage"}));
                     timelines.push_back(
                         timeline_at("a.jsonl", {th::timestamp_at(50), th::timestamp_at(5)}));
                     timelines.push_back(timeline_at("b.jsonl", {th::timestamp_at(30)}));

                     batch::sort_by_earliest_timestamp(timelines);
                     require(timelines[0].file_path == "a.jsonl", "earliest record decides");
                     require(timelines[1].file_path == "b.jsonl", "ties broken by path");
                     require(timelines[2].file_path == "z.jsonl", "tie partner follows");
                     require(timelines[3].file_path == "none.jsonl", "missing timestamps last");

                     batch::sort_by_earliest_timestamp(timelines, true);
                     require(timelines[0].file_path == "b.jsonl", "newest first, path tiebreak");
                     require(timelines[2].file_path == "a.jsonl", "oldest last among dated");
                     require(timelines[3].file_path == "none.jsonl", "undated still last");

                     require(!batch::earliest_timestamp_ms(timelines[3]).has_value(),
                             "no parseable timestamp");
                   }});
}

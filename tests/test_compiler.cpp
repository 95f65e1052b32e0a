#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"

#include "traceops/timeline/compiler.hpp"

#include <string>

namespace {

namespace th = traceops::testing;

std::string read_at(const int seconds, const std::string &id, const std::string &path,
                    const int offset, const int limit, const std::uint64_t input_tokens = 10'000,
                    const std::uint64_t output_tokens = 1'000) {
  const std::string input = R"({"file_path":")" + path + R"(","offset":)" +
                            std::to_string(offset) + R"(,"limit":)" + std::to_string(limit) + "}";
  return th::assistant_tools_line(th::timestamp_at(seconds),
                                  {{.id = id, .name = "Read", .input_json = input}}, input_tokens,
                                  output_tokens);
}

std::string bash_at(const int seconds, const std::string &id, const std::string &command,
                    const std::uint64_t input_tokens = 2'000,
                    const std::uint64_t output_tokens = 200) {
  return th::assistant_tools_line(
      th::timestamp_at(seconds),
      {{.id = id, .name = "Bash", .input_json = R"({"command":")" + command + "\"}"}},
      input_tokens, output_tokens);
}

std::string dump(const std::vector<std::string> &lines) {
  std::string out;
  for (const auto &line : lines) {
    out += "\n  " + line;
  }
  return out;
}

} // namespace

void register_compiler_tests(std::vector<traceops::tests::TestCase> &tests) {
  using traceops::tests::require;
  namespace tl = traceops::timeline;

  tests.push_back({"compiler_empty_conversation_returns_none", [] {
                     const auto compiler = th::default_compiler();
                     const auto records = th::parse_lines({
                         th::user_text_line(th::timestamp_at(0), "hello"),
                         th::assistant_tools_line(th::timestamp_at(1),
                                                  {{.id = "g1", .name = "Glob"},
                                                   {.id = "g2", .name = "TodoWrite"}},
                                                  500, 50),
                     });
                     const auto index = tl::CorrelationIndex::build(records);
                     const auto compiled = compiler.compile(records, index);
                     require(!compiled.has_value(), "no emitted action should yield none");

                     const auto empty = compiler.compile({}, tl::CorrelationIndex{});
                     require(!empty.has_value(), "no records should yield none");
                   }});

  tests.push_back({"compiler_compresses_consecutive_large_reads", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/big.cpp", 0, 100),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(4000)),
                         read_at(2, "r2", "/src/big.cpp", 100, 100),
                         th::text_result_line(th::timestamp_at(3), "r2", th::sized_text(4000)),
                         read_at(4, "r3", "/src/big.cpp", 200, 100),
                         th::text_result_line(th::timestamp_at(5), "r3", th::sized_text(4000)),
                     });
                     require(lines.size() == 1, "expected one compressed line:" + dump(lines));
                     require(lines[0] == "1. Read: [12000b $0.1350] big.cpp[L1-L100], "
                                         "big.cpp[L101-L200], big.cpp[L201-L300]",
                             "got: " + lines[0]);
                   }});

  tests.push_back({"compiler_small_read_is_invisible_to_runs", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/a.cpp", 0, 80),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(4000)),
                         read_at(2, "r2", "/src/tiny.hpp", 0, 10),
                         th::text_result_line(th::timestamp_at(3), "r2", th::sized_text(500)),
                         read_at(4, "r3", "/src/b.cpp", 0, 80),
                         th::text_result_line(th::timestamp_at(5), "r3", th::sized_text(4000)),
                     });
                     require(lines.size() == 1, "small read must not break the run:" + dump(lines));
                     require(lines[0].find("8000b") != std::string::npos, "only large reads counted");
                     require(lines[0].find("tiny.hpp") == std::string::npos, "small read hidden");
                     require(lines[0].find("a.cpp[L1-L80], b.cpp[L1-L80]") != std::string::npos,
                             "files listed in first-seen order: " + lines[0]);
                   }});

  tests.push_back({"compiler_small_read_does_not_start_a_run", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/tiny.hpp", 0, 10),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(500)),
                         bash_at(2, "b1", "ls"),
                     });
                     require(lines.size() == 1, "only the bash line expected:" + dump(lines));
                     require(lines[0].rfind("1. Bash:", 0) == 0, "bash gets sequence 1: " + lines[0]);
                   }});

  tests.push_back({"compiler_merges_ranges_under_existing_file", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/a.cpp", 0, 50),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(3000)),
                         read_at(2, "r2", "/src/b.cpp", 0, 50),
                         th::text_result_line(th::timestamp_at(3), "r2", th::sized_text(3000)),
                         read_at(4, "r3", "/src/a.cpp", 50, 50),
                         th::text_result_line(th::timestamp_at(5), "r3", th::sized_text(3000)),
                     });
                     require(lines.size() == 1, "one run expected:" + dump(lines));
                     require(lines[0].find("a.cpp[L1-L50], a.cpp[L51-L100], b.cpp[L1-L50]") !=
                                 std::string::npos,
                             "ranges should group under their file: " + lines[0]);
                   }});

  tests.push_back({"compiler_differing_kind_flushes_run", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/a.cpp", 0, 50),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(3500)),
                         th::assistant_tools_line(
                             th::timestamp_at(10),
                             {{.id = "e1",
                               .name = "Edit",
                               .input_json = R"({"file_path":"/src/a.cpp","new_string":"x\ny"})"}},
                             10'000, 1'000),
                         bash_at(20, "b1", "make"),
                     });
                     require(lines.size() == 3, "read run, edit run, bash:" + dump(lines));
                     require(lines[0].rfind("1. Read: [3500b", 0) == 0, "read first: " + lines[0]);
                     require(lines[1] == "2. Edit: [+10s 3b $0.0450] a.cpp[L1-L2]",
                             "edit run measured from read run: " + lines[1]);
                     require(lines[2].rfind("3. Bash: [+10s in=2000t out=200t $0.0090 cmd=4b]", 0) == 0,
                             "bash elapsed from edit run: " + lines[2]);
                   }});

  tests.push_back({"compiler_drops_idle_reasoning", [] {
                     const auto lines = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::thinking_line(th::timestamp_at(100), 50'000, 5'000),
                         bash_at(110, "b2", "pwd"),
                     });
                     require(lines.size() == 2, "idle reasoning must be dropped:" + dump(lines));
                     require(lines[0] == "1. Bash: [in=2000t out=200t $0.0090 cmd=2b] ls",
                             "got: " + lines[0]);
                     require(lines[1] == "2. Bash: [+1m50s in=2000t out=200t $0.0090 cmd=3b] pwd",
                             "elapsed measured from the last action: " + lines[1]);
                   }});

  tests.push_back({"compiler_keeps_reasoning_at_idle_boundary", [] {
                     const auto lines = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::thinking_line(th::timestamp_at(60), 10'000, 1'000),
                         bash_at(65, "b2", "pwd"),
                     });
                     require(lines.size() == 3, "a 60s gap is not idle:" + dump(lines));
                     require(lines[1] == "\xF0\x9F\x92\xAD [+1m in=10000t out=1000t $0.0450]",
                             "reasoning at the boundary: " + lines[1]);
                     require(lines[2].rfind("2. Bash: [+5s ", 0) == 0, "got: " + lines[2]);
                   }});

  tests.push_back({"compiler_drops_reasoning_past_idle_boundary", [] {
                     const auto lines = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::thinking_line(th::timestamp_at(61), 10'000, 1'000),
                     });
                     require(lines.size() == 1, "a 61s gap is idle:" + dump(lines));
                     require(lines[0] == "1. Bash: [in=2000t out=200t $0.0090 cmd=2b] ls",
                             "got: " + lines[0]);
                   }});

  tests.push_back({"compiler_accumulates_reasoning_runs", [] {
                     const auto lines = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::thinking_line(th::timestamp_at(20), 10'000, 1'000),
                         th::thinking_line(th::timestamp_at(30), 10'000, 1'000),
                         bash_at(35, "b2", "pwd"),
                     });
                     require(lines.size() == 3, "bash, reasoning, bash:" + dump(lines));
                     require(lines[1] == "\xF0\x9F\x92\xAD [+20s 2x in=20000t out=2000t $0.0900]",
                             "reasoning summary mismatch: " + lines[1]);
                     require(lines[2].rfind("2. Bash: [+5s ", 0) == 0,
                             "bash elapsed from reasoning end: " + lines[2]);
                   }});

  tests.push_back({"compiler_single_reasoning_has_no_count", [] {
                     const auto lines = th::compile_lines({
                         th::thinking_line(th::timestamp_at(0), 10'000, 1'000),
                         th::thinking_line(th::timestamp_at(5), 0, 1'000),
                     });
                     require(lines.size() == 1, "unbilled reasoning is ignored:" + dump(lines));
                     require(lines[0] == "\xF0\x9F\x92\xAD [in=10000t out=1000t $0.0450]",
                             "got: " + lines[0]);
                   }});

  tests.push_back({"compiler_sequence_skips_markers", [] {
                     const auto lines = th::compile_lines({
                         th::assistant_tools_line(
                             th::timestamp_at(0),
                             {{.id = "b1", .name = "Bash", .input_json = R"({"command":"ls"})"},
                              {.id = "b2", .name = "Bash", .input_json = R"({"command":"pwd"})"}},
                             2'000, 200),
                         th::text_result_line(th::timestamp_at(1), "b1", "a"),
                         th::text_result_line(th::timestamp_at(1), "b2", "/x"),
                         th::thinking_line(th::timestamp_at(10), 10'000, 1'000),
                         bash_at(15, "b3", "make"),
                         th::text_result_line(th::timestamp_at(16), "b3", "ok"),
                     });
                     require(lines.size() == 5, "five entries expected:" + dump(lines));
                     require(lines[0] == "1. Bash: [cmd=2b out=1b] ls", "got: " + lines[0]);
                     require(lines[1] == "2. Bash: [cmd=3b out=2b] pwd", "got: " + lines[1]);
                     require(lines[2] == "MessageEnd #1: [in=2000t out=200t $0.0090]",
                             "aggregate marker: " + lines[2]);
                     require(lines[3] == "\xF0\x9F\x92\xAD [+10s in=10000t out=1000t $0.0450]",
                             "reasoning marker: " + lines[3]);
                     require(lines[4] == "3. Bash: [+5s in=2000t out=200t $0.0090 cmd=4b out=2b] make",
                             "sequence continues at 3: " + lines[4]);
                   }});

  tests.push_back({"compiler_message_end_counts_assistant_records", [] {
                     const auto lines = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::assistant_tools_line(
                             th::timestamp_at(5),
                             {{.id = "b2", .name = "Bash", .input_json = R"({"command":"ls"})"},
                              {.id = "g1", .name = "Grep", .input_json = R"({"pattern":"x"})"}},
                             2'000, 200),
                     });
                     require(lines.size() == 3, "two actions and one marker:" + dump(lines));
                     require(lines[2] == "MessageEnd #2: [in=2000t out=200t $0.0090]",
                             "marker numbers the second assistant record: " + lines[2]);
                   }});

  tests.push_back({"compiler_no_message_end_without_visible_tools_or_usage", [] {
                     const auto hidden_only = th::compile_lines({
                         bash_at(0, "b1", "ls"),
                         th::assistant_tools_line(th::timestamp_at(5),
                                                  {{.id = "g1", .name = "Glob"},
                                                   {.id = "g2", .name = "Grep"}},
                                                  2'000, 200),
                     });
                     require(hidden_only.size() == 1, "hidden tools emit nothing:" + dump(hidden_only));

                     const auto unbilled = th::compile_lines({
                         th::assistant_tools_line(
                             th::timestamp_at(0),
                             {{.id = "b1", .name = "Bash", .input_json = R"({"command":"ls"})"},
                              {.id = "b2", .name = "Bash", .input_json = R"({"command":"pwd"})"}},
                             2'000, 0),
                     });
                     require(unbilled.size() == 2, "no marker without usage:" + dump(unbilled));
                   }});

  tests.push_back({"compiler_heredoc_never_echoes_body", [] {
                     const auto lines = th::compile_lines({
                         th::assistant_tools_line(
                             th::timestamp_at(0),
                             {{.id = "toolu_hd",
                               .name = "Bash",
                               .input_json =
                                   R"({"command":"cat > /tmp/x.sh <<EOF\necho secret-body\nEOF"})"}},
                             2'000, 200),
                     });
                     require(lines.size() == 1, "one action expected:" + dump(lines));
                     require(lines[0].find("secret-body") == std::string::npos, "body leaked");
                     require(lines[0].find("tool_use_id=\"toolu_hd\"") != std::string::npos,
                             "reference expected: " + lines[0]);
                   }});

  tests.push_back({"compiler_inserts_user_message_before_actions", [] {
                     std::string long_message(150, 'm');
                     const auto lines = th::compile_lines({
                         th::user_text_line(th::timestamp_at(0), "  Please\n fix   the\ttests  "),
                         th::user_text_line(th::timestamp_at(1), "second thought wins"),
                         bash_at(2, "b1", "make test"),
                         th::user_text_line(th::timestamp_at(3), long_message),
                         th::assistant_tools_line(th::timestamp_at(4), {{.id = "g", .name = "Glob"}},
                                                  100, 10),
                         bash_at(5, "b2", "make"),
                     });
                     require(lines.size() == 4, "two user lines and two actions:" + dump(lines));
                     require(lines[0] == "\nUser: second thought wins\n", "latest message: " + lines[0]);
                     require(lines[1].rfind("1. Bash:", 0) == 0, "action follows message");
                     require(lines[2] == "\nUser: " + std::string(97, 'm') + "...\n",
                             "long message truncated to 100 chars");
                     require(lines[3].rfind("2. Bash:", 0) == 0, "second action");
                   }});

  tests.push_back({"compiler_user_message_flushes_open_run", [] {
                     const auto lines = th::compile_lines({
                         read_at(0, "r1", "/src/a.cpp", 0, 50),
                         th::text_result_line(th::timestamp_at(1), "r1", th::sized_text(3100)),
                         th::user_text_line(th::timestamp_at(2), "now the header"),
                         read_at(3, "r2", "/src/a.hpp", 0, 50),
                         th::text_result_line(th::timestamp_at(4), "r2", th::sized_text(3100)),
                     });
                     require(lines.size() == 3, "run, user, run:" + dump(lines));
                     require(lines[0].rfind("1. Read:", 0) == 0, "first run before the message");
                     require(lines[1] == "\nUser: now the header\n", "user line");
                     require(lines[2].rfind("2. Read: [+3s ", 0) == 0, "second run: " + lines[2]);
                   }});

  tests.push_back({"compiler_external_tools_are_never_hidden", [] {
                     traceops::config::TimelineConfig options;
                     options.hidden_tools.push_back("mcp__search__Grep");
                     const tl::TimelineCompiler compiler(options, tl::CostEstimator{});
                     const auto records = th::parse_lines({
                         th::assistant_tools_line(
                             th::timestamp_at(0),
                             {{.id = "m1", .name = "mcp__search__Grep", .input_json = R"({"q":"x"})"}},
                             100, 10),
                     });
                     const auto entries = compiler.compile(records, tl::CorrelationIndex::build(records));
                     require(entries.has_value() && entries->size() == 1, "external tool shown");
                     require(entries->front().render().find("MCP: ") != std::string::npos,
                             "external formatter used");
                   }});

  tests.push_back({"compiler_unrecognized_tool_is_surfaced", [] {
                     const auto lines = th::compile_lines({
                         th::assistant_tools_line(
                             th::timestamp_at(0),
                             {{.id = "n1", .name = "Frobnicate", .input_json = R"({"a":1})"}}, 100, 10),
                     });
                     require(lines.size() == 1, "one line:" + dump(lines));
                     require(lines[0].find("Frobnicate: (new tool - needs formatter)") != std::string::npos,
                             "needs-formatter marker: " + lines[0]);
                   }});

  tests.push_back({"compiler_missing_timestamps_omit_elapsed", [] {
                     const auto lines = th::compile_lines({
                         th::assistant_tools_line("", {{.id = "b1", .name = "Bash",
                                                        .input_json = R"({"command":"ls"})"}},
                                                  2'000, 200),
                         th::assistant_tools_line("not a time",
                                                  {{.id = "b2", .name = "Bash",
                                                    .input_json = R"({"command":"pwd"})"}},
                                                  2'000, 200),
                     });
                     require(lines.size() == 2, "both actions kept:" + dump(lines));
                     require(lines[1] == "2. Bash: [in=2000t out=200t $0.0090 cmd=3b] pwd",
                             "no elapsed without timestamps: " + lines[1]);
                   }});

  tests.push_back({"compiler_result_carries_records_and_text", [] {
                     traceops::transcript::Conversation conversation;
                     conversation.file_path = "/logs/abc.jsonl";
                     conversation.records = th::parse_lines({
                         th::user_text_line(th::timestamp_at(0), "go"),
                         bash_at(1, "b1", "ls"),
                         bash_at(2, "b2", "pwd"),
                     });
                     const auto compiled =
                         th::default_compiler().compile_conversation(std::move(conversation));
                     require(compiled.has_value(), "timeline expected");
                     require(compiled->file_path == "/logs/abc.jsonl", "file path carried");
                     require(compiled->records.size() == 3, "records returned alongside");
                     require(compiled->action_count == 2, "two numbered actions");
                     const std::string text = compiled->text();
                     require(text.rfind("\nUser: go\n\n1. Bash:", 0) == 0,
                             "user line surrounded by blank lines: " + text);
                     require(text.find("\n2. Bash: [+1s ") != std::string::npos, "second action");
                   }});
}

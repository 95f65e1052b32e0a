#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"

#include "traceops/transcript/parser.hpp"

#include <variant>

void register_transcript_tests(std::vector<traceops::tests::TestCase> &tests) {
  using traceops::tests::require;
  namespace tr = traceops::transcript;
  namespace th = traceops::testing;

  tests.push_back({"transcript_parses_assistant_tool_use", [] {
                     const auto line = th::assistant_tools_line(
                         th::timestamp_at(0),
                         {{.id = "toolu_1",
                           .name = "Read",
                           .input_json = R"({"file_path":"/src/a.cpp","offset":10,"limit":20})"}},
                         1200, 80, "claude-opus-4");
                     const auto parsed = tr::parse_record_jsonl(line);
                     require(parsed.ok(), parsed.error());
                     const auto &record = parsed.value();
                     require(record.role == tr::RecordRole::Assistant, "role should be assistant");
                     require(record.model.value_or("") == "claude-opus-4", "model mismatch");
                     require(record.billable_usage().has_value(), "usage should be billable");
                     require(record.tool_use_count() == 1, "one tool use expected");
                     const auto &tool = std::get<tr::ToolUseBlock>(record.content.front());
                     require(tool.id == "toolu_1" && tool.name == "Read", "tool identity mismatch");
                     require(tool.input_string("file_path").value_or("") == "/src/a.cpp",
                             "file_path mismatch");
                     require(tool.input_int("offset").value_or(0) == 10, "offset mismatch");
                     require(tool.input_json() ==
                                 R"({"file_path":"/src/a.cpp","offset":10,"limit":20})",
                             "compact input mismatch: " + tool.input_json());
                   }});

  tests.push_back({"transcript_parses_tool_result_variants", [] {
                     const auto text = tr::parse_record_jsonl(
                         th::text_result_line(th::timestamp_at(1), "toolu_1", "line1\nline2", 2));
                     require(text.ok(), text.error());
                     const auto &result = std::get<tr::ToolResultBlock>(text.value().content.front());
                     require(result.tool_use_id == "toolu_1", "tool_use_id mismatch");
                     require(result.content.is_text(), "string content should be text");
                     require(result.content.byte_size() == 11, "byte size mismatch");
                     require(result.exit_code.value_or(0) == 2, "exit code mismatch");

                     const auto structured = tr::parse_record_jsonl(
                         R"({"type":"user","timestamp":"2025-03-01T10:00:00Z","message":{"role":"user","content":[{"type":"tool_result","tool_use_id":"t2","content":[ {"type": "text", "text": "ok"} ]}]}})");
                     require(structured.ok(), structured.error());
                     const auto &block =
                         std::get<tr::ToolResultBlock>(structured.value().content.front());
                     require(!block.content.is_text(), "array content is structured");
                     require(block.content.serialized == R"([{"type":"text","text":"ok"}])",
                             "structured content should be compact: " + block.content.serialized);
                     require(!block.exit_code.has_value(), "no exit code expected");
                   }});

  tests.push_back({"transcript_plain_string_content_is_text", [] {
                     const auto parsed = tr::parse_record_jsonl(
                         R"({"type":"user","timestamp":"2025-03-01T10:00:00Z","message":{"role":"user","content":"please fix the build"}})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().first_text().value_or("") == "please fix the build",
                             "plain string should become a text block");
                   }});

  tests.push_back({"transcript_thinking_and_unknown_blocks", [] {
                     const auto parsed = tr::parse_record_jsonl(
                         R"({"type":"assistant","message":{"content":[{"type":"thinking","thinking":"hmm"},{"type":"image","source":{}}],"usage":{"input_tokens":5,"output_tokens":0}}})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().starts_with_thinking(), "thinking should lead");
                     require(parsed.value().content.size() == 1, "unknown block type is dropped");
                     require(parsed.value().usage.has_value(), "usage should be present");
                     require(!parsed.value().billable_usage().has_value(),
                             "zero output tokens is not billable");
                   }});

  tests.push_back({"transcript_rejects_malformed_lines", [] {
                     require(!tr::parse_record_jsonl("").ok(), "blank line should fail");
                     require(!tr::parse_record_jsonl("{\"type\":\"user\"").ok(),
                             "truncated object should fail");
                     require(!tr::parse_record_jsonl("{\"type\":\"user\"} trailing").ok(),
                             "trailing garbage should fail");
                     require(!tr::parse_record_jsonl("[1,2,3]").ok(), "arrays are not records");
                   }});

  tests.push_back({"transcript_file_skips_bad_lines", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file(
                         "session.jsonl",
                         th::user_text_line(th::timestamp_at(0), "hello") + "\n" +
                             "not json at all\n\n" +
                             th::thinking_line(th::timestamp_at(5), 10, 20) + "\n" +
                             "{\"type\":\"assistant\",\n");
                     const auto loaded = tr::load_conversation_file(workspace.path() / "session.jsonl");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().records.size() == 2, "two valid records expected");
                     require(loaded.value().file_path.find("session.jsonl") != std::string::npos,
                             "file path should be kept");
                   }});

  tests.push_back({"transcript_missing_file_fails", [] {
                     th::TempWorkspace workspace;
                     const auto loaded = tr::load_conversation_file(workspace.path() / "absent.jsonl");
                     require(!loaded.ok(), "missing file should fail");
                   }});
}

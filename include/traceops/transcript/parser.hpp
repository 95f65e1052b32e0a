#pragma once

#include "traceops/common/result.hpp"
#include "traceops/transcript/record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace traceops::transcript {

[[nodiscard]] common::Result<ConversationRecord> parse_record_jsonl(const std::string &line);

[[nodiscard]] std::vector<ConversationRecord> parse_conversation_text(const std::string &content);

/// Read and parse one conversation log. A read failure fails the result; a
/// readable file always succeeds, possibly with zero records.
[[nodiscard]] common::Result<Conversation>
load_conversation_file(const std::filesystem::path &path);

} // namespace traceops::transcript

#pragma once

#include "traceops/transcript/record.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace traceops::timeline {

/// Tool-invocation id -> the result that answered it. Built once per
/// conversation before compilation; a repeated id keeps the last result.
class CorrelationIndex {
public:
  [[nodiscard]] static CorrelationIndex build(const std::vector<transcript::ConversationRecord> &records);

  [[nodiscard]] const transcript::ToolResultBlock *find(const std::string &tool_use_id) const;
  [[nodiscard]] std::size_t size() const { return results_.size(); }

private:
  std::unordered_map<std::string, transcript::ToolResultBlock> results_;
};

} // namespace traceops::timeline

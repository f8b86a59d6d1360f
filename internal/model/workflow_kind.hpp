#pragma once

#include <cstdint>
#include <string_view>

namespace reconciler::model {

enum class WorkflowKind : std::uint8_t {
  kUnspecified = 0,
  kRawFile = 1,
  kGeneratedA = 2,
  kGeneratedB = 3,
};

constexpr std::string_view ToString(WorkflowKind kind) {
  switch (kind) {
    case WorkflowKind::kRawFile:
      return "raw_file";
    case WorkflowKind::kGeneratedA:
      return "generated_a";
    case WorkflowKind::kGeneratedB:
      return "generated_b";
    case WorkflowKind::kUnspecified:
    default:
      return "unspecified";
  }
}

// Generated kinds are owned by the controller and participate in pause
// reconciliation. Raw files are opaque.
constexpr bool IsManaged(WorkflowKind kind) {
  return kind == WorkflowKind::kGeneratedA || kind == WorkflowKind::kGeneratedB;
}

}  // namespace reconciler::model

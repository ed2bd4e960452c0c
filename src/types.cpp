#include "deepsearch/types.hpp"

namespace deepsearch {
namespace types {

std::string relationshipTypeToString(RelationshipType type) {
  switch (type) {
  case RelationshipType::Direct:
    return "Direct";
  case RelationshipType::Indirect:
    return "Indirect";
  case RelationshipType::SignificantMention:
    return "Significant Mention";
  case RelationshipType::NoEvidenceFound:
    return "No Evidence Found";
  case RelationshipType::Unknown:
  default:
    return "Unknown";
  }
}

RelationshipType relationshipTypeFromString(const std::string &value) {
  if (value == "Direct") {
    return RelationshipType::Direct;
  } else if (value == "Indirect") {
    return RelationshipType::Indirect;
  } else if (value == "Significant Mention" || value == "SignificantMention") {
    return RelationshipType::SignificantMention;
  } else if (value == "No Evidence Found" || value == "NoEvidenceFound") {
    return RelationshipType::NoEvidenceFound;
  }
  return RelationshipType::Unknown;
}

std::string sessionStatusToString(SessionStatus status) {
  switch (status) {
  case SessionStatus::Pending:
    return "pending";
  case SessionStatus::Running:
    return "running";
  case SessionStatus::Completed:
    return "completed";
  case SessionStatus::Cancelled:
    return "cancelled";
  case SessionStatus::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

bool isTerminal(SessionStatus status) {
  return status == SessionStatus::Completed ||
         status == SessionStatus::Cancelled || status == SessionStatus::Failed;
}

std::string eventTypeName(const StreamEvent &event) {
  return std::visit(
      [](const auto &e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InitEvent>) {
          return "init";
        } else if constexpr (std::is_same_v<T, BatchInfoEvent>) {
          return "batch_info";
        } else if constexpr (std::is_same_v<T, HeartbeatEvent>) {
          return "heartbeat";
        } else if constexpr (std::is_same_v<T, ResultEvent>) {
          return "result";
        } else if constexpr (std::is_same_v<T, ReconnectWarningEvent>) {
          return "reconnect_warning";
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return "error";
        } else {
          static_assert(std::is_same_v<T, CompleteEvent>,
                        "unhandled stream event");
          return "complete";
        }
      },
      event);
}

} // namespace types
} // namespace deepsearch

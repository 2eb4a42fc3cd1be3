#pragma once
#include "cohort/mpc/computation_result.hpp"
#include "cohort/mpc/secure_aggregator.hpp"
#include "cohort/utils/error_codes.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cohort {

enum class SessionStatus { Pending = 0, Collecting, Ready, Computed, Failed };

inline std::string sessionStatusToString(SessionStatus status) {
  switch (status) {
  case SessionStatus::Pending: return "PENDING";
  case SessionStatus::Collecting: return "COLLECTING";
  case SessionStatus::Ready: return "READY";
  case SessionStatus::Computed: return "COMPUTED";
  case SessionStatus::Failed: return "FAILED";
  }
  return "UNKNOWN";
}

inline std::optional<SessionStatus> parseSessionStatus(const std::string &name) {
  if (name == "PENDING") return SessionStatus::Pending;
  if (name == "COLLECTING") return SessionStatus::Collecting;
  if (name == "READY") return SessionStatus::Ready;
  if (name == "COMPUTED") return SessionStatus::Computed;
  if (name == "FAILED") return SessionStatus::Failed;
  return std::nullopt;
}

// Error recorded verbatim when a session fails
struct SessionError {
  ErrorCode code = ErrorCode::Success;
  std::string message;
};

// Answer to get_result: exactly one of result / error is set, or neither
// while the session is still pending.
struct ResultLookup {
  SessionStatus status = SessionStatus::Pending;
  std::optional<ComputationResult> result;
  std::optional<SessionError> error;

  bool isPending() const { return !result && !error; }
};

// Stateful record of one secure computation.
//
// PENDING -> COLLECTING -> READY -> COMPUTED, and FAILED from any
// non-terminal state. Terminal sessions are immutable. Rejected operations
// leave the session untouched. Not thread-safe: ComputationService serializes
// access per session.
class ComputationSession {
public:
  using Clock = std::chrono::system_clock;

  ComputationSession() = default;

  // Validates the roster and threshold; ValidationError on any violation
  static Result<ComputationSession>
  create(std::string id, ComputationType type,
         const std::vector<std::string> &participating_org_ids,
         std::size_t threshold, std::string security_method,
         std::optional<std::string> metric_type = std::nullopt);

  // Whether org_id may submit now: StateError once terminal or after a prior
  // submission, NotFoundError for organizations outside the roster.
  Result<void> acceptsSubmissionFrom(const std::string &org_id) const;

  // Record one organization's shares. Late submissions after READY are
  // accepted without changing status.
  Result<void> submitShare(const std::string &org_id,
                           std::vector<Share> shares);

  // Run the aggregation once. Repeated calls after COMPUTED return the cached
  // result; after FAILED they return the recorded error.
  Result<ComputationResult> compute(SecureAggregator &aggregator,
                                    const LocalDeviationStep &local_step = {});

  // Externally driven failure (timeouts, orchestration policy)
  Result<void> fail(ErrorCode code, const std::string &message);

  ResultLookup getResult() const;

  const std::string &id() const { return id_; }
  ComputationType type() const { return type_; }
  SessionStatus status() const { return status_; }
  std::size_t threshold() const { return threshold_; }
  const std::set<std::string> &participants() const { return participants_; }
  const SharesByParty &submissions() const { return submissions_; }
  std::size_t submittedCount() const { return submissions_.size(); }
  bool hasSubmitted(const std::string &org_id) const {
    return submissions_.count(org_id) > 0;
  }
  const std::string &securityMethod() const { return security_method_; }
  const std::optional<std::string> &metricType() const { return metric_type_; }
  const std::optional<ComputationResult> &result() const { return result_; }
  const std::optional<SessionError> &error() const { return error_; }
  Clock::time_point createdAt() const { return created_at_; }
  Clock::time_point updatedAt() const { return updated_at_; }
  const std::optional<Clock::time_point> &completedAt() const {
    return completed_at_;
  }
  bool isTerminal() const {
    return status_ == SessionStatus::Computed ||
           status_ == SessionStatus::Failed;
  }

  friend void to_json(nlohmann::json &j, const ComputationSession &s);
  friend void from_json(const nlohmann::json &j, ComputationSession &s);

private:
  void recordFailure(ErrorCode code, const std::string &message);

  std::string id_;
  ComputationType type_ = ComputationType::Sum;
  std::set<std::string> participants_;
  std::size_t threshold_ = 1;
  SessionStatus status_ = SessionStatus::Pending;
  SharesByParty submissions_;
  std::optional<ComputationResult> result_;
  std::optional<SessionError> error_;
  std::string security_method_;
  std::optional<std::string> metric_type_;
  Clock::time_point created_at_;
  Clock::time_point updated_at_;
  std::optional<Clock::time_point> completed_at_;
};

// Summary row returned by list operations
struct SessionSummary {
  std::string id;
  ComputationType type = ComputationType::Sum;
  SessionStatus status = SessionStatus::Pending;
  std::chrono::time_point<std::chrono::system_clock> created_at;
};

inline SessionSummary summarize(const ComputationSession &session) {
  return SessionSummary{session.id(), session.type(), session.status(),
                        session.createdAt()};
}

} // namespace cohort

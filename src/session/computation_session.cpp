#include "cohort/session/computation_session.hpp"
#include "cohort/utils/logging.hpp"
#include <stdexcept>

namespace cohort {

namespace {

int64_t toMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

Result<ComputationSession>
ComputationSession::create(std::string id, ComputationType type,
                           const std::vector<std::string> &participating_org_ids,
                           std::size_t threshold, std::string security_method,
                           std::optional<std::string> metric_type) {
  if (id.empty()) {
    return Result<ComputationSession>(ErrorCode::ValidationError,
                                      "Session id cannot be empty");
  }

  std::set<std::string> participants;
  for (const auto &org_id : participating_org_ids) {
    if (org_id.empty()) {
      return Result<ComputationSession>(ErrorCode::ValidationError,
                                        "Organization id cannot be empty");
    }
    if (!participants.insert(org_id).second) {
      return Result<ComputationSession>(
          ErrorCode::ValidationError,
          "Duplicate organization in roster: " + org_id);
    }
  }

  if (threshold < 1) {
    return Result<ComputationSession>(ErrorCode::ValidationError,
                                      "Threshold must be at least 1");
  }
  if (threshold > participants.size()) {
    return Result<ComputationSession>(
        ErrorCode::ValidationError,
        "Threshold " + std::to_string(threshold) + " exceeds the " +
            std::to_string(participants.size()) + " participating organizations");
  }

  ComputationSession session;
  session.id_ = std::move(id);
  session.type_ = type;
  session.participants_ = std::move(participants);
  session.threshold_ = threshold;
  session.security_method_ = std::move(security_method);
  session.metric_type_ = std::move(metric_type);
  session.created_at_ = Clock::now();
  session.updated_at_ = session.created_at_;

  COHORT_DEBUG("Created session " << session.id_ << " ("
                                  << computationTypeToString(type) << ", "
                                  << session.participants_.size()
                                  << " participants, threshold " << threshold
                                  << ")");
  return session;
}

Result<void>
ComputationSession::acceptsSubmissionFrom(const std::string &org_id) const {
  if (isTerminal()) {
    return Result<void>(ErrorCode::StateError,
                        "Session " + id_ + " is " +
                            sessionStatusToString(status_) +
                            " and no longer accepts submissions");
  }
  if (participants_.count(org_id) == 0) {
    return Result<void>(ErrorCode::NotFoundError,
                        "Organization '" + org_id +
                            "' is not a participant of session " + id_);
  }
  if (hasSubmitted(org_id)) {
    return Result<void>(ErrorCode::StateError,
                        "Organization '" + org_id +
                            "' has already submitted to session " + id_);
  }
  return Result<void>();
}

Result<void> ComputationSession::submitShare(const std::string &org_id,
                                             std::vector<Share> shares) {
  auto accepted = acceptsSubmissionFrom(org_id);
  if (!accepted) {
    return accepted;
  }
  if (shares.empty()) {
    return Result<void>(ErrorCode::ValidationError,
                        "Submission carries no shares");
  }

  std::map<uint32_t, field::Element> seen;
  for (const auto &share : shares) {
    if (share.party_index == 0 || share.party_index > participants_.size()) {
      return Result<void>(ErrorCode::ValidationError,
                          "Share party index " +
                              std::to_string(share.party_index) +
                              " is outside 1.." +
                              std::to_string(participants_.size()));
    }
    auto [it, inserted] = seen.emplace(share.party_index, share.value);
    if (!inserted && it->second != share.value) {
      return Result<void>(ErrorCode::DuplicateShareError,
                          "Conflicting shares for party index " +
                              std::to_string(share.party_index));
    }
  }

  submissions_.emplace(org_id, std::move(shares));
  updated_at_ = Clock::now();

  if (status_ == SessionStatus::Pending) {
    status_ = SessionStatus::Collecting;
  }
  if (status_ == SessionStatus::Collecting &&
      submissions_.size() >= threshold_) {
    status_ = SessionStatus::Ready;
  }

  COHORT_DEBUG("Session " << id_ << ": " << submissions_.size() << "/"
                          << participants_.size() << " submissions, status "
                          << sessionStatusToString(status_));
  return Result<void>();
}

Result<ComputationResult>
ComputationSession::compute(SecureAggregator &aggregator,
                            const LocalDeviationStep &local_step) {
  switch (status_) {
  case SessionStatus::Computed:
    if (!result_) {
      return Result<ComputationResult>(ErrorCode::StateError,
                                       "Session " + id_ +
                                           " is COMPUTED without a result");
    }
    COHORT_DEBUG("Session " << id_ << " already computed, returning cache");
    return *result_;

  case SessionStatus::Failed:
    if (!error_) {
      return Result<ComputationResult>(ErrorCode::StateError,
                                       "Session " + id_ + " failed");
    }
    return Result<ComputationResult>(error_->code, error_->message);

  case SessionStatus::Pending:
  case SessionStatus::Collecting: {
    std::string message = "Session " + id_ + " has " +
                          std::to_string(submissions_.size()) +
                          " submissions, below the threshold of " +
                          std::to_string(threshold_);
    recordFailure(ErrorCode::InsufficientShares, message);
    return Result<ComputationResult>(ErrorCode::InsufficientShares, message);
  }

  case SessionStatus::Ready:
    break;
  }

  auto outcome = aggregator.aggregate(type_, submissions_, threshold_,
                                      local_step);
  if (!outcome) {
    recordFailure(outcome.error(), std::string(outcome.message()));
    return outcome;
  }

  result_ = outcome.value();
  status_ = SessionStatus::Computed;
  updated_at_ = Clock::now();
  completed_at_ = updated_at_;

  COHORT_INFO("Session " << id_ << " computed "
                         << computationTypeToString(type_) << " over "
                         << submissions_.size() << " submissions");
  return outcome;
}

Result<void> ComputationSession::fail(ErrorCode code,
                                      const std::string &message) {
  if (isTerminal()) {
    return Result<void>(ErrorCode::StateError,
                        "Session " + id_ + " is already " +
                            sessionStatusToString(status_));
  }
  recordFailure(code, message);
  return Result<void>();
}

ResultLookup ComputationSession::getResult() const {
  ResultLookup lookup;
  lookup.status = status_;
  if (status_ == SessionStatus::Computed) {
    lookup.result = result_;
  } else if (status_ == SessionStatus::Failed) {
    lookup.error = error_;
  }
  return lookup;
}

void ComputationSession::recordFailure(ErrorCode code,
                                       const std::string &message) {
  error_ = SessionError{code, message};
  status_ = SessionStatus::Failed;
  updated_at_ = Clock::now();
  completed_at_ = updated_at_;
  COHORT_WARN("Session " << id_ << " failed: " << errorToString(code) << ": "
                         << message);
}

// JSON conversion functions for ComputationSession
void to_json(nlohmann::json &j, const ComputationSession &s) {
  nlohmann::json submissions = nlohmann::json::object();
  for (const auto &[org_id, shares] : s.submissions_) {
    submissions[org_id] = shares;
  }

  j = nlohmann::json{{"id", s.id_},
                     {"computation_type", computationTypeToString(s.type_)},
                     {"participating_org_ids", s.participants_},
                     {"threshold", s.threshold_},
                     {"status", sessionStatusToString(s.status_)},
                     {"submissions", submissions},
                     {"security_method", s.security_method_},
                     {"created_at", toMillis(s.created_at_)},
                     {"updated_at", toMillis(s.updated_at_)}};

  j["metric_type"] = s.metric_type_ ? nlohmann::json(*s.metric_type_)
                                    : nlohmann::json(nullptr);
  j["result"] = s.result_ ? nlohmann::json(*s.result_) : nlohmann::json(nullptr);
  if (s.error_) {
    j["error"] = {{"code", std::string(errorToString(s.error_->code))},
                  {"message", s.error_->message}};
  } else {
    j["error"] = nullptr;
  }
  j["completed_at"] = s.completed_at_
                          ? nlohmann::json(toMillis(*s.completed_at_))
                          : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json &j, ComputationSession &s) {
  j.at("id").get_to(s.id_);

  auto type = parseComputationType(j.at("computation_type").get<std::string>());
  if (!type) {
    throw std::invalid_argument("Unknown computation type: " +
                                j.at("computation_type").get<std::string>());
  }
  s.type_ = *type;

  auto status = parseSessionStatus(j.at("status").get<std::string>());
  if (!status) {
    throw std::invalid_argument("Unknown session status: " +
                                j.at("status").get<std::string>());
  }
  s.status_ = *status;

  j.at("participating_org_ids").get_to(s.participants_);
  j.at("threshold").get_to(s.threshold_);
  j.at("security_method").get_to(s.security_method_);

  s.submissions_.clear();
  const auto &submissions = j.at("submissions");
  for (auto it = submissions.begin(); it != submissions.end(); ++it) {
    s.submissions_[it.key()] = it.value().get<std::vector<Share>>();
  }

  s.created_at_ = fromMillis(j.at("created_at").get<int64_t>());
  s.updated_at_ = fromMillis(j.at("updated_at").get<int64_t>());

  s.metric_type_.reset();
  if (j.contains("metric_type") && !j["metric_type"].is_null()) {
    s.metric_type_ = j["metric_type"].get<std::string>();
  }

  s.result_.reset();
  if (j.contains("result") && !j["result"].is_null()) {
    s.result_ = j["result"].get<ComputationResult>();
  }

  s.error_.reset();
  if (j.contains("error") && !j["error"].is_null()) {
    s.error_ = SessionError{
        errorFromString(j["error"].at("code").get<std::string>()),
        j["error"].at("message").get<std::string>()};
  }

  s.completed_at_.reset();
  if (j.contains("completed_at") && !j["completed_at"].is_null()) {
    s.completed_at_ = fromMillis(j["completed_at"].get<int64_t>());
  }
}

} // namespace cohort

#include "cohort/service/audit_log.hpp"
#include "cohort/crypto/signature.hpp"
#include "cohort/utils/logging.hpp"
#include <stdexcept>

namespace cohort {

std::string AuditEntry::signedPayload() const {
  nlohmann::json j = *this;
  j.erase("signature");
  return j.dump();
}

AuditLog::AuditLog(const std::string &path) {
  auto keypair = SignatureUtils::generateKeyPair();
  public_key_ = keypair.first;
  private_key_ = keypair.second;

  if (!path.empty()) {
    sink_.open(path, std::ios::app);
    if (!sink_.is_open()) {
      throw std::runtime_error("Failed to open audit log " + path);
    }
    COHORT_LOG("Audit log at " << path << " (key " << public_key_ << ")");
  }
}

AuditEntry AuditLog::record(const std::string &action,
                            const std::string &session_id,
                            const std::string &org_id,
                            nlohmann::json details) {
  AuditEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.action = action;
  entry.session_id = session_id;
  entry.org_id = org_id;
  entry.details = std::move(details);

  std::lock_guard<std::mutex> lock(entries_mutex_);
  entry.sequence = next_sequence_++;
  entry.signature =
      SignatureUtils::createSignature(entry.signedPayload(), private_key_);
  entries_.push_back(entry);

  if (sink_.is_open()) {
    sink_ << nlohmann::json(entry).dump() << '\n';
    sink_.flush();
    if (!sink_) {
      COHORT_ERROR("Failed to append audit entry " << entry.sequence);
    }
  }

  COHORT_DEBUG("Audit #" << entry.sequence << " " << action << " session="
                         << session_id);
  return entry;
}

std::vector<AuditEntry> AuditLog::entries() const {
  std::lock_guard<std::mutex> lock(entries_mutex_);
  return entries_;
}

std::vector<AuditEntry>
AuditLog::entriesFor(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(entries_mutex_);
  std::vector<AuditEntry> matching;
  for (const auto &entry : entries_) {
    if (entry.session_id == session_id) {
      matching.push_back(entry);
    }
  }
  return matching;
}

bool AuditLog::verify(const AuditEntry &entry) const {
  return SignatureUtils::verifySignature(entry.signedPayload(),
                                         entry.signature, public_key_);
}

} // namespace cohort

#include "cohort/session/computation_store.hpp"
#include "cohort/utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace cohort {

namespace fs = std::filesystem;

namespace {

constexpr const char *kSessionExtension = ".json";

Result<ComputationSession> readSessionFile(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<ComputationSession>(ErrorCode::StorageError,
                                      "Cannot open " + path.string());
  }

  try {
    nlohmann::json j;
    file >> j;
    return j.get<ComputationSession>();
  } catch (const std::exception &e) {
    COHORT_ERROR("Corrupt session file " << path << ": " << e.what());
    return Result<ComputationSession>(
        ErrorCode::StorageError,
        "Corrupt session file " + path.string() + ": " + e.what());
  }
}

} // namespace

FileComputationStore::FileComputationStore(fs::path directory)
    : directory_(std::move(directory)) {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec || !fs::is_directory(directory_)) {
    throw std::runtime_error("Failed to create session store directory " +
                             directory_.string() + ": " + ec.message());
  }
  COHORT_LOG("Session store at " << directory_.string());
}

bool FileComputationStore::isSafeId(const std::string &id) {
  return !id.empty() &&
         std::all_of(id.begin(), id.end(), [](unsigned char c) {
           return std::isalnum(c) || c == '-' || c == '_';
         });
}

fs::path FileComputationStore::pathFor(const std::string &id) const {
  return directory_ / (id + kSessionExtension);
}

Result<void> FileComputationStore::save(const ComputationSession &session) {
  if (!isSafeId(session.id())) {
    return Result<void>(ErrorCode::ValidationError,
                        "Session id is not usable as a file name: " +
                            session.id());
  }

  nlohmann::json j = session;
  const fs::path target = pathFor(session.id());
  const fs::path staging = target.string() + ".tmp";

  std::unique_lock<std::shared_mutex> lock(files_mutex_);
  {
    std::ofstream file(staging, std::ios::trunc);
    if (!file.is_open()) {
      return Result<void>(ErrorCode::StorageError,
                          "Cannot write " + staging.string());
    }
    file << j.dump(2);
    file.flush();
    if (!file) {
      return Result<void>(ErrorCode::StorageError,
                          "Failed writing " + staging.string());
    }
  }

  std::error_code ec;
  fs::rename(staging, target, ec);
  if (ec) {
    fs::remove(staging, ec);
    return Result<void>(ErrorCode::StorageError,
                        "Failed to replace " + target.string());
  }

  COHORT_DEBUG("Persisted session " << session.id() << " ("
                                    << sessionStatusToString(session.status())
                                    << ")");
  return Result<void>();
}

Result<ComputationSession> FileComputationStore::load(const std::string &id) {
  if (!isSafeId(id)) {
    return Result<ComputationSession>(ErrorCode::NotFoundError,
                                      "Session not found: " + id);
  }

  std::shared_lock<std::shared_mutex> lock(files_mutex_);
  const fs::path path = pathFor(id);
  if (!fs::exists(path)) {
    return Result<ComputationSession>(ErrorCode::NotFoundError,
                                      "Session not found: " + id);
  }
  return readSessionFile(path);
}

std::vector<SessionSummary>
FileComputationStore::list(const SessionFilter &filter) {
  std::vector<SessionSummary> summaries;
  {
    std::shared_lock<std::shared_mutex> lock(files_mutex_);
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(directory_, ec)) {
      if (!entry.is_regular_file() ||
          entry.path().extension() != kSessionExtension) {
        continue;
      }
      auto session = readSessionFile(entry.path());
      if (!session) {
        COHORT_WARN("Skipping unreadable session file " << entry.path());
        continue;
      }
      if (filter.matches(session.value())) {
        summaries.push_back(summarize(session.value()));
      }
    }
  }

  std::sort(summaries.begin(), summaries.end(),
            [](const SessionSummary &a, const SessionSummary &b) {
              return a.created_at != b.created_at ? a.created_at < b.created_at
                                                  : a.id < b.id;
            });
  return summaries;
}

Result<void> FileComputationStore::remove(const std::string &id) {
  if (!isSafeId(id)) {
    return Result<void>(ErrorCode::NotFoundError, "Session not found: " + id);
  }

  std::unique_lock<std::shared_mutex> lock(files_mutex_);
  std::error_code ec;
  if (!fs::remove(pathFor(id), ec)) {
    if (ec) {
      return Result<void>(ErrorCode::StorageError,
                          "Failed to remove session " + id + ": " +
                              ec.message());
    }
    return Result<void>(ErrorCode::NotFoundError, "Session not found: " + id);
  }
  return Result<void>();
}

} // namespace cohort

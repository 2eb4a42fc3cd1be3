#include "cohort/service/computation_service.hpp"
#include "cohort/utils/logging.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

using namespace cohort;

namespace {

int reportError(const std::string &stage, ErrorCode code,
                std::string_view message) {
  nlohmann::json error = {{"stage", stage},
                          {"error", std::string(errorToString(code))},
                          {"message", std::string(message)}};
  std::cerr << error.dump(2) << std::endl;
  return 1;
}

std::shared_ptr<ComputationStore> makeStore(const EngineConfig &config) {
  if (config.store_directory.empty()) {
    return std::make_shared<InMemoryComputationStore>();
  }
  return std::make_shared<FileComputationStore>(config.store_directory);
}

} // namespace

// Runs one computation job:
// {
//   "computation_type": "sum" | "mean" | "variance",
//   "metric_type": "heart_rate",          (optional)
//   "threshold": 2,                        (optional)
//   "export_format": "json" | "csv",       (optional)
//   "participants": [{"org_id": "...", "value": 72.5}, ...]
// }
int main(int argc, char *argv[]) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " <job.json> [config.json]"
              << std::endl;
    return 2;
  }

  std::ifstream job_file(argv[1]);
  if (!job_file.is_open()) {
    std::cerr << "Cannot open job file " << argv[1] << std::endl;
    return 2;
  }

  nlohmann::json job;
  try {
    job_file >> job;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "Invalid job file " << argv[1] << ": " << e.what()
              << std::endl;
    return 2;
  }

  try {
    EngineConfig config = argc == 3 ? EngineConfig(argv[2]) : EngineConfig();

    std::shared_ptr<AuditLog> audit_log;
    if (!config.audit_log_path.empty()) {
      audit_log = std::make_shared<AuditLog>(config.audit_log_path);
    }
    ComputationService service(makeStore(config), config, audit_log);

    auto type =
        parseComputationType(job.at("computation_type").get<std::string>());
    if (!type) {
      return reportError("create", ErrorCode::ValidationError,
                         "Unknown computation_type " +
                             job.at("computation_type").dump());
    }

    std::optional<std::string> metric_type;
    if (job.contains("metric_type") && !job["metric_type"].is_null()) {
      metric_type = job["metric_type"].get<std::string>();
    }
    std::optional<std::size_t> threshold;
    if (job.contains("threshold")) {
      threshold = job["threshold"].get<std::size_t>();
    }

    std::vector<std::string> org_ids;
    for (const auto &participant : job.at("participants")) {
      org_ids.push_back(participant.at("org_id").get<std::string>());
    }

    auto created = service.create(*type, org_ids, threshold, metric_type);
    if (!created) {
      return reportError("create", created.error(), created.message());
    }
    const std::string session_id = created.value();

    for (const auto &participant : job.at("participants")) {
      if (!participant.contains("value") || participant["value"].is_null()) {
        // Organization declined to contribute
        continue;
      }
      auto submitted =
          service.submit(session_id, participant.at("org_id").get<std::string>(),
                         participant["value"].get<double>());
      if (!submitted) {
        return reportError("submit", submitted.error(), submitted.message());
      }
    }

    auto result = service.compute(session_id);
    if (!result) {
      return reportError("compute", result.error(), result.message());
    }

    if (job.contains("export_format")) {
      auto exported = service.exportResult(
          session_id, job["export_format"].get<std::string>());
      if (!exported) {
        return reportError("export", exported.error(), exported.message());
      }
      std::cout << exported.value().content << std::endl;
    } else {
      nlohmann::json output = {{"session_id", session_id},
                               {"result", result.value()}};
      std::cout << output.dump(2) << std::endl;
    }
  } catch (const std::exception &e) {
    COHORT_LOG_AND_EXIT("cohort_cli: " << e.what(), 1);
  }

  return 0;
}

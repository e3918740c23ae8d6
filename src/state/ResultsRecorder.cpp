#include "state/ResultsRecorder.hpp"

#include <filesystem>
#include <fstream>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "state/DeployedResources.hpp"

namespace ldp::state {

namespace {
constexpr const char* kSchemaVersion = "2.0";
constexpr const char* kBackend = "api";
}  // namespace

ResultsRecorder::ResultsRecorder() = default;
ResultsRecorder::~ResultsRecorder() = default;

nlohmann::json ResultsRecorder::buildDeployedValues(const nlohmann::json& jResourceValues) {
  return {{"resources", jResourceValues},
          {"schema_version", kSchemaVersion},
          {"backend", kBackend}};
}

void ResultsRecorder::record(const nlohmann::json& jResults, const std::string& sStage,
                             const std::string& sProjectDir) const {
  const std::filesystem::path pathRecord(DeployedResources::recordPath(sProjectDir, sStage));

  std::error_code ec;
  std::filesystem::create_directories(pathRecord.parent_path(), ec);
  if (ec) {
    throw common::StateError("record_dir_failed", "Unable to create " +
                                                      pathRecord.parent_path().string() +
                                                      ": " + ec.message());
  }

  // nlohmann::json objects are key-sorted, so dump() output is stable
  std::ofstream ofs(pathRecord, std::ios::trunc);
  if (!ofs) {
    throw common::StateError("record_write_failed", "Unable to write " + pathRecord.string());
  }
  ofs << jResults.dump(2) << '\n';
  ofs.flush();
  if (!ofs) {
    throw common::StateError("record_write_failed", "Unable to write " + pathRecord.string());
  }
  common::Logger::get()->info("Recorded deployed values for stage '{}' at {}", sStage,
                              pathRecord.string());
}

}  // namespace ldp::state

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Ui.hpp"
#include "core/Deployer.hpp"
#include "core/DeploymentReporter.hpp"
#include "model/Instructions.hpp"
#include "state/DeployedResources.hpp"

// Reports the persisted state of one stage and previews its teardown plan.
// Cloud calls need a concrete ICloudClient, which this binary does not link.

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = ldp::common::Config::load();

    ldp::common::Logger::init(cfgApp.sLogLevel, cfgApp.sLogFile);
    auto spLog = ldp::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (app={}, stage={}, region={})", cfgApp.sAppName,
                cfgApp.sStage, cfgApp.sRegion);

    // ── Step 2: Load the deployed record ─────────────────────────────────
    const auto oDeployed =
        ldp::state::DeployedResources::load(cfgApp.sProjectDir, cfgApp.sStage);
    if (!oDeployed) {
      spLog->warn("Step 2: No deployed record for stage '{}' at {}", cfgApp.sStage,
                  ldp::state::DeployedResources::recordPath(cfgApp.sProjectDir, cfgApp.sStage));
      return EXIT_SUCCESS;
    }
    spLog->info("Step 2: Loaded {} deployed resources", oDeployed->resourceNames().size());

    // ── Step 3: Report ───────────────────────────────────────────────────
    ldp::common::ConsoleUi cuOut;
    ldp::core::DeploymentReporter(cuOut).displayReport(oDeployed->document());

    // ── Step 4: Teardown preview ─────────────────────────────────────────
    const auto plTeardown = ldp::core::Deployer::teardownPlan(oDeployed);
    spLog->info("Step 4: Teardown would issue {} instructions", plTeardown.size());
    cuOut.write(ldp::model::toJson(plTeardown).dump(2) + "\n");

    return EXIT_SUCCESS;
  } catch (const ldp::common::AppError& ex) {
    std::cerr << "[fatal] " << ex._sErrorCode << ": " << ex.what() << "\n";
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}

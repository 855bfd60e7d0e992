#include "SignRelay/Pipeline/Mediator.hpp"

#include "SignRelay/Utils/Logging.hpp"

using namespace signrelay::utils::types;
using enum signrelay::utils::error::RelayErrorCode;

namespace signrelay::pipeline {
  fn OfflineMediator::mediate(const MediationRequest& request) -> Result<MediationResult> {
    debug_log("No mediation backend, refusing '{}' ({}, {})", request.rawInput, request.context.mode, request.context.scenario);

    ERR(ApiUnavailable, "No mediation backend is configured");
  }
} // namespace signrelay::pipeline

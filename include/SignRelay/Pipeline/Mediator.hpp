#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Context.hpp"

namespace signrelay::pipeline {
  namespace {
    using utils::types::f32;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Vec;
  } // namespace

  struct MediationRequest {
    String          rawInput;      ///< Phrase as received from recognition.
    PipelineContext context;       ///< Direction and scenario of the cycle.
    Vec<String>     recentHistory; ///< Most recent mediated texts, oldest first.
  };

  struct MediationResult {
    String mediatedText;
    f32    confidence = 1.0F;
  };

  /**
   * @class IMediator
   * @brief Turns a raw phrase into clearer text for the other party.
   *
   * Implementations may block for as long as they like; the pipeline runs
   * them off its worker thread and stops waiting after its configured
   * timeout. A call whose cycle was superseded still runs to completion and
   * its result is discarded.
   */
  class IMediator {
   public:
    virtual ~IMediator() = default;

    IMediator(const IMediator&)                = delete;
    IMediator(IMediator&&)                     = delete;
    fn operator=(const IMediator&)->IMediator& = delete;
    fn operator=(IMediator&&)->IMediator&      = delete;

    /**
     * @return The mediated text, or MediationFailure/ApiUnavailable/Timeout on failure.
     */
    virtual fn mediate(const MediationRequest& request) -> Result<MediationResult> = 0;

   protected:
    IMediator() = default;
  };

  /**
   * @brief Mediator used when no backend is configured. Every call fails with ApiUnavailable.
   */
  class OfflineMediator final : public IMediator {
   public:
    OfflineMediator() = default;

    fn mediate(const MediationRequest& request) -> Result<MediationResult> override;
  };
} // namespace signrelay::pipeline

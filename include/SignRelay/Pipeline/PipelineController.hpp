#pragma once

#include <atomic>             // std::atomic
#include <condition_variable> // std::condition_variable_any
#include <matchit.hpp>        // matchit::{match, is, _}
#include <stop_token>         // std::stop_token
#include <thread>             // std::jthread
#include <variant>            // std::variant

#include "../Avatar/IdleStateManager.hpp"
#include "../Cache/AvatarCache.hpp"
#include "../Cache/PhraseCache.hpp"
#include "../Speech/SpeechOutput.hpp"
#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Context.hpp"
#include "Mediator.hpp"
#include "StatusChannel.hpp"

namespace signrelay::pipeline {
  namespace {
    using utils::clock::IClock;
    using utils::clock::Timestamp;
    using utils::error::RelayError;
    using utils::types::Future;
    using utils::types::i64;
    using utils::types::Mutex;
    using utils::types::Option;
    using utils::types::Promise;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::Unit;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  enum class PipelineStatus : u8 {
    Listening,
    Understanding,
    Responding,
    Speaking,
    Idle,
  };

  struct SpeechInput {
    String transcript;
  };

  struct GestureInput {
    String intent; ///< Recognized sign intent, e.g. "PAIN".
    String phrase; ///< Phrase the recognizer produced for the gesture.
  };

  using InputEvent = std::variant<SpeechInput, GestureInput>;

  /**
   * @brief Phrase a cycle works on: the transcript, or the gesture phrase
   * (falling back to its intent when the phrase is empty).
   */
  fn DerivePhrase(const InputEvent& event) -> String;

  enum class CyclePath : u8 {
    FastPath,   ///< Answered from a phrase table.
    Mediated,   ///< Answered by the mediator.
    Fallback,   ///< Mediator failed or timed out; fallback text was spoken.
    Ignored,    ///< Input was empty.
    Superseded, ///< A newer input or cancel() replaced this cycle.
  };

  struct CycleOutcome {
    u64                                               cycleId = 0;
    CyclePath                                         path    = CyclePath::Ignored;
    String                                            text;
    i64                                               elapsedMs = 0; ///< From processInput() to the speaking emission.
    Option<String>                                    signIntent;
    Option<cache::CacheEntry<cache::AvatarAnimation>> animation; ///< Cached animation for the text, hearing-to-deaf only.
  };

  struct PipelineConfig {
    i64            mediationTimeoutMs = 1500;  ///< Longest wait for the mediator before falling back.
    Option<String> fallbackPhrase;             ///< Spoken when mediation fails; the raw input otherwise.
    bool           learnFromMediation = false; ///< Add successful deaf-to-hearing mediations to the medical table.
    usize          historySize        = 5;
    i64            fastPathBudgetMs   = 150;
  };

  struct PipelineMetrics {
    u64 cycles             = 0;
    u64 fastPathHits       = 0;
    u64 mediations         = 0;
    u64 mediationFailures  = 0;
    u64 mediationTimeouts  = 0;
    u64 superseded         = 0;
    u64 ignored            = 0;
    i64 lastElapsedMs      = 0;
    i64 maxFastPathElapsed = 0;
  };

  /**
   * @brief Collaborators of a PipelineController. Only `avatarCache` may be null.
   */
  struct PipelineServices {
    SharedPointer<cache::PhraseCache>       emergencyPhrases;
    SharedPointer<cache::PhraseCache>       medicalTerms;
    SharedPointer<cache::AvatarCache>       avatarCache;
    SharedPointer<IMediator>                mediator;
    SharedPointer<speech::ISpeechOutput>    speech;
    SharedPointer<avatar::IdleStateManager> idle;
    SharedPointer<IClock>                   clock;
  };

  /**
   * @class PipelineController
   * @brief Runs one mediation cycle at a time on its own worker thread.
   *
   * A cycle derives a phrase from the input event, answers it from the
   * emergency/medical tables when emergency mode is on, and otherwise asks
   * the mediator. The result is spoken and published on the subtitle channel.
   *
   * Status values of one cycle are published in order. A newer input
   * supersedes the current cycle: from that point the old cycle publishes
   * nothing and its future resolves as Superseded.
   *
   * Channel subscribers run on the publishing thread while the publish lock
   * is held. They may read currentStatus(), isProcessing() and getMetrics(),
   * but must not call processInput() or cancel() synchronously.
   */
  class PipelineController {
   public:
    PipelineController(PipelineServices services, PipelineConfig config = {});
    ~PipelineController();

    PipelineController(const PipelineController&)                = delete;
    PipelineController(PipelineController&&)                     = delete;
    fn operator=(const PipelineController&)->PipelineController& = delete;
    fn operator=(PipelineController&&)->PipelineController&      = delete;

    /**
     * @brief Queues a cycle for @p event, superseding any cycle in flight.
     * @return Resolves when the cycle reaches speaking, is ignored, or is superseded.
     */
    fn processInput(InputEvent event, PipelineContext context, bool emergencyModeEnabled = true) -> Future<CycleOutcome>;

    /**
     * @brief Supersedes the current cycle without starting another, stops speech and returns to listening.
     */
    fn cancel() -> Unit;

    [[nodiscard]] fn currentStatus() const -> PipelineStatus;
    [[nodiscard]] fn isProcessing() const -> bool;
    [[nodiscard]] fn getMetrics() const -> PipelineMetrics;

    [[nodiscard]] fn statusChannel() -> Channel<PipelineStatus>& {
      return m_emitter->statuses;
    }

    [[nodiscard]] fn subtitleChannel() -> Channel<String>& {
      return m_emitter->subtitles;
    }

    [[nodiscard]] fn errorChannel() -> Channel<RelayError>& {
      return m_emitter->errors;
    }

   private:
    /**
     * @brief Publishing side, shared with speech callbacks so they stay valid
     * after the controller is gone.
     */
    struct Emitter {
      mutable Mutex publishMutex; ///< Orders publication and guards `generation`.
      u64           generation = 0;

      std::atomic<PipelineStatus> status { PipelineStatus::Idle }; ///< Last published status, readable without the publish lock.

      Channel<PipelineStatus> statuses;
      Channel<String>         subtitles;
      Channel<RelayError>     errors;

      /**
       * @brief Publishes @p next if @p cycleId is still the current cycle.
       */
      fn emitIfCurrent(u64 cycleId, PipelineStatus next) -> bool;

      fn errorIfCurrent(u64 cycleId, const RelayError& error) -> Unit;

      [[nodiscard]] fn isCurrent(u64 cycleId) const -> bool;
    };

    struct MediationSlot {
      Mutex                           mutex;
      std::condition_variable_any     ready;
      Option<Result<MediationResult>> result;
      bool                            cancelled = false;

      fn cancel() -> Unit;
    };

    struct PendingCycle {
      u64                   cycleId;
      InputEvent            event;
      PipelineContext       context;
      bool                  emergencyModeEnabled;
      Timestamp             receivedAt;
      Promise<CycleOutcome> promise;
    };

    /**
     * @brief Starts a new generation, resolving the queued cycle and waking any mediation wait.
     * Requires m_queueMutex.
     * @return The new generation.
     */
    fn supersedeLocked() -> u64;

    fn workerLoop(const std::stop_token& stopToken) -> Unit;
    fn runCycle(const PendingCycle& cycle) -> CycleOutcome;

    /**
     * @return None if the cycle was superseded while waiting, otherwise the
     * mediator's result or a MediationFailure/MediationTimeout error.
     */
    fn mediate(const PendingCycle& cycle, const String& phrase) -> Option<Result<MediationResult>>;

    fn deliver(const PendingCycle& cycle, const String& text, CyclePath path, Option<String> signIntent) -> CycleOutcome;

    fn rememberDelivered(const String& text) -> Unit;
    [[nodiscard]] fn recentHistory() const -> Vec<String>;

    fn superseded(u64 cycleId) -> CycleOutcome;

    PipelineServices m_services;
    PipelineConfig   m_config;

    SharedPointer<Emitter> m_emitter = std::make_shared<Emitter>();

    Mutex                        m_queueMutex;
    std::condition_variable_any  m_queueReady;
    Option<PendingCycle>         m_pending;
    SharedPointer<MediationSlot> m_activeMediation;
    std::atomic<bool>            m_busy { false };

    mutable Mutex m_historyMutex;
    Vec<String>   m_history;

    mutable Mutex   m_metricsMutex;
    PipelineMetrics m_metrics;

    std::jthread m_worker;
  };
} // namespace signrelay::pipeline

template <>
struct std::formatter<signrelay::pipeline::PipelineStatus> : std::formatter<std::string_view> {
  fn format(const signrelay::pipeline::PipelineStatus status, std::format_context& ctx) const {
    using matchit::match, matchit::is, matchit::_;
    using enum signrelay::pipeline::PipelineStatus;

    return std::formatter<std::string_view>::format(
      match(status)(
        is | Listening     = "listening",
        is | Understanding = "understanding",
        is | Responding    = "responding",
        is | Speaking      = "speaking",
        is | _             = "idle"
      ),
      ctx
    );
  }
};

#include "SignRelay/Pipeline/PipelineController.hpp"

#include <algorithm> // std::{max, ranges::all_of}
#include <cctype>    // std::isspace
#include <format>    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include "SignRelay/Utils/Logging.hpp"

using namespace signrelay::utils::types;
using signrelay::utils::clock::Timestamp;
using signrelay::utils::error::RelayError;
using enum signrelay::utils::error::RelayErrorCode;

namespace signrelay::pipeline {
  fn DerivePhrase(const InputEvent& event) -> String {
    if (const auto* speechInput = std::get_if<SpeechInput>(&event))
      return speechInput->transcript;

    const auto& gesture = std::get<GestureInput>(event);

    return gesture.phrase.empty() ? gesture.intent : gesture.phrase;
  }

  fn PipelineController::Emitter::emitIfCurrent(const u64 cycleId, const PipelineStatus next) -> bool {
    const LockGuard lock(publishMutex);

    if (cycleId != generation)
      return false;

    status.store(next);
    statuses.publish(next);

    return true;
  }

  fn PipelineController::Emitter::errorIfCurrent(const u64 cycleId, const RelayError& error) -> Unit {
    const LockGuard lock(publishMutex);

    if (cycleId == generation)
      errors.publish(error);
  }

  fn PipelineController::Emitter::isCurrent(const u64 cycleId) const -> bool {
    const LockGuard lock(publishMutex);
    return cycleId == generation;
  }

  fn PipelineController::MediationSlot::cancel() -> Unit {
    {
      const LockGuard lock(mutex);
      cancelled = true;
    }

    ready.notify_all();
  }

  PipelineController::PipelineController(PipelineServices services, PipelineConfig config)
    : m_services(std::move(services)),
      m_config(std::move(config)),
      m_worker([this](const std::stop_token& stopToken) { workerLoop(stopToken); }) {}

  PipelineController::~PipelineController() {
    {
      const LockGuard lock(m_queueMutex);
      supersedeLocked();
    }

    m_worker.request_stop();

    if (m_worker.joinable())
      m_worker.join();

    m_services.speech->cancel();
  }

  fn PipelineController::processInput(InputEvent event, const PipelineContext context, const bool emergencyModeEnabled) -> Future<CycleOutcome> {
    Promise<CycleOutcome> promise;
    Future<CycleOutcome>  future = promise.get_future();

    {
      const LockGuard lock(m_queueMutex);

      const u64 cycleId = supersedeLocked();

      m_pending.emplace(PendingCycle {
        .cycleId              = cycleId,
        .event                = std::move(event),
        .context              = context,
        .emergencyModeEnabled = emergencyModeEnabled,
        .receivedAt           = m_services.clock->now(),
        .promise              = std::move(promise),
      });

      m_busy = true;
    }

    m_queueReady.notify_one();

    return future;
  }

  fn PipelineController::cancel() -> Unit {
    u64 cycleId = 0;

    {
      const LockGuard lock(m_queueMutex);
      cycleId = supersedeLocked();
    }

    m_services.speech->cancel();
    m_emitter->emitIfCurrent(cycleId, PipelineStatus::Listening);

    debug_log("Pipeline cancelled");
  }

  fn PipelineController::currentStatus() const -> PipelineStatus {
    return m_emitter->status.load();
  }

  fn PipelineController::isProcessing() const -> bool {
    return m_busy;
  }

  fn PipelineController::getMetrics() const -> PipelineMetrics {
    const LockGuard lock(m_metricsMutex);
    return m_metrics;
  }

  fn PipelineController::supersedeLocked() -> u64 {
    u64 nextGeneration = 0;

    {
      const LockGuard lock(m_emitter->publishMutex);
      nextGeneration = ++m_emitter->generation;
    }

    if (m_pending) {
      m_pending->promise.set_value(superseded(m_pending->cycleId));
      m_pending.reset();
    }

    if (m_activeMediation)
      m_activeMediation->cancel();

    return nextGeneration;
  }

  fn PipelineController::workerLoop(const std::stop_token& stopToken) -> Unit {
    while (true) {
      Option<PendingCycle> cycle;

      {
        UniqueLock lock(m_queueMutex);

        if (!m_queueReady.wait(lock, stopToken, [this] { return m_pending.has_value(); }))
          break;

        cycle.emplace(std::move(*m_pending));
        m_pending.reset();
      }

      try {
        cycle->promise.set_value(runCycle(*cycle));
      } catch (const Exception& e) {
        error_log("Pipeline cycle {} failed: {}", cycle->cycleId, e.what());
        cycle->promise.set_exception(std::current_exception());
      }

      {
        const LockGuard lock(m_queueMutex);

        if (!m_pending)
          m_busy = false;
      }
    }
  }

  fn PipelineController::runCycle(const PendingCycle& cycle) -> CycleOutcome {
    const u64 cycleId = cycle.cycleId;

    {
      const LockGuard lock(m_metricsMutex);
      ++m_metrics.cycles;
    }

    if (!m_emitter->emitIfCurrent(cycleId, PipelineStatus::Listening))
      return superseded(cycleId);

    const String phrase = DerivePhrase(cycle.event);

    if (std::ranges::all_of(phrase, [](const unsigned char chr) { return std::isspace(chr) != 0; })) {
      m_emitter->emitIfCurrent(cycleId, PipelineStatus::Idle);

      {
        const LockGuard lock(m_metricsMutex);
        ++m_metrics.ignored;
      }

      debug_log("Ignoring empty input");

      return { .cycleId = cycleId, .path = CyclePath::Ignored };
    }

    if (cycle.emergencyModeEnabled) {
      cache::PhraseLookup lookup = m_services.emergencyPhrases->lookup(phrase);

      if (!lookup.hit)
        lookup = m_services.medicalTerms->lookup(phrase);

      if (lookup.hit && lookup.entry) {
        if (!m_emitter->emitIfCurrent(cycleId, PipelineStatus::Understanding) ||
            !m_emitter->emitIfCurrent(cycleId, PipelineStatus::Responding))
          return superseded(cycleId);

        {
          const LockGuard lock(m_metricsMutex);
          ++m_metrics.fastPathHits;
        }

        debug_log("Fast path hit for '{}' in {:.1f}us", lookup.entry->phrase, lookup.lookupTimeMicros);

        return deliver(cycle, lookup.entry->mediatedText, CyclePath::FastPath, lookup.entry->signIntent);
      }
    }

    if (!m_emitter->emitIfCurrent(cycleId, PipelineStatus::Understanding))
      return superseded(cycleId);

    const Option<Result<MediationResult>> mediated = mediate(cycle, phrase);

    if (!mediated)
      return superseded(cycleId);

    String    text;
    CyclePath path = CyclePath::Mediated;

    if (*mediated) {
      text = (*mediated)->mediatedText;

      if (m_config.learnFromMediation && cycle.context.mode == Mode::DeafToHearing)
        if (Result<> learned = m_services.medicalTerms->addTerm(phrase, text, None, (*mediated)->confidence); !learned)
          debug_at(learned.error());
    } else {
      text = m_config.fallbackPhrase.value_or(phrase);
      path = CyclePath::Fallback;
    }

    if (!m_emitter->emitIfCurrent(cycleId, PipelineStatus::Responding))
      return superseded(cycleId);

    return deliver(cycle, text, path, None);
  }

  fn PipelineController::mediate(const PendingCycle& cycle, const String& phrase) -> Option<Result<MediationResult>> {
    const u64 cycleId = cycle.cycleId;

    auto slot = std::make_shared<MediationSlot>();

    {
      const LockGuard lock(m_queueMutex);

      if (!m_emitter->isCurrent(cycleId))
        return None;

      m_activeMediation = slot;
    }

    {
      const LockGuard lock(m_metricsMutex);
      ++m_metrics.mediations;
    }

    MediationRequest request {
      .rawInput      = phrase,
      .context       = cycle.context,
      .recentHistory = recentHistory(),
    };

    // The call is left running if the wait below gives up; the slot keeps its result alive.
    std::thread([slot, mediator = m_services.mediator, request = std::move(request)] {
      Result<MediationResult> result = [&]() -> Result<MediationResult> {
        try {
          return mediator->mediate(request);
        } catch (const Exception& e) {
          ERR_FMT(MediationFailure, "Mediator threw: {}", e.what());
        }
      }();

      {
        const LockGuard lock(slot->mutex);
        slot->result = std::move(result);
      }

      slot->ready.notify_all();
    }).detach();

    Option<Result<MediationResult>> result;
    bool                            cancelled = false;

    {
      UniqueLock lock(slot->mutex);

      slot->ready.wait_for(lock, Millis(m_config.mediationTimeoutMs), [&slot] { return slot->result.has_value() || slot->cancelled; });

      cancelled = slot->cancelled;
      result    = std::move(slot->result);
    }

    {
      const LockGuard lock(m_queueMutex);

      if (m_activeMediation == slot)
        m_activeMediation.reset();
    }

    if (cancelled || !m_emitter->isCurrent(cycleId))
      return None;

    if (!result) {
      RelayError error(MediationTimeout, std::format("Mediation exceeded {} ms", m_config.mediationTimeoutMs));

      {
        const LockGuard lock(m_metricsMutex);
        ++m_metrics.mediationTimeouts;
      }

      warn_at(error);
      m_emitter->errorIfCurrent(cycleId, error);

      return Result<MediationResult>(Err(std::move(error)));
    }

    if (*result && (*result)->mediatedText.empty())
      *result = Err(RelayError(MediationFailure, "Mediator returned empty text"));

    if (!*result) {
      RelayError error = result->error();

      if (error.code != MediationFailure)
        error = RelayError(MediationFailure, std::format("{}: {}", error.code, error.message));

      {
        const LockGuard lock(m_metricsMutex);
        ++m_metrics.mediationFailures;
      }

      warn_at(error);
      m_emitter->errorIfCurrent(cycleId, error);

      return Result<MediationResult>(Err(std::move(error)));
    }

    return result;
  }

  fn PipelineController::deliver(const PendingCycle& cycle, const String& text, const CyclePath path, Option<String> signIntent) -> CycleOutcome {
    const u64 cycleId = cycle.cycleId;

    m_services.speech->cancel();

    const i64 elapsedMs = m_services.clock->now() - cycle.receivedAt;

    {
      const LockGuard lock(m_emitter->publishMutex);

      if (m_emitter->generation != cycleId)
        return superseded(cycleId);

      m_emitter->status.store(PipelineStatus::Speaking);
      m_emitter->statuses.publish(PipelineStatus::Speaking);
      m_emitter->subtitles.publish(text);
    }

    m_services.idle->signalActivity();

    if (path == CyclePath::FastPath && elapsedMs > m_config.fastPathBudgetMs)
      warn_log("Fast path took {} ms, over the {} ms budget", elapsedMs, m_config.fastPathBudgetMs);

    {
      const LockGuard lock(m_metricsMutex);

      m_metrics.lastElapsedMs = elapsedMs;

      if (path == CyclePath::FastPath)
        m_metrics.maxFastPathElapsed = std::max(m_metrics.maxFastPathElapsed, elapsedMs);
    }

    rememberDelivered(text);

    CycleOutcome outcome {
      .cycleId    = cycleId,
      .path       = path,
      .text       = text,
      .elapsedMs  = elapsedMs,
      .signIntent = std::move(signIntent),
      .animation  = None,
    };

    if (cycle.context.mode == Mode::HearingToDeaf && m_services.avatarCache) {
      const String animationKey = cache::GenerateTextKey(text, ScenarioName(cycle.context.scenario));

      outcome.animation = m_services.avatarCache->getAvatarAnimation(animationKey);

      // A phrase-table answer carries its gloss; store it as the animation for this text.
      if (!outcome.animation && outcome.signIntent) {
        cache::AvatarAnimation animation { .signSequence = { *outcome.signIntent }, .rendering = cache::ProceduralRendering {} };

        m_services.avatarCache->setAvatarAnimation(animationKey, animation);

        const Timestamp storedAt = m_services.clock->now();

        outcome.animation = cache::CacheEntry<cache::AvatarAnimation> {
          .key            = animationKey,
          .payload        = std::move(animation),
          .createdAt      = storedAt,
          .lastAccessedAt = storedAt,
          .usageCount     = 1,
        };
      }
    }

    const std::weak_ptr<Emitter> emitter = m_emitter;

    speech::SpeechRequest request {
      .text     = text,
      .scenario = cycle.context.scenario,
      .profile  = speech::VoiceProfileFor(cycle.context.scenario),
      .onStart  = [cycleId] { debug_log("Speech started for cycle {}", cycleId); },
      .onEnd =
        [emitter, cycleId] {
          if (const SharedPointer<Emitter> target = emitter.lock())
            target->emitIfCurrent(cycleId, PipelineStatus::Idle);
        },
      .onError =
        [emitter, cycleId](const RelayError& error) {
          if (const SharedPointer<Emitter> target = emitter.lock()) {
            target->errorIfCurrent(cycleId, RelayError(SpeechFailure, error.message));
            target->emitIfCurrent(cycleId, PipelineStatus::Idle);
          }
        },
    };

    try {
      m_services.speech->speak(std::move(request));
    } catch (const Exception& e) {
      const RelayError error(SpeechFailure, e.what());

      warn_at(error);
      m_emitter->errorIfCurrent(cycleId, error);
      m_emitter->emitIfCurrent(cycleId, PipelineStatus::Idle);
    }

    debug_log("Cycle {} delivered via {} in {} ms", cycleId, magic_enum::enum_name(path), elapsedMs);

    return outcome;
  }

  fn PipelineController::rememberDelivered(const String& text) -> Unit {
    const LockGuard lock(m_historyMutex);

    m_history.push_back(text);

    while (m_history.size() > m_config.historySize)
      m_history.erase(m_history.begin());
  }

  fn PipelineController::recentHistory() const -> Vec<String> {
    const LockGuard lock(m_historyMutex);
    return m_history;
  }

  fn PipelineController::superseded(const u64 cycleId) -> CycleOutcome {
    {
      const LockGuard lock(m_metricsMutex);
      ++m_metrics.superseded;
    }

    debug_log("Cycle {} superseded", cycleId);

    return { .cycleId = cycleId, .path = CyclePath::Superseded };
  }
} // namespace signrelay::pipeline

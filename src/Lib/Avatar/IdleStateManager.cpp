#include "SignRelay/Avatar/IdleStateManager.hpp"

#include <algorithm>   // std::max
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include "SignRelay/Utils/Logging.hpp"

using namespace signrelay::utils::types;
using signrelay::utils::clock::IClock;
using signrelay::utils::clock::Timestamp;

namespace signrelay::avatar {
  IdleStateManager::IdleStateManager(const IdleConfig config, SharedPointer<IClock> clock, const bool runTimer)
    : m_clock(std::move(clock)), m_config(config), m_lastActivity(m_clock->now()) {
    if (runTimer)
      m_timer.emplace([this](const std::stop_token& stopToken) { timerLoop(stopToken); });
  }

  IdleStateManager::~IdleStateManager() {
    if (m_timer) {
      m_timer->request_stop();
      m_timer->join();
    }
  }

  fn IdleStateManager::setCallbacks(IdleCallbacks callbacks) -> Unit {
    const LockGuard lock(m_mutex);
    m_callbacks = std::move(callbacks);
  }

  fn IdleStateManager::signalActivity() -> Unit {
    const LockGuard dispatchLock(m_dispatchMutex);

    Vec<Edge>     edges;
    IdleCallbacks callbacks;

    {
      const LockGuard lock(m_mutex);

      const Timestamp now = m_clock->now();

      advanceLocked(now, edges);

      m_lastActivity = now;

      switch (m_state) {
        case IdleState::Idle:
          m_state            = IdleState::Transitioning;
          m_target           = IdleState::Active;
          m_transitionEndsAt = now + m_config.transitionDurationMs;
          edges.push_back(Edge::IdleEnd);
          edges.push_back(Edge::TransitionStart);
          break;
        case IdleState::Transitioning:
          m_target           = IdleState::Active;
          m_transitionEndsAt = now + m_config.transitionDurationMs;
          break;
        case IdleState::Active:
          break;
      }

      wakeTimerLocked();
      callbacks = m_callbacks;
    }

    dispatch(edges, callbacks);
  }

  fn IdleStateManager::forceIdle() -> Unit {
    const LockGuard dispatchLock(m_dispatchMutex);

    Vec<Edge>     edges;
    IdleCallbacks callbacks;

    {
      const LockGuard lock(m_mutex);

      const Timestamp now = m_clock->now();

      advanceLocked(now, edges);

      if (m_state == IdleState::Active) {
        m_state            = IdleState::Transitioning;
        m_target           = IdleState::Idle;
        m_transitionEndsAt = now + m_config.transitionDurationMs;
        edges.push_back(Edge::TransitionStart);
      } else if (m_state == IdleState::Transitioning && m_target == IdleState::Active) {
        m_target           = IdleState::Idle;
        m_transitionEndsAt = now + m_config.transitionDurationMs;
      }

      wakeTimerLocked();
      callbacks = m_callbacks;
    }

    dispatch(edges, callbacks);
  }

  fn IdleStateManager::poll() -> Unit {
    const LockGuard dispatchLock(m_dispatchMutex);

    Vec<Edge>     edges;
    IdleCallbacks callbacks;

    {
      const LockGuard lock(m_mutex);
      advanceLocked(m_clock->now(), edges);
      callbacks = m_callbacks;
    }

    dispatch(edges, callbacks);
  }

  fn IdleStateManager::updateConfig(const IdleConfig config) -> Unit {
    const LockGuard lock(m_mutex);
    m_config = config;
    wakeTimerLocked();
  }

  fn IdleStateManager::state() const -> IdleState {
    const LockGuard lock(m_mutex);
    return m_state;
  }

  fn IdleStateManager::isIdle() const -> bool {
    return state() == IdleState::Idle;
  }

  fn IdleStateManager::isActive() const -> bool {
    return state() == IdleState::Active;
  }

  fn IdleStateManager::isTransitioning() const -> bool {
    return state() == IdleState::Transitioning;
  }

  fn IdleStateManager::timeSinceLastActivity() const -> i64 {
    const LockGuard lock(m_mutex);
    return m_clock->now() - m_lastActivity;
  }

  fn IdleStateManager::advanceLocked(const Timestamp now, Vec<Edge>& edges) -> Unit {
    // Edges are applied at the time they were due, so a clock that jumps
    // past several deadlines still produces them in order.
    while (true) {
      if (m_state == IdleState::Transitioning && now >= m_transitionEndsAt) {
        edges.push_back(Edge::TransitionEnd);

        if (m_target == IdleState::Active) {
          m_state       = IdleState::Active;
          m_activeSince = m_transitionEndsAt;
        } else {
          m_state = IdleState::Idle;
          edges.push_back(Edge::IdleStart);
        }

        continue;
      }

      if (m_state == IdleState::Active) {
        if (const Timestamp idleAt = idleDeadlineLocked(); now >= idleAt) {
          m_state            = IdleState::Transitioning;
          m_target           = IdleState::Idle;
          m_transitionEndsAt = idleAt + m_config.transitionDurationMs;
          edges.push_back(Edge::TransitionStart);
          continue;
        }
      }

      break;
    }
  }

  fn IdleStateManager::idleDeadlineLocked() const -> Timestamp {
    return std::max(m_lastActivity + m_config.idleTimeoutMs, m_activeSince);
  }

  fn IdleStateManager::nextDeadlineLocked() const -> Option<Timestamp> {
    switch (m_state) {
      case IdleState::Transitioning: return m_transitionEndsAt;
      case IdleState::Active:        return idleDeadlineLocked();
      case IdleState::Idle:          return None;
    }

    return None;
  }

  fn IdleStateManager::wakeTimerLocked() -> Unit {
    m_timersChanged = true;
    m_wakeup.notify_all();
  }

  fn IdleStateManager::dispatch(const Vec<Edge>& edges, const IdleCallbacks& callbacks) -> Unit {
    for (const Edge edge : edges) {
      debug_log("Idle state edge: {}", magic_enum::enum_name(edge));

      const Fn<void()>* callback = nullptr;

      switch (edge) {
        case Edge::IdleStart:       callback = &callbacks.onIdleStart; break;
        case Edge::IdleEnd:         callback = &callbacks.onIdleEnd; break;
        case Edge::TransitionStart: callback = &callbacks.onTransitionStart; break;
        case Edge::TransitionEnd:   callback = &callbacks.onTransitionEnd; break;
      }

      if (callback == nullptr || !*callback)
        continue;

      try {
        (*callback)();
      } catch (const Exception& e) {
        warn_log("Idle state callback for {} threw: {}", magic_enum::enum_name(edge), e.what());
      }
    }
  }

  fn IdleStateManager::timerLoop(const std::stop_token& stopToken) -> Unit {
    while (!stopToken.stop_requested()) {
      {
        UniqueLock lock(m_mutex);

        m_timersChanged = false;

        if (const Option<Timestamp> deadline = nextDeadlineLocked()) {
          const Timestamp delay = std::max<Timestamp>(*deadline - m_clock->now(), 0);

          m_wakeup.wait_for(lock, stopToken, Millis(delay), [this] { return m_timersChanged; });
        } else
          m_wakeup.wait(lock, stopToken, [this] { return m_timersChanged; });
      }

      if (stopToken.stop_requested())
        break;

      poll();
    }
  }
} // namespace signrelay::avatar

#pragma once

#include <condition_variable> // std::condition_variable_any
#include <stop_token>         // std::stop_token
#include <thread>             // std::jthread

#include "../Utils/Clock.hpp"
#include "../Utils/Types.hpp"

namespace signrelay::avatar {
  namespace {
    using utils::clock::IClock;
    using utils::clock::Timestamp;
    using utils::types::Fn;
    using utils::types::i64;
    using utils::types::Mutex;
    using utils::types::Option;
    using utils::types::SharedPointer;
    using utils::types::u8;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  enum class IdleState : u8 {
    Idle,          ///< No recent activity; the avatar may play idle motion.
    Active,        ///< Conversation in progress; idle motion is suppressed.
    Transitioning, ///< Blending between the two.
  };

  struct IdleConfig {
    i64 idleTimeoutMs        = 3000; ///< Quiet time in the active state before heading back to idle.
    i64 transitionDurationMs = 500;  ///< Length of the transitioning state in either direction.
  };

  /**
   * @brief Edge callbacks. Any may be empty. They run on whichever thread
   * crossed the edge and must not call back into the manager.
   */
  struct IdleCallbacks {
    Fn<void()> onIdleStart;       ///< Entered idle.
    Fn<void()> onIdleEnd;         ///< Left idle.
    Fn<void()> onTransitionStart; ///< Entered transitioning.
    Fn<void()> onTransitionEnd;   ///< Left transitioning.
  };

  /**
   * @class IdleStateManager
   * @brief Timer-driven idle/active state machine for the avatar presentation layer.
   *
   * Transitions:
   *  - idle -> transitioning -> active on signalActivity()
   *  - active -> transitioning -> idle after idleTimeoutMs without activity
   *
   * Deadlines are taken from the injected clock. With `runTimer` the manager
   * owns a thread that sleeps until the next deadline; without it the owner
   * calls poll() (tests drive a manual clock this way).
   */
  class IdleStateManager {
   public:
    IdleStateManager(IdleConfig config, SharedPointer<IClock> clock, bool runTimer = true);
    ~IdleStateManager();

    IdleStateManager(const IdleStateManager&)                = delete;
    IdleStateManager(IdleStateManager&&)                     = delete;
    fn operator=(const IdleStateManager&)->IdleStateManager& = delete;
    fn operator=(IdleStateManager&&)->IdleStateManager&      = delete;

    fn setCallbacks(IdleCallbacks callbacks) -> Unit;

    /**
     * @brief Records conversational activity.
     *
     * From idle, starts the transition to active. From active, only pushes
     * the no-activity deadline back. From transitioning, heads for active
     * and restarts the transition timer.
     */
    fn signalActivity() -> Unit;

    /**
     * @brief Starts the transition to idle now, regardless of the no-activity deadline.
     */
    fn forceIdle() -> Unit;

    /**
     * @brief Applies every deadline that has passed on the clock.
     */
    fn poll() -> Unit;

    fn updateConfig(IdleConfig config) -> Unit;

    [[nodiscard]] fn state() const -> IdleState;
    [[nodiscard]] fn isIdle() const -> bool;
    [[nodiscard]] fn isActive() const -> bool;
    [[nodiscard]] fn isTransitioning() const -> bool;

    [[nodiscard]] fn timeSinceLastActivity() const -> i64;

   private:
    enum class Edge : u8 {
      IdleStart,
      IdleEnd,
      TransitionStart,
      TransitionEnd,
    };

    // The following require m_mutex.
    fn advanceLocked(Timestamp now, Vec<Edge>& edges) -> Unit;
    [[nodiscard]] fn idleDeadlineLocked() const -> Timestamp;
    [[nodiscard]] fn nextDeadlineLocked() const -> Option<Timestamp>;
    fn wakeTimerLocked() -> Unit;

    static fn dispatch(const Vec<Edge>& edges, const IdleCallbacks& callbacks) -> Unit;

    fn timerLoop(const std::stop_token& stopToken) -> Unit;

    SharedPointer<IClock> m_clock;

    Mutex m_dispatchMutex; ///< Held while an edge is computed and its callbacks run.

    mutable Mutex               m_mutex;
    std::condition_variable_any m_wakeup;
    bool                        m_timersChanged = false;

    IdleConfig    m_config;
    IdleCallbacks m_callbacks;
    IdleState     m_state            = IdleState::Idle;
    IdleState     m_target           = IdleState::Idle; ///< Where the current transition ends.
    Timestamp     m_transitionEndsAt = 0;
    Timestamp     m_activeSince      = 0;
    Timestamp     m_lastActivity     = 0;

    Option<std::jthread> m_timer;
  };
} // namespace signrelay::avatar

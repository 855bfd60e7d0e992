#pragma once

#include <chrono> // std::chrono::{duration_cast, milliseconds, system_clock}

#include "Definitions.hpp"
#include "Types.hpp"

namespace signrelay::utils::clock {
  namespace {
    using types::i64;
  } // namespace

  /**
   * @brief Milliseconds since the Unix epoch.
   */
  using Timestamp = i64;

  inline constexpr Timestamp MS_PER_HOUR = 3'600'000;

  /**
   * @class IClock
   * @brief Source of wall-clock time for cache timestamps and pipeline timers.
   *
   * Production code uses SystemClock; tests substitute a manually advanced clock.
   */
  class IClock {
   public:
    IClock(const IClock&) = delete;
    IClock(IClock&&)      = delete;

    fn operator=(const IClock&)->IClock& = delete;
    fn operator=(IClock&&)->IClock&      = delete;

    virtual ~IClock() = default;

    [[nodiscard]] virtual fn now() const -> Timestamp = 0;

   protected:
    IClock() = default;
  };

  class SystemClock final : public IClock {
   public:
    SystemClock() = default;

    [[nodiscard]] fn now() const -> Timestamp override {
      using namespace std::chrono;
      return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
  };
} // namespace signrelay::utils::clock
